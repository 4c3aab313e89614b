/*
 * Part of the SharedKey Auth (SKA) project.
 *
 * SPDX-FileCopyrightText: 2025 SKA contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SharedKey Auth (SKA). See LICENSE for details.
 */

#include "ska/secret_store.hpp"
#include "ska/log.hpp"
#include "ska/internal/utils.hpp"

#include <fstream>
#include <sstream>

namespace ska {

SecretStore::SecretStore() = default;

SecretStore::~SecretStore() {
    for (auto& c : _pool) {
        if (c.ctx) {
            redisFree(c.ctx);
            c.ctx = nullptr;
            c.valid = false;
        }
    }
    for (auto& kv : _file_map) internal::secure_wipe(kv.second);
}

bool SecretStore::decode_secret(const std::string& hex, std::string& out_bin) {
    if (!internal::hex_to_bytes(hex, out_bin)) return false;
    if (out_bin.size() < kMinSecret || out_bin.size() > kMaxSecret) {
        internal::secure_wipe(out_bin);
        return false;
    }
    return true;
}

/* ---------------- File backend ---------------- */

bool SecretStore::init_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.good()) {
        log_line(std::string("[AUTH] failed to open file: ") + path);
        return false;
    }
    std::unordered_map<std::string, std::string> tmp;
    std::string account, sec_hex, extra;
    size_t line_no = 0;
    for (std::string line; std::getline(in, line); ) {
        ++line_no;
        internal::trim_inplace(line);
        if (line.empty() || line[0] == '#') continue;
        std::istringstream iss(line);
        if (!(iss >> account >> sec_hex) || (iss >> extra) ||
            account.find(':') != std::string::npos)
        {
            log_line("[AUTH] bad line " + std::to_string(line_no));
            return false;
        }
        std::string sec_bin;
        if (!decode_secret(sec_hex, sec_bin)) {
            log_line("[AUTH] bad secret at line " + std::to_string(line_no));
            return false;
        }
        tmp[account] = std::move(sec_bin);
    }
    internal::secure_wipe(sec_hex);
    size_t n = 0;
    {
        std::lock_guard<std::mutex> lk(_file_mtx);
        _file_map.swap(tmp);
        n = _file_map.size();
        _backend = Backend::File;
    }
    for (auto& kv : tmp) internal::secure_wipe(kv.second);
    log_line("[AUTH] file backend initialized: " + std::to_string(n) + " entries");
    return true;
}

std::size_t SecretStore::file_entries() const {
    std::lock_guard<std::mutex> lk(_file_mtx);
    return _file_map.size();
}

/* ---------------- Redis backend ---------------- */

bool SecretStore::init_redis(const RedisOptions& opt) {
    _opt = opt;
    if (_opt.pool_size <= 0) _opt.pool_size = 1;

    _pool.resize(_opt.pool_size);

    // Pre-connect all slots (best effort)
    size_t connected = 0;
    for (size_t i = 0; i < _pool.size(); ++i) {
        if (redis_connect_one(i)) ++connected;
    }
    {
        std::lock_guard<std::mutex> lk(_pool_mtx);
        _free.clear();
        for (size_t i = 0; i < _pool.size(); ++i) _free.push_back(i);
    }
    _cache.reset(std::chrono::seconds(_opt.cache_ttl_sec), _opt.cache_max_entries);
    _backend = Backend::Redis;
    log_line("[AUTH] redis backend initialized: pool=" + std::to_string(_pool.size()) +
             " connected=" + std::to_string(connected) +
             " host=" + _opt.host + ":" + std::to_string(_opt.port) +
             " db=" + std::to_string(_opt.db) +
             " prefix=" + _opt.key_prefix +
             " cache_ttl=" + std::to_string(_opt.cache_ttl_sec) + "s");
    return true;
}

bool SecretStore::redis_connect_one(size_t idx) {
    timeval tv{};
    tv.tv_sec  = _opt.timeout_ms / 1000;
    tv.tv_usec = (_opt.timeout_ms % 1000) * 1000;

    ::redisContext* ctx = redisConnectWithTimeout(_opt.host.c_str(), _opt.port, tv);
    if (!ctx || ctx->err) {
        if (ctx) {
            log_line(std::string("[AUTH][redis] connect error: ") + ctx->errstr);
            redisFree(ctx);
        } else {
            log_line("[AUTH][redis] connect error: NULL context");
        }
        _pool[idx].ctx = nullptr;
        _pool[idx].valid = false;
        return false;
    }
    if (redisSetTimeout(ctx, tv) != REDIS_OK) {
        log_line("[AUTH][redis] failed to set command timeout");
    }

    if (!redis_auth_and_select(ctx)) {
        redisFree(ctx);
        _pool[idx].ctx = nullptr;
        _pool[idx].valid = false;
        return false;
    }

    _pool[idx].ctx = ctx;
    _pool[idx].valid = true;
    return true;
}

bool SecretStore::redis_auth_and_select(::redisContext* ctx) {
    if (!_opt.password.empty()) {
        redisReply* r = (redisReply*)redisCommand(ctx, "AUTH %s", _opt.password.c_str());
        if (!r) {
            log_line("[AUTH][redis] AUTH failed: no reply");
            return false;
        }
        bool ok = (r->type != REDIS_REPLY_ERROR);
        if (!ok) {
            log_line(std::string("[AUTH][redis] AUTH error: ") + (r->str ? r->str : ""));
        }
        freeReplyObject(r);
        if (!ok) return false;
    }
    if (_opt.db != 0) {
        redisReply* r = (redisReply*)redisCommand(ctx, "SELECT %d", _opt.db);
        if (!r) {
            log_line("[AUTH][redis] SELECT failed: no reply");
            return false;
        }
        bool ok = (r->type != REDIS_REPLY_ERROR);
        if (!ok) {
            log_line(std::string("[AUTH][redis] SELECT error: ") + (r->str ? r->str : ""));
        }
        freeReplyObject(r);
        if (!ok) return false;
    }
    return true;
}

void SecretStore::redis_close_one(size_t idx) {
    if (idx >= _pool.size()) return;
    if (_pool[idx].ctx) {
        redisFree(_pool[idx].ctx);
        _pool[idx].ctx = nullptr;
    }
    _pool[idx].valid = false;
}

void SecretStore::Slot::acquire() {
    if (have) return;
    std::unique_lock<std::mutex> lk(store._pool_mtx);
    store._pool_cv.wait(lk, [&]{ return !store._free.empty(); });
    idx = store._free.front();
    store._free.pop_front();
    have = true;
}

void SecretStore::Slot::release() {
    if (!have) return;
    {
        std::lock_guard<std::mutex> lk(store._pool_mtx);
        store._free.push_back(idx);
    }
    store._pool_cv.notify_one();
    idx = (size_t)-1;
    have = false;
}

::redisContext* SecretStore::Slot::ctx() {
    // The slot is exclusively owned by this thread until release().
    auto& c = store._pool[idx];
    if (!c.valid || !c.ctx || c.ctx->err) {
        store.redis_close_one(idx);
        (void)store.redis_connect_one(idx);
    }
    return store._pool[idx].ctx;
}

std::optional<std::string> SecretStore::redis_get_secret(const std::string& account) {
    {
        std::string cached;
        switch (_cache.get(account, cached)) {
            case internal::SecretCache::Hit::Known:   return cached;
            case internal::SecretCache::Hit::Unknown: return std::nullopt;
            case internal::SecretCache::Hit::Miss:    break;
        }
    }

    // No lock is held from here to the reply: the GET may block.
    Slot slot(*this);
    slot.acquire();

    ::redisContext* c = slot.ctx();
    if (!c) return std::nullopt;

    const std::string rkey = _opt.key_prefix + account;
    redisReply* r = (redisReply*)redisCommand(c, "GET %b", rkey.data(), rkey.size());
    if (!r) {
        // Connection likely broken; next acquire will reconnect
        log_line("[AUTH][redis] GET failed: no reply");
        return std::nullopt;
    }

    std::optional<std::string> out;
    bool absent = false;
    if (r->type == REDIS_REPLY_NIL) {
        absent = true;
    } else if (r->type == REDIS_REPLY_STRING && r->str) {
        std::string hex(r->str, r->len);
        std::string bin;
        if (decode_secret(hex, bin)) {
            out = std::move(bin);
        } else {
            log_line("[AUTH][redis] malformed secret stored for an account");
            absent = true;
        }
        internal::secure_wipe(hex);
    } else if (r->type == REDIS_REPLY_ERROR) {
        log_line(std::string("[AUTH][redis] GET error: ") + (r->str ? r->str : ""));
    }
    freeReplyObject(r);

    // Transport and server errors are not cached; a definite NIL is.
    if (out) {
        _cache.put_known(account, *out);
    } else if (absent) {
        _cache.put_unknown(account);
    }
    return out;
}

/* ---------------- Public lookup (dispatch by backend) ---------------- */

std::optional<std::string> SecretStore::lookup(const std::string& account) {
    if (_backend == Backend::File) {
        std::lock_guard<std::mutex> lk(_file_mtx);
        auto it = _file_map.find(account);
        if (it == _file_map.end()) return std::nullopt;
        return it->second;
    } else if (_backend == Backend::Redis) {
        return redis_get_secret(account);
    }
    return std::nullopt;
}

SecretResolver SecretStore::resolver() {
    return [this](const std::string& account) { return lookup(account); };
}

} // namespace ska
