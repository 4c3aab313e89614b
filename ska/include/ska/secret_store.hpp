/*
 * Part of the SharedKey Auth (SKA) project.
 *
 * SPDX-FileCopyrightText: 2025 SKA contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SharedKey Auth (SKA). See LICENSE for details.
 */

#pragma once
#include <string>
#include <unordered_map>
#include <vector>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <optional>

// hiredis types live in the global namespace; include the header here
#include <hiredis/hiredis.h>

#include "ska/internal/secret_cache.hpp"
#include "ska/signature_validator.hpp"

namespace ska {

/**
 * Account -> secret lookup backed by a key file or Redis.
 * Thread-safe lookups. When Redis is used, answers (including "no such
 * account") are cached in-memory with TTL.
 * Serves as the SecretResolver of a host that has no key service of its own.
 */
class SecretStore {
public:
    SecretStore();
    ~SecretStore();

    SecretStore(const SecretStore&) = delete;
    SecretStore& operator=(const SecretStore&) = delete;

    // Accepted secret sizes (raw bytes).
    static constexpr std::size_t kMinSecret = 16;
    static constexpr std::size_t kMaxSecret = 64;

    // ---- File backend: "<account> <hex-secret>" per line, '#' comments ----
    bool init_file(const std::string& path);

    // ---- Redis backend ----
    struct RedisOptions {
        std::string host = "127.0.0.1";
        int         port = 6379;
        int         db   = 0;                 // SELECT db
        std::string password;                 // optional
        std::string key_prefix = "ska:key:";  // key = key_prefix + account
        int         pool_size  = 8;           // number of hiredis connections
        int         timeout_ms = 200;         // connect + command timeout
        int         cache_ttl_sec = 60;       // TTL for in-memory cache entries
        std::size_t cache_max_entries = 100000;
    };
    bool init_redis(const RedisOptions& opt);

    // Secret bytes for `account`, or nullopt if unknown (or backend down).
    std::optional<std::string> lookup(const std::string& account);

    // Resolver bound to this store; the store must outlive it.
    SecretResolver resolver();

    std::size_t file_entries() const;

private:
    enum class Backend { None, File, Redis };
    Backend _backend = Backend::None;

    // -------- File map --------
    mutable std::mutex _file_mtx;
    std::unordered_map<std::string, std::string> _file_map; // account -> secret bytes

    // -------- Redis pool + cache --------
    struct RedisConn { ::redisContext* ctx = nullptr; bool valid = false; };
    std::vector<RedisConn> _pool;
    std::deque<size_t>     _free;
    std::mutex             _pool_mtx;
    std::condition_variable _pool_cv;

    RedisOptions _opt{};

    internal::SecretCache _cache;

    static bool decode_secret(const std::string& hex, std::string& out_bin);

    bool redis_connect_one(size_t idx);
    void redis_close_one(size_t idx);
    bool redis_auth_and_select(::redisContext* ctx);
    std::optional<std::string> redis_get_secret(const std::string& account);

    // RAII slot guard for pool index
    class Slot {
    public:
        explicit Slot(SecretStore& s) : store(s) {}
        ~Slot() { release(); }
        void acquire();
        void release();
        ::redisContext* ctx();     // ensure connected and return pointer
    private:
        SecretStore& store;
        size_t idx = (size_t)-1;
        bool   have = false;
    };
};

} // namespace ska
