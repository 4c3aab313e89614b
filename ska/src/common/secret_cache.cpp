/*
 * Part of the SharedKey Auth (SKA) project.
 *
 * SPDX-FileCopyrightText: 2025 SKA contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SharedKey Auth (SKA). See LICENSE for details.
 */

#include "ska/internal/secret_cache.hpp"
#include "ska/internal/utils.hpp"

namespace ska::internal {

SecretCache::SecretCache(std::chrono::seconds ttl, std::size_t max_entries)
    : _ttl(ttl), _max_entries(max_entries) {}

SecretCache::~SecretCache() {
    for (auto& kv : _map) secure_wipe(kv.second.secret);
}

SecretCache::Hit SecretCache::get(const std::string& account, std::string& secret_out) {
    std::lock_guard<std::mutex> lk(_mtx);
    auto it = _map.find(account);
    if (it == _map.end()) return Hit::Miss;
    if (std::chrono::steady_clock::now() >= it->second.expires) {
        secure_wipe(it->second.secret);
        _map.erase(it);
        return Hit::Miss;
    }
    if (it->second.secret.empty()) return Hit::Unknown;
    secret_out = it->second.secret;
    return Hit::Known;
}

void SecretCache::put_known(const std::string& account, const std::string& secret) {
    if (secret.empty()) return;
    put(account, secret);
}

void SecretCache::put_unknown(const std::string& account) {
    put(account, std::string());
}

void SecretCache::put(const std::string& account, const std::string& secret) {
    std::lock_guard<std::mutex> lk(_mtx);
    if (_max_entries == 0) return;
    const auto now = std::chrono::steady_clock::now();
    if (_map.size() >= _max_entries && _map.find(account) == _map.end()) {
        evict_locked(now);
    }
    Entry& e = _map[account];
    secure_wipe(e.secret);
    e.secret  = secret;
    e.expires = now + _ttl;
}

// Expired entries first; if still full, an arbitrary live one.
void SecretCache::evict_locked(std::chrono::steady_clock::time_point now) {
    for (auto it = _map.begin(); it != _map.end(); ) {
        if (now >= it->second.expires) {
            secure_wipe(it->second.secret);
            it = _map.erase(it);
        } else {
            ++it;
        }
    }
    if (_map.size() >= _max_entries && !_map.empty()) {
        auto it = _map.begin();
        secure_wipe(it->second.secret);
        _map.erase(it);
    }
}

void SecretCache::reset(std::chrono::seconds ttl, std::size_t max_entries) {
    std::lock_guard<std::mutex> lk(_mtx);
    for (auto& kv : _map) secure_wipe(kv.second.secret);
    _map.clear();
    _ttl = ttl;
    _max_entries = max_entries;
}

std::size_t SecretCache::size() const {
    std::lock_guard<std::mutex> lk(_mtx);
    return _map.size();
}

} // namespace ska::internal
