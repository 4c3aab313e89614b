/*
 * Part of the SharedKey Auth (SKA) project.
 *
 * SPDX-FileCopyrightText: 2025 SKA contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SharedKey Auth (SKA). See LICENSE for details.
 */

#pragma once
#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace ska::internal {

/**
 * TTL cache in front of a remote secret backend.
 * Accounts the backend reported absent are cached too, so after the first
 * lookup a known and an unknown account are both answered from memory.
 */
class SecretCache {
public:
    enum class Hit { Miss, Known, Unknown };

    explicit SecretCache(std::chrono::seconds ttl = std::chrono::seconds(60),
                         std::size_t max_entries = 100000);
    ~SecretCache();

    SecretCache(const SecretCache&) = delete;
    SecretCache& operator=(const SecretCache&) = delete;

    // Known: secret_out holds the secret. Unknown: cached absence.
    Hit get(const std::string& account, std::string& secret_out);

    void put_known(const std::string& account, const std::string& secret);
    void put_unknown(const std::string& account);

    // Drops every entry and applies new limits.
    void reset(std::chrono::seconds ttl, std::size_t max_entries);
    std::size_t size() const;

private:
    struct Entry {
        std::string secret;   // empty = account absent
        std::chrono::steady_clock::time_point expires;
    };

    void put(const std::string& account, const std::string& secret);
    void evict_locked(std::chrono::steady_clock::time_point now);

    mutable std::mutex _mtx;
    std::chrono::seconds _ttl;
    std::size_t _max_entries;
    std::unordered_map<std::string, Entry> _map;
};

} // namespace ska::internal
