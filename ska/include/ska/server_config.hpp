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
#include <cstddef>
#include <cstdint>
#include "ska/wire.hpp"

namespace ska {

struct ServerConfig {
    // Core
    uint16_t    port = 8080;          // 0: kernel-chosen, see Server::port()
    size_t      max_body = 2*1024*1024;
    size_t      max_header = 64*1024;
    std::string log_file;             // empty: stdout only

    // SharedKey verification
    int         max_age_sec    = 300;
    int         clock_skew_sec = 30;
    std::string scheme           = kDefaultScheme;
    std::string timestamp_header = kDefaultTimestampHeader;
    int         expired_status = 403; // 403 or 401
    bool        log_unknown_account = false;

    // Error redaction (403/412 bodies; 401 is always generic)
    bool redact_errors = false;

    // Keep-alive
    int  ka_timeout_sec = 5;
    int  ka_max         = 100;

    // Secret store: file, or Redis when auth_use_redis=true
    std::string auth_file;
    bool auth_use_redis = false;
    struct {
        std::string host = "127.0.0.1";
        int         port = 6379;
        int         db   = 0;
        std::string password;
        std::string key_prefix = "ska:key:";
        int         pool_size  = 8;
        int         timeout_ms = 200;
        int         cache_ttl_sec = 60;
        size_t      cache_max_entries = 100000;
    } redis;
};

} // namespace ska
