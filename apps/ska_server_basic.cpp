/*
 * Part of the SharedKey Auth (SKA) project.
 *
 * SPDX-FileCopyrightText: 2025 SKA contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SharedKey Auth (SKA). See LICENSE for details.
 */

#include "ska/log.hpp"
#include "ska/server.hpp"
#include "ska/server_config.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <unistd.h>   // dup2, STDOUT_FILENO, STDERR_FILENO
#include <fcntl.h>    // open

// Silences all console output by redirecting stdout/stderr to /dev/null.
static void make_process_quiet() {
    int nullfd = ::open("/dev/null", O_WRONLY);
    if (nullfd >= 0) {
        (void)::dup2(nullfd, STDOUT_FILENO);
        (void)::dup2(nullfd, STDERR_FILENO);
        ::close(nullfd);
    }
}

static void usage(const char* argv0) {
    std::cerr <<
      "Usage:\n  " << argv0
      << " --port <n> [--auth_file <path>]\n"
         "  [--max_age <sec>] [--clock_skew <sec>] [--expired_status 401|403]\n"
         "  [--scheme SharedKey] [--ts_header X-SKA-Date]\n"
         "  [--redact_errors 0|1] [--log_unknown_account 0|1]\n"
         "  [--max_body <bytes>] [--ka_timeout <sec>] [--ka_max <n>]\n"
         "  [--log_file <path>] [--quiet 0|1]   (suppress all console logs when 1)\n"
         "  Redis secret backend:\n"
         "    --auth_redis 1 "
         "[--redis_host 127.0.0.1] [--redis_port 6379] [--redis_db 0]\n"
         "    [--redis_password ****] [--redis_prefix ska:key:] [--redis_pool 8]\n"
         "    [--redis_timeout_ms 200] [--auth_cache_ttl 60]\n";
}

int main(int argc, char** argv) {
    ska::ServerConfig cfg;
    bool quiet = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--port" && i+1 < argc) cfg.port = (uint16_t)std::stoi(argv[++i]);
            else if (a == "--auth_file" && i+1 < argc) cfg.auth_file = argv[++i];
            else if (a == "--max_age" && i+1 < argc) cfg.max_age_sec = std::stoi(argv[++i]);
            else if (a == "--clock_skew" && i+1 < argc) cfg.clock_skew_sec = std::stoi(argv[++i]);
            else if (a == "--expired_status" && i+1 < argc) cfg.expired_status = std::stoi(argv[++i]);
            else if (a == "--scheme" && i+1 < argc) cfg.scheme = argv[++i];
            else if (a == "--ts_header" && i+1 < argc) cfg.timestamp_header = argv[++i];
            else if (a == "--redact_errors" && i+1 < argc) cfg.redact_errors = (std::stoi(argv[++i]) != 0);
            else if (a == "--log_unknown_account" && i+1 < argc) cfg.log_unknown_account = (std::stoi(argv[++i]) != 0);
            else if (a == "--max_body" && i+1 < argc) cfg.max_body = (size_t)std::stoull(argv[++i]);
            else if (a == "--ka_timeout" && i+1 < argc) cfg.ka_timeout_sec = std::stoi(argv[++i]);
            else if (a == "--ka_max" && i+1 < argc) cfg.ka_max = std::stoi(argv[++i]);
            else if (a == "--log_file" && i+1 < argc) cfg.log_file = argv[++i];
            else if (a == "--quiet" && i+1 < argc) quiet = (std::stoi(argv[++i]) != 0);

            // Redis backend flags
            else if (a == "--auth_redis" && i+1 < argc) cfg.auth_use_redis = (std::stoi(argv[++i]) != 0);
            else if (a == "--redis_host" && i+1 < argc) cfg.redis.host = argv[++i];
            else if (a == "--redis_port" && i+1 < argc) cfg.redis.port = std::stoi(argv[++i]);
            else if (a == "--redis_db" && i+1 < argc)   cfg.redis.db = std::stoi(argv[++i]);
            else if (a == "--redis_password" && i+1<argc) cfg.redis.password = argv[++i];
            else if (a == "--redis_prefix" && i+1<argc)   cfg.redis.key_prefix = argv[++i];
            else if (a == "--redis_pool" && i+1<argc)     cfg.redis.pool_size = std::stoi(argv[++i]);
            else if (a == "--redis_timeout_ms" && i+1<argc) cfg.redis.timeout_ms = std::stoi(argv[++i]);
            else if (a == "--auth_cache_ttl" && i+1<argc)   cfg.redis.cache_ttl_sec = std::stoi(argv[++i]);

            else { usage(argv[0]); return 2; }
        }
    } catch (const std::logic_error& e) {
        // std::stoi and friends: invalid_argument / out_of_range
        std::cerr << "Bad numeric flag value: " << e.what() << "\n";
        usage(argv[0]);
        return 2;
    }

    // Apply quiet mode before any logging can occur.
    if (quiet) {
        make_process_quiet();
    }
    if (!cfg.log_file.empty()) {
        ska::set_log_file(cfg.log_file);
    }

    // Secret backend requirement
    if (!cfg.auth_use_redis && cfg.auth_file.empty()) {
        std::cerr << "Either --auth_file (file backend) or --auth_redis 1 (Redis backend) must be provided\n";
        return 2;
    }

    try {
        ska::Server srv(cfg);
        srv.run();  // blocking
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] exception: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
