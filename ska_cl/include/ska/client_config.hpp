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

// Public client configuration. Per-instance; thread-safe at call level.
struct ClientConfig {
    // Endpoint
    std::string host = "127.0.0.1";
    std::uint16_t port = 8080;
    std::string  base_path = "";   // optional path prefix, e.g. "/api"

    // Credentials (one account per client instance)
    std::string account;           // e.g. "device-001"
    std::string secret_hex;        // 32..128 hex chars

    // Wire contract
    std::string scheme           = kDefaultScheme;
    std::string timestamp_header = kDefaultTimestampHeader;
    std::string content_type     = "application/json"; // sent with a non-empty body

    // Timeouts
    int connect_timeout_sec = 5;   // TCP connect timeout
    int io_timeout_sec      = 5;   // recv/send timeout
    int ka_max              = 100; // max requests per connection before re-open

    // Logging
    std::string log_file = "client.log";
};

} // namespace ska
