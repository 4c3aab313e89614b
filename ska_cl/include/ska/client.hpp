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
#include <memory>
#include "ska/client_config.hpp"
#include "ska/http_response.hpp"
#include "ska/internal/http_parser.hpp"

namespace ska {

// Keep-alive HTTP client that signs every request with SharedKey.
class Client {
public:
    // Throws std::invalid_argument on a bad account or secret_hex.
    explicit Client(const ClientConfig& cfg);
    ~Client();

    // GET /whoami
    bool whoami(HttpResponse& out);

    // POST /echo
    bool post_echo(const std::string& payload, HttpResponse& out);

    // Generic request:
    //  method: "GET" or "POST"
    //  path:   e.g. "/echo" (prefixed by base_path if set)
    //  query:  (key, value) pairs, sent in canonical order
    //  body:   request body; Content-Type and Content-SHA256 are added when non-empty
    bool request(const std::string& method,
                 const std::string& path,
                 const internal::QueryParams& query,
                 const std::string& body,
                 HttpResponse& out);

private:
    struct Impl;
    std::unique_ptr<Impl> _p;
};

} // namespace ska
