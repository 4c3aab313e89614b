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
#include "ska/client_config.hpp"
#include "ska/http_request.hpp"

namespace ska::internal {

// RAII TCP connection with timeouts and basic send/recv helpers.
class TcpConn {
public:
    TcpConn() = default;
    ~TcpConn();

    TcpConn(const TcpConn&) = delete;
    TcpConn& operator=(const TcpConn&) = delete;

    // Open TCP connection to cfg.host:cfg.port with timeouts.
    bool open(const ska::ClientConfig& cfg);

    void close();
    int  fd() const { return _fd; }

    bool send_all(const char* d, std::size_t len);
    bool recv_until(std::string& out, const std::string& delim, std::size_t max_total = (1u<<20));

private:
    int _fd = -1;
};

// Parse the head of an HTTP/1.1 response. hdr_end_off is the offset of the
// body in `head_and_maybe_body`.
bool parse_http_response(const std::string& head_and_maybe_body,
                         std::size_t& hdr_end_off,
                         int& status_code,
                         std::string& status_text,
                         ska::HeaderList& headers);

// Request line, headers (with Host and Content-Length) and body.
std::string serialize_request(const ska::HttpRequest& r, const std::string& host);

} // namespace ska::internal
