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
#include <utility>
#include <vector>
#include "ska/http_request.hpp"

namespace ska::internal {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

// Parse "GET /path?x=1 HTTP/1.1"
bool parse_request_line(const std::string& line, ska::HttpRequest& r);

// Parse "Name: value" header lines (CRLF separated, no request line) into r.headers.
bool parse_header_block(const std::string& block, ska::HeaderList& out);

// Percent-decode ('+' is a space). Malformed escapes are kept verbatim.
std::string url_decode(const std::string& s);

// Parse query string into decoded (key, value) pairs, order and repeats kept.
QueryParams parse_query(const std::string& q);

// Make sorted canonical query string
std::string canonical_query_sorted(QueryParams params);

// Case-insensitive header lookup (first match, empty when absent)
std::string hdr_ci(const ska::HttpRequest& R, const char* name);
std::string hdr_ci(const ska::HeaderList& H, const char* name);

// All values of a header, in arrival order.
std::vector<std::string> hdr_ci_all(const ska::HeaderList& H, const std::string& name);

} // namespace ska::internal
