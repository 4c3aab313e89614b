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

namespace ska {

// Header fields in arrival order. Names keep their wire spelling; lookups
// are case-insensitive.
using HeaderList = std::vector<std::pair<std::string, std::string>>;

// Plain HTTP request structure as produced by our parser.
struct HttpRequest {
    std::string method;   // "GET", "POST", ...
    std::string path;     // "/data", raw (not percent-decoded)
    std::string query;    // "a=1&b=2", raw, without '?'
    std::string httpver;  // "HTTP/1.1"
    HeaderList  headers;
    std::string body;
};

// First header named `name` (case-insensitive), or nullptr.
const std::string* find_header(const HttpRequest& r, const std::string& name);

// Replace every header named `name` with a single `name: value`.
void set_header(HttpRequest& r, const std::string& name, const std::string& value);

// "path?query" (or just "path" when the query is empty).
std::string request_target(const HttpRequest& r);

} // namespace ska
