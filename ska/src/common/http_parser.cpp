/*
 * Part of the SharedKey Auth (SKA) project.
 *
 * SPDX-FileCopyrightText: 2025 SKA contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SharedKey Auth (SKA). See LICENSE for details.
 */

#include "ska/internal/http_parser.hpp"
#include "ska/internal/utils.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <strings.h> // strcasecmp

namespace ska::internal {

bool parse_request_line(const std::string& line, ska::HttpRequest& r) {
    std::istringstream iss(line);
    std::string target;
    if (!(iss >> r.method >> target >> r.httpver)) return false;
    std::string extra;
    if (iss >> extra) return false;
    if (r.httpver != "HTTP/1.1" && r.httpver != "HTTP/1.0") return false;
    if (target.empty() || target[0] != '/') return false;

    const std::size_t q = target.find('?');
    if (q == std::string::npos) {
        r.path = target;
        r.query.clear();
    } else {
        r.path  = target.substr(0, q);
        r.query = target.substr(q + 1);
    }
    return true;
}

bool parse_header_block(const std::string& block, ska::HeaderList& out) {
    out.clear();
    std::size_t pos = 0;
    while (pos < block.size()) {
        std::size_t next = block.find("\r\n", pos);
        if (next == std::string::npos) next = block.size();
        std::string line = block.substr(pos, next - pos);
        pos = next + 2;
        if (line.empty()) continue;
        // obsolete line folding is not accepted
        if (line[0] == ' ' || line[0] == '\t') return false;
        std::size_t c = line.find(':');
        if (c == std::string::npos || c == 0) return false;
        std::string k = line.substr(0, c), v = line.substr(c + 1);
        // no whitespace or CTL in names, no CTL but HTAB in values
        for (unsigned char ch : k) {
            if (ch <= 0x20 || ch == 0x7f) return false;
        }
        for (unsigned char ch : v) {
            if ((ch < 0x20 && ch != '\t') || ch == 0x7f) return false;
        }
        trim_inplace(v);
        out.emplace_back(std::move(k), std::move(v));
    }
    return true;
}

std::string url_decode(const std::string& s) {
    std::string o; o.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            int hi = hexval(s[i+1]), lo = hexval(s[i+2]);
            if (hi >= 0 && lo >= 0) { o.push_back((char)((hi << 4) | lo)); i += 2; continue; }
        }
        if (s[i] == '+') { o.push_back(' '); continue; }
        o.push_back(s[i]);
    }
    return o;
}

QueryParams parse_query(const std::string& q) {
    QueryParams out;
    std::size_t p = 0;
    while (p <= q.size()) {
        std::size_t amp = q.find('&', p);
        if (amp == std::string::npos) amp = q.size();
        const std::string item = q.substr(p, amp - p);
        if (!item.empty()) {
            const std::size_t eq = item.find('=');
            if (eq == std::string::npos) {
                out.emplace_back(url_decode(item), std::string());
            } else {
                out.emplace_back(url_decode(item.substr(0, eq)),
                                 url_decode(item.substr(eq + 1)));
            }
        }
        p = amp + 1;
    }
    return out;
}

std::string canonical_query_sorted(QueryParams params) {
    auto enc = [](const std::string& s){
        static const char* H = "0123456789ABCDEF";
        std::string out; out.reserve(s.size() * 3);
        for (unsigned char c : s) {
            if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
                out.push_back((char)c);
            } else {
                out.push_back('%');
                out.push_back(H[c >> 4]);
                out.push_back(H[c & 0xF]);
            }
        }
        return out;
    };

    std::sort(params.begin(), params.end());
    std::string out;
    bool first = true;
    for (const auto& kv : params) {
        if (!first) out.push_back('&');
        first = false;
        out += enc(kv.first);
        out.push_back('=');
        out += enc(kv.second);
    }
    return out;
}

std::string hdr_ci(const ska::HeaderList& H, const char* name) {
    for (const auto& kv : H) {
        if (strcasecmp(kv.first.c_str(), name) == 0) return kv.second;
    }
    return {};
}

std::string hdr_ci(const ska::HttpRequest& R, const char* name) {
    return hdr_ci(R.headers, name);
}

std::vector<std::string> hdr_ci_all(const ska::HeaderList& H, const std::string& name) {
    std::vector<std::string> out;
    for (const auto& kv : H) {
        if (strcasecmp(kv.first.c_str(), name.c_str()) == 0) out.push_back(kv.second);
    }
    return out;
}

} // namespace ska::internal

namespace ska {

const std::string* find_header(const HttpRequest& r, const std::string& name) {
    for (const auto& kv : r.headers) {
        if (strcasecmp(kv.first.c_str(), name.c_str()) == 0) return &kv.second;
    }
    return nullptr;
}

void set_header(HttpRequest& r, const std::string& name, const std::string& value) {
    r.headers.erase(std::remove_if(r.headers.begin(), r.headers.end(),
                                   [&](const std::pair<std::string, std::string>& kv) {
                                       return strcasecmp(kv.first.c_str(), name.c_str()) == 0;
                                   }),
                    r.headers.end());
    r.headers.emplace_back(name, value);
}

std::string request_target(const HttpRequest& r) {
    if (r.query.empty()) return r.path;
    return r.path + "?" + r.query;
}

} // namespace ska
