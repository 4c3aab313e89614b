/*
 * Part of the SharedKey Auth (SKA) project.
 *
 * SPDX-FileCopyrightText: 2025 SKA contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SharedKey Auth (SKA). See LICENSE for details.
 */

#include "ska/internal/canonical.hpp"
#include "ska/internal/http_parser.hpp"
#include "ska/internal/utils.hpp"
#include "ska/wire.hpp"

#include <cstring>
#include <map>
#include <vector>

namespace ska::internal {

namespace {

bool has_line_break(const std::string& v) {
    return v.find_first_of("\r\n") != std::string::npos;
}

// Trim and fold runs of linear whitespace into one space.
std::string fold_value(const std::string& v) {
    std::string out;
    out.reserve(v.size());
    bool in_ws = false;
    for (char c : v) {
        if (c == ' ' || c == '\t') {
            in_ws = true;
            continue;
        }
        if (in_ws && !out.empty()) out.push_back(' ');
        in_ws = false;
        out.push_back(c);
    }
    return out;
}

} // namespace

std::string canonical_resource(const ska::HttpRequest& R) {
    std::string out = R.path.empty() ? std::string("/") : R.path;
    const std::string qcanon = canonical_query_sorted(parse_query(R.query));
    if (!qcanon.empty()) {
        out.push_back('?');
        out += qcanon;
    }
    return out;
}

std::string canonical_extension_headers(const ska::HeaderList& H,
                                        const std::string& timestamp_header)
{
    const std::string prefix = kExtensionHeaderPrefix;
    const std::string ts_name = lower_copy(timestamp_header);

    // std::map keeps names sorted; vectors keep arrival order per name.
    std::map<std::string, std::vector<std::string>> grouped;
    for (const auto& kv : H) {
        std::string name = lower_copy(kv.first);
        if (name.compare(0, prefix.size(), prefix) != 0) continue;
        if (name == ts_name) continue;
        grouped[name].push_back(fold_value(kv.second));
    }

    std::string out;
    bool first = true;
    for (const auto& g : grouped) {
        if (!first) out.push_back('\n');
        first = false;
        out += g.first;
        out.push_back(':');
        for (std::size_t i = 0; i < g.second.size(); ++i) {
            if (i) out.push_back(',');
            out += g.second[i];
        }
    }
    return out;
}

CanonicalResult build_string_to_sign(const ska::HttpRequest& R,
                                     const std::string& timestamp_header)
{
    CanonicalResult res;

    // A signed field must appear once and stay on one line.
    for (const std::string& name : {timestamp_header, std::string(kContentTypeHeader),
                                    std::string(kContentHashHeader)}) {
        const std::vector<std::string> all = hdr_ci_all(R.headers, name);
        if (all.size() > 1 || (all.size() == 1 && has_line_break(all[0]))) {
            res.error = CanonError::MalformedField;
            res.field = name;
            return res;
        }
    }
    for (const auto& kv : R.headers) {
        if (lower_copy(kv.first).compare(0, std::strlen(kExtensionHeaderPrefix),
                                         kExtensionHeaderPrefix) != 0) continue;
        if (has_line_break(kv.first) || has_line_break(kv.second) ||
            kv.first.find(':') != std::string::npos) {
            res.error = CanonError::MalformedField;
            res.field = kv.first;
            return res;
        }
    }

    const std::string* ts = ska::find_header(R, timestamp_header);
    if (!ts || ts->empty()) {
        res.error = CanonError::MissingField;
        res.field = timestamp_header;
        return res;
    }

    const std::string* ctype = ska::find_header(R, kContentTypeHeader);
    const std::string* chash = ska::find_header(R, kContentHashHeader);

    // A body must be bound to the signature through its type and digest.
    if (!R.body.empty()) {
        if (!ctype || ctype->empty()) {
            res.error = CanonError::MissingField;
            res.field = kContentTypeHeader;
            return res;
        }
        if (!chash || chash->empty()) {
            res.error = CanonError::MissingField;
            res.field = kContentHashHeader;
            return res;
        }
    }

    std::string hash_v;
    if (chash) {
        hash_v = lower_copy(*chash);
        trim_inplace(hash_v);
        if (hash_v.size() != 64 || !is_hex(hash_v)) {
            res.error = CanonError::MalformedField;
            res.field = kContentHashHeader;
            return res;
        }
    }

    std::string ctype_v = ctype ? *ctype : std::string();
    trim_inplace(ctype_v);
    std::string ts_v = *ts;
    trim_inplace(ts_v);

    std::string s;
    s.reserve(128 + R.path.size() + R.query.size());
    s += upper_copy(R.method);
    s.push_back('\n');
    s += hash_v;
    s.push_back('\n');
    s += ctype_v;
    s.push_back('\n');
    s += ts_v;
    s.push_back('\n');
    s += canonical_resource(R);
    s.push_back('\n');
    s += canonical_extension_headers(R.headers, timestamp_header);

    res.value = std::move(s);
    return res;
}

} // namespace ska::internal
