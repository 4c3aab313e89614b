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

#include "ska/http_request.hpp"
#include "ska/signature_validator.hpp"

namespace ska {

struct SignerOptions {
    std::string scheme           = kDefaultScheme;
    std::string timestamp_header = kDefaultTimestampHeader;
    Clock now;                   // empty: system_clock::now
};

// Client side of SharedKey v1: produces the Authorization header the
// SignatureValidator accepts.
class Signer {
public:
    // `secret` is raw key bytes. Throws std::invalid_argument on an empty
    // account/secret or an account containing ':' or whitespace.
    Signer(std::string account, std::string secret, SignerOptions opt = {});
    ~Signer();

    Signer(const Signer&) = delete;
    Signer& operator=(const Signer&) = delete;

    // Sets the timestamp header (if absent), Content-SHA256 (non-empty body)
    // and Authorization. Returns false if the request cannot be signed.
    bool sign(HttpRequest& r) const;

    // Canonical string for `r` as it stands; empty if a field is missing.
    std::string string_to_sign(const HttpRequest& r) const;

    // Base64 MAC over `string_to_sign`; empty on failure.
    std::string signature(const std::string& string_to_sign) const;

    const std::string& account() const { return _account; }

private:
    std::string _account;
    std::string _secret;
    SignerOptions _opt;
};

} // namespace ska
