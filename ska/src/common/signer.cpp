/*
 * Part of the SharedKey Auth (SKA) project.
 *
 * SPDX-FileCopyrightText: 2025 SKA contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SharedKey Auth (SKA). See LICENSE for details.
 */

#include "ska/signer.hpp"
#include "ska/internal/canonical.hpp"
#include "ska/internal/hmac.hpp"
#include "ska/internal/time.hpp"
#include "ska/internal/utils.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace ska {

Signer::Signer(std::string account, std::string secret, SignerOptions opt)
    : _account(std::move(account)), _secret(std::move(secret)), _opt(std::move(opt))
{
    const bool bad_account =
        _account.empty() ||
        std::any_of(_account.begin(), _account.end(), [](char c){
            return c == ':' || std::isspace((unsigned char)c) != 0;
        });
    if (bad_account) {
        throw std::invalid_argument("Signer: account must be non-empty without ':' or whitespace");
    }
    if (_secret.empty()) {
        throw std::invalid_argument("Signer: secret must not be empty");
    }
}

Signer::~Signer() {
    internal::secure_wipe(_secret);
}

std::string Signer::string_to_sign(const HttpRequest& r) const {
    const internal::CanonicalResult canon = internal::build_string_to_sign(r, _opt.timestamp_header);
    if (canon.error != internal::CanonError::None) return {};
    return canon.value;
}

std::string Signer::signature(const std::string& sts) const {
    std::string mac;
    if (!internal::hmac_sha256_bin(_secret, sts, mac)) return {};
    std::string b64 = internal::base64_encode(mac);
    internal::secure_wipe(mac);
    return b64;
}

bool Signer::sign(HttpRequest& r) const {
    if (!find_header(r, _opt.timestamp_header)) {
        const auto now = _opt.now ? _opt.now() : std::chrono::system_clock::now();
        set_header(r, _opt.timestamp_header, internal::format_http_date(now));
    }
    if (!r.body.empty()) {
        set_header(r, kContentHashHeader, internal::sha256_hex(r.body));
    }

    const std::string sts = string_to_sign(r);
    if (sts.empty()) return false;
    const std::string sig = signature(sts);
    if (sig.empty()) return false;

    set_header(r, kAuthorizationHeader, _opt.scheme + " " + _account + ":" + sig);
    return true;
}

} // namespace ska
