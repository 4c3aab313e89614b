/*
 * Part of the SharedKey Auth (SKA) project.
 *
 * SPDX-FileCopyrightText: 2025 SKA contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SharedKey Auth (SKA). See LICENSE for details.
 */

#include "ska/internal/credential.hpp"
#include "ska/internal/hmac.hpp"
#include "ska/internal/utils.hpp"

#include <algorithm>
#include <cctype>

namespace ska::internal {

bool parse_authorization(const std::string& header,
                         const std::string& scheme,
                         Credential& out,
                         std::string& reason)
{
    out = Credential{};

    // Exactly "<scheme> " then the credential, no tolerance for extra spaces.
    if (header.size() <= scheme.size() + 1 ||
        header.compare(0, scheme.size(), scheme) != 0 ||
        header[scheme.size()] != ' ')
    {
        reason = "BAD_SCHEME";
        return false;
    }

    const std::string cred = header.substr(scheme.size() + 1);
    const bool has_ws = std::any_of(cred.begin(), cred.end(),
                                    [](char c){ return std::isspace((unsigned char)c) != 0; });
    const std::size_t colon = cred.find(':');
    if (has_ws || colon == std::string::npos || colon == 0 ||
        cred.find(':', colon + 1) != std::string::npos)
    {
        reason = "BAD_CREDENTIAL";
        return false;
    }

    std::string sig;
    if (!base64_decode_strict(cred.substr(colon + 1), sig)) {
        reason = "BAD_SIGNATURE_ENCODING";
        return false;
    }
    if (sig.size() != kMacSize) {
        secure_wipe(sig);
        reason = "BAD_SIGNATURE_LENGTH";
        return false;
    }

    out.account   = cred.substr(0, colon);
    out.signature = std::move(sig);
    return true;
}

} // namespace ska::internal
