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

namespace ska::internal {

struct Credential {
    std::string account;
    std::string signature; // raw MAC bytes (kMacSize)
};

// Parse "<scheme> <account>:<base64-signature>". Anything else is rejected
// with a short reason ("BAD_SCHEME", "BAD_CREDENTIAL", "BAD_SIGNATURE_ENCODING",
// "BAD_SIGNATURE_LENGTH").
bool parse_authorization(const std::string& header,
                         const std::string& scheme,
                         Credential& out,
                         std::string& reason);

} // namespace ska::internal
