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

namespace ska::internal {

enum class CanonError { None, MissingField, MalformedField };

struct CanonicalResult {
    CanonError  error = CanonError::None;
    std::string field;  // offending header when error != None
    std::string value;  // string to sign when error == None
};

// Shared by signer and verifier; see ska/wire.hpp for the layout.
CanonicalResult build_string_to_sign(const ska::HttpRequest& R,
                                     const std::string& timestamp_header);

std::string canonical_resource(const ska::HttpRequest& R);

std::string canonical_extension_headers(const ska::HeaderList& H,
                                        const std::string& timestamp_header);

} // namespace ska::internal
