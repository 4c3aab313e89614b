/*
 * Part of the SharedKey Auth (SKA) project.
 *
 * SPDX-FileCopyrightText: 2025 SKA contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SharedKey Auth (SKA). See LICENSE for details.
 */

#pragma once

// SharedKey v1 wire contract.
//
//   Authorization: <scheme> <account>:<base64(HMAC-SHA256(secret, string-to-sign))>
//
//   string-to-sign = METHOD              "\n"
//                    Content-SHA256      "\n"   (lowercased, or empty)
//                    Content-Type        "\n"   (or empty)
//                    <timestamp header>  "\n"   (IMF-fixdate)
//                    canonical resource  "\n"   (path ["?" sorted query])
//                    extension headers          (sorted "name:value" lines)
//
// Changing anything here breaks every deployed signer.

namespace ska {

constexpr const char* kDefaultScheme          = "SharedKey";
constexpr const char* kDefaultTimestampHeader = "X-SKA-Date";
constexpr const char* kAuthorizationHeader    = "Authorization";
constexpr const char* kContentTypeHeader      = "Content-Type";
constexpr const char* kContentHashHeader      = "Content-SHA256";
constexpr const char* kExtensionHeaderPrefix  = "x-ska-";

} // namespace ska
