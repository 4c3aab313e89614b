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
#include <cstddef>

namespace ska::internal {

// Output size of the signing MAC (HMAC-SHA256).
constexpr std::size_t kMacSize = 32;

// HMAC-SHA256(key, msg) -> 32 bytes (binary) as std::string
bool hmac_sha256_bin(const std::string& key_bin,
                     const std::string& msg,
                     std::string& out_bin);

} // namespace ska::internal
