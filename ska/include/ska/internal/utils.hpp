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
#include <cstdint>

namespace ska::internal {

// Trim spaces from both sides (in-place).
void trim_inplace(std::string& s);

// Hex helpers
int  hexval(char c);
bool is_hex(const std::string& s);
bool hex_to_bytes(const std::string& hex, std::string& out);
std::string bytes_to_hex(const unsigned char* p, std::size_t n);

// Standard base64 (RFC 4648, padded). Decoding rejects anything that would
// not re-encode to exactly the same text.
std::string base64_encode(const std::string& bin);
bool base64_decode_strict(const std::string& b64, std::string& out_bin);

// SHA-256 as lowercase hex (uses OpenSSL from .cpp)
std::string sha256_hex(const std::string& data);

// Constant-time equality. Length mismatch returns false without touching
// the contents; equal lengths always compare every byte.
bool ct_equal(const std::string& a, const std::string& b);

// Upper / lower
std::string upper_copy(std::string s);
std::string lower_copy(std::string s);

// Securely wipe string contents
void secure_wipe(std::string& s);

// Cryptographically random bytes; empty string on RNG failure.
std::string random_bytes(std::size_t n);

} // namespace ska::internal
