/*
 * Part of the SharedKey Auth (SKA) project.
 *
 * SPDX-FileCopyrightText: 2025 SKA contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SharedKey Auth (SKA). See LICENSE for details.
 */

#include "ska/internal/hmac.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace ska::internal {

bool hmac_sha256_bin(const std::string& key_bin,
                     const std::string& msg,
                     std::string& out_bin)
{
    unsigned int mac_len = 0;
    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned char* p = HMAC(EVP_sha256(),
                            key_bin.data(), (int)key_bin.size(),
                            reinterpret_cast<const unsigned char*>(msg.data()),
                            msg.size(),
                            mac, &mac_len);
    if (!p || mac_len != kMacSize) return false;
    out_bin.assign(reinterpret_cast<const char*>(mac), kMacSize);
    return true;
}

} // namespace ska::internal
