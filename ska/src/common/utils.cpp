/*
 * Part of the SharedKey Auth (SKA) project.
 *
 * SPDX-FileCopyrightText: 2025 SKA contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SharedKey Auth (SKA). See LICENSE for details.
 */

#include "ska/internal/utils.hpp"
#include <algorithm>
#include <cctype>
#include <vector>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

namespace ska::internal {

void trim_inplace(std::string& s) {
    std::size_t a = 0;
    while (a < s.size() && std::isspace((unsigned char)s[a])) ++a;
    std::size_t b = s.size();
    while (b > a && std::isspace((unsigned char)s[b-1])) --b;
    if (a > 0 || b < s.size()) s.assign(s.begin()+a, s.begin()+b);
}

int hexval(char c){
    if(c>='0'&&c<='9')return c-'0';
    if(c>='a'&&c<='f')return 10+(c-'a');
    if(c>='A'&&c<='F')return 10+(c-'A');
    return -1;
}

bool is_hex(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](char c){ return hexval(c) >= 0; });
}

bool hex_to_bytes(const std::string& hex, std::string& out){
    if(hex.size() % 2) return false;
    out.clear(); out.reserve(hex.size()/2);
    for(std::size_t i=0;i<hex.size(); i+=2){
        int h=hexval(hex[i]); int l=hexval(hex[i+1]);
        if(h<0 || l<0) return false;
        out.push_back((char)((h<<4)|l));
    }
    return true;
}

std::string bytes_to_hex(const unsigned char* p, std::size_t n){
    static const char* H="0123456789abcdef";
    std::string s; s.resize(n*2);
    for(std::size_t i=0;i<n;++i){ s[2*i]=H[p[i]>>4]; s[2*i+1]=H[p[i]&0xF]; }
    return s;
}

std::string base64_encode(const std::string& bin) {
    if (bin.empty()) return {};
    std::vector<unsigned char> out(4 * ((bin.size() + 2) / 3) + 1);
    const int n = EVP_EncodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(bin.data()),
                                  (int)bin.size());
    if (n < 0) return {};
    return std::string(reinterpret_cast<const char*>(out.data()), (std::size_t)n);
}

bool base64_decode_strict(const std::string& b64, std::string& out_bin) {
    out_bin.clear();
    if (b64.empty() || b64.size() % 4 != 0) return false;

    std::size_t pad = 0;
    if (b64[b64.size()-1] == '=') ++pad;
    if (b64[b64.size()-2] == '=') ++pad;
    for (std::size_t i = 0; i < b64.size() - pad; ++i) {
        const unsigned char c = (unsigned char)b64[i];
        if (!(std::isalnum(c) || c == '+' || c == '/')) return false;
    }

    std::vector<unsigned char> out(3 * (b64.size() / 4) + 1);
    const int n = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(b64.data()),
                                  (int)b64.size());
    if (n < 0 || (std::size_t)n < pad) return false;

    // EVP_DecodeBlock keeps the zero bytes produced by padding.
    out_bin.assign(reinterpret_cast<const char*>(out.data()), (std::size_t)n - pad);

    // Reject non-canonical encodings (stray bits in the last symbol).
    if (base64_encode(out_bin) != b64) {
        secure_wipe(out_bin);
        return false;
    }
    return true;
}

std::string sha256_hex(const std::string& data) {
    unsigned char d[SHA256_DIGEST_LENGTH];
    SHA256((const unsigned char*)data.data(), data.size(), d);
    return bytes_to_hex(d, SHA256_DIGEST_LENGTH);
}

bool ct_equal(const std::string& a, const std::string& b){
    if(a.size()!=b.size()) return false;
    if(a.empty()) return true;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string upper_copy(std::string s){
    for(char& c: s) c = (char)std::toupper((unsigned char)c);
    return s;
}
std::string lower_copy(std::string s){
    for(char& c: s) c = (char)std::tolower((unsigned char)c);
    return s;
}

void secure_wipe(std::string& s){
    if(!s.empty()){
        OPENSSL_cleanse(s.data(), s.size());
        s.clear();
        s.shrink_to_fit();
    }
}

std::string random_bytes(std::size_t n){
    std::string b; b.resize(n);
    if (RAND_bytes((unsigned char*)b.data(), (int)b.size()) != 1) return {};
    return b;
}

} // namespace ska::internal
