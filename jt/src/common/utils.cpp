/*
 * Part of the JoinTrust (JT) project.
 *
 * SPDX-FileCopyrightText: 2025 JoinTrust contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of JoinTrust (JT). See LICENSE for details.
 */

#include "jt/internal/utils.hpp"
#include <cctype>
#include <strings.h> // strcasecmp
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <openssl/crypto.h>
#include <openssl/rand.h>

namespace jt::internal {

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

std::string bytes_to_hex(const unsigned char* p, std::size_t n){
    static const char* H="0123456789abcdef";
    std::string s; s.resize(n*2);
    for(std::size_t i=0;i<n;++i){ s[2*i]=H[p[i]>>4]; s[2*i+1]=H[p[i]&0xF]; }
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

std::string base64_encode(const std::string& data){
    if(data.empty()) return {};
    std::string out; out.resize(4*((data.size()+2)/3));
    const int n = EVP_EncodeBlock((unsigned char*)out.data(),
                                  (const unsigned char*)data.data(), (int)data.size());
    out.resize(n < 0 ? 0 : (std::size_t)n);
    return out;
}

std::string sha256_hex(const std::string& data) {
    unsigned char d[SHA256_DIGEST_LENGTH];
    SHA256((const unsigned char*)data.data(), data.size(), d);
    return bytes_to_hex(d, SHA256_DIGEST_LENGTH);
}

std::string sha256_base64(const std::string& data) {
    unsigned char d[SHA256_DIGEST_LENGTH];
    SHA256((const unsigned char*)data.data(), data.size(), d);
    return base64_encode(std::string((const char*)d, SHA256_DIGEST_LENGTH));
}

std::string random_token(std::size_t len){
    static const char alphabet[] = "bcdfghjklmnpqrstvwxz2456789";
    constexpr unsigned n_chars = sizeof(alphabet) - 1;
    // largest multiple of n_chars that fits in a byte; above it is rejected
    constexpr unsigned limit = 256 - (256 % n_chars);

    std::string out; out.reserve(len);
    unsigned char buf[64];
    while(out.size() < len){
        if(RAND_bytes(buf, (int)sizeof(buf)) != 1) return {};
        for(unsigned char b: buf){
            if(b >= limit) continue;
            out.push_back(alphabet[b % n_chars]);
            if(out.size() == len) break;
        }
    }
    return out;
}

std::string hdr_ci(const std::unordered_map<std::string,std::string>& H, const char* name){
    auto it = H.find(name);
    if (it != H.end()) return it->second;
    for (const auto& kv : H){
        if (strcasecmp(kv.first.c_str(), name)==0) return kv.second;
    }
    return {};
}

} // namespace jt::internal
