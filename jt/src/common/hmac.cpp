/*
 * Part of the JoinTrust (JT) project.
 *
 * SPDX-FileCopyrightText: 2025 JoinTrust contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of JoinTrust (JT). See LICENSE for details.
 */

#include "jt/internal/hmac.hpp"
#include "jt/internal/utils.hpp"
#include <openssl/hmac.h>
#include <openssl/crypto.h>

namespace jt::internal {

bool hmac_sha512_bin(const std::string& key,
                     const std::string& msg,
                     std::string& out_bin)
{
    unsigned int mac_len = 0;
    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned char* p = HMAC(EVP_sha512(),
                            key.data(), (int)key.size(),
                            reinterpret_cast<const unsigned char*>(msg.data()),
                            msg.size(),
                            mac, &mac_len);
    if (!p || mac_len != 64) return false;
    out_bin.assign(reinterpret_cast<const char*>(mac), 64);
    return true;
}

std::string response_hash(const std::string& token,
                          const std::string& nonce,
                          const std::string& body)
{
    std::string msg;
    msg.reserve(nonce.size() + body.size() + 2);
    msg.append(nonce);
    msg.push_back('\0');
    msg.append(body);
    msg.push_back('\0');

    std::string mac;
    if (!hmac_sha512_bin(token, msg, mac)) return {};
    return base64_encode(mac);
}

bool verify_response_hash(const std::string& token,
                          const std::string& nonce,
                          const std::string& body,
                          const std::string& received_b64)
{
    if (received_b64.empty()) return false;
    const std::string expected = response_hash(token, nonce, body);
    if (expected.empty() || expected.size() != received_b64.size()) return false;
    return CRYPTO_memcmp(expected.data(), received_b64.data(), expected.size()) == 0;
}

} // namespace jt::internal
