/*
 * Part of the JoinTrust (JT) project.
 *
 * SPDX-FileCopyrightText: 2025 JoinTrust contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of JoinTrust (JT). See LICENSE for details.
 */

#pragma once
#include <string>

namespace jt::internal {

// HMAC-SHA512(key, msg) -> 64 bytes (binary) as std::string
bool hmac_sha512_bin(const std::string& key,
                     const std::string& msg,
                     std::string& out_bin);

// base64(HMAC-SHA512(key = token, nonce || 0x00 || body || 0x00)).
// This is the value the server puts in X-Cattle-Hash. Empty on failure.
std::string response_hash(const std::string& token,
                          const std::string& nonce,
                          const std::string& body);

// Compare a received X-Cattle-Hash against the locally computed one.
// A missing header never verifies.
bool verify_response_hash(const std::string& token,
                          const std::string& nonce,
                          const std::string& body,
                          const std::string& received_b64);

} // namespace jt::internal
