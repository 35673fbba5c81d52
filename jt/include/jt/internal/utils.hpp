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
#include <cstddef>
#include <unordered_map>

namespace jt::internal {

void trim_inplace(std::string& s);
int  hexval(char c);
std::string bytes_to_hex(const unsigned char* p, std::size_t n);
std::string lower_copy(std::string s);
void secure_wipe(std::string& s);

// Standard base64 with padding (OpenSSL EVP_EncodeBlock).
std::string base64_encode(const std::string& data);

// Lowercase hex SHA-256; used as the CA bundle checksum.
std::string sha256_hex(const std::string& data);

// base64(SHA-256(data)); the bootstrap bearer credential.
std::string sha256_base64(const std::string& data);

// Random token of `len` chars over [bcdfghjklmnpqrstvwxz2456789]
// (OpenSSL RAND_bytes, rejection sampled). Empty on RNG failure.
std::string random_token(std::size_t len = 54);

// Case-insensitive header lookup.
std::string hdr_ci(const std::unordered_map<std::string,std::string>& H, const char* name);

} // namespace jt::internal
