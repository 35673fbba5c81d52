/*
 * Part of the JoinTrust (JT) project.
 *
 * SPDX-FileCopyrightText: 2025 JoinTrust contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of JoinTrust (JT). See LICENSE for details.
 */

#pragma once
#include <openssl/ssl.h>
#include <string>
#include "jt/client_config.hpp"
#include "jt/types.hpp"

namespace jt::internal {

// TLS client context for a single request. Trust comes from the system
// store (or cfg.tls_ca_file/dir), from a pinned PEM bundle, or is
// switched off entirely for the bootstrap download.
class TlsClientContext {
public:
    TlsClientContext(const jt::ClientConfig& cfg, const jt::TlsTrust& trust);
    ~TlsClientContext();

    SSL_CTX* ctx() const { return _ctx; }
    bool verify_peer() const { return _verify; }

    // Empty when the context is usable.
    const std::string& error() const { return _error; }

    // non-copyable
    TlsClientContext(const TlsClientContext&) = delete;
    TlsClientContext& operator=(const TlsClientContext&) = delete;

private:
    SSL_CTX* _ctx = nullptr;
    bool _verify = true;
    std::string _error;

    bool load_pinned_bundle(const std::string& pem);
    void fail(const char* where);
};

// Drain the OpenSSL error queue into one string (and the log).
std::string drain_openssl_errors(const char* tag, const char* where);

} // namespace jt::internal
