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
#include "jt/bootstrap.hpp"
#include "jt/status.hpp"
#include "jt/token_resolver.hpp"
#include "jt/transport.hpp"
#include "jt/types.hpp"

namespace jt {

struct FetchResult {
    std::string body;
    std::string ca_checksum;  // checksum of the CA bundle used; empty for the default store
};

// Authenticated GET of a server resource after bootstrapping trust with
// TrustBootstrapper. The resource client is pinned to the verified bundle,
// or uses the default store when the bundle is empty.
class TrustedFetcher {
public:
    // `hardware` may be null; hardware-backed tokens then fail with a
    // configuration error.
    TrustedFetcher(HttpTransport& transport,
                   const TokenResolver& resolver,
                   HardwareRetriever* hardware = nullptr);

    // Cluster-scoped token: no bearer header on the resource request.
    Status get(const std::string& server, const std::string& token,
               const std::string& path, FetchResult& out) const;

    // Machine-scoped token: resolved first (may be hardware-backed),
    // sent as base64(token) bearer.
    Status machine_get(const std::string& server, const std::string& token,
                       const std::string& path, FetchResult& out) const;

    Status fetch(const std::string& server, const std::string& token,
                 const std::string& path, TokenScope scope, FetchResult& out) const;

private:
    HttpTransport& _transport;
    TrustBootstrapper _bootstrap;
    const TokenResolver& _resolver;
    HardwareRetriever* _hardware;
};

} // namespace jt
