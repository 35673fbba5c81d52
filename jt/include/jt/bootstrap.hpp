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
#include "jt/status.hpp"
#include "jt/transport.hpp"
#include "jt/types.hpp"

namespace jt {

// Verified CA bundle. Empty pem means the host's default trust store is
// already sufficient; checksum is then empty as well.
struct CaBundle {
    std::string pem;
    std::string checksum;   // lowercase hex SHA-256 of pem

    bool empty() const { return pem.empty(); }
};

// Obtains a server's CA bundle with nothing but the join token as root of
// trust.
//
// 1. Try https://{host}/cacerts (machine tokens: /v1-rancheros/cacerts)
//    through the default trust store. Any response means the server
//    certificate already verifies: the result is an empty bundle.
// 2. Otherwise repeat the request without certificate verification,
//    sending a fresh nonce in X-Cattle-Nonce and base64(sha256(token)) as
//    bearer. The body is accepted only if X-Cattle-Hash equals
//    base64(HMAC-SHA512(token, nonce 0x00 body 0x00)).
class TrustBootstrapper {
public:
    explicit TrustBootstrapper(HttpTransport& transport);

    Status ca_certs(const std::string& server,
                    const std::string& token,
                    TokenScope scope,
                    CaBundle& out) const;

    // Well-known endpoint path for a token scope.
    static const char* cacerts_path(TokenScope scope);

private:
    HttpTransport& _transport;
};

} // namespace jt
