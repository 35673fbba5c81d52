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

namespace jt {

// Public client configuration. Per-instance; passed explicitly to the
// transport, bootstrapper and fetcher (there are no process-wide clients).
struct ClientConfig {
    // Limit for one whole request: connect, proxy tunnel, TLS handshake,
    // writing the request and reading the full response.
    int timeout_ms = 5000;

    // Forward proxies, "http://[user:pass@]host:port" (scheme optional).
    // Empty: connect directly. See load_proxy_env().
    std::string http_proxy;
    std::string https_proxy;
    // Comma-separated hosts, domains (".example.com"), IPs or CIDRs that
    // bypass the proxy; "*" disables proxying.
    std::string no_proxy;

    // Default trust store override. Empty: OpenSSL default verify paths.
    std::string tls_ca_file;
    std::string tls_ca_dir;

    // Upper bound for response head + body
    std::size_t max_response_bytes = 16u << 20;

    std::string user_agent = "jt-client/1";

    // Logging; empty means stderr only
    std::string log_file;
};

// Fill the proxy fields from HTTPS_PROXY, HTTP_PROXY and NO_PROXY (the
// lowercase names are used when the uppercase ones are unset or empty).
void load_proxy_env(ClientConfig& cfg);

} // namespace jt
