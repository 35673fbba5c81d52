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
#include "jt/client_config.hpp"
#include "jt/internal/url.hpp"

namespace jt::internal {

// True when `target` is dialled directly: "localhost", loopback IPs, or a
// match in the comma-separated `no_proxy` list. Entries may carry a port
// ("host:8443"); "example.com" also matches its subdomains, ".example.com"
// only the subdomains.
bool bypass_proxy(const Url& target, const std::string& no_proxy);

// Pick the forward proxy for `target` (https_proxy for https, http_proxy
// for http). `use` is false for a direct connection. Returns false with
// `err` when the configured proxy address is unusable; only plain http
// proxies are supported.
bool select_proxy(const Url& target, const jt::ClientConfig& cfg,
                  bool& use, Url& proxy, std::string& err);

// Proxy-Authorization value ("Basic ...") for a proxy URL with credentials,
// empty otherwise.
std::string proxy_authorization(const Url& proxy);

} // namespace jt::internal
