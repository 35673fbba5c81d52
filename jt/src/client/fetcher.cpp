/*
 * Part of the JoinTrust (JT) project.
 *
 * SPDX-FileCopyrightText: 2025 JoinTrust contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of JoinTrust (JT). See LICENSE for details.
 */

#include "jt/fetcher.hpp"
#include "jt/log.hpp"
#include "jt/internal/url.hpp"
#include "jt/internal/utils.hpp"
#include <utility>

namespace jt {

TrustedFetcher::TrustedFetcher(HttpTransport& transport,
                               const TokenResolver& resolver,
                               HardwareRetriever* hardware)
    : _transport(transport),
      _bootstrap(transport),
      _resolver(resolver),
      _hardware(hardware) {}

Status TrustedFetcher::get(const std::string& server, const std::string& token,
                           const std::string& path, FetchResult& out) const {
    return fetch(server, token, path, TokenScope::Cluster, out);
}

Status TrustedFetcher::machine_get(const std::string& server, const std::string& token,
                                   const std::string& path, FetchResult& out) const {
    return fetch(server, token, path, TokenScope::Machine, out);
}

Status TrustedFetcher::fetch(const std::string& server, const std::string& token,
                             const std::string& path, TokenScope scope,
                             FetchResult& out) const
{
    internal::Url url;
    std::string reason;
    if (!internal::parse_url(server, url, reason)) {
        return Status::error(ErrorKind::Configuration, "parse server URL: " + reason);
    }
    std::string p = (!path.empty() && path[0] == '/') ? path : "/" + path;
    const std::size_t q = p.find('?');
    if (q != std::string::npos) {
        url.query = p.substr(q + 1);
        p.erase(q);
    }
    url.path = p;

    ResolvedToken resolved;
    resolved.token = token;
    if (scope == TokenScope::Machine) {
        Status st = _resolver.resolve(token, resolved);
        if (!st.ok()) return st;
    }

    CaBundle ca;
    Status st = _bootstrap.ca_certs(server, resolved.token, scope, ca);
    if (!st.ok()) return st;

    if (resolved.hardware_backed) {
        if (!_hardware) {
            return Status::error(ErrorKind::Configuration,
                                 "hardware-backed token but no hardware retriever configured");
        }
        jt::log_line("[FETCH] " + url.str() + " via hardware-backed identity");
        std::string body;
        st = _hardware->get(ca, url.str(), body);
        if (!st.ok()) return st;
        out.body = std::move(body);
        out.ca_checksum = ca.checksum;
        return {};
    }

    HttpHeaders headers;
    if (scope == TokenScope::Machine) {
        headers["Authorization"] = "Bearer " + internal::base64_encode(resolved.token);
    }

    const TlsTrust trust = ca.empty() ? TlsTrust::system_default() : TlsTrust::pinned(ca.pem);

    HttpResponse resp;
    st = _transport.get(url.str(), headers, trust, resp);
    if (!st.ok()) return st;

    if (resp.status_code != 200) {
        return Status::error(ErrorKind::Protocol,
                             resp.body + ": " + std::to_string(resp.status_code) + " " + resp.status_text);
    }

    jt::log_line("[FETCH] " + url.str() + ": " + std::to_string(resp.body.size()) + " bytes (" +
                 (ca.empty() ? std::string("default trust store") : "pinned CA " + ca.checksum) + ")");
    out.body = std::move(resp.body);
    out.ca_checksum = ca.checksum;
    return {};
}

} // namespace jt
