/*
 * Part of the JoinTrust (JT) project.
 *
 * SPDX-FileCopyrightText: 2025 JoinTrust contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of JoinTrust (JT). See LICENSE for details.
 */

#include "jt/bootstrap.hpp"
#include "jt/log.hpp"
#include "jt/internal/hmac.hpp"
#include "jt/internal/url.hpp"
#include "jt/internal/utils.hpp"
#include <utility>

namespace {

constexpr char kNonceHeader[] = "X-Cattle-Nonce";
constexpr char kHashHeader[]  = "X-Cattle-Hash";
constexpr std::size_t kMaxBodyExcerpt = 512;

std::string excerpt(const std::string& body) {
    if (body.size() <= kMaxBodyExcerpt) return body;
    return body.substr(0, kMaxBodyExcerpt) + "...";
}

} // namespace

namespace jt {

TrustBootstrapper::TrustBootstrapper(HttpTransport& transport)
    : _transport(transport) {}

const char* TrustBootstrapper::cacerts_path(TokenScope scope) {
    return scope == TokenScope::Cluster ? "/cacerts" : "/v1-rancheros/cacerts";
}

Status TrustBootstrapper::ca_certs(const std::string& server,
                                   const std::string& token,
                                   TokenScope scope,
                                   CaBundle& out) const
{
    const std::string nonce = internal::random_token();
    if (nonce.empty()) {
        return Status::error(ErrorKind::Configuration, "failed to generate nonce");
    }

    internal::Url server_url;
    std::string reason;
    if (!internal::parse_url(server, server_url, reason)) {
        return Status::error(ErrorKind::Configuration, "parse server URL: " + reason);
    }

    const std::string request_url =
        "https://" + server_url.authority() + cacerts_path(scope);

    // Trial request: if the default store already trusts the server, no bundle is
    // needed. Whatever came back (status, redirect, payload) is not examined.
    {
        HttpResponse trial;
        Status st = _transport.get(request_url, {}, TlsTrust::system_default(), trial);
        if (st.ok()) {
            jt::log_line("[BOOTSTRAP] " + request_url + " trusted by default store (HTTP " +
                         std::to_string(trial.status_code) + "), no CA override");
            out = CaBundle{};
            return {};
        }
        jt::log_line("[BOOTSTRAP] default-store request to " + request_url + " failed (" + st.message() +
                     "), falling back to token-verified download");
    }

    HttpHeaders headers;
    headers[kNonceHeader]  = nonce;
    headers["Authorization"] = "Bearer " + internal::sha256_base64(token);

    HttpResponse resp;
    Status st = _transport.get(request_url, headers, TlsTrust::skip_verify(), resp);
    if (!st.ok()) {
        return Status::error(st.kind() == ErrorKind::Configuration ? ErrorKind::Configuration
                                                                   : ErrorKind::Transport,
                             "insecure cacerts download from " + request_url + ": " + st.message());
    }

    if (resp.status_code != 200) {
        return Status::error(ErrorKind::Protocol,
                             "response " + std::to_string(resp.status_code) + ": " +
                             resp.status_text + " getting cacerts: " + excerpt(resp.body));
    }

    const std::string received = resp.header(kHashHeader);
    if (!internal::verify_response_hash(token, nonce, resp.body, received)) {
        const std::string expected = internal::response_hash(token, nonce, resp.body);
        jt::log_line("[BOOTSTRAP] " + std::string(kHashHeader) + " mismatch for " + request_url +
                     ", discarding " + std::to_string(resp.body.size()) + " byte body (token " +
                     redact(token) + ")");
        internal::secure_wipe(resp.body);
        return Status::error(ErrorKind::Integrity,
                             "response hash (" + received + ") does not match (" + expected + ")");
    }

    if (resp.body.empty()) {
        jt::log_line("[BOOTSTRAP] " + request_url + " verified, server sent no CA bundle");
        out = CaBundle{};
        return {};
    }

    CaBundle bundle;
    bundle.pem.swap(resp.body);
    bundle.checksum = internal::sha256_hex(bundle.pem);
    jt::log_line("[BOOTSTRAP] verified CA bundle from " + request_url + ": " +
                 std::to_string(bundle.pem.size()) + " bytes, sha256 " + bundle.checksum);
    out = std::move(bundle);
    return {};
}

} // namespace jt
