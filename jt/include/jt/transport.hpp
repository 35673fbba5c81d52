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
#include "jt/http_response.hpp"
#include "jt/status.hpp"
#include "jt/types.hpp"

namespace jt {

// One blocking HTTP GET. Each call opens and releases its own connection;
// implementations hold no per-request state and may be shared across threads.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // `url` is absolute ("https://host:port/path"). Any parsed response,
    // whatever its status, is ok(); only failures to obtain one are errors.
    virtual Status get(const std::string& url,
                       const HttpHeaders& headers,
                       const TlsTrust& trust,
                       HttpResponse& out) = 0;
};

// POSIX sockets + OpenSSL implementation.
class SocketTransport : public HttpTransport {
public:
    explicit SocketTransport(const ClientConfig& cfg);

    Status get(const std::string& url,
               const HttpHeaders& headers,
               const TlsTrust& trust,
               HttpResponse& out) override;

private:
    ClientConfig _cfg;
};

} // namespace jt
