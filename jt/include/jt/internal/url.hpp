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
#include <cstdint>

namespace jt::internal {

struct Url {
    std::string   scheme;    // "http" | "https", lowercased
    std::string   userinfo;  // "user[:password]" as written; never part of str()
    std::string   host;      // without brackets for IPv6 literals
    std::uint16_t port = 0;  // explicit or scheme default
    bool          explicit_port = false;
    std::string   path;      // always starts with '/'
    std::string   query;     // without '?'

    // "host[:port]" as written in the URL (IPv6 re-bracketed)
    std::string authority() const;

    // "host:port" with the port always present (CONNECT authority)
    std::string host_port() const;

    // Request target: path plus "?query" when present
    std::string target() const;

    std::string str() const;
};

// Parse "scheme://host[:port][/path][?query]". Returns false and a reason
// for anything without a supported scheme or a host.
bool parse_url(const std::string& s, Url& out, std::string& reason);

} // namespace jt::internal
