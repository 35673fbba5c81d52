/*
 * Part of the JoinTrust (JT) project.
 *
 * SPDX-FileCopyrightText: 2025 JoinTrust contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of JoinTrust (JT). See LICENSE for details.
 */

#include "jt/internal/url.hpp"
#include "jt/internal/utils.hpp"
#include <algorithm>
#include <cctype>

namespace jt::internal {

std::string Url::authority() const {
    std::string h = (host.find(':') != std::string::npos) ? "[" + host + "]" : host;
    if (explicit_port) h += ":" + std::to_string(port);
    return h;
}

std::string Url::host_port() const {
    const std::string h = (host.find(':') != std::string::npos) ? "[" + host + "]" : host;
    return h + ":" + std::to_string(port);
}

std::string Url::target() const {
    return query.empty() ? path : path + "?" + query;
}

std::string Url::str() const {
    return scheme + "://" + authority() + target();
}

bool parse_url(const std::string& in, Url& out, std::string& reason) {
    std::string s = in;
    trim_inplace(s);

    const std::size_t sep = s.find("://");
    if (sep == std::string::npos || sep == 0) {
        reason = "missing scheme in URL \"" + s + "\"";
        return false;
    }
    Url u;
    u.scheme = lower_copy(s.substr(0, sep));
    if (u.scheme == "https") u.port = 443;
    else if (u.scheme == "http") u.port = 80;
    else {
        reason = "unsupported scheme \"" + u.scheme + "\"";
        return false;
    }

    std::string rest = s.substr(sep + 3);
    const std::size_t frag = rest.find('#');
    if (frag != std::string::npos) rest.erase(frag);

    const std::size_t auth_end = rest.find_first_of("/?");
    std::string auth = rest.substr(0, auth_end);
    std::string tail = (auth_end == std::string::npos) ? "" : rest.substr(auth_end);

    const std::size_t at = auth.rfind('@');
    if (at != std::string::npos) {
        u.userinfo = auth.substr(0, at);
        auth.erase(0, at + 1);
    }

    std::string port_s;
    if (!auth.empty() && auth[0] == '[') {
        const std::size_t rb = auth.find(']');
        if (rb == std::string::npos) {
            reason = "unterminated IPv6 literal in \"" + s + "\"";
            return false;
        }
        u.host = auth.substr(1, rb - 1);
        std::string after = auth.substr(rb + 1);
        if (!after.empty()) {
            if (after[0] != ':') {
                reason = "invalid authority \"" + auth + "\"";
                return false;
            }
            port_s = after.substr(1);
        }
    } else {
        const std::size_t colon = auth.rfind(':');
        if (colon != std::string::npos) {
            u.host = auth.substr(0, colon);
            port_s = auth.substr(colon + 1);
        } else {
            u.host = auth;
        }
    }

    if (u.host.empty()) {
        reason = "missing host in URL \"" + s + "\"";
        return false;
    }
    if (!port_s.empty()) {
        if (port_s.size() > 5 || !std::all_of(port_s.begin(), port_s.end(), ::isdigit)) {
            reason = "invalid port \"" + port_s + "\"";
            return false;
        }
        const unsigned long p = std::stoul(port_s);
        if (p == 0 || p > 65535) {
            reason = "invalid port \"" + port_s + "\"";
            return false;
        }
        u.port = (std::uint16_t)p;
        u.explicit_port = true;
    }

    const std::size_t q = tail.find('?');
    u.path  = tail.substr(0, q);
    u.query = (q == std::string::npos) ? "" : tail.substr(q + 1);
    if (u.path.empty()) u.path = "/";

    out = u;
    return true;
}

} // namespace jt::internal
