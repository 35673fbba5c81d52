/*
 * Part of the JoinTrust (JT) project.
 *
 * SPDX-FileCopyrightText: 2025 JoinTrust contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of JoinTrust (JT). See LICENSE for details.
 */

#include "jt/internal/proxy.hpp"
#include "jt/internal/utils.hpp"

#include <arpa/inet.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <sstream>

namespace {

struct IpAddr {
    int family = 0;
    unsigned char b[16]{};
    std::size_t len() const { return family == AF_INET ? 4 : 16; }
};

bool parse_ip(const std::string& s, IpAddr& ip) {
    if (::inet_pton(AF_INET, s.c_str(), ip.b) == 1)  { ip.family = AF_INET;  return true; }
    if (::inet_pton(AF_INET6, s.c_str(), ip.b) == 1) { ip.family = AF_INET6; return true; }
    return false;
}

bool is_loopback(const IpAddr& ip) {
    if (ip.family == AF_INET) return ip.b[0] == 127;
    static const unsigned char v6_loopback[16] = {0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,1};
    return std::memcmp(ip.b, v6_loopback, sizeof(v6_loopback)) == 0;
}

bool same_ip(const IpAddr& a, const IpAddr& b) {
    return a.family == b.family && std::memcmp(a.b, b.b, a.len()) == 0;
}

// "10.0.0.0/8", "fd00::/8"
bool in_cidr(const IpAddr& ip, const std::string& cidr) {
    const std::size_t slash = cidr.find('/');
    IpAddr net;
    if (!parse_ip(cidr.substr(0, slash), net) || net.family != ip.family) return false;

    const std::string bits_s = cidr.substr(slash + 1);
    if (bits_s.empty() || bits_s.size() > 3 ||
        !std::all_of(bits_s.begin(), bits_s.end(), ::isdigit)) {
        return false;
    }
    const std::size_t bits = (std::size_t)std::stoi(bits_s);
    if (bits > net.len() * 8) return false;

    const std::size_t full = bits / 8;
    const std::size_t rem  = bits % 8;
    if (std::memcmp(ip.b, net.b, full) != 0) return false;
    if (rem == 0) return true;
    const unsigned char mask = (unsigned char)(0xFF << (8 - rem));
    return (ip.b[full] & mask) == (net.b[full] & mask);
}

// "host", "host:port" or "[v6]:port"; a bare IPv6 literal has no port.
void split_entry(const std::string& e, std::string& host, std::string& port) {
    host = e;
    port.clear();
    if (!e.empty() && e[0] == '[') {
        const std::size_t rb = e.find(']');
        if (rb == std::string::npos) return;
        host = e.substr(1, rb - 1);
        if (rb + 1 < e.size() && e[rb + 1] == ':') port = e.substr(rb + 2);
        return;
    }
    const std::size_t c = e.find(':');
    if (c != std::string::npos && e.find(':', c + 1) == std::string::npos) {
        host = e.substr(0, c);
        port = e.substr(c + 1);
    }
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string env_any(const char* upper, const char* lower) {
    const char* v = std::getenv(upper);
    if (v && *v) return v;
    v = std::getenv(lower);
    return (v && *v) ? std::string(v) : std::string();
}

} // namespace

namespace jt {

void load_proxy_env(ClientConfig& cfg) {
    cfg.https_proxy = env_any("HTTPS_PROXY", "https_proxy");
    cfg.http_proxy  = env_any("HTTP_PROXY", "http_proxy");
    cfg.no_proxy    = env_any("NO_PROXY", "no_proxy");
}

} // namespace jt

namespace jt::internal {

bool bypass_proxy(const Url& target, const std::string& no_proxy) {
    const std::string host = lower_copy(target.host);
    if (host == "localhost") return true;

    IpAddr ip;
    const bool host_is_ip = parse_ip(host, ip);
    if (host_is_ip && is_loopback(ip)) return true;

    const std::string port = std::to_string(target.port);

    std::istringstream list(no_proxy);
    std::string entry;
    while (std::getline(list, entry, ',')) {
        trim_inplace(entry);
        entry = lower_copy(entry);
        if (entry.empty()) continue;
        if (entry == "*") return true;

        if (entry.find('/') != std::string::npos) {
            if (host_is_ip && in_cidr(ip, entry)) return true;
            continue;
        }

        std::string ehost, eport;
        split_entry(entry, ehost, eport);
        if (!eport.empty() && eport != port) continue;

        IpAddr eip;
        if (parse_ip(ehost, eip)) {
            if (host_is_ip && same_ip(ip, eip)) return true;
            continue;
        }

        if (ehost.compare(0, 2, "*.") == 0) ehost.erase(0, 1);
        if (ehost.empty()) continue;
        if (ehost[0] == '.') {
            if (ends_with(host, ehost)) return true;
        } else if (host == ehost || ends_with(host, "." + ehost)) {
            return true;
        }
    }
    return false;
}

bool select_proxy(const Url& target, const jt::ClientConfig& cfg,
                  bool& use, Url& proxy, std::string& err) {
    use = false;
    std::string value = (target.scheme == "https") ? cfg.https_proxy : cfg.http_proxy;
    trim_inplace(value);
    if (value.empty() || bypass_proxy(target, cfg.no_proxy)) return true;

    if (value.find("://") == std::string::npos) value = "http://" + value;

    // parse errors echo the input, which may hold proxy credentials
    std::string reason;
    Url p;
    if (!parse_url(value, p, reason)) {
        err = "invalid proxy address";
        return false;
    }
    if (p.scheme != "http") {
        err = "unsupported proxy scheme \"" + p.scheme + "\"";
        return false;
    }
    proxy = p;
    use = true;
    return true;
}

std::string proxy_authorization(const Url& proxy) {
    if (proxy.userinfo.empty()) return {};
    return "Basic " + base64_encode(proxy.userinfo);
}

} // namespace jt::internal
