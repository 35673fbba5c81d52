/*
 * Part of the JoinTrust (JT) project.
 *
 * SPDX-FileCopyrightText: 2025 JoinTrust contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of JoinTrust (JT). See LICENSE for details.
 */

#include <gtest/gtest.h>

#include <cstdlib>

#include "loopback_server.hpp"
#include "jt/internal/proxy.hpp"
#include "jt/transport.hpp"

using namespace jt;
using jt::internal::Url;
using jt::internal::bypass_proxy;
using jt::internal::parse_url;
using jt::internal::select_proxy;
using jt::test::LoopbackServer;
using jt::test::Recorder;
using jt::test::TestPki;

namespace {

Url url(const std::string& s) {
    Url u;
    std::string why;
    EXPECT_TRUE(parse_url(s, u, why)) << why;
    return u;
}

// Restores one environment variable on scope exit.
class EnvVar {
public:
    EnvVar(const char* name, const char* value) : _name(name) {
        const char* old = std::getenv(name);
        _had = (old != nullptr);
        if (_had) _old = old;
        if (value) ::setenv(name, value, 1);
        else ::unsetenv(name);
    }
    ~EnvVar() {
        if (_had) ::setenv(_name.c_str(), _old.c_str(), 1);
        else ::unsetenv(_name.c_str());
    }

private:
    std::string _name;
    std::string _old;
    bool _had = false;
};

} // namespace

TEST(NoProxy, LoopbackIsAlwaysDirect) {
    EXPECT_TRUE(bypass_proxy(url("https://localhost:9345/"), ""));
    EXPECT_TRUE(bypass_proxy(url("https://127.0.0.1/"), ""));
    EXPECT_TRUE(bypass_proxy(url("https://127.8.0.3/"), ""));
    EXPECT_TRUE(bypass_proxy(url("https://[::1]:443/"), ""));
    EXPECT_FALSE(bypass_proxy(url("https://cluster.test/"), ""));
}

TEST(NoProxy, Wildcard) {
    EXPECT_TRUE(bypass_proxy(url("https://cluster.test/"), "*"));
    EXPECT_TRUE(bypass_proxy(url("https://cluster.test/"), "foo, *"));
}

TEST(NoProxy, DomainMatching) {
    const std::string list = "example.com";
    EXPECT_TRUE(bypass_proxy(url("https://example.com/"), list));
    EXPECT_TRUE(bypass_proxy(url("https://rancher.example.com/"), list));
    EXPECT_FALSE(bypass_proxy(url("https://badexample.com/"), list));

    EXPECT_FALSE(bypass_proxy(url("https://example.com/"), ".example.com"));
    EXPECT_TRUE(bypass_proxy(url("https://a.example.com/"), ".example.com"));
    EXPECT_TRUE(bypass_proxy(url("https://a.example.com/"), "*.example.com"));

    EXPECT_TRUE(bypass_proxy(url("https://Cluster.Test/"), " other.test , CLUSTER.test "));
}

TEST(NoProxy, PortQualifiedEntries) {
    EXPECT_TRUE(bypass_proxy(url("https://cluster.test:8443/"), "cluster.test:8443"));
    EXPECT_FALSE(bypass_proxy(url("https://cluster.test/"), "cluster.test:8443"));
    EXPECT_TRUE(bypass_proxy(url("https://10.1.2.3:6443/"), "10.1.2.3:6443"));
    EXPECT_TRUE(bypass_proxy(url("https://[fd00::5]:6443/"), "[fd00::5]:6443"));
}

TEST(NoProxy, IpAndCidrEntries) {
    EXPECT_TRUE(bypass_proxy(url("https://10.1.2.3/"), "10.1.2.3"));
    EXPECT_FALSE(bypass_proxy(url("https://10.1.2.4/"), "10.1.2.3"));

    EXPECT_TRUE(bypass_proxy(url("https://10.1.2.3/"), "10.0.0.0/8"));
    EXPECT_FALSE(bypass_proxy(url("https://11.0.0.1/"), "10.0.0.0/8"));
    EXPECT_TRUE(bypass_proxy(url("https://192.168.7.9/"), "192.168.4.0/22"));
    EXPECT_FALSE(bypass_proxy(url("https://192.168.8.1/"), "192.168.4.0/22"));
    EXPECT_TRUE(bypass_proxy(url("https://[fd12::1]/"), "fd00::/8"));
    EXPECT_FALSE(bypass_proxy(url("https://cluster.test/"), "10.0.0.0/8"));
}

TEST(SelectProxy, SchemePicksTheVariable) {
    ClientConfig cfg;
    cfg.https_proxy = "http://secure-proxy:3128";
    cfg.http_proxy  = "plain-proxy:8080";

    bool use = false;
    Url p;
    std::string err;
    ASSERT_TRUE(select_proxy(url("https://cluster.test/"), cfg, use, p, err)) << err;
    EXPECT_TRUE(use);
    EXPECT_EQ(p.host, "secure-proxy");
    EXPECT_EQ(p.port, 3128);

    ASSERT_TRUE(select_proxy(url("http://cluster.test/"), cfg, use, p, err)) << err;
    EXPECT_TRUE(use);
    EXPECT_EQ(p.host, "plain-proxy");
    EXPECT_EQ(p.port, 8080);
}

TEST(SelectProxy, DirectWhenUnsetOrExcluded) {
    ClientConfig cfg;
    bool use = true;
    Url p;
    std::string err;
    ASSERT_TRUE(select_proxy(url("https://cluster.test/"), cfg, use, p, err));
    EXPECT_FALSE(use);

    cfg.https_proxy = "http://proxy:3128";
    cfg.no_proxy = ".test";
    ASSERT_TRUE(select_proxy(url("https://cluster.test/"), cfg, use, p, err));
    EXPECT_FALSE(use);
}

TEST(SelectProxy, RejectsUnusableProxies) {
    ClientConfig cfg;
    bool use = false;
    Url p;
    std::string err;

    cfg.https_proxy = "https://proxy:3128";
    EXPECT_FALSE(select_proxy(url("https://cluster.test/"), cfg, use, p, err));
    EXPECT_NE(err.find("unsupported proxy scheme"), std::string::npos) << err;

    cfg.https_proxy = "http://user:s3cret@:3128";
    EXPECT_FALSE(select_proxy(url("https://cluster.test/"), cfg, use, p, err));
    EXPECT_EQ(err.find("s3cret"), std::string::npos) << err;
}

TEST(SelectProxy, CredentialsBecomeBasicAuth) {
    EXPECT_EQ(internal::proxy_authorization(url("http://user:pw@proxy:3128")), "Basic dXNlcjpwdw==");
    EXPECT_EQ(internal::proxy_authorization(url("http://proxy:3128")), "");
}

TEST(ProxyEnv, UppercaseWinsLowercaseFillsIn) {
    EnvVar a("HTTPS_PROXY", ""), b("https_proxy", "http://lower:1");
    EnvVar c("HTTP_PROXY", "http://upper:2"), d("http_proxy", "http://lower:2");
    EnvVar e("NO_PROXY", nullptr), f("no_proxy", ".internal");

    ClientConfig cfg;
    load_proxy_env(cfg);
    EXPECT_EQ(cfg.https_proxy, "http://lower:1");
    EXPECT_EQ(cfg.http_proxy, "http://upper:2");
    EXPECT_EQ(cfg.no_proxy, ".internal");
}

TEST(ProxyTransport, HttpsTunnelsThroughConnect) {
    TestPki pki("DNS:cluster.test");
    ASSERT_TRUE(pki.ok());
    auto ctx = pki.server_ctx();
    ASSERT_TRUE(ctx);
    Recorder connect_heads;
    Recorder tunnelled_heads;
    LoopbackServer proxy([&](int fd) {
        connect_heads.add(jt::test::read_head(fd));
        if (!jt::test::send_str(fd, "HTTP/1.1 200 Connection established\r\n\r\n")) return;
        jt::test::serve_tls(fd, ctx.get(), jt::test::http_reply("bundle"), &tunnelled_heads);
    });
    ASSERT_TRUE(proxy.ok());

    ClientConfig cfg;
    cfg.https_proxy = "http://user:pw@127.0.0.1:" + std::to_string(proxy.port());
    SocketTransport t{cfg};
    HttpResponse resp;
    Status st = t.get("https://cluster.test:9443/cacerts", {}, TlsTrust::pinned(pki.ca_pem), resp);
    ASSERT_TRUE(st.ok()) << st.to_string();
    EXPECT_EQ(resp.body, "bundle");

    const auto c = connect_heads.items();
    ASSERT_EQ(c.size(), 1u);
    EXPECT_EQ(c[0].rfind("CONNECT cluster.test:9443 HTTP/1.1\r\n", 0), 0u) << c[0];
    EXPECT_NE(c[0].find("Proxy-Authorization: Basic dXNlcjpwdw==\r\n"), std::string::npos);

    const auto inner = tunnelled_heads.items();
    ASSERT_EQ(inner.size(), 1u);
    EXPECT_EQ(inner[0].rfind("GET /cacerts HTTP/1.1\r\n", 0), 0u) << inner[0];
    EXPECT_NE(inner[0].find("Host: cluster.test:9443\r\n"), std::string::npos);
    EXPECT_EQ(inner[0].find("Proxy-Authorization"), std::string::npos);
}

TEST(ProxyTransport, TunnelStillVerifiesTheTarget) {
    TestPki pki("DNS:other.test");
    ASSERT_TRUE(pki.ok());
    auto ctx = pki.server_ctx();
    LoopbackServer proxy([&](int fd) {
        jt::test::read_head(fd);
        if (!jt::test::send_str(fd, "HTTP/1.1 200 Connection established\r\n\r\n")) return;
        jt::test::serve_tls(fd, ctx.get(), jt::test::http_reply("bundle"));
    });
    ASSERT_TRUE(proxy.ok());

    ClientConfig cfg;
    cfg.https_proxy = "127.0.0.1:" + std::to_string(proxy.port());
    SocketTransport t{cfg};
    HttpResponse resp;
    Status st = t.get("https://cluster.test/cacerts", {}, TlsTrust::pinned(pki.ca_pem), resp);
    EXPECT_EQ(st.kind(), ErrorKind::Transport);
    EXPECT_NE(st.message().find("x509"), std::string::npos) << st.message();
}

TEST(ProxyTransport, RefusedConnectIsTransportError) {
    LoopbackServer proxy([](int fd) {
        jt::test::read_head(fd);
        jt::test::send_str(fd, "HTTP/1.1 407 Proxy Authentication Required\r\nContent-Length: 0\r\n\r\n");
    });
    ASSERT_TRUE(proxy.ok());

    ClientConfig cfg;
    cfg.https_proxy = "http://127.0.0.1:" + std::to_string(proxy.port());
    SocketTransport t{cfg};
    HttpResponse resp;
    Status st = t.get("https://cluster.test/cacerts", {}, TlsTrust::skip_verify(), resp);
    EXPECT_EQ(st.kind(), ErrorKind::Transport);
    EXPECT_NE(st.message().find("proxyconnect: 407"), std::string::npos) << st.message();
}

TEST(ProxyTransport, PlainHttpUsesAbsoluteForm) {
    Recorder heads;
    LoopbackServer proxy([&](int fd) {
        heads.add(jt::test::read_head(fd));
        jt::test::send_str(fd, jt::test::http_reply("ok"));
    });
    ASSERT_TRUE(proxy.ok());

    ClientConfig cfg;
    cfg.http_proxy = "http://user:pw@127.0.0.1:" + std::to_string(proxy.port());
    SocketTransport t{cfg};
    HttpResponse resp;
    Status st = t.get("http://cluster.test/v3/connect?x=1", {}, TlsTrust::system_default(), resp);
    ASSERT_TRUE(st.ok()) << st.to_string();
    EXPECT_EQ(resp.body, "ok");

    const auto h = heads.items();
    ASSERT_EQ(h.size(), 1u);
    EXPECT_EQ(h[0].rfind("GET http://cluster.test/v3/connect?x=1 HTTP/1.1\r\n", 0), 0u) << h[0];
    EXPECT_NE(h[0].find("Host: cluster.test\r\n"), std::string::npos);
    EXPECT_NE(h[0].find("Proxy-Authorization: Basic dXNlcjpwdw==\r\n"), std::string::npos);
}

TEST(ProxyTransport, LoopbackTargetsSkipTheProxy) {
    LoopbackServer srv([](int fd) {
        jt::test::read_head(fd);
        jt::test::send_str(fd, jt::test::http_reply("direct"));
    });
    ASSERT_TRUE(srv.ok());

    ClientConfig cfg;
    cfg.http_proxy = "http://proxy.invalid:3128";
    SocketTransport t{cfg};
    HttpResponse resp;
    Status st = t.get("http://127.0.0.1:" + std::to_string(srv.port()) + "/", {},
                      TlsTrust::system_default(), resp);
    ASSERT_TRUE(st.ok()) << st.to_string();
    EXPECT_EQ(resp.body, "direct");
}

TEST(ProxyTransport, UnreachableProxyIsTransportError) {
    int port = 0;
    {
        LoopbackServer gone([](int) {});
        port = gone.port();
    }
    ClientConfig cfg;
    cfg.https_proxy = "http://127.0.0.1:" + std::to_string(port);
    SocketTransport t{cfg};
    HttpResponse resp;
    Status st = t.get("https://cluster.test/cacerts", {}, TlsTrust::skip_verify(), resp);
    EXPECT_EQ(st.kind(), ErrorKind::Transport);
    EXPECT_NE(st.message().find("proxyconnect tcp"), std::string::npos) << st.message();
}
