/*
 * Part of the JoinTrust (JT) project.
 *
 * SPDX-FileCopyrightText: 2025 JoinTrust contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of JoinTrust (JT). See LICENSE for details.
 */

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "loopback_server.hpp"
#include "jt/transport.hpp"

using namespace jt;
using jt::test::LoopbackServer;
using jt::test::Recorder;
using jt::test::TestPki;

namespace {

std::string base(const char* scheme, const LoopbackServer& srv) {
    return std::string(scheme) + "://127.0.0.1:" + std::to_string(srv.port());
}

long long elapsed_ms(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - since).count();
}

} // namespace

TEST(SocketTransport, PinnedBundleTrustsItsServer) {
    TestPki pki("IP:127.0.0.1");
    ASSERT_TRUE(pki.ok());
    auto ctx = pki.server_ctx();
    ASSERT_TRUE(ctx);
    Recorder seen;
    LoopbackServer srv([&](int fd) {
        jt::test::serve_tls(fd, ctx.get(), jt::test::http_reply("-----PEM-----"), &seen);
    });
    ASSERT_TRUE(srv.ok());

    SocketTransport t{ClientConfig{}};
    HttpResponse resp;
    Status st = t.get(base("https", srv) + "/cacerts", {{"X-Cattle-Nonce", "bcdf"}},
                      TlsTrust::pinned(pki.ca_pem), resp);
    ASSERT_TRUE(st.ok()) << st.to_string();
    EXPECT_EQ(resp.status_code, 200);
    EXPECT_EQ(resp.body, "-----PEM-----");

    const auto heads = seen.items();
    ASSERT_EQ(heads.size(), 1u);
    EXPECT_EQ(heads[0].rfind("GET /cacerts HTTP/1.1\r\n", 0), 0u);
    EXPECT_NE(heads[0].find("X-Cattle-Nonce: bcdf\r\n"), std::string::npos);
}

TEST(SocketTransport, SystemStoreRejectsPrivateCa) {
    TestPki pki("IP:127.0.0.1");
    ASSERT_TRUE(pki.ok());
    auto ctx = pki.server_ctx();
    LoopbackServer srv([&](int fd) { jt::test::serve_tls(fd, ctx.get(), jt::test::http_reply("x")); });

    SocketTransport t{ClientConfig{}};
    HttpResponse resp;
    Status st = t.get(base("https", srv) + "/cacerts", {}, TlsTrust::system_default(), resp);
    EXPECT_EQ(st.kind(), ErrorKind::Transport);
    EXPECT_NE(st.message().find("x509"), std::string::npos) << st.message();
}

TEST(SocketTransport, PinnedBundleIsTheOnlyTrustRoot) {
    TestPki pki("IP:127.0.0.1");
    TestPki other("IP:127.0.0.1");
    ASSERT_TRUE(pki.ok());
    ASSERT_TRUE(other.ok());
    auto ctx = pki.server_ctx();
    LoopbackServer srv([&](int fd) { jt::test::serve_tls(fd, ctx.get(), jt::test::http_reply("x")); });

    SocketTransport t{ClientConfig{}};
    HttpResponse resp;
    Status st = t.get(base("https", srv) + "/", {}, TlsTrust::pinned(other.ca_pem), resp);
    EXPECT_EQ(st.kind(), ErrorKind::Transport);
    EXPECT_NE(st.message().find("x509"), std::string::npos) << st.message();
}

TEST(SocketTransport, CertificateMustNameTheDialledAddress) {
    TestPki pki("DNS:cluster.test");
    ASSERT_TRUE(pki.ok());
    auto ctx = pki.server_ctx();
    LoopbackServer srv([&](int fd) { jt::test::serve_tls(fd, ctx.get(), jt::test::http_reply("x")); });

    SocketTransport t{ClientConfig{}};
    HttpResponse resp;
    Status st = t.get(base("https", srv) + "/", {}, TlsTrust::pinned(pki.ca_pem), resp);
    EXPECT_EQ(st.kind(), ErrorKind::Transport);
    EXPECT_NE(st.message().find("x509"), std::string::npos) << st.message();
}

TEST(SocketTransport, SkipVerifyAcceptsAnyCertificate) {
    TestPki pki("DNS:cluster.test");
    ASSERT_TRUE(pki.ok());
    auto ctx = pki.server_ctx();
    LoopbackServer srv([&](int fd) { jt::test::serve_tls(fd, ctx.get(), jt::test::http_reply("ok")); });

    SocketTransport t{ClientConfig{}};
    HttpResponse resp;
    Status st = t.get(base("https", srv) + "/", {}, TlsTrust::skip_verify(), resp);
    ASSERT_TRUE(st.ok()) << st.to_string();
    EXPECT_EQ(resp.body, "ok");
}

TEST(SocketTransport, UnparseableBundleFailsBeforeDialling) {
    LoopbackServer srv([](int) {});
    ASSERT_TRUE(srv.ok());

    SocketTransport t{ClientConfig{}};
    HttpResponse resp;
    Status st = t.get(base("https", srv) + "/", {}, TlsTrust::pinned("not a certificate"), resp);
    EXPECT_EQ(st.kind(), ErrorKind::Configuration);
    EXPECT_EQ(srv.accepted(), 0);
}

TEST(SocketTransport, TrickledBodyHitsRequestDeadline) {
    LoopbackServer srv([](int fd) {
        jt::test::read_head(fd);
        if (!jt::test::send_str(fd, "HTTP/1.1 200 OK\r\nContent-Length: 12\r\n\r\n")) return;
        for (int i = 0; i < 12; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(250));
            if (!jt::test::send_str(fd, "x")) return;
        }
    });
    ASSERT_TRUE(srv.ok());

    ClientConfig cfg;
    cfg.timeout_ms = 1000;
    SocketTransport t{cfg};
    HttpResponse resp;

    const auto start = std::chrono::steady_clock::now();
    Status st = t.get(base("http", srv) + "/cacerts", {}, TlsTrust::skip_verify(), resp);
    const long long ms = elapsed_ms(start);

    EXPECT_EQ(st.kind(), ErrorKind::Transport);
    EXPECT_NE(st.message().find("timeout"), std::string::npos) << st.message();
    EXPECT_GE(ms, 900);
    EXPECT_LT(ms, 2500);
}

TEST(SocketTransport, StalledHandshakeHitsRequestDeadline) {
    LoopbackServer srv([](int) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1200));
    });
    ASSERT_TRUE(srv.ok());

    ClientConfig cfg;
    cfg.timeout_ms = 400;
    SocketTransport t{cfg};
    HttpResponse resp;

    const auto start = std::chrono::steady_clock::now();
    Status st = t.get(base("https", srv) + "/", {}, TlsTrust::skip_verify(), resp);
    EXPECT_EQ(st.kind(), ErrorKind::Transport);
    EXPECT_NE(st.message().find("timeout"), std::string::npos) << st.message();
    EXPECT_LT(elapsed_ms(start), 1100);
}

TEST(SocketTransport, ResponseSizeIsCapped) {
    LoopbackServer srv([](int fd) {
        jt::test::read_head(fd);
        jt::test::send_str(fd, jt::test::http_reply(std::string(64 * 1024, 'a')));
    });
    ASSERT_TRUE(srv.ok());

    ClientConfig cfg;
    cfg.max_response_bytes = 4096;
    SocketTransport t{cfg};
    HttpResponse resp;
    Status st = t.get(base("http", srv) + "/", {}, TlsTrust::skip_verify(), resp);
    EXPECT_EQ(st.kind(), ErrorKind::Protocol);
    EXPECT_NE(st.message().find("size limit"), std::string::npos) << st.message();
}

TEST(SocketTransport, ErrorStatusIsStillAResponse) {
    LoopbackServer srv([](int fd) {
        jt::test::read_head(fd);
        jt::test::send_str(fd, "HTTP/1.1 403 Forbidden\r\nTransfer-Encoding: chunked\r\n\r\n"
                               "6\r\ndenied\r\n0\r\n\r\n");
    });
    ASSERT_TRUE(srv.ok());

    SocketTransport t{ClientConfig{}};
    HttpResponse resp;
    Status st = t.get(base("http", srv) + "/v1-rancheros/cacerts", {}, TlsTrust::skip_verify(), resp);
    ASSERT_TRUE(st.ok()) << st.to_string();
    EXPECT_EQ(resp.status_code, 403);
    EXPECT_EQ(resp.status_text, "Forbidden");
    EXPECT_EQ(resp.body, "denied");
}

TEST(SocketTransport, RefusedConnectionIsTransportError) {
    int port = 0;
    {
        LoopbackServer gone([](int) {});
        port = gone.port();
    }
    SocketTransport t{ClientConfig{}};
    HttpResponse resp;
    Status st = t.get("http://127.0.0.1:" + std::to_string(port) + "/", {}, TlsTrust::skip_verify(), resp);
    EXPECT_EQ(st.kind(), ErrorKind::Transport);
    EXPECT_NE(st.message().find("Get \"http://127.0.0.1:"), std::string::npos) << st.message();
}
