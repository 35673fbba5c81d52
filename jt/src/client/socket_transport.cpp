/*
 * Part of the JoinTrust (JT) project.
 *
 * SPDX-FileCopyrightText: 2025 JoinTrust contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of JoinTrust (JT). See LICENSE for details.
 */

#include "jt/transport.hpp"
#include "jt/log.hpp"

#include "jt/internal/http_low.hpp"
#include "jt/internal/proxy.hpp"
#include "jt/internal/tls_cli_ctx.hpp"
#include "jt/internal/url.hpp"

#include <openssl/ssl.h>
#include <openssl/x509v3.h>
#include <openssl/err.h>

#include <memory>
#include <cstring>
#include <utility>

#include <poll.h>
#include <cerrno>
#include <arpa/inet.h>

namespace {

using jt::internal::Deadline;
using jt::internal::IoStatus;

// Upper bound for a proxy's CONNECT reply head.
constexpr std::size_t kMaxConnectReply = 16u << 10;

// Wait for the socket in the direction OpenSSL asked for.
IoStatus wait_for_ssl(int fd, int ssl_err, Deadline deadline) {
    return jt::internal::wait_fd(fd, ssl_err == SSL_ERROR_WANT_READ ? POLLIN : POLLOUT, deadline);
}

// TLS handshake on a non-blocking socket, bounded by the request deadline.
[[nodiscard]] bool ssl_connect_with_deadline(SSL* ssl, int fd, Deadline deadline, std::string& err) {
    while (true) {
        ::ERR_clear_error();
        const int rc = ::SSL_connect(ssl);
        if (rc == 1) {
            return true;
        }

        const int ssl_err = ::SSL_get_error(ssl, rc);

        if (ssl_err == SSL_ERROR_WANT_READ || ssl_err == SSL_ERROR_WANT_WRITE) {
            const IoStatus ws = wait_for_ssl(fd, ssl_err, deadline);
            if (ws == IoStatus::Timeout) {
                err = "TLS handshake timeout";
                return false;
            }
            if (ws != IoStatus::Ok) {
                err = std::string("TLS handshake: poll: ") + std::strerror(errno);
                return false;
            }
            continue;
        }

        // Certificate verification failures land here too
        const long vr = ::SSL_get_verify_result(ssl);
        const std::string detail = jt::internal::drain_openssl_errors("[TLS-CLI]", "SSL_connect");
        if (vr != X509_V_OK) {
            err = std::string("x509: ") + X509_verify_cert_error_string(vr);
        } else if (!detail.empty()) {
            err = "TLS handshake failed: " + detail;
        } else {
            err = "TLS handshake failed: ssl_error=" + std::to_string(ssl_err);
        }
        return false;
    }
}

// A TCP connection to the server or to a forward proxy, optionally wrapped
// in TLS. Released on destruction.
class Conn {
public:
    Conn() = default;
    ~Conn() { close(); }

    Conn(const Conn&) = delete;
    Conn& operator=(const Conn&) = delete;

    jt::Status open(const jt::internal::Url& u,
                    const jt::ClientConfig& cfg,
                    const jt::TlsTrust& trust,
                    Deadline deadline)
    {
        const bool tls = (u.scheme == "https");

        // Trust material first: a bad pinned bundle fails before any dial.
        if (tls) {
            _tls = std::make_unique<jt::internal::TlsClientContext>(cfg, trust);
            if (!_tls->ctx()) {
                return jt::Status::error(trust.mode == jt::TrustMode::PinnedBundle
                                             ? jt::ErrorKind::Configuration
                                             : jt::ErrorKind::Transport,
                                         "TLS setup: " + _tls->error());
            }
        }

        bool use_proxy = false;
        jt::internal::Url proxy;
        std::string err;
        if (!jt::internal::select_proxy(u, cfg, use_proxy, proxy, err)) {
            return jt::Status::error(jt::ErrorKind::Configuration, err);
        }

        if (use_proxy) {
            jt::log_line("[PROXY] " + u.host_port() + " via " + proxy.host_port());
            if (!_tcp.open(proxy.host, proxy.port, deadline, err)) {
                return jt::Status::error(jt::ErrorKind::Transport, "proxyconnect tcp: " + err);
            }
            const std::string auth = jt::internal::proxy_authorization(proxy);
            if (!tls) {
                // plain http goes through the proxy as an absolute-form request
                _forward_proxy = true;
                _proxy_auth = auth;
                return {};
            }
            jt::Status st = tunnel(u, auth, deadline);
            if (!st.ok()) return st;
        } else if (!_tcp.open(u.host, u.port, deadline, err)) {
            return jt::Status::error(jt::ErrorKind::Transport, err);
        }

        if (!tls) return {};
        return handshake(u, deadline);
    }

    // True when requests are sent to a forward proxy in absolute form.
    bool forward_proxy() const { return _forward_proxy; }
    const std::string& proxy_auth() const { return _proxy_auth; }

    IoStatus send_all(const std::string& data, Deadline deadline) {
        if (!_ssl) return _tcp.send_all(data.data(), data.size(), deadline);
        std::size_t off = 0;
        while (off < data.size()) {
            ERR_clear_error();
            const int n = SSL_write(_ssl.get(), data.data() + off, (int)(data.size() - off));
            if (n > 0) { off += (std::size_t)n; continue; }
            const int e = SSL_get_error(_ssl.get(), n);
            if (e == SSL_ERROR_WANT_READ || e == SSL_ERROR_WANT_WRITE) {
                const IoStatus ws = wait_for_ssl(_tcp.fd(), e, deadline);
                if (ws != IoStatus::Ok) return ws;
                continue;
            }
            ERR_clear_error();
            return IoStatus::Error;
        }
        return IoStatus::Ok;
    }

    IoStatus recv_some(char* buf, std::size_t len, Deadline deadline, std::size_t& got) {
        if (!_ssl) return _tcp.recv_some(buf, len, deadline, got);
        got = 0;
        for (;;) {
            ERR_clear_error();
            const int n = SSL_read(_ssl.get(), buf, (int)len);
            if (n > 0) { got = (std::size_t)n; return IoStatus::Ok; }
            const int e = SSL_get_error(_ssl.get(), n);
            if (e == SSL_ERROR_WANT_READ || e == SSL_ERROR_WANT_WRITE) {
                const IoStatus ws = wait_for_ssl(_tcp.fd(), e, deadline);
                if (ws != IoStatus::Ok) return ws;
                continue;
            }
            if (e == SSL_ERROR_ZERO_RETURN) return IoStatus::Closed;
            // Peers often close without close_notify once the body is sent
            if (e == SSL_ERROR_SYSCALL && n == 0 && ERR_peek_error() == 0) return IoStatus::Closed;
            ERR_clear_error();
            return IoStatus::Error;
        }
    }

    void close() {
        if (_ssl) {
            // non-blocking: send close_notify if it fits, never wait for the reply
            if (SSL_is_init_finished(_ssl.get())) SSL_shutdown(_ssl.get());
            ERR_clear_error();
            _ssl.reset();
        }
        _tcp.close();
    }

private:
    // CONNECT through the proxy; the reply head is read byte by byte so
    // nothing past it is consumed before the TLS handshake.
    jt::Status tunnel(const jt::internal::Url& u, const std::string& auth, Deadline deadline) {
        const std::string req = jt::internal::build_connect_request(u, auth);
        const IoStatus ss = _tcp.send_all(req.data(), req.size(), deadline);
        if (ss != IoStatus::Ok) {
            return io_error(ss, "proxyconnect: write failed");
        }

        std::string head;
        while (head.size() < 4 || head.compare(head.size() - 4, 4, "\r\n\r\n") != 0) {
            if (head.size() >= kMaxConnectReply) {
                return jt::Status::error(jt::ErrorKind::Protocol, "proxyconnect: reply head too large");
            }
            char c = 0;
            std::size_t got = 0;
            const IoStatus rs = _tcp.recv_some(&c, 1, deadline, got);
            if (rs == IoStatus::Closed) {
                return jt::Status::error(jt::ErrorKind::Transport, "proxyconnect: proxy closed the connection");
            }
            if (rs != IoStatus::Ok) {
                return io_error(rs, "proxyconnect: read failed");
            }
            head.push_back(c);
        }

        std::size_t off = 0;
        int code = 0;
        std::string text;
        jt::HttpHeaders hdrs;
        if (!jt::internal::parse_http_response(head, off, code, text, hdrs)) {
            return jt::Status::error(jt::ErrorKind::Protocol, "proxyconnect: malformed reply");
        }
        if (code != 200) {
            jt::log_line("[PROXY] CONNECT " + u.host_port() + " refused: " + std::to_string(code) + " " + text);
            return jt::Status::error(jt::ErrorKind::Transport,
                                     "proxyconnect: " + std::to_string(code) + " " + text);
        }
        return {};
    }

    jt::Status handshake(const jt::internal::Url& u, Deadline deadline) {
        SSL* s = SSL_new(_tls->ctx());
        if (!s) {
            return jt::Status::error(jt::ErrorKind::Transport,
                                     "SSL_new: " + jt::internal::drain_openssl_errors("[TLS-CLI]", "SSL_new"));
        }
        _ssl.reset(s);
        SSL_set_fd(s, _tcp.fd());

        // SNI is only meaningful for DNS names
        unsigned char tmp[16];
        const bool is_ipv4 = (::inet_pton(AF_INET, u.host.c_str(), tmp) == 1);
        const bool is_ipv6 = (!is_ipv4 && (::inet_pton(AF_INET6, u.host.c_str(), tmp) == 1));
        if (!is_ipv4 && !is_ipv6) {
            SSL_set_tlsext_host_name(s, u.host.c_str());
        }

        // Chain validation alone is not enough; bind it to the host in the URL.
        if (_tls->verify_peer()) {
            X509_VERIFY_PARAM* param = SSL_get0_param(s);
            if (!param) {
                return jt::Status::error(jt::ErrorKind::Transport, "SSL_get0_param failed");
            }
            if (is_ipv4 || is_ipv6) {
                if (X509_VERIFY_PARAM_set1_ip_asc(param, u.host.c_str()) != 1) {
                    return jt::Status::error(jt::ErrorKind::Transport, "X509_VERIFY_PARAM_set1_ip_asc failed");
                }
            } else if (SSL_set1_host(s, u.host.c_str()) != 1) {
                return jt::Status::error(jt::ErrorKind::Transport, "SSL_set1_host failed");
            }
        }

        std::string hs_err;
        if (!ssl_connect_with_deadline(s, _tcp.fd(), deadline, hs_err)) {
            jt::log_line("[TLS-CLI] TLS handshake with " + u.authority() + " failed: " + hs_err);
            return jt::Status::error(jt::ErrorKind::Transport, hs_err);
        }

        if (_tls->verify_peer()) {
            const long vr = SSL_get_verify_result(s);
            if (vr != X509_V_OK) {
                return jt::Status::error(jt::ErrorKind::Transport,
                                         std::string("x509: ") + X509_verify_cert_error_string(vr));
            }
        }
        return {};
    }

    static jt::Status io_error(IoStatus st, const std::string& what) {
        return jt::Status::error(jt::ErrorKind::Transport,
                                 st == IoStatus::Timeout ? what + ": i/o timeout" : what);
    }

    jt::internal::TcpConn _tcp;
    std::unique_ptr<jt::internal::TlsClientContext> _tls;
    std::unique_ptr<SSL, void(*)(SSL*)> _ssl{nullptr, [](SSL* s){ if(s){ SSL_free(s); } }};
    bool _forward_proxy = false;
    std::string _proxy_auth;
};

} // namespace

namespace jt {

SocketTransport::SocketTransport(const ClientConfig& cfg) : _cfg(cfg) {}

Status SocketTransport::get(const std::string& url,
                            const HttpHeaders& headers,
                            const TlsTrust& trust,
                            HttpResponse& out)
{
    // One budget for the whole exchange, as with a client-wide timeout.
    const internal::Deadline deadline = internal::deadline_after_ms(_cfg.timeout_ms);

    internal::Url u;
    std::string reason;
    if (!internal::parse_url(url, u, reason)) {
        return Status::error(ErrorKind::Configuration, reason);
    }

    const std::string prefix = "Get \"" + u.str() + "\": ";
    const std::string timeout_msg =
        prefix + "request timeout (" + std::to_string(_cfg.timeout_ms) + " ms exceeded)";

    Conn conn;
    Status st = conn.open(u, _cfg, trust, deadline);
    if (!st.ok()) {
        return Status::error(st.kind(), prefix + st.message());
    }

    HttpHeaders req_headers = headers;
    if (!conn.proxy_auth().empty()) {
        req_headers["Proxy-Authorization"] = conn.proxy_auth();
    }
    const std::string req =
        internal::build_get_request(u, req_headers, _cfg.user_agent, conn.forward_proxy());
    const internal::IoStatus ws = conn.send_all(req, deadline);
    if (ws == internal::IoStatus::Timeout) {
        return Status::error(ErrorKind::Transport, timeout_msg);
    }
    if (ws != internal::IoStatus::Ok) {
        return Status::error(ErrorKind::Transport, prefix + "write failed");
    }

    HttpResponse resp;
    std::string raw;
    std::size_t hdr_end_off = 0;
    bool have_head = false;
    bool eof = false;
    char buf[4096];

    for (;;) {
        if (!have_head) {
            have_head = internal::parse_http_response(raw, hdr_end_off, resp.status_code,
                                                      resp.status_text, resp.headers);
            if (!have_head && raw.find("\r\n\r\n") != std::string::npos) {
                return Status::error(ErrorKind::Protocol, prefix + "malformed HTTP response");
            }
        }
        if (have_head) {
            const internal::BodyState bs =
                internal::extract_body(raw, hdr_end_off, resp.status_code, resp.headers, eof, resp.body);
            if (bs == internal::BodyState::Complete) break;
            if (bs == internal::BodyState::Malformed) {
                return Status::error(ErrorKind::Protocol, prefix + "malformed response body");
            }
        }
        if (eof) {
            return Status::error(ErrorKind::Transport, prefix + "unexpected EOF");
        }

        std::size_t got = 0;
        const internal::IoStatus rs = conn.recv_some(buf, sizeof(buf), deadline, got);
        if (rs == internal::IoStatus::Timeout) {
            jt::log_line("[TCP] " + u.authority() + ": request timeout after " +
                         std::to_string(raw.size()) + " bytes");
            return Status::error(ErrorKind::Transport, timeout_msg);
        }
        if (rs == internal::IoStatus::Error) {
            return Status::error(ErrorKind::Transport, prefix + "read failed");
        }
        if (rs == internal::IoStatus::Closed) {
            eof = true;
            continue;
        }
        raw.append(buf, buf + got);
        if (raw.size() > _cfg.max_response_bytes) {
            return Status::error(ErrorKind::Protocol, prefix + "response exceeds size limit");
        }
    }

    out = std::move(resp);
    return {};
}

} // namespace jt
