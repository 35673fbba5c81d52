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
#include <cstddef>
#include <cstdint>
#include <chrono>
#include <sys/types.h>
#include "jt/http_response.hpp"
#include "jt/internal/url.hpp"

namespace jt::internal {

using Deadline = std::chrono::steady_clock::time_point;

Deadline deadline_after_ms(int ms);

// Milliseconds left until `deadline`, clamped to [0, INT_MAX].
int remaining_ms(Deadline deadline) noexcept;

enum class IoStatus { Ok, Closed, Timeout, Error };

// Block until `fd` is ready for `events` or the deadline passes.
IoStatus wait_fd(int fd, short events, Deadline deadline);

// RAII TCP connection. The socket stays non-blocking after open(); every
// call waits on it with poll() against the caller's deadline.
class TcpConn {
public:
    TcpConn() = default;
    ~TcpConn();

    TcpConn(const TcpConn&) = delete;
    TcpConn& operator=(const TcpConn&) = delete;

    // Open TCP connection to host:port before `deadline`. On failure
    // `err` holds the cause.
    bool open(const std::string& host, std::uint16_t port,
              Deadline deadline, std::string& err);

    void close();
    int  fd() const { return _fd; }

    IoStatus send_all(const char* d, std::size_t len, Deadline deadline);
    // Ok with got > 0, Closed on orderly shutdown
    IoStatus recv_some(char* d, std::size_t len, Deadline deadline, std::size_t& got);

private:
    int _fd = -1;
};

// "GET <target> HTTP/1.1" with Host, User-Agent, Accept, Connection: close
// and the extra headers. `absolute_form` puts the full URL in the request
// line, as a forward proxy expects.
std::string build_get_request(const Url& url,
                              const jt::HttpHeaders& extra,
                              const std::string& user_agent,
                              bool absolute_form = false);

// "CONNECT host:port HTTP/1.1" opening a tunnel to `target` through a proxy.
// `proxy_auth` is the Proxy-Authorization value, empty for none.
std::string build_connect_request(const Url& target, const std::string& proxy_auth);

// Parse status line + headers of an HTTP/1.x response.
bool parse_http_response(const std::string& head_and_maybe_body,
                         std::size_t& hdr_end_off,
                         int& status_code,
                         std::string& status_text,
                         jt::HttpHeaders& headers);

enum class BodyState { Incomplete, Complete, Malformed };

// Decode a chunked body. Complete once the terminating chunk and trailer
// have been seen; Incomplete when more bytes are needed.
BodyState decode_chunked(const std::string& data, std::string& out);

// Extract the body that follows the header block in `raw`, framed by
// Content-Length, chunked encoding, or connection close (`eof`).
BodyState extract_body(const std::string& raw,
                       std::size_t hdr_end_off,
                       int status_code,
                       const jt::HttpHeaders& headers,
                       bool eof,
                       std::string& body);

} // namespace jt::internal
