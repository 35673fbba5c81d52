// SPDX-License-Identifier: Apache-2.0
// Part of the JoinTrust (JT) project.
// jt/src/client/http_low.cpp

#include "jt/internal/http_low.hpp"
#include "jt/log.hpp"
#include "jt/internal/utils.hpp"

#include <sys/socket.h>
#include <netdb.h>
#include <unistd.h>
#include <netinet/tcp.h>
#include <fcntl.h>
#include <poll.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <limits>
#include <sstream>

namespace jt::internal {

Deadline deadline_after_ms(int ms) {
    return std::chrono::steady_clock::now() + std::chrono::milliseconds(std::max(1, ms));
}

int remaining_ms(Deadline deadline) noexcept {
    using namespace std::chrono;
    const auto now = steady_clock::now();
    if (now >= deadline) return 0;
    const auto ms = duration_cast<milliseconds>(deadline - now).count();
    if (ms <= 0) return 1; // sub-millisecond remainder still gets one poll
    if (ms > static_cast<long long>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(ms);
}

IoStatus wait_fd(int fd, short events, Deadline deadline) {
    for (;;) {
        const int ms = remaining_ms(deadline);
        if (ms <= 0) return IoStatus::Timeout;

        struct pollfd pfd;
        pfd.fd      = fd;
        pfd.events  = events;
        pfd.revents = 0;
        const int pr = ::poll(&pfd, 1, ms);
        if (pr > 0) return IoStatus::Ok; // POLLHUP/POLLERR surface on the next call
        if (pr == 0) return IoStatus::Timeout;
        if (errno != EINTR) return IoStatus::Error;
    }
}

TcpConn::~TcpConn() { close(); }

bool TcpConn::open(const std::string& host, std::uint16_t port,
                   Deadline deadline, std::string& err) {
    close();

    struct addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    const std::string where = "dial tcp " + host + ":" + std::to_string(port);

    struct addrinfo* res = nullptr;
    int rc = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res);
    if (rc != 0 || !res) {
        err = std::string("lookup ") + host + ": " + gai_strerror(rc);
        jt::log_line("[TCP] getaddrinfo failed: " + err);
        return false;
    }

    int s_ok = -1;
    int last_errno = 0;
    for (auto* p = res; p; p = p->ai_next) {
        if (remaining_ms(deadline) <= 0) { last_errno = ETIMEDOUT; break; }

        int s = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if (s < 0) { last_errno = errno; continue; }

        int flags = fcntl(s, F_GETFL, 0);
        if (flags < 0 || fcntl(s, F_SETFL, flags | O_NONBLOCK) < 0) {
            last_errno = errno;
            ::close(s);
            continue;
        }

        int ret = ::connect(s, p->ai_addr, p->ai_addrlen);
        if (ret < 0 && errno == EINPROGRESS) {
            const IoStatus ws = wait_fd(s, POLLOUT, deadline);
            if (ws != IoStatus::Ok) {
                last_errno = (ws == IoStatus::Timeout) ? ETIMEDOUT : errno;
                ::close(s);
                continue;
            }
            int soerr = 0;
            socklen_t slen = sizeof(soerr);
            if (getsockopt(s, SOL_SOCKET, SO_ERROR, &soerr, &slen) < 0 || soerr != 0) {
                last_errno = soerr ? soerr : errno;
                ::close(s);
                continue;
            }
        } else if (ret < 0) {
            last_errno = errno;
            ::close(s);
            continue;
        }

        int one = 1;
        setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

        s_ok = s;
        break;
    }
    freeaddrinfo(res);

    if (s_ok < 0) {
        if (last_errno == ETIMEDOUT) {
            err = where + ": i/o timeout";
        } else {
            err = where + ": " + (last_errno ? std::strerror(last_errno) : "no usable address");
        }
        jt::log_line("[TCP] connect failed: " + err);
        return false;
    }

    _fd = s_ok;
    return true;
}

void TcpConn::close(){
    if (_fd>=0) { ::close(_fd); _fd=-1; }
}

IoStatus TcpConn::send_all(const char* d, std::size_t len, Deadline deadline) {
    std::size_t off = 0;
    while (off < len) {
        ssize_t n = ::send(_fd, d + off, len - off, MSG_NOSIGNAL);
        if (n > 0) { off += (std::size_t)n; continue; }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            const IoStatus ws = wait_fd(_fd, POLLOUT, deadline);
            if (ws != IoStatus::Ok) return ws;
            continue;
        }
        return IoStatus::Error;
    }
    return IoStatus::Ok;
}

IoStatus TcpConn::recv_some(char* d, std::size_t len, Deadline deadline, std::size_t& got) {
    got = 0;
    for (;;) {
        ssize_t n = ::recv(_fd, d, len, 0);
        if (n > 0) { got = (std::size_t)n; return IoStatus::Ok; }
        if (n == 0) return IoStatus::Closed;
        if (errno == EINTR) continue;
        if (errno != EAGAIN && errno != EWOULDBLOCK) return IoStatus::Error;
        const IoStatus ws = wait_fd(_fd, POLLIN, deadline);
        if (ws != IoStatus::Ok) return ws;
    }
}

std::string build_get_request(const Url& url,
                              const jt::HttpHeaders& extra,
                              const std::string& user_agent,
                              bool absolute_form)
{
    std::ostringstream req;
    req << "GET " << (absolute_form ? url.str() : url.target()) << " HTTP/1.1\r\n";
    req << "Host: " << url.authority() << "\r\n";
    req << "User-Agent: " << user_agent << "\r\n";
    req << "Accept: */*\r\n";
    for (const auto& kv : extra) {
        req << kv.first << ": " << kv.second << "\r\n";
    }
    req << "Connection: close\r\n";
    req << "\r\n";
    return req.str();
}

std::string build_connect_request(const Url& target, const std::string& proxy_auth)
{
    std::ostringstream req;
    req << "CONNECT " << target.host_port() << " HTTP/1.1\r\n";
    req << "Host: " << target.host_port() << "\r\n";
    if (!proxy_auth.empty()) {
        req << "Proxy-Authorization: " << proxy_auth << "\r\n";
    }
    req << "\r\n";
    return req.str();
}

bool parse_http_response(const std::string& head_and_maybe_body,
                         std::size_t& hdr_end_off,
                         int& status_code,
                         std::string& status_text,
                         jt::HttpHeaders& headers)
{
    std::size_t hdr_end = head_and_maybe_body.find("\r\n\r\n");
    if (hdr_end == std::string::npos) return false;
    hdr_end_off = hdr_end + 4;

    std::string hdrs = head_and_maybe_body.substr(0, hdr_end);
    std::size_t line_end = hdrs.find("\r\n");
    if (line_end == std::string::npos) line_end = hdrs.size();
    std::string status = hdrs.substr(0, line_end);

    // "HTTP/1.1 200 OK"
    if (status.compare(0, 5, "HTTP/") != 0) return false;
    std::istringstream iss(status);
    std::string httpver;
    if (!(iss >> httpver >> status_code)) return false;
    std::getline(iss, status_text);
    if (!status_text.empty() && status_text[0] == ' ') status_text.erase(0,1);

    headers.clear();
    std::size_t pos = line_end + 2;
    while (pos < hdrs.size()) {
        std::size_t next = hdrs.find("\r\n", pos);
        if (next == std::string::npos) next = hdrs.size();
        std::string line = hdrs.substr(pos, next - pos);
        pos = next + 2;
        std::size_t c = line.find(':');
        if (c != std::string::npos) {
            std::string k = line.substr(0, c), v = line.substr(c + 1);
            trim_inplace(k);
            trim_inplace(v);
            headers[k] = v;
        }
    }
    return true;
}

BodyState decode_chunked(const std::string& data, std::string& out)
{
    out.clear();
    std::size_t pos = 0;
    for (;;) {
        const std::size_t eol = data.find("\r\n", pos);
        if (eol == std::string::npos) return BodyState::Incomplete;

        std::string size_line = data.substr(pos, eol - pos);
        const std::size_t ext = size_line.find(';');
        if (ext != std::string::npos) size_line.erase(ext);
        trim_inplace(size_line);
        if (size_line.empty() || size_line.size() > 15) return BodyState::Malformed;

        std::size_t chunk = 0;
        for (char c : size_line) {
            const int v = hexval(c);
            if (v < 0) return BodyState::Malformed;
            chunk = (chunk << 4) | (std::size_t)v;
        }
        pos = eol + 2;

        if (chunk == 0) {
            // trailer section ends with an empty line
            for (;;) {
                const std::size_t tl = data.find("\r\n", pos);
                if (tl == std::string::npos) return BodyState::Incomplete;
                if (tl == pos) return BodyState::Complete;
                pos = tl + 2;
            }
        }

        if (data.size() < pos + chunk + 2) return BodyState::Incomplete;
        out.append(data, pos, chunk);
        pos += chunk;
        if (data.compare(pos, 2, "\r\n") != 0) return BodyState::Malformed;
        pos += 2;
    }
}

BodyState extract_body(const std::string& raw,
                       std::size_t hdr_end_off,
                       int status_code,
                       const jt::HttpHeaders& headers,
                       bool eof,
                       std::string& body)
{
    body.clear();
    if ((status_code >= 100 && status_code < 200) || status_code == 204 || status_code == 304) {
        return BodyState::Complete;
    }

    const std::string rest = raw.size() > hdr_end_off ? raw.substr(hdr_end_off) : std::string();

    const std::string te = lower_copy(hdr_ci(headers, "Transfer-Encoding"));
    if (te.find("chunked") != std::string::npos) {
        BodyState st = decode_chunked(rest, body);
        if (st == BodyState::Incomplete && eof) return BodyState::Malformed;
        return st;
    }

    const std::string cl = hdr_ci(headers, "Content-Length");
    if (!cl.empty()) {
        if (cl.size() > 15 || !std::all_of(cl.begin(), cl.end(), ::isdigit)) {
            return BodyState::Malformed;
        }
        const std::size_t content_len = (std::size_t)std::stoull(cl);
        if (rest.size() < content_len) {
            return eof ? BodyState::Malformed : BodyState::Incomplete;
        }
        body.assign(rest, 0, content_len);
        return BodyState::Complete;
    }

    // Delimited by connection close
    if (!eof) return BodyState::Incomplete;
    body = rest;
    return BodyState::Complete;
}

} // namespace jt::internal
