// SPDX-License-Identifier: Apache-2.0
// Part of the HmacSeal (HS) project.
// hs_cl/src/client/http_low.cpp

#include "hs/internal/http_low.hpp"
#include "hs/log.hpp"
#include "hs/internal/utils.hpp"

#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <unistd.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sstream>

#include <fcntl.h>   // fcntl, O_NONBLOCK
#include <poll.h>    // poll

namespace hs::internal {

TcpConn::~TcpConn() { close(); }

// Non-blocking connect bounded by timeout_ms; leaves the socket blocking.
static bool connect_with_timeout(int s, const addrinfo* p, int timeout_ms) {
    int flags = fcntl(s, F_GETFL, 0);
    if (flags < 0) return false;
    if (fcntl(s, F_SETFL, flags | O_NONBLOCK) < 0) return false;

    int ret = ::connect(s, p->ai_addr, p->ai_addrlen);
    if (ret < 0) {
        if (errno != EINPROGRESS) return false;

        pollfd pfd{};
        pfd.fd     = s;
        pfd.events = POLLOUT;
        int pr = 0;
        do {
            pr = ::poll(&pfd, 1, timeout_ms);
        } while (pr < 0 && errno == EINTR);
        if (pr <= 0 || !(pfd.revents & POLLOUT)) return false;

        int soerr = 0;
        socklen_t slen = sizeof(soerr);
        if (getsockopt(s, SOL_SOCKET, SO_ERROR, &soerr, &slen) < 0 || soerr != 0) {
            return false;
        }
    }
    return fcntl(s, F_SETFL, flags) == 0;
}

bool TcpConn::open(const hs::ClientConfig& cfg) {
    close();

    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* res = nullptr;
    int rc = getaddrinfo(cfg.host.c_str(), std::to_string(cfg.port).c_str(), &hints, &res);
    if (rc != 0 || !res) {
        hs::log_line(std::string("[TCP] getaddrinfo failed: ") + gai_strerror(rc));
        return false;
    }

    const int connect_timeout_ms = std::max(1, cfg.connect_timeout_sec) * 1000;

    int s_ok = -1;
    for (auto* p = res; p; p = p->ai_next) {
        int s = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if (s < 0) continue;
        if (!connect_with_timeout(s, p, connect_timeout_ms)) {
            ::close(s);
            continue;
        }

        int one = 1;
        setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

        timeval tv{cfg.io_timeout_sec, 0};
        setsockopt(s, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
        setsockopt(s, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        s_ok = s;
        break;
    }
    freeaddrinfo(res);

    if (s_ok < 0) {
        hs::log_line("[TCP] connect to " + cfg.host + ":" + std::to_string(cfg.port) +
                     " failed (timed out or refused)");
        return false;
    }

    _fd = s_ok;
    return true;
}

void TcpConn::close() {
    if (_fd >= 0) { ::close(_fd); _fd = -1; }
}

bool TcpConn::send_all(const char* d, std::size_t len) {
    std::size_t off = 0;
    while (off < len) {
        ssize_t n = ::send(_fd, d + off, len - off, MSG_NOSIGNAL);
        if (n <= 0) return false;
        off += static_cast<std::size_t>(n);
    }
    return true;
}

bool TcpConn::recv_some(std::string& out, std::size_t max_chunk) {
    char buf[4096];
    ssize_t n = ::recv(_fd, buf, std::min(sizeof(buf), max_chunk), 0);
    if (n <= 0) return false;
    out.append(buf, buf + n);
    return true;
}

bool TcpConn::recv_until(std::string& out, const std::string& delim, std::size_t max_total) {
    while (out.find(delim) == std::string::npos) {
        if (!recv_some(out, 4096)) return false;
        if (out.size() > max_total) return false;
    }
    return true;
}

bool parse_http_response(const std::string& head_and_maybe_body,
                         std::size_t& hdr_end_off,
                         int& status_code,
                         std::string& status_text,
                         std::unordered_map<std::string,std::string>& headers)
{
    std::size_t hdr_end = head_and_maybe_body.find("\r\n\r\n");
    if (hdr_end == std::string::npos) return false;
    hdr_end_off = hdr_end + 4;

    const std::string hdrs = head_and_maybe_body.substr(0, hdr_end);
    std::size_t line_end = hdrs.find("\r\n");
    const std::string status = hdrs.substr(0, line_end);

    // "HTTP/1.1 200 OK"
    std::istringstream iss(status);
    std::string httpver;
    if (!(iss >> httpver >> status_code)) return false;
    if (httpver.rfind("HTTP/", 0) != 0) return false;
    std::getline(iss, status_text);
    trim_inplace(status_text);

    headers.clear();
    if (line_end == std::string::npos) return true;

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
            headers[lower_copy(k)] = v;
        }
    }
    return true;
}

} // namespace hs::internal
