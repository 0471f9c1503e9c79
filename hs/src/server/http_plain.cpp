/*
 * Part of the HmacSeal (HS) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacSeal contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacSeal (HS). See LICENSE for details.
 */

#include "hs/server_config.hpp"
#include "hs/http_request.hpp"
#include "hs/abort_signal.hpp"
#include "hs/auth_result.hpp"
#include "hs/verifier.hpp"
#include "hs/internal/http_parser.hpp"
#include "hs/internal/http_plain.hpp"
#include "hs/internal/utils.hpp"
#include "hs/log.hpp"

#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <poll.h>
#include <unistd.h>
#include <sstream>
#include <vector>
#include <algorithm>
#include <chrono>
#include <memory>
#include <future>

namespace hs::internal {

// --- HTTP/1.1 keep-alive helpers ---

static bool is_http11(const std::string& ver) {
    return ver == "HTTP/1.1";
}

static bool should_keep_alive(const hs::HttpRequest& R) {
    std::string conn = lower_copy(hdr_ci(R, "connection"));
    if (is_http11(R.httpver)) {
        return (conn != "close");
    } else {
        return (conn == "keep-alive");
    }
}

// --- I/O helpers ---

static bool send_all(int fd, const char* d, std::size_t len) {
    std::size_t off = 0;
    while (off < len) {
        ssize_t n = ::send(fd, d + off, len - off, MSG_NOSIGNAL);
        if (n <= 0) return false;
        off += static_cast<std::size_t>(n);
    }
    return true;
}

static void send_http_resp(int fd,
                           const hs::ServerConfig& cfg,
                           int sc,
                           const char* st,
                           const std::string& body,
                           bool keep_alive)
{
    std::ostringstream oss;
    oss << "HTTP/1.1 " << sc << " " << st << "\r\n";
    oss << "Content-Type: application/json\r\n";
    oss << "Content-Length: " << body.size() << "\r\n";
    if (keep_alive) {
        oss << "Connection: keep-alive\r\n";
        oss << "Keep-Alive: timeout=" << cfg.ka_timeout_sec
            << ", max=" << cfg.ka_max << "\r\n";
    } else {
        oss << "Connection: close\r\n";
    }
    oss << "\r\n";
    const std::string h = oss.str();
    if (!send_all(fd, h.data(), h.size())) return;
    (void)send_all(fd, body.data(), body.size());
}

static std::string make_error_body(const hs::ServerConfig& cfg, const hs::AuthResult& r) {
    if (cfg.redact_errors) return R"({"status":"ERROR"})";
    return std::string(R"({"error":)") + hs::to_json(r) + "}";
}

static std::string make_protocol_error(const hs::ServerConfig& cfg, const char* reason) {
    if (cfg.redact_errors) return R"({"status":"ERROR"})";
    return std::string(R"({"status":"ERROR","reason":")") + reason + R"("})";
}

// HTTP status for a failed authentication.
static int status_for(const hs::AuthResult& r, const char*& text) {
    if (r.status == hs::AuthStatus::Errored) {
        text = "Internal Server Error";
        return 500;
    }
    if (r.code == "REQUEST_BODY_TOO_LARGE") {
        text = "Payload Too Large";
        return 413;
    }
    text = "Unauthorized";
    return 401;
}

// Why a request head could not be read.
enum class HeadRead { Ok, Closed, TooLarge, Malformed };

// Reads up to the blank line. Bytes past it stay in `pending`.
static HeadRead recv_request_head(int fd,
                                  const hs::ServerConfig& cfg,
                                  std::string& pending,
                                  hs::HttpRequest& R)
{
    char buf[4096];
    std::size_t hdr_end;
    while ((hdr_end = pending.find("\r\n\r\n")) == std::string::npos) {
        if (pending.size() > cfg.max_header_bytes) return HeadRead::TooLarge;
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) return HeadRead::Closed;
        pending.append(buf, buf + n);
    }
    if (hdr_end > cfg.max_header_bytes) return HeadRead::TooLarge;

    const std::string head = pending.substr(0, hdr_end);
    pending.erase(0, hdr_end + 4);
    return parse_request_head(head, R) ? HeadRead::Ok : HeadRead::Malformed;
}

static bool parse_content_length(const std::string& v, std::size_t& out) {
    if (v.empty() || v.size() > 19) return false;
    std::size_t n = 0;
    for (char c : v) {
        if (c < '0' || c > '9') return false;
        n = n * 10 + static_cast<std::size_t>(c - '0');
    }
    out = n;
    return true;
}

// State shared between the connection loop and R.read_body.
struct BodyState {
    int fd = -1;
    std::size_t content_len = 0;
    std::string* pending = nullptr;
    bool consumed = false;
};

static hs::BodyRead read_body_from_socket(BodyState& st, std::size_t limit, std::string& out) {
    if (st.content_len > limit) return hs::BodyRead::TooLarge;

    std::string& p = *st.pending;
    const std::size_t take = std::min(p.size(), st.content_len);
    out.assign(p, 0, take);
    p.erase(0, take);

    char buf[4096];
    while (out.size() < st.content_len) {
        const std::size_t need = st.content_len - out.size();
        ssize_t n = ::recv(st.fd, buf, std::min(sizeof(buf), need), 0);
        if (n <= 0) return hs::BodyRead::Failed;
        out.append(buf, buf + n);
    }
    st.consumed = true;
    return hs::BodyRead::Ok;
}

// Runs the verifier on its own thread and fires R.abort if the peer
// goes away while the verdict is pending. A half-close (POLLRDHUP alone)
// is a client that finished sending and still waits for the response.
static hs::AuthResult authenticate_watching_peer(int fd,
                                                 const hs::Verifier& verifier,
                                                 hs::HttpRequest& R)
{
    auto fut = verifier.authenticate_async(R, hs::BodySource::Drain);
    while (fut.wait_for(std::chrono::milliseconds(50)) != std::future_status::ready) {
        if (R.abort->aborted()) continue;
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = 0;   // POLLHUP and POLLERR are always reported
        if (::poll(&pfd, 1, 0) > 0 && (pfd.revents & (POLLHUP | POLLERR))) {
            R.abort->abort();
        }
    }
    return fut.get();
}

// --- Per-request dispatcher (plain TCP) ---

static bool dispatch_request_plain(int fd,
                                   const hs::ServerConfig& cfg,
                                   const std::string& peer_ip,
                                   hs::HttpRequest& R,
                                   BodyState& body,
                                   const hs::Verifier& verifier)
{
    bool ka = should_keep_alive(R);

    if (R.path == "/health" && R.method == "GET") {
        send_http_resp(fd, cfg, 200, "OK", R"({"status":"OK"})", ka && body.content_len == 0);
        return ka && body.content_len == 0;
    }

    const hs::AuthResult res = authenticate_watching_peer(fd, verifier, R);

    // Unread body bytes would be parsed as the next request.
    if (!body.consumed && body.content_len > 0) ka = false;

    if (!res.ok()) {
        const char* text = nullptr;
        const int sc = status_for(res, text);
        hs::log_line(std::string("[") + std::to_string(sc) + "] ip=" + peer_ip +
                     " " + R.method + " " + R.path + " code=" + res.code);
        send_http_resp(fd, cfg, sc, text, make_error_body(cfg, res), ka);
        return ka;
    }

    std::ostringstream os;
    os << R"({"status":"OK","apiKey":")" << json_escape(res.api_key)
       << R"(","size":)" << R.body.size() << "}";
    send_http_resp(fd, cfg, 200, "OK", os.str(), ka);
    hs::log_line(std::string("[200] ip=") + peer_ip + " key=" + res.api_key +
                 " " + R.method + " " + R.path);
    return ka;
}

// --- Exported entry point for server.cpp ---

void handle_connection_plain(int fd,
                             const hs::ServerConfig& cfg,
                             const std::string& peer_ip,
                             const hs::Verifier& verifier)
{
    // Per-connection kernel timeouts
    timeval tv{cfg.ka_timeout_sec, 0};
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    std::string pending;
    int served = 0;
    while (served < cfg.ka_max) {
        hs::HttpRequest R;
        const HeadRead hr = recv_request_head(fd, cfg, pending, R);
        if (hr == HeadRead::Closed) break;
        if (hr == HeadRead::TooLarge) {
            send_http_resp(fd, cfg, 431, "Request Header Fields Too Large",
                           make_protocol_error(cfg, "HEADER_TOO_LARGE"), false);
            break;
        }
        if (hr == HeadRead::Malformed) {
            send_http_resp(fd, cfg, 400, "Bad Request",
                           make_protocol_error(cfg, "BAD_REQUEST"), false);
            break;
        }

        if (find_header(R.headers, "transfer-encoding")) {
            send_http_resp(fd, cfg, 411, "Length Required",
                           make_protocol_error(cfg, "CONTENT_LENGTH_REQUIRED"), false);
            break;
        }

        BodyState body;
        body.fd = fd;
        body.pending = &pending;
        if (const std::string* cl = find_header(R.headers, "content-length")) {
            if (!parse_content_length(*cl, body.content_len)) {
                send_http_resp(fd, cfg, 400, "Bad Request",
                               make_protocol_error(cfg, "BAD_CONTENT_LENGTH"), false);
                break;
            }
        }
        if (body.content_len == 0) {
            body.consumed = true;
            R.body_buffered = true;
        } else {
            R.read_body = [&body](std::size_t limit, std::string& out) {
                return read_body_from_socket(body, limit, out);
            };
        }
        R.abort = std::make_shared<hs::AbortSignal>();

        bool ka_next = dispatch_request_plain(fd, cfg, peer_ip, R, body, verifier);
        ++served;
        if (!ka_next) break;
    }
    ::close(fd);
}

} // namespace hs::internal
