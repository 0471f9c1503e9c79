/*
 * Part of the HmacSeal (HS) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacSeal contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacSeal (HS). See LICENSE for details.
 */

#include "hs/client.hpp"
#include "hs/log.hpp"
#include "hs/http_response.hpp"
#include "hs/request_signer.hpp"
#include "hs/sign.hpp"

#include "hs/internal/utils.hpp"
#include "hs/internal/http_parser.hpp"
#include "hs/internal/http_low.hpp"  // TCP + HTTP response parser

#include <sstream>
#include <algorithm>
#include <mutex>
#include <memory>

namespace hs {

namespace {

Algorithm algorithm_or_throw(const std::string& name) {
    const auto alg = parse_algorithm(name);
    if (!alg) throw UnsupportedAlgorithm(name);
    return *alg;
}

bool parse_length(const std::string& v, std::size_t& out) {
    if (v.empty() || v.size() > 19) return false;
    std::size_t n = 0;
    for (char c : v) {
        if (c < '0' || c > '9') return false;
        n = n * 10 + static_cast<std::size_t>(c - '0');
    }
    out = n;
    return true;
}

} // namespace

struct Client::Impl {
    ClientConfig cfg;
    RequestSigner signer;

    // Keep-alive state
    std::mutex mtx;
    std::unique_ptr<internal::TcpConn> conn;
    int served_on_conn = 0;

    explicit Impl(const ClientConfig& c)
        : cfg(c)
        , signer(c.api_key, c.secret, algorithm_or_throw(c.algorithm))
    {
        hs::set_log_file(cfg.log_file);
    }

    ~Impl() {
        std::lock_guard<std::mutex> lk(mtx);
        close_conn_locked();
    }

    void close_conn_locked() {
        if (conn) {
            conn->close();
            conn.reset();
        }
        served_on_conn = 0;
    }

    bool ensure_conn_locked() {
        if (conn && served_on_conn < cfg.ka_max) return true;
        close_conn_locked();
        conn = std::make_unique<internal::TcpConn>();
        if (!conn->open(cfg)) { conn.reset(); return false; }
        return true;
    }

    bool recv_response_locked(HttpResponse& out) {
        std::string head;
        if (!conn->recv_until(head, "\r\n\r\n", (1u<<20))) return false;

        std::size_t hdr_end_off = 0;
        if (!internal::parse_http_response(head, hdr_end_off, out.status_code,
                                           out.status_text, out.headers)) {
            hs::log_line("[CLIENT] malformed response head");
            return false;
        }

        std::size_t content_len = 0;
        const std::string* cl = internal::find_header(out.headers, "content-length");
        if (!cl || !parse_length(*cl, content_len)) {
            hs::log_line("[CLIENT] response without a usable Content-Length");
            return false;
        }

        out.body.assign(head, hdr_end_off, std::string::npos);
        if (out.body.size() > content_len) out.body.resize(content_len);
        while (out.body.size() < content_len) {
            if (!conn->recv_some(out.body, content_len - out.body.size())) return false;
        }

        const std::string c = internal::lower_copy(internal::hdr_ci(out.headers, "connection"));
        served_on_conn++;
        if (c == "close" || served_on_conn >= cfg.ka_max) {
            close_conn_locked();
        }
        return true;
    }
};

Client::Client(const ClientConfig& cfg)
    : _p(std::make_unique<Client::Impl>(cfg)) {}

Client::~Client() = default;

bool Client::request(const std::string& method,
                     const std::string& path,
                     const QueryParams& query,
                     const std::string& body,
                     HttpResponse& out)
{
    // The server sees base_path as part of the path, so it is signed too.
    std::string full_path = _p->cfg.base_path;
    if (!full_path.empty() && full_path[0] != '/') full_path = "/" + full_path;
    if (!full_path.empty() && full_path.back() == '/' && !path.empty() && path[0] == '/') {
        full_path.pop_back();
    }
    full_path += path;
    if (full_path.empty()) full_path = "/";

    SignedRequest sr;
    try {
        sr = _p->signer.sign(method, full_path, query, body, _p->cfg.content_type);
    } catch (const std::exception& e) {
        hs::log_line(std::string("[CLIENT] signing failed: ") + e.what());
        return false;
    }
    if (_p->cfg.verbose) {
        hs::log_line("[CLIENT] canonical request:\n" + sr.canonical);
    }

    std::ostringstream req;
    req << sr.method << " " << sr.target() << " HTTP/1.1\r\n";
    req << "Host: " << _p->cfg.host << "\r\n";
    req << "User-Agent: hs-client/1\r\n";
    req << "Accept: */*\r\n";
    for (const auto& kv : sr.headers) {
        req << kv.first << ": " << kv.second << "\r\n";
    }
    req << "Connection: keep-alive\r\n";
    req << "\r\n";
    const std::string head = req.str();

    std::lock_guard<std::mutex> lk(_p->mtx);
    // One retry: the server may have closed an idle keep-alive connection.
    for (int attempt = 0; attempt < 2; ++attempt) {
        const bool reused = (_p->conn != nullptr);
        if (!_p->ensure_conn_locked()) return false;

        bool sent = _p->conn->send_all(head.data(), head.size());
        if (sent && !body.empty()) sent = _p->conn->send_all(body.data(), body.size());
        if (sent && _p->recv_response_locked(out)) return true;

        _p->close_conn_locked();
        if (!reused) break;
    }
    hs::log_line("[CLIENT] request failed: " + sr.method + " " + sr.target());
    return false;
}

bool Client::get(const std::string& path, const QueryParams& query, HttpResponse& out) {
    return request("GET", path, query, /*body*/"", out);
}

bool Client::post(const std::string& path, const std::string& body, HttpResponse& out) {
    return request("POST", path, /*query*/{}, body, out);
}

} // namespace hs
