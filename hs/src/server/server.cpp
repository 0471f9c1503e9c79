/*
 * Part of the HmacSeal (HS) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacSeal contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacSeal (HS). See LICENSE for details.
 */

#include "hs/server.hpp"
#include "hs/log.hpp"
#include "hs/internal/http_plain.hpp"

#include <stdexcept>
#include <string>
#include <cstdio>
#include <cstring>
#include <cerrno>
#include <thread>
#include <utility>

#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <unistd.h>

namespace hs {

// ---------- small socket helpers (internal) ----------

static int set_reuseaddr(int s) { int o = 1; return ::setsockopt(s, SOL_SOCKET, SO_REUSEADDR, &o, sizeof(o)); }
static int set_nodelay (int s)  { int o = 1; return ::setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &o, sizeof(o)); }

static std::string sockaddr_to_ip(const sockaddr_storage& ss) {
    char buf[INET6_ADDRSTRLEN] = {0};
    if (ss.ss_family == AF_INET) {
        const sockaddr_in* a = reinterpret_cast<const sockaddr_in*>(&ss);
        inet_ntop(AF_INET, &a->sin_addr, buf, sizeof(buf));
    } else if (ss.ss_family == AF_INET6) {
        const sockaddr_in6* a = reinterpret_cast<const sockaddr_in6*>(&ss);
        inet_ntop(AF_INET6, &a->sin6_addr, buf, sizeof(buf));
    } else {
        std::snprintf(buf, sizeof(buf), "unknown");
    }
    return std::string(buf);
}

// ---------- Server impl ----------

Server::Server(const ServerConfig& cfg)
    : _cfg(std::make_shared<const ServerConfig>(cfg))
    , _keys(std::make_shared<internal::KeyStore>())
{
    // --- Initialize key backend (file or Redis) ---
    if (_cfg->auth_use_redis) {
        internal::KeyStore::RedisOptions ropt;
        ropt.host          = _cfg->redis.host;
        ropt.port          = _cfg->redis.port;
        ropt.db            = _cfg->redis.db;
        ropt.password      = _cfg->redis.password;
        ropt.key_prefix    = _cfg->redis.key_prefix;
        ropt.pool_size     = _cfg->redis.pool_size;
        ropt.timeout_ms    = _cfg->redis.timeout_ms;
        ropt.cache_ttl_sec = _cfg->redis.cache_ttl_sec;

        if (!_keys->init_redis(ropt)) {
            throw std::runtime_error("KeyStore: failed to init Redis backend");
        }
    } else {
        if (_cfg->auth_file.empty()) {
            throw std::runtime_error("KeyStore: auth_file is required when Redis is disabled");
        }
        if (!_keys->init_file(_cfg->auth_file)) {
            throw std::runtime_error("KeyStore: failed to load auth_file");
        }
    }

    // Lookups run on worker threads so the verifier timeout bounds Redis stalls.
    // The shared_ptr keeps the store alive for lookups that outlast a request.
    std::shared_ptr<internal::KeyStore> keys = _keys;
    _verifier = std::make_shared<const Verifier>(
        _cfg->verifier,
        make_threaded_delegate([keys](const std::string& api_key) {
            return keys->lookup(api_key);
        }));
}

Server::~Server() {
    stop();
}

void Server::stop() {
    _stop.store(true, std::memory_order_relaxed);
    const int fd = _listen_fd.exchange(-1);
    if (fd >= 0) {
        // Unblocks accept() in serve_plain.
        ::shutdown(fd, SHUT_RDWR);
        ::close(fd);
    }
}

int Server::create_listen_socket() {
    int srv = ::socket(AF_INET, SOCK_STREAM, 0);
    if (srv < 0) {
        hs::log_line(std::string("[FATAL] socket() failed: ") + std::strerror(errno));
        throw std::runtime_error("socket() failed");
    }
    (void)set_reuseaddr(srv);

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(_cfg->port);

    if (bind(srv, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        hs::log_line(std::string("[FATAL] bind() failed: ") + std::strerror(errno));
        ::close(srv);
        throw std::runtime_error("bind() failed");
    }
    if (listen(srv, 512) < 0) {
        hs::log_line(std::string("[FATAL] listen() failed: ") + std::strerror(errno));
        ::close(srv);
        throw std::runtime_error("listen() failed");
    }
    sockaddr_in bound{};
    socklen_t blen = sizeof(bound);
    if (::getsockname(srv, reinterpret_cast<sockaddr*>(&bound), &blen) == 0) {
        _bound_port.store(ntohs(bound.sin_port));
    }
    return srv;
}

void Server::run() {
    const VerifierConfig& vc = _cfg->verifier;

    hs::log_line("[INFO] HmacSeal server starting...");
    hs::log_line("[INFO] Port: " + std::to_string(_cfg->port));
    if (_cfg->auth_use_redis) {
        hs::log_line(std::string("[INFO] Key backend: REDIS host=") + _cfg->redis.host +
                     ":" + std::to_string(_cfg->redis.port) +
                     " db=" + std::to_string(_cfg->redis.db) +
                     " prefix=" + _cfg->redis.key_prefix);
    } else {
        hs::log_line("[INFO] Key backend: FILE " + _cfg->auth_file);
    }
    hs::log_line("[INFO] Secret lookup timeout=" + std::to_string(vc.secret_for_key_timeout_ms) +
                 "ms, timestamp skew=" + std::to_string(vc.permitted_timestamp_skew_ms) +
                 "ms, body limit=" + std::to_string(vc.body_size_limit) + "B" +
                 (vc.verbose ? ", verbose" : ""));
    if (_cfg->redact_errors) {
        hs::log_line("[INFO] Error redaction: ENABLED");
    }
    hs::log_line("[INFO] KA timeout=" + std::to_string(_cfg->ka_timeout_sec) +
                 "s, KA max=" + std::to_string(_cfg->ka_max));

    serve_plain();
}

void Server::serve_plain() {
    int srv = create_listen_socket();
    _listen_fd.store(srv);
    hs::log_line(std::string("[INFO] Listening HTTP on :") + std::to_string(port()));
    if (_stop.load(std::memory_order_relaxed)) {
        // stop() ran before the socket existed.
        const int fd = _listen_fd.exchange(-1);
        if (fd >= 0) ::close(fd);
        return;
    }

    while (!_stop.load(std::memory_order_relaxed)) {
        sockaddr_storage cli{};
        socklen_t cl = sizeof(cli);
        int fd = ::accept(srv, reinterpret_cast<sockaddr*>(&cli), &cl);
        if (fd < 0) {
            if (errno == EINTR) continue;
            if (_stop.load(std::memory_order_relaxed)) break;
            // transient error; continue
            continue;
        }
        (void)set_nodelay(fd);
        std::string peer = sockaddr_to_ip(cli);

        // Detach a per-connection handler; it will manage the fd lifetime.
        std::thread([cfg = _cfg, verifier = _verifier, fd, peer]() {
            internal::handle_connection_plain(fd, *cfg, peer, *verifier);
            // handler is responsible for closing the fd
        }).detach();
    }

    const int still = _listen_fd.exchange(-1);
    if (still >= 0) ::close(still);
}

} // namespace hs
