/*
 * Part of the HmacSeal (HS) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacSeal contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacSeal (HS). See LICENSE for details.
 */

#pragma once
#include <memory>
#include <atomic>
#include <cstdint>
#include "hs/server_config.hpp"
#include "hs/verifier.hpp"
#include "hs/internal/key_store.hpp"

namespace hs {

// Plain HTTP/1.1 server that authenticates every request (except /health)
// with a Verifier backed by the configured key store.
class Server {
public:
    explicit Server(const ServerConfig& cfg);
    ~Server();

    // Blocking run: create socket, listen and accept.
    void run();

    // Sets the stop flag and closes the listening socket. Open connections
    // are served to completion; they keep their own references to the
    // config and verifier.
    void stop();

    // Port the listener is bound to (useful with port 0); 0 until listening.
    uint16_t port() const { return static_cast<uint16_t>(_bound_port.load()); }

private:
    // Shared with the detached connection threads, which may outlive the Server.
    std::shared_ptr<const ServerConfig> _cfg;
    std::shared_ptr<internal::KeyStore> _keys;
    std::shared_ptr<const Verifier> _verifier;
    std::atomic<bool> _stop{false};
    std::atomic<int>  _listen_fd{-1};
    std::atomic<int>  _bound_port{0};

    void serve_plain();

    // helpers
    int create_listen_socket();
};

} // namespace hs
