/*
 * Part of the HmacSeal (HS) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacSeal contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacSeal (HS). See LICENSE for details.
 */

#pragma once
#include <string>
#include <unordered_map>
#include <cstddef>
#include "hs/client_config.hpp"

namespace hs::internal {

// RAII TCP connection with timeouts and basic send/recv helpers.
class TcpConn {
public:
    TcpConn() = default;
    ~TcpConn();

    TcpConn(const TcpConn&) = delete;
    TcpConn& operator=(const TcpConn&) = delete;

    // Open TCP connection to cfg.host:cfg.port with timeouts.
    bool open(const hs::ClientConfig& cfg);

    void close();
    int  fd() const { return _fd; }

    bool send_all(const char* d, std::size_t len);
    bool recv_some(std::string& out, std::size_t max_chunk);
    bool recv_until(std::string& out, const std::string& delim, std::size_t max_total = (1u<<20));

private:
    int _fd = -1;
};

// Parse an HTTP/1.x status line and header block. Header names are
// lower-cased. hdr_end_off points past the blank line.
bool parse_http_response(const std::string& head_and_maybe_body,
                         std::size_t& hdr_end_off,
                         int& status_code,
                         std::string& status_text,
                         std::unordered_map<std::string,std::string>& headers);

} // namespace hs::internal
