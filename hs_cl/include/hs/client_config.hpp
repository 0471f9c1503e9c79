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
#include <cstddef>
#include <cstdint>

namespace hs {

// Public client configuration. Per-instance; thread-safe at call level.
struct ClientConfig {
    // Endpoint
    std::string host = "127.0.0.1";
    std::uint16_t port = 8080;
    std::string  base_path = "";   // optional path prefix, e.g. "/api"

    // Credentials (single API key for this client instance)
    std::string api_key;
    std::string secret;
    std::string algorithm = "sha256";   // sha1 | sha256 | sha512

    // Sent and signed for requests that carry a body
    std::string content_type = "application/json";

    // Timeouts
    int connect_timeout_sec = 5;   // TCP connect timeout
    int io_timeout_sec      = 5;   // recv/send timeout
    int ka_max              = 100; // max requests per connection before re-open

    // Logging
    std::string log_file;          // empty: stdout only
    bool verbose = false;          // log canonical strings
};

} // namespace hs
