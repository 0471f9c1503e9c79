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
#include "hs/verifier_config.hpp"

namespace hs {

struct ServerConfig {
    // Core
    uint16_t port = 8080;

    // Signature verification (timeouts, skew, body limit, verbose)
    VerifierConfig verifier;

    // Key file ("<api_key> <secret>" per line; ignored when auth_use_redis=true)
    std::string auth_file;

    // Error redaction
    bool redact_errors = false;

    // Request head guard
    std::size_t max_header_bytes = 64 * 1024;

    // Keep-alive
    int  ka_timeout_sec = 5;
    int  ka_max         = 100;

    // ---- Redis key backend ----
    bool auth_use_redis = false;
    struct {
        std::string host = "127.0.0.1";
        int         port = 6379;
        int         db   = 0;
        std::string password;
        std::string key_prefix = "hs:key:";
        int         pool_size  = 8;
        int         timeout_ms = 200;
        int         cache_ttl_sec = 60;
    } redis;
};

} // namespace hs
