/*
 * Part of the HmacSeal (HS) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacSeal contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacSeal (HS). See LICENSE for details.
 */

#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace hs {

struct VerifierConfig {
    // Upper bound for the secret delegate to answer.
    int          secret_for_key_timeout_ms   = 10 * 1000;

    // Allowed distance between the `date` header and the server clock,
    // in either direction.
    std::int64_t permitted_timestamp_skew_ms = 60 * 1000;

    // Cap for bodies drained by the verifier (BodySource::Drain).
    std::size_t  body_size_limit = 5 * 1024 * 1024;

    // Log every step of the verification through hs::log_line.
    bool         verbose = false;
};

// "5mb", "512kb", "1gb", "100b" or "100" -> bytes (binary multiples).
bool parse_size(const std::string& s, std::size_t& out_bytes);

} // namespace hs
