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
#include <cstdint>
#include <ctime>

namespace hs {

// RFC 1123 date as used by the HTTP `date` header: "Tue, 20 Apr 2016 18:48:24 GMT".
std::string format_http_date(std::time_t t);
std::string http_date_now();

// Accepts RFC 1123, ISO8601 "YYYY-MM-DDTHH:MM:SSZ" or unix seconds.
bool parse_timestamp(const std::string& s, std::int64_t& out_epoch);

// Milliseconds since the unix epoch (system clock).
std::int64_t unix_now_ms();

} // namespace hs
