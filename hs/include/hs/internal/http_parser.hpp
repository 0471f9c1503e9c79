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
#include "hs/http_request.hpp"

namespace hs::internal {

// Parse "GET /path?x=1 HTTP/1.1"; the target is split into path and raw query.
bool parse_request_line(const std::string& line, hs::HttpRequest& r);

// Parse request line + header block (no trailing blank line). Header names
// are lower-cased, names and values trimmed; a repeated header keeps the
// first value.
bool parse_request_head(const std::string& head, hs::HttpRequest& r);

// Case-insensitive header lookup; nullptr when absent.
const std::string* find_header(const std::unordered_map<std::string,std::string>& H,
                               const char* name);

// Case-insensitive header lookup; empty when absent.
std::string hdr_ci(const std::unordered_map<std::string,std::string>& H, const char* name);
std::string hdr_ci(const hs::HttpRequest& R, const char* name);

} // namespace hs::internal
