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

namespace hs::internal {

// Trim spaces from both sides (in-place).
void trim_inplace(std::string& s);
std::string trim_copy(std::string s);

// Hex helpers
int  hexval(char c);
std::string bytes_to_hex(const unsigned char* p, std::size_t n);

// SHA-256 as lower-case hex (uses OpenSSL from .cpp)
std::string sha256_hex(const std::string& data);

// Constant-effort equality; length mismatch fails early.
bool ct_equal(const std::string& a, const std::string& b);

// Upper / lower
std::string upper_copy(std::string s);
std::string lower_copy(std::string s);

// Securely wipe string contents
void secure_wipe(std::string& s);

// Escape for embedding inside a JSON string literal.
std::string json_escape(const std::string& s);

} // namespace hs::internal
