/*
 * Part of the HmacSeal (HS) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacSeal contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacSeal (HS). See LICENSE for details.
 */

#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace hs {

// HMAC variants accepted on the wire as "sha1", "sha256", "sha512".
enum class Algorithm { Sha1, Sha256, Sha512 };

class UnsupportedAlgorithm : public std::invalid_argument {
public:
    explicit UnsupportedAlgorithm(const std::string& name);
    const std::string& name() const noexcept { return _name; }

private:
    std::string _name;
};

std::optional<Algorithm> parse_algorithm(const std::string& name);
const char* algorithm_name(Algorithm alg);

// Wire names of every supported algorithm, in a stable order.
const std::vector<std::string>& supported_algorithms();

// hex(HMAC(secret, canonical)). Throws std::runtime_error if OpenSSL fails.
std::string sign(const std::string& canonical, const std::string& secret, Algorithm alg);

// Same, by wire name. Throws UnsupportedAlgorithm for unknown names.
std::string sign(const std::string& canonical, const std::string& secret,
                 const std::string& algorithm);

} // namespace hs
