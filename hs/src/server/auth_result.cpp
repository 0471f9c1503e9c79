/*
 * Part of the HmacSeal (HS) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacSeal contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacSeal (HS). See LICENSE for details.
 */

#include "hs/auth_result.hpp"
#include "hs/verifier_config.hpp"
#include "hs/internal/utils.hpp"
#include <cctype>
#include <limits>
#include <stdexcept>

namespace hs {

const char* auth_status_name(AuthStatus s) {
    switch (s) {
    case AuthStatus::Authenticated: return "authenticated";
    case AuthStatus::Rejected:      return "rejected";
    case AuthStatus::Errored:       return "errored";
    }
    return "";
}

std::string to_json(const AuthResult& r) {
    using internal::json_escape;
    if (r.ok()) {
        return R"({"apiKey":")" + json_escape(r.api_key) +
               R"(","signature":")" + json_escape(r.signature) + R"("})";
    }
    std::string out = R"({"message":")" + json_escape(r.message) +
                      R"(","code":")" + json_escape(r.code) + "\"";
    if (!r.details.empty()) out += R"(,"details":")" + json_escape(r.details) + "\"";
    if (!r.time.empty())    out += R"(,"time":")" + json_escape(r.time) + "\"";
    out += "}";
    return out;
}

bool parse_size(const std::string& raw, std::size_t& out_bytes) {
    const std::string s = internal::lower_copy(internal::trim_copy(raw));
    std::size_t i = 0;
    while (i < s.size() && std::isdigit((unsigned char)s[i])) ++i;
    if (i == 0) return false;

    std::string unit = s.substr(i);
    internal::trim_inplace(unit);
    std::size_t mul = 1;
    if (unit.empty() || unit == "b")  mul = 1;
    else if (unit == "kb")            mul = std::size_t(1) << 10;
    else if (unit == "mb")            mul = std::size_t(1) << 20;
    else if (unit == "gb")            mul = std::size_t(1) << 30;
    else return false;

    unsigned long long n = 0;
    try {
        n = std::stoull(s.substr(0, i));
    } catch (const std::out_of_range&) {
        return false;
    }
    if (n > std::numeric_limits<std::size_t>::max() / mul) return false;
    out_bytes = static_cast<std::size_t>(n) * mul;
    return true;
}

} // namespace hs
