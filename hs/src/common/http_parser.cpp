/*
 * Part of the HmacSeal (HS) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacSeal contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacSeal (HS). See LICENSE for details.
 */

#include "hs/internal/http_parser.hpp"
#include "hs/internal/utils.hpp"
#include <sstream>
#include <strings.h> // strcasecmp

namespace hs::internal {

bool parse_request_line(const std::string& line, hs::HttpRequest& r) {
    std::istringstream iss(line);
    std::string method, target, ver, extra;
    if (!(iss >> method >> target >> ver)) return false;
    if (iss >> extra) return false;
    if (ver.rfind("HTTP/", 0) != 0) return false;
    if (target.empty() || target[0] != '/') return false;

    const std::size_t q = target.find('?');
    r.method  = method;
    r.path    = target.substr(0, q);
    r.query   = (q == std::string::npos) ? std::string() : target.substr(q + 1);
    r.httpver = ver;
    return true;
}

bool parse_request_head(const std::string& head, hs::HttpRequest& r) {
    std::size_t line_end = head.find("\r\n");
    const std::string first = head.substr(0, line_end);
    if (!parse_request_line(first, r)) return false;

    r.headers.clear();
    if (line_end == std::string::npos) return true;

    std::size_t pos = line_end + 2;
    while (pos < head.size()) {
        std::size_t next = head.find("\r\n", pos);
        if (next == std::string::npos) next = head.size();
        std::string line = head.substr(pos, next - pos);
        pos = next + 2;
        std::size_t c = line.find(':');
        if (c == std::string::npos) {
            if (trim_copy(line).empty()) continue;
            return false;
        }
        std::string k = line.substr(0, c), v = line.substr(c + 1);
        trim_inplace(k);
        trim_inplace(v);
        if (k.empty()) return false;
        r.headers.emplace(lower_copy(k), v);
    }
    return true;
}

const std::string* find_header(const std::unordered_map<std::string,std::string>& H,
                               const char* name)
{
    auto it = H.find(name);
    if (it != H.end()) return &it->second;
    for (const auto& kv : H) {
        if (strcasecmp(kv.first.c_str(), name) == 0) return &kv.second;
    }
    return nullptr;
}

std::string hdr_ci(const std::unordered_map<std::string,std::string>& H, const char* name) {
    const std::string* v = find_header(H, name);
    return v ? *v : std::string();
}

std::string hdr_ci(const hs::HttpRequest& R, const char* name) {
    return hdr_ci(R.headers, name);
}

} // namespace hs::internal
