/*
 * Part of the HmacSeal (HS) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacSeal contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacSeal (HS). See LICENSE for details.
 */

#include "hs/canonical.hpp"
#include "hs/internal/utils.hpp"
#include <algorithm>
#include <map>
#include <utility>
#include <sstream>

namespace hs {

const std::vector<std::string>& signed_header_names() {
    static const std::vector<std::string> names = {
        "content-length", "content-type", "date", "x-api-key"
    };
    return names;
}

static bool is_unreserved(unsigned char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '-' || c == '.' || c == '_' || c == '~';
}

std::string url_encode(const std::string& s) {
    static const char* H = "0123456789ABCDEF";
    std::string out; out.reserve(s.size()*3);
    for (unsigned char c : s) {
        if (is_unreserved(c)) {
            out.push_back((char)c);
        } else {
            out.push_back('%');
            out.push_back(H[c>>4]);
            out.push_back(H[c&0xF]);
        }
    }
    return out;
}

std::string url_decode(const std::string& s) {
    std::string o; o.reserve(s.size());
    for (std::size_t i=0;i<s.size();++i) {
        if (s[i]=='%' && i+2<s.size()) {
            int hi=internal::hexval(s[i+1]), lo=internal::hexval(s[i+2]);
            if (hi>=0 && lo>=0) { o.push_back((char)((hi<<4)|lo)); i+=2; continue; }
        }
        if (s[i]=='+') { o.push_back(' '); continue; }
        o.push_back(s[i]);
    }
    return o;
}

QueryPairs parse_query(const std::string& q) {
    QueryPairs out;
    std::size_t p = 0;
    while (p <= q.size()) {
        std::size_t amp = q.find('&', p);
        if (amp == std::string::npos) amp = q.size();
        const std::string tok = q.substr(p, amp - p);
        if (!tok.empty()) {
            const std::size_t eq = tok.find('=');
            if (eq == std::string::npos) {
                out.emplace_back(url_decode(tok), std::string());
            } else {
                out.emplace_back(url_decode(tok.substr(0, eq)), url_decode(tok.substr(eq + 1)));
            }
        }
        p = amp + 1;
    }
    return out;
}

static void flatten_into(const std::string& key, const QueryValue& v, QueryPairs& out) {
    switch (v.kind) {
    case QueryValue::Kind::Scalar:
        out.emplace_back(key, v.scalar);
        break;
    case QueryValue::Kind::List:
        for (std::size_t i = 0; i < v.items.size(); ++i) {
            flatten_into(key + "[" + std::to_string(i) + "]", v.items[i], out);
        }
        break;
    case QueryValue::Kind::Map:
        for (const auto& f : v.fields) {
            flatten_into(key + "[" + f.first + "]", f.second, out);
        }
        break;
    }
}

QueryPairs flatten_query(const QueryParams& params) {
    QueryPairs out;
    for (const auto& kv : params) {
        flatten_into(kv.first, kv.second, out);
    }
    return out;
}

std::string canonical_query(const QueryPairs& pairs) {
    std::vector<std::pair<std::string,std::string>> v;
    v.reserve(pairs.size());
    for (const auto& kv : pairs) {
        v.emplace_back(url_encode(kv.first), url_encode(kv.second));
    }
    std::sort(v.begin(), v.end(), [](const auto& a, const auto& b){
        if(a.first<b.first) return true;
        if(a.first>b.first) return false;
        return a.second<b.second;
    });
    std::ostringstream oss;
    bool first=true;
    for (const auto& kv : v) {
        if(!first) oss << '&';
        first=false;
        oss << kv.first << '=' << kv.second;
    }
    return oss.str();
}

std::string canonical_headers(const HeaderMap& headers, bool has_body) {
    // std::map keeps the lines sorted by lower-cased name.
    // Value: (original name, trimmed value).
    std::map<std::string, std::pair<std::string, std::string>> picked;
    for (const auto& kv : headers) {
        const std::string name = internal::lower_copy(kv.first);
        if (!has_body && (name == "content-length" || name == "content-type")) continue;
        const auto& allowed = signed_header_names();
        if (std::find(allowed.begin(), allowed.end(), name) == allowed.end()) continue;

        // Names differing only in case: the lower-case spelling wins,
        // otherwise the smallest original name.
        auto it = picked.find(name);
        if (it != picked.end()) {
            const std::string& prev = it->second.first;
            if (prev == name) continue;
            if (kv.first != name && !(kv.first < prev)) continue;
        }
        picked[name] = {kv.first, internal::trim_copy(kv.second)};
    }
    std::ostringstream oss;
    bool first=true;
    for (const auto& kv : picked) {
        if(!first) oss << '\n';
        first=false;
        oss << kv.first << ':' << kv.second.second;
    }
    return oss.str();
}

std::string canonicalize(const std::string& method,
                         const std::string& path,
                         const QueryPairs& query,
                         const HeaderMap& headers,
                         const std::string& body)
{
    std::ostringstream oss;
    oss << internal::upper_copy(method)              << "\n"
        << path                                      << "\n"
        << canonical_query(query)                    << "\n"
        << canonical_headers(headers, !body.empty()) << "\n"
        << internal::sha256_hex(body);
    return oss.str();
}

} // namespace hs
