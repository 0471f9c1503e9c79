/*
 * Part of the HmacSeal (HS) project.
 *
 * SPDX-FileCopyrightText: 2025 HmacSeal contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of HmacSeal (HS). See LICENSE for details.
 */

#include "hs/internal/time.hpp"
#include "hs/internal/utils.hpp"
#include <algorithm> // std::all_of
#include <chrono>
#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace hs {

std::string format_http_date(std::time_t t) {
    std::tm tm{};
    gmtime_r(&t, &tm);
    // strftime %a/%b follow LC_TIME; the header must stay English.
    static const char* kDays[]   = {"Sun","Mon","Tue","Wed","Thu","Fri","Sat"};
    static const char* kMonths[] = {"Jan","Feb","Mar","Apr","May","Jun",
                                    "Jul","Aug","Sep","Oct","Nov","Dec"};
    char buf[40]{0};
    const int n = std::snprintf(buf, sizeof(buf), "%s, %02d %s %04d %02d:%02d:%02d GMT",
                                kDays[tm.tm_wday % 7], tm.tm_mday, kMonths[tm.tm_mon % 12],
                                tm.tm_year + 1900, tm.tm_hour, tm.tm_min, tm.tm_sec);
    if (n <= 0) return {};
    return std::string(buf, static_cast<std::size_t>(n));
}

std::string http_date_now() {
    return format_http_date(std::time(nullptr));
}

std::int64_t unix_now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

static int month_index(const std::string& m) {
    static const char* kMonths[] = {"jan","feb","mar","apr","may","jun",
                                    "jul","aug","sep","oct","nov","dec"};
    const std::string lm = internal::lower_copy(m);
    for (int i = 0; i < 12; ++i) {
        if (lm == kMonths[i]) return i;
    }
    return -1;
}

static bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
                                     [](unsigned char c){ return std::isdigit(c) != 0; });
}

// "Tue, 20 Apr 2016 18:48:24 GMT"
static bool parse_rfc1123(const std::string& s, std::int64_t& out_epoch) {
    const std::size_t comma = s.find(',');
    if (comma == std::string::npos) return false;

    char mon[4]{0};
    char zone[4]{0};
    int d = 0, y = 0, H = 0, M = 0, S = 0;
    int consumed = 0;
    const std::string rest = s.substr(comma + 1);
    if (std::sscanf(rest.c_str(), " %2d %3s %4d %2d:%2d:%2d %3s%n",
                    &d, mon, &y, &H, &M, &S, zone, &consumed) != 7) {
        return false;
    }
    if (static_cast<std::size_t>(consumed) != rest.size()) return false;
    if (internal::upper_copy(zone) != "GMT") return false;

    const int m = month_index(mon);
    if (m < 0 || d < 1 || d > 31 || H > 23 || M > 59 || S > 60) return false;

    std::tm tm{};
    tm.tm_year = y - 1900;
    tm.tm_mon  = m;
    tm.tm_mday = d;
    tm.tm_hour = H;
    tm.tm_min  = M;
    tm.tm_sec  = S;
    // timegm is GNU extension (Linux)
    out_epoch = timegm(&tm);
    return (out_epoch != -1);
}

bool parse_timestamp(const std::string& raw, std::int64_t& out_epoch) {
    const std::string s = internal::trim_copy(raw);

    // numeric unix seconds
    if (all_digits(s)) {
        try {
            out_epoch = std::stoll(s);
            return true;
        } catch (const std::out_of_range&) {
            return false;
        }
    }
    // ISO8601 "YYYY-MM-DDTHH:MM:SSZ"
    if (s.size() == 20 && s[4] == '-' && s[7] == '-' &&
        s[10] == 'T' && s[13] == ':' && s[16] == ':' && s[19] == 'Z')
    {
        const std::string parts[] = {s.substr(0, 4), s.substr(5, 2), s.substr(8, 2),
                                     s.substr(11, 2), s.substr(14, 2), s.substr(17, 2)};
        for (const auto& p : parts) {
            if (!all_digits(p)) return false;
        }
        const int y = std::stoi(parts[0]);
        const int m = std::stoi(parts[1]);
        const int d = std::stoi(parts[2]);
        const int H = std::stoi(parts[3]);
        const int M = std::stoi(parts[4]);
        const int S = std::stoi(parts[5]);
        if (m < 1 || m > 12 || d < 1 || d > 31 || H > 23 || M > 59 || S > 60) return false;

        std::tm tm{};
        tm.tm_year = y - 1900;
        tm.tm_mon  = m - 1;
        tm.tm_mday = d;
        tm.tm_hour = H;
        tm.tm_min  = M;
        tm.tm_sec  = S;
        out_epoch = timegm(&tm);
        return (out_epoch != -1);
    }
    return parse_rfc1123(s, out_epoch);
}

} // namespace hs
