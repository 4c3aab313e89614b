/*
 * Part of the SharedKey Auth (SKA) project.
 *
 * SPDX-FileCopyrightText: 2025 SKA contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SharedKey Auth (SKA). See LICENSE for details.
 */

#include "ska/internal/time.hpp"
#include <cctype>
#include <cstdio>
#include <cstring>
#include <ctime>

namespace ska::internal {

namespace {

const char* const kWeekdays[7] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
const char* const kMonths[12]  = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                  "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

bool digits(const std::string& s, std::size_t pos, std::size_t n, int& out) {
    out = 0;
    for (std::size_t i = pos; i < pos + n; ++i) {
        if (!std::isdigit((unsigned char)s[i])) return false;
        out = out * 10 + (s[i] - '0');
    }
    return true;
}

int days_in_month(int year, int mon0) {
    static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (mon0 == 1) {
        const bool leap = (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
        return leap ? 29 : 28;
    }
    return kDays[mon0];
}

} // namespace

std::string format_http_date(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[40]{0};
    std::snprintf(buf, sizeof(buf), "%s, %02d %s %04d %02d:%02d:%02d GMT",
                  kWeekdays[tm.tm_wday], tm.tm_mday, kMonths[tm.tm_mon],
                  tm.tm_year + 1900, tm.tm_hour, tm.tm_min, tm.tm_sec);
    return std::string(buf);
}

bool parse_http_date(const std::string& s, std::chrono::system_clock::time_point& out) {
    // "Sun, 06 Nov 1994 08:49:37 GMT"
    if (s.size() != 29 || s[3] != ',' || s[4] != ' ' || s[7] != ' ' ||
        s[11] != ' ' || s[16] != ' ' || s[19] != ':' || s[22] != ':' ||
        s.compare(25, 4, " GMT") != 0)
    {
        return false;
    }

    int wday = -1;
    for (int i = 0; i < 7; ++i) {
        if (s.compare(0, 3, kWeekdays[i]) == 0) { wday = i; break; }
    }
    int mon = -1;
    for (int i = 0; i < 12; ++i) {
        if (s.compare(8, 3, kMonths[i]) == 0) { mon = i; break; }
    }
    if (wday < 0 || mon < 0) return false;

    int d = 0, y = 0, H = 0, M = 0, S = 0;
    if (!digits(s, 5, 2, d) || !digits(s, 12, 4, y) || !digits(s, 17, 2, H) ||
        !digits(s, 20, 2, M) || !digits(s, 23, 2, S))
    {
        return false;
    }
    if (y < 1970 || d < 1 || d > days_in_month(y, mon) || H > 23 || M > 59 || S > 59) {
        return false;
    }

    std::tm tm{};
    tm.tm_year = y - 1900;
    tm.tm_mon  = mon;
    tm.tm_mday = d;
    tm.tm_hour = H;
    tm.tm_min  = M;
    tm.tm_sec  = S;
    // timegm is GNU extension (Linux)
    const std::time_t epoch = timegm(&tm);
    if (epoch == (std::time_t)-1) return false;

    std::tm check{};
    gmtime_r(&epoch, &check);
    if (check.tm_wday != wday) return false;

    out = std::chrono::system_clock::from_time_t(epoch);
    return true;
}

} // namespace ska::internal
