// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "format_utils.h"

#include <cctype>
#include <cstdio>

namespace magpie::format {

namespace {

constexpr size_t FRACTION_DIGITS = 9;
constexpr int64_t NANOS_PER_SECOND = 1000000000;

// Span representable by an int64 nanosecond count (1678-01-01 .. 2261-12-31)
constexpr int64_t MIN_EPOCH_SECONDS = -9214560000;
constexpr int64_t MAX_EPOCH_SECONDS = 9214646399;

// Days since 1970-01-01 for a proleptic Gregorian date (H. Hinnant's algorithm)
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civil_from_days(int64_t z, int& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<int>(static_cast<int64_t>(yoe) + era * 400 + (m <= 2));
}

bool is_leap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned days_in_month(int y, unsigned m) {
    static const unsigned DAYS[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && is_leap(y)) ? 29 : DAYS[m - 1];
}

// Reads exactly n digits at pos, advancing pos
bool read_digits(const std::string& s, size_t& pos, size_t n, int& out) {
    if (pos + n > s.size()) {
        return false;
    }
    int v = 0;
    for (size_t i = 0; i < n; ++i) {
        char c = s[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        v = v * 10 + (c - '0');
    }
    pos += n;
    out = v;
    return true;
}

bool expect(const std::string& s, size_t& pos, char c) {
    if (pos >= s.size() || s[pos] != c) {
        return false;
    }
    ++pos;
    return true;
}

} // namespace

// =============================================================================
// Timestamps
// =============================================================================

std::optional<Timestamp> parse_iso8601(const std::string& text) {
    size_t pos = 0;
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

    if (!read_digits(text, pos, 4, year) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, month) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, day)) {
        return std::nullopt;
    }
    if (pos >= text.size() || (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' ')) {
        return std::nullopt;
    }
    ++pos;
    if (!read_digits(text, pos, 2, hour) || !expect(text, pos, ':') ||
        !read_digits(text, pos, 2, minute) || !expect(text, pos, ':') ||
        !read_digits(text, pos, 2, second)) {
        return std::nullopt;
    }

    if (month < 1 || month > 12 || day < 1 ||
        static_cast<unsigned>(day) > days_in_month(year, static_cast<unsigned>(month)) ||
        hour > 23 || minute > 59 || second > 59) {
        return std::nullopt;
    }

    int64_t nanos = 0;
    if (pos < text.size() && (text[pos] == '.' || text[pos] == ',')) {
        ++pos;
        size_t digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (++digits > FRACTION_DIGITS) {
                return std::nullopt;
            }
            nanos = nanos * 10 + (text[pos] - '0');
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (size_t i = digits; i < FRACTION_DIGITS; ++i) {
            nanos *= 10;
        }
    }

    int offset_minutes = 0;
    if (pos < text.size()) {
        char c = text[pos++];
        if (c == 'Z' || c == 'z') {
            // UTC
        } else if (c == '+' || c == '-') {
            int oh = 0, om = 0;
            if (!read_digits(text, pos, 2, oh) || !expect(text, pos, ':') ||
                !read_digits(text, pos, 2, om) || oh > 23 || om > 59) {
                return std::nullopt;
            }
            offset_minutes = (c == '+' ? 1 : -1) * (oh * 60 + om);
        } else {
            return std::nullopt;
        }
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    int64_t secs = days * 86400 + hour * 3600 + minute * 60 + second - offset_minutes * 60;
    if (secs < MIN_EPOCH_SECONDS || secs > MAX_EPOCH_SECONDS) {
        return std::nullopt;
    }
    return Timestamp(std::chrono::nanoseconds(secs * NANOS_PER_SECOND + nanos));
}

std::string iso8601(Timestamp ts) {
    int64_t ns = ts.time_since_epoch().count();
    int64_t secs = ns / NANOS_PER_SECOND;
    if (ns % NANOS_PER_SECOND < 0) {
        --secs;
    }
    int64_t frac = ns - secs * NANOS_PER_SECOND;
    int64_t days = secs >= 0 ? secs / 86400 : (secs - 86399) / 86400;
    int64_t sod = secs - days * 86400;

    int y = 0;
    unsigned m = 0, d = 0;
    civil_from_days(days, y, m, d);

    char fraction[16];
    if (frac % 1000000 == 0) {
        std::snprintf(fraction, sizeof(fraction), "%03d", static_cast<int>(frac / 1000000));
    } else if (frac % 1000 == 0) {
        std::snprintf(fraction, sizeof(fraction), "%06d", static_cast<int>(frac / 1000));
    } else {
        std::snprintf(fraction, sizeof(fraction), "%09d", static_cast<int>(frac));
    }

    char buf[48];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d.%sZ", y, m, d,
                  static_cast<int>(sod / 3600), static_cast<int>((sod % 3600) / 60),
                  static_cast<int>(sod % 60), fraction);
    return std::string(buf);
}

// =============================================================================
// Duration / Size Formatting
// =============================================================================

std::string duration(int total_seconds) {
    // Handle negative or zero
    if (total_seconds <= 0) {
        return "0s";
    }

    int hours = total_seconds / 3600;
    int minutes = (total_seconds % 3600) / 60;
    int seconds = total_seconds % 60;

    char buf[32];

    if (hours == 0 && minutes == 0) {
        std::snprintf(buf, sizeof(buf), "%ds", seconds);
    } else if (hours == 0) {
        std::snprintf(buf, sizeof(buf), "%dm %02ds", minutes, seconds);
    } else {
        std::snprintf(buf, sizeof(buf), "%dh %02dm", hours, minutes);
    }

    return std::string(buf);
}

std::string byte_size(uint64_t bytes) {
    char buf[32];
    if (bytes < 1024) {
        std::snprintf(buf, sizeof(buf), "%llu B", static_cast<unsigned long long>(bytes));
    } else if (bytes < 1024ULL * 1024) {
        std::snprintf(buf, sizeof(buf), "%.1f KiB", static_cast<double>(bytes) / 1024.0);
    } else {
        std::snprintf(buf, sizeof(buf), "%.2f MiB",
                      static_cast<double>(bytes) / (1024.0 * 1024.0));
    }
    return std::string(buf);
}

} // namespace magpie::format
