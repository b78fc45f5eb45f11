/**
 * MAILRLM - Resumable Email Analysis Toolkit
 * ISO-8601 timestamp Implementation
 */

#include "util/time_format.hpp"

#include <fmt/format.h>

#include <cctype>
#include <cstdint>
#include <ctime>

namespace mailrlm::util {

namespace {

// Read exactly `count` digits at `pos`, advancing it
bool read_digits(std::string_view text, std::size_t& pos, std::size_t count, int& out) {
    if (pos + count > text.size()) {
        return false;
    }
    int value = 0;
    for (std::size_t i = 0; i < count; ++i) {
        char c = text[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    pos += count;
    out = value;
    return true;
}

bool expect(std::string_view text, std::size_t& pos, char c) {
    if (pos >= text.size() || text[pos] != c) {
        return false;
    }
    ++pos;
    return true;
}

} // namespace

std::string format_iso8601(Timestamp tp) {
    auto since_epoch = tp.time_since_epoch();
    auto secs = std::chrono::floor<std::chrono::seconds>(since_epoch);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(since_epoch - secs);

    std::time_t t = static_cast<std::time_t>(secs.count());
    std::tm tm{};
    gmtime_r(&t, &tm);

    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:06}Z",
                       tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                       tm.tm_hour, tm.tm_min, tm.tm_sec,
                       micros.count());
}

std::optional<Timestamp> parse_iso8601(std::string_view text) {
    std::size_t pos = 0;
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

    if (!read_digits(text, pos, 4, year) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, month) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, day)) {
        return std::nullopt;
    }
    if (pos >= text.size() || (text[pos] != 'T' && text[pos] != ' ')) {
        return std::nullopt;
    }
    ++pos;
    if (!read_digits(text, pos, 2, hour) || !expect(text, pos, ':') ||
        !read_digits(text, pos, 2, minute) || !expect(text, pos, ':') ||
        !read_digits(text, pos, 2, second)) {
        return std::nullopt;
    }

    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    // Fractional seconds, up to nanosecond precision
    std::chrono::nanoseconds fraction{0};
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        std::int64_t value = 0;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 9) {
                value = value * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (int i = digits; i < 9; ++i) {
            value *= 10;
        }
        fraction = std::chrono::nanoseconds(value);
    }

    std::chrono::seconds offset{0};
    bool has_zone = false;
    if (pos < text.size()) {
        has_zone = true;
        char zone = text[pos];
        if (zone == 'Z' || zone == 'z') {
            ++pos;
        } else if (zone == '+' || zone == '-') {
            ++pos;
            int off_h = 0, off_m = 0;
            if (!read_digits(text, pos, 2, off_h) || !expect(text, pos, ':') ||
                !read_digits(text, pos, 2, off_m)) {
                return std::nullopt;
            }
            offset = std::chrono::hours(off_h) + std::chrono::minutes(off_m);
            if (zone == '-') {
                offset = -offset;
            }
        } else {
            return std::nullopt;
        }
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    std::time_t t = 0;
    if (has_zone) {
        t = timegm(&tm);
    } else {
        tm.tm_isdst = -1;
        t = std::mktime(&tm);
        if (t == static_cast<std::time_t>(-1)) {
            return std::nullopt;
        }
    }

    auto tp = std::chrono::system_clock::from_time_t(t) - offset;
    return tp + std::chrono::duration_cast<std::chrono::system_clock::duration>(fraction);
}

} // namespace mailrlm::util
