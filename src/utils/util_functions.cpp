/**
 * @file util_functions.cpp
 * @brief Timestamp helpers shared by the codec, schema and store
 */

#include "remindd/common.h"
#include <cctype>
#include <ctime>

namespace remindd {

namespace {

bool read_digits(const std::string& s, size_t& pos, size_t count, int& out) {
    if (pos + count > s.size()) {
        return false;
    }
    int value = 0;
    for (size_t i = 0; i < count; ++i) {
        char c = s[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    pos += count;
    out = value;
    return true;
}

bool expect(const std::string& s, size_t& pos, char c) {
    if (pos >= s.size() || s[pos] != c) {
        return false;
    }
    ++pos;
    return true;
}

bool is_leap(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap(year)) {
        return 29;
    }
    return days[month - 1];
}

} // namespace

std::string format_timestamp(TimePoint tp) {
    auto time_t_val = Clock::to_time_t(tp);
    std::tm tm{};
    if (gmtime_r(&time_t_val, &tm) == nullptr) {
        return "";
    }
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

std::optional<TimePoint> parse_timestamp(const std::string& text) {
    size_t pos = 0;
    int year = 0, month = 0, day = 0;
    int hour = 0, minute = 0, second = 0;
    int offset_minutes = 0;

    if (!read_digits(text, pos, 4, year) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, month) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, day)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month)) {
        return std::nullopt;
    }

    if (pos < text.size()) {
        if (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' ') {
            return std::nullopt;
        }
        ++pos;
        if (!read_digits(text, pos, 2, hour) || !expect(text, pos, ':') ||
            !read_digits(text, pos, 2, minute)) {
            return std::nullopt;
        }
        if (pos < text.size() && text[pos] == ':') {
            ++pos;
            if (!read_digits(text, pos, 2, second)) {
                return std::nullopt;
            }
            // Fractional seconds are accepted and truncated
            if (pos < text.size() && text[pos] == '.') {
                ++pos;
                size_t start = pos;
                while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                    ++pos;
                }
                if (pos == start) {
                    return std::nullopt;
                }
            }
        }
        if (hour > 23 || minute > 59 || second > 60) {
            return std::nullopt;
        }

        if (pos < text.size()) {
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
                if (off_h > 23 || off_m > 59) {
                    return std::nullopt;
                }
                offset_minutes = off_h * 60 + off_m;
                if (zone == '-') {
                    offset_minutes = -offset_minutes;
                }
            } else {
                return std::nullopt;
            }
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
    std::time_t utc = timegm(&tm);
    if (utc == static_cast<std::time_t>(-1) && year != 1969) {
        return std::nullopt;
    }
    utc -= static_cast<std::time_t>(offset_minutes) * 60;
    return Clock::from_time_t(utc);
}

} // namespace remindd
