/**
 * @file TimeUtils.cpp
 * @brief Implementation of TimeUtils.
 */

#include "infrastructure/TimeUtils.hpp"
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace vaultbreakdown::infrastructure {

namespace {
    bool ReadDigits(const std::string& s, size_t& pos, size_t count, int& out) {
        if (pos + count > s.size()) return false;
        int value = 0;
        for (size_t i = 0; i < count; ++i) {
            char c = s[pos + i];
            if (!std::isdigit(static_cast<unsigned char>(c))) return false;
            value = value * 10 + (c - '0');
        }
        out = value;
        pos += count;
        return true;
    }

    bool Expect(const std::string& s, size_t& pos, char c) {
        if (pos >= s.size() || s[pos] != c) return false;
        ++pos;
        return true;
    }
}

std::string TimeUtils::ToIso8601Utc(std::chrono::system_clock::time_point tp) {
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp - secs).count();
    if (micros < 0) {
        secs -= std::chrono::seconds(1);
        micros += 1000000;
    }
    std::time_t t = std::chrono::system_clock::to_time_t(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setw(6) << std::setfill('0') << micros
       << "+00:00";
    return ss.str();
}

std::optional<std::chrono::system_clock::time_point> TimeUtils::ParseIso8601(const std::string& raw) {
    std::string text = raw;
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.pop_back();
    size_t pos = text.find_first_not_of(" \t\r\n");
    if (pos == std::string::npos) return std::nullopt;

    std::tm tm{};
    int year, month, day, hour, minute, second;
    if (!ReadDigits(text, pos, 4, year) || !Expect(text, pos, '-') ||
        !ReadDigits(text, pos, 2, month) || !Expect(text, pos, '-') ||
        !ReadDigits(text, pos, 2, day)) {
        return std::nullopt;
    }
    if (pos >= text.size() || (text[pos] != 'T' && text[pos] != ' ')) return std::nullopt;
    ++pos;
    if (!ReadDigits(text, pos, 2, hour) || !Expect(text, pos, ':') ||
        !ReadDigits(text, pos, 2, minute) || !Expect(text, pos, ':') ||
        !ReadDigits(text, pos, 2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    long micros = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 6) micros = micros * 10 + (text[pos] - '0');
            ++digits;
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (int i = digits; i < 6; ++i) micros *= 10;
    }

    long offsetSeconds = 0;
    if (pos < text.size()) {
        if (text[pos] == 'Z' || text[pos] == 'z') {
            ++pos;
        } else if (text[pos] == '+' || text[pos] == '-') {
            int sign = text[pos] == '-' ? -1 : 1;
            ++pos;
            int oh, om;
            if (!ReadDigits(text, pos, 2, oh) || !Expect(text, pos, ':') || !ReadDigits(text, pos, 2, om)) {
                return std::nullopt;
            }
            offsetSeconds = sign * (oh * 3600L + om * 60L);
        } else {
            return std::nullopt;
        }
    }
    if (pos != text.size()) return std::nullopt;

    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    std::time_t t = timegm(&tm);
    if (t == static_cast<std::time_t>(-1) && !(year == 1969 && month == 12 && day == 31)) {
        return std::nullopt;
    }

    auto tp = std::chrono::system_clock::from_time_t(t);
    tp += std::chrono::microseconds(micros);
    tp -= std::chrono::seconds(offsetSeconds);
    return tp;
}

std::string TimeUtils::TodayLocalDate() {
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d");
    return ss.str();
}

std::chrono::system_clock::time_point TimeUtils::FromFileTime(std::filesystem::file_time_type ftime) {
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        ftime - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now());
}

} // namespace vaultbreakdown::infrastructure
