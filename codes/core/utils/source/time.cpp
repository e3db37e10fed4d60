#include "utils/time.hpp"
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace traffic_probe {
namespace utils {

uint64_t get_current_time_ms() {
    auto now = std::chrono::system_clock::now();
    auto duration = now.time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

uint64_t get_monotonic_time_ms() {
    auto now = std::chrono::steady_clock::now();
    auto duration = now.time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

std::string format_current_time(const char* format) {
    auto now = std::chrono::system_clock::now();
    std::time_t time = std::chrono::system_clock::to_time_t(now);
    std::tm tm;
    localtime_r(&time, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, format);
    return oss.str();
}

std::string format_iso8601_utc(uint64_t timestamp_ms) {
    std::time_t time = static_cast<std::time_t>(timestamp_ms / 1000);
    std::tm tm;
    gmtime_r(&time, &tm);

    char buffer[40];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03uZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec,
                  static_cast<unsigned>(timestamp_ms % 1000));
    return buffer;
}

bool parse_iso8601(const std::string& text, uint64_t* timestamp_ms) {
    if (timestamp_ms == nullptr || text.size() < 19) {
        return false;
    }

    std::tm tm = {};
    int consumed = 0;
    int matched = std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                              &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                              &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed);
    if (matched != 6 || consumed != 19) {
        return false;
    }
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;

    size_t pos = 19;

    // 小数秒，只取前三位
    uint64_t millis = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 3) {
                millis = millis * 10 + static_cast<uint64_t>(text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return false;
        }
        for (; digits < 3; ++digits) {
            millis *= 10;
        }
    }

    // 时区
    long offset_seconds = 0;
    if (pos < text.size()) {
        char zone = text[pos];
        if (zone == 'Z' && pos + 1 == text.size()) {
            offset_seconds = 0;
        } else if ((zone == '+' || zone == '-') && pos + 6 == text.size()) {
            int hours = 0;
            int minutes = 0;
            if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &hours, &minutes) != 2) {
                return false;
            }
            offset_seconds = hours * 3600L + minutes * 60L;
            if (zone == '-') {
                offset_seconds = -offset_seconds;
            }
        } else {
            return false;
        }
    }

    std::time_t seconds = timegm(&tm);
    if (seconds == static_cast<std::time_t>(-1)) {
        return false;
    }
    long long utc_seconds = static_cast<long long>(seconds) - offset_seconds;
    if (utc_seconds < 0) {
        return false;
    }

    *timestamp_ms = static_cast<uint64_t>(utc_seconds) * 1000 + millis;
    return true;
}

} // namespace utils
} // namespace traffic_probe
