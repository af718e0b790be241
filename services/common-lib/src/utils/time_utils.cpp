/**
 * @file time_utils.cpp
 * @brief ISO 8601 conversion utilities implementation
 */

#include "cga/utils/time_utils.h"
#include <sstream>
#include <iomanip>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <ctime>

namespace cga {
namespace utils {

std::string formatIso8601(const TimePoint& tp, bool includeMilliseconds) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    int64_t secs = ms / 1000;
    int64_t millis = ms % 1000;
    if (millis < 0) {
        millis += 1000;
        secs -= 1;
    }

    std::time_t t = static_cast<std::time_t>(secs);
    struct tm tm_time;
    if (!gmtime_r(&t, &tm_time)) {
        return "";
    }

    // Format as ISO8601: YYYY-MM-DDTHH:MM:SS[.mmm]Z
    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << (tm_time.tm_year + 1900) << '-'
        << std::setw(2) << (tm_time.tm_mon + 1) << '-'
        << std::setw(2) << tm_time.tm_mday << 'T'
        << std::setw(2) << tm_time.tm_hour << ':'
        << std::setw(2) << tm_time.tm_min << ':'
        << std::setw(2) << tm_time.tm_sec;
    if (includeMilliseconds) {
        oss << '.' << std::setw(3) << millis;
    }
    oss << 'Z';

    return oss.str();
}

std::optional<TimePoint> parseIso8601(const std::string& iso8601) {
    struct tm tm_time;
    std::memset(&tm_time, 0, sizeof(tm_time));

    char sep = 0;
    int consumed = 0;
    int scanned = std::sscanf(iso8601.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d%n",
                              &tm_time.tm_year, &tm_time.tm_mon, &tm_time.tm_mday, &sep,
                              &tm_time.tm_hour, &tm_time.tm_min, &tm_time.tm_sec, &consumed);
    if (scanned != 7 || (sep != 'T' && sep != ' ')) {
        return std::nullopt;
    }
    if (tm_time.tm_mon < 1 || tm_time.tm_mon > 12 || tm_time.tm_mday < 1 || tm_time.tm_mday > 31 ||
        tm_time.tm_hour > 23 || tm_time.tm_min > 59 || tm_time.tm_sec > 60) {
        return std::nullopt;
    }

    std::string rest = iso8601.substr(static_cast<size_t>(consumed));
    int millis = 0;
    if (!rest.empty() && rest[0] == '.') {
        size_t i = 1;
        int digits = 0;
        while (i < rest.size() && std::isdigit(static_cast<unsigned char>(rest[i]))) {
            // Keep millisecond precision, drop the rest
            if (digits < 3) {
                millis = millis * 10 + (rest[i] - '0');
            }
            ++digits;
            ++i;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (int d = digits; d < 3; ++d) {
            millis *= 10;
        }
        rest = rest.substr(i);
    }
    if (rest != "Z" && rest != "+00" && rest != "+00:00") {
        return std::nullopt;
    }

    tm_time.tm_year -= 1900;
    tm_time.tm_mon -= 1;
    tm_time.tm_isdst = 0;

    std::time_t time = timegm(&tm_time);
    if (time == -1) {
        return std::nullopt;
    }

    return std::chrono::system_clock::from_time_t(time) + std::chrono::milliseconds(millis);
}

TimePoint truncateToMillis(const TimePoint& tp) {
    return fromUnixMillis(toUnixMillis(tp));
}

TimePoint addDays(const TimePoint& tp, int days) {
    return tp + std::chrono::hours(24 * static_cast<int64_t>(days));
}

int64_t toUnixMillis(const TimePoint& tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint fromUnixMillis(int64_t millis) {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(millis)));
}

} // namespace utils
} // namespace cga
