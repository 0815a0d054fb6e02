/**
 * @file TimeUtil.cpp
 * @brief ISO 8601 formatting and parsing
 */

#include "taskcore/shared/util/TimeUtil.hpp"

#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace taskcore::shared::util {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date (no timegm dependency)
int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

} // namespace

std::string formatIso8601(const TimePoint& tp, bool includeMilliseconds) {
    const int64_t millis = toUnixMillis(tp);
    int64_t seconds = millis / 1000;
    int64_t msPart = millis % 1000;
    if (msPart < 0) {
        msPart += 1000;
        seconds -= 1;
    }

    std::time_t timeValue = static_cast<std::time_t>(seconds);
    struct tm tmTime {};
    if (!gmtime_r(&timeValue, &tmTime)) {
        return "";
    }

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << (tmTime.tm_year + 1900) << '-'
        << std::setw(2) << (tmTime.tm_mon + 1) << '-'
        << std::setw(2) << tmTime.tm_mday << 'T'
        << std::setw(2) << tmTime.tm_hour << ':'
        << std::setw(2) << tmTime.tm_min << ':'
        << std::setw(2) << tmTime.tm_sec;
    if (includeMilliseconds) {
        oss << '.' << std::setw(3) << msPart;
    }
    oss << 'Z';
    return oss.str();
}

std::optional<TimePoint> parseIso8601(const std::string& iso8601) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (std::sscanf(iso8601.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &year, &month, &day, &hour, &minute, &second, &consumed) != 6) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    int millis = 0;
    size_t pos = static_cast<size_t>(consumed);
    if (pos < iso8601.size() && iso8601[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < iso8601.size() && iso8601[pos] >= '0' && iso8601[pos] <= '9') {
            if (digits < 3) {
                millis = millis * 10 + (iso8601[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (int i = digits; i < 3; ++i) {
            millis *= 10;
        }
    }
    if (pos >= iso8601.size() || iso8601[pos] != 'Z' || pos + 1 != iso8601.size()) {
        return std::nullopt;
    }

    const int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    const int64_t totalSeconds = days * 86400 + hour * 3600 + minute * 60 + second;
    return fromUnixMillis(totalSeconds * 1000 + millis);
}

int64_t toUnixMillis(const TimePoint& tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint fromUnixMillis(int64_t millis) {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(millis)));
}

} // namespace taskcore::shared::util
