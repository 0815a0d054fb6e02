/**
 * @file TimeUtil.hpp
 * @brief Time formatting helpers for event records and snapshots
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace taskcore::shared::util {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @brief Format time_point as ISO 8601 UTC string
 *
 * @param tp std::chrono time_point
 * @param includeMilliseconds Include milliseconds in output
 * @return ISO 8601 string (e.g., "2026-02-02T12:34:56.789Z")
 */
std::string formatIso8601(const TimePoint& tp, bool includeMilliseconds = true);

/**
 * @brief Parse ISO 8601 UTC string ("YYYY-MM-DDTHH:MM:SS[.mmm]Z")
 * @return time_point, or std::nullopt on malformed input
 */
std::optional<TimePoint> parseIso8601(const std::string& iso8601);

int64_t toUnixMillis(const TimePoint& tp);

TimePoint fromUnixMillis(int64_t millis);

} // namespace taskcore::shared::util
