/**
 * @file JsonUtil.hpp
 * @brief Field accessors for event payloads and snapshot state
 */

#pragma once

#include "TimeUtil.hpp"

#include <json/json.h>

#include <optional>
#include <string>

namespace taskcore::shared::util {

/**
 * @throws exception::DomainException (INVALID_PAYLOAD) when the member is absent or not a string
 */
std::string requireString(const Json::Value& json, const char* key);

int requireInt(const Json::Value& json, const char* key);

std::optional<std::string> optionalString(const Json::Value& json, const char* key);

std::optional<double> optionalDouble(const Json::Value& json, const char* key);

std::optional<int> optionalInt(const Json::Value& json, const char* key);

/**
 * @throws exception::DomainException (INVALID_PAYLOAD) on a malformed timestamp
 */
std::optional<TimePoint> optionalTime(const Json::Value& json, const char* key);

TimePoint requireTime(const Json::Value& json, const char* key);

template<typename T>
void putOptional(Json::Value& json, const char* key, const std::optional<T>& value) {
    if (value) {
        json[key] = *value;
    }
}

inline void putOptionalTime(Json::Value& json, const char* key, const std::optional<TimePoint>& value) {
    if (value) {
        json[key] = formatIso8601(*value);
    }
}

/**
 * @brief Compact, key-sorted serialization (stable input for signatures)
 */
std::string toCompactString(const Json::Value& json);

/**
 * @throws exception::DomainException (INVALID_PAYLOAD) on malformed text
 */
Json::Value parseJson(const std::string& text);

} // namespace taskcore::shared::util
