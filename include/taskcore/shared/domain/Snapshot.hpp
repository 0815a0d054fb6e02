/**
 * @file Snapshot.hpp
 * @brief Versioned serialization contract for aggregate state
 */

#pragma once

#include <json/json.h>

#include <chrono>
#include <string>

namespace taskcore::shared::domain {

/**
 * @brief Point-in-time aggregate state
 *
 * schemaVersion identifies the layout of `state`; each aggregate upgrades
 * older layouts on restore. `version` is the aggregate version the state
 * corresponds to, so events with a higher aggregateVersion can be replayed on
 * top of it.
 */
struct AggregateSnapshot {
    std::string aggregateType;
    std::string aggregateId;
    int schemaVersion = 1;
    int version = 0;
    Json::Value state{Json::objectValue};
    std::chrono::system_clock::time_point takenAt{};

    [[nodiscard]] Json::Value toJson() const;

    /**
     * @throws shared::exception::DomainException (INVALID_SNAPSHOT) on malformed input
     */
    static AggregateSnapshot fromJson(const Json::Value& json);
};

} // namespace taskcore::shared::domain
