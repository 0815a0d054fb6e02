#include "taskcore/shared/domain/Snapshot.hpp"
#include "taskcore/shared/exception/DomainException.hpp"
#include "taskcore/shared/util/TimeUtil.hpp"

namespace taskcore::shared::domain {

Json::Value AggregateSnapshot::toJson() const {
    Json::Value json(Json::objectValue);
    json["aggregateType"] = aggregateType;
    json["aggregateId"] = aggregateId;
    json["schemaVersion"] = schemaVersion;
    json["version"] = version;
    json["takenAt"] = util::formatIso8601(takenAt);
    json["state"] = state;
    return json;
}

AggregateSnapshot AggregateSnapshot::fromJson(const Json::Value& json) {
    if (!json.isObject() || !json.isMember("aggregateType") || !json.isMember("aggregateId") ||
        !json.isMember("version") || !json.isMember("state")) {
        throw exception::DomainException("INVALID_SNAPSHOT", "Snapshot record is incomplete");
    }

    AggregateSnapshot snapshot;
    snapshot.aggregateType = json["aggregateType"].asString();
    snapshot.aggregateId = json["aggregateId"].asString();
    snapshot.schemaVersion = json.get("schemaVersion", 1).asInt();
    snapshot.version = json["version"].asInt();
    snapshot.state = json["state"];
    if (json.isMember("takenAt")) {
        auto takenAt = util::parseIso8601(json["takenAt"].asString());
        if (takenAt) {
            snapshot.takenAt = *takenAt;
        }
    }
    return snapshot;
}

} // namespace taskcore::shared::domain
