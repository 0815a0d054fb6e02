#include "taskcore/shared/domain/DomainEvent.hpp"
#include "taskcore/shared/exception/DomainException.hpp"
#include "taskcore/shared/util/TimeUtil.hpp"

namespace taskcore::shared::domain {

Json::Value DomainEvent::toJson() const {
    Json::Value json(Json::objectValue);
    json["eventId"] = eventId_;
    json["aggregateId"] = aggregateId_;
    json["aggregateType"] = aggregateType_;
    json["aggregateVersion"] = aggregateVersion_;
    json["occurredAt"] = util::formatIso8601(occurredAt_);
    json["eventType"] = eventType_;
    json["payload"] = payload_;
    return json;
}

DomainEvent DomainEvent::fromJson(const Json::Value& json) {
    static const char* required[] = {
        "eventId", "aggregateId", "aggregateType", "aggregateVersion", "occurredAt", "eventType"
    };
    for (const char* field : required) {
        if (!json.isMember(field)) {
            throw exception::DomainException(
                "INVALID_EVENT_RECORD",
                std::string("Event record is missing field: ") + field);
        }
    }

    auto occurredAt = util::parseIso8601(json["occurredAt"].asString());
    if (!occurredAt) {
        throw exception::DomainException(
            "INVALID_EVENT_RECORD",
            "Event record has malformed occurredAt: " + json["occurredAt"].asString());
    }

    return DomainEvent(
        json["eventId"].asString(),
        json["aggregateId"].asString(),
        json["aggregateType"].asString(),
        json["aggregateVersion"].asInt(),
        *occurredAt,
        json["eventType"].asString(),
        json.get("payload", Json::Value(Json::objectValue)));
}

} // namespace taskcore::shared::domain
