#include "taskcore/taskmanagement/domain/model/Task.hpp"
#include "taskcore/shared/exception/DomainException.hpp"
#include "taskcore/shared/util/TimeUtil.hpp"

namespace taskcore::taskmanagement::domain::model {

namespace {

using shared::util::TimePoint;

void putTime(Json::Value& json, const char* key, const std::optional<TimePoint>& value) {
    if (value) {
        json[key] = shared::util::formatIso8601(*value);
    }
}

std::optional<TimePoint> getTime(const Json::Value& json, const char* key) {
    if (!json.isMember(key) || json[key].isNull()) {
        return std::nullopt;
    }
    auto parsed = shared::util::parseIso8601(json[key].asString());
    if (!parsed) {
        throw shared::exception::DomainException(
            "INVALID_TASK_RECORD", std::string("Malformed timestamp in field ") + key);
    }
    return parsed;
}

std::optional<double> getHours(const Json::Value& json, const char* key) {
    if (!json.isMember(key) || json[key].isNull()) {
        return std::nullopt;
    }
    return json[key].asDouble();
}

} // namespace

Json::Value Task::toJson() const {
    Json::Value json(Json::objectValue);
    json["id"] = id.toString();
    json["title"] = title;
    json["description"] = description;
    json["status"] = model::toString(status);
    json["priority"] = model::toString(priority);
    json["createdBy"] = createdBy.toString();
    json["createdAt"] = shared::util::formatIso8601(createdAt);
    if (assignee) {
        json["assignee"] = assignee->toString();
    }
    if (estimatedHours) {
        json["estimatedHours"] = *estimatedHours;
    }
    if (actualHours) {
        json["actualHours"] = *actualHours;
    }
    putTime(json, "dueDate", dueDate);
    putTime(json, "startedAt", startedAt);
    putTime(json, "completedAt", completedAt);
    return json;
}

Task Task::fromJson(const Json::Value& json) {
    if (!json.isObject() || !json.isMember("id") || !json.isMember("title") || !json.isMember("createdBy")) {
        throw shared::exception::DomainException("INVALID_TASK_RECORD", "Task record is incomplete");
    }

    Task task(TaskId::of(json["id"].asString()), json["title"].asString(),
              UserId::of(json["createdBy"].asString()));
    task.description = json.get("description", "").asString();

    try {
        task.status = parseTaskStatus(json.get("status", "TODO").asString());
        task.priority = parseTaskPriority(json.get("priority", "MEDIUM").asString());
    } catch (const std::invalid_argument& e) {
        throw shared::exception::DomainException("INVALID_TASK_RECORD", e.what());
    }

    if (json.isMember("assignee") && !json["assignee"].isNull()) {
        task.assignee = UserId::of(json["assignee"].asString());
    }
    task.estimatedHours = getHours(json, "estimatedHours");
    task.actualHours = getHours(json, "actualHours");
    task.dueDate = getTime(json, "dueDate");
    task.startedAt = getTime(json, "startedAt");
    task.completedAt = getTime(json, "completedAt");
    if (auto createdAt = getTime(json, "createdAt")) {
        task.createdAt = *createdAt;
    }
    return task;
}

} // namespace taskcore::taskmanagement::domain::model
