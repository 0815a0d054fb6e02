#include "taskcore/taskmanagement/domain/event/TaskEvents.hpp"
#include "taskcore/shared/exception/DomainException.hpp"
#include "taskcore/shared/util/JsonUtil.hpp"

#include <functional>
#include <map>

namespace taskcore::taskmanagement::domain::event {

using namespace shared::util;

Json::Value TaskGraphCreated::toPayload() const {
    Json::Value payload(Json::objectValue);
    payload["projectId"] = projectId;
    payload["name"] = name;
    payload["createdBy"] = createdBy;
    return payload;
}

TaskGraphCreated TaskGraphCreated::fromPayload(const Json::Value& payload) {
    return TaskGraphCreated{requireString(payload, "projectId"),
                            optionalString(payload, "name").value_or(""),
                            requireString(payload, "createdBy")};
}

Json::Value TaskCreated::toPayload() const {
    Json::Value payload(Json::objectValue);
    payload["taskId"] = taskId;
    payload["title"] = title;
    payload["description"] = description;
    payload["priority"] = priority;
    payload["createdBy"] = createdBy;
    putOptional(payload, "assignee", assignee);
    putOptionalTime(payload, "dueDate", dueDate);
    putOptional(payload, "estimatedHours", estimatedHours);
    return payload;
}

TaskCreated TaskCreated::fromPayload(const Json::Value& payload) {
    TaskCreated event;
    event.taskId = requireString(payload, "taskId");
    event.title = requireString(payload, "title");
    event.description = optionalString(payload, "description").value_or("");
    event.priority = requireString(payload, "priority");
    event.createdBy = requireString(payload, "createdBy");
    event.assignee = optionalString(payload, "assignee");
    event.dueDate = optionalTime(payload, "dueDate");
    event.estimatedHours = optionalDouble(payload, "estimatedHours");
    return event;
}

Json::Value TaskUpdated::toPayload() const {
    Json::Value payload(Json::objectValue);
    payload["taskId"] = taskId;
    payload["title"] = title;
    payload["description"] = description;
    payload["priority"] = priority;
    payload["updatedBy"] = updatedBy;
    putOptionalTime(payload, "dueDate", dueDate);
    putOptional(payload, "estimatedHours", estimatedHours);
    return payload;
}

TaskUpdated TaskUpdated::fromPayload(const Json::Value& payload) {
    TaskUpdated event;
    event.taskId = requireString(payload, "taskId");
    event.title = requireString(payload, "title");
    event.description = optionalString(payload, "description").value_or("");
    event.priority = requireString(payload, "priority");
    event.updatedBy = requireString(payload, "updatedBy");
    event.dueDate = optionalTime(payload, "dueDate");
    event.estimatedHours = optionalDouble(payload, "estimatedHours");
    return event;
}

Json::Value TaskAssigned::toPayload() const {
    Json::Value payload(Json::objectValue);
    payload["taskId"] = taskId;
    payload["assignee"] = assignee;
    payload["assignedBy"] = assignedBy;
    putOptional(payload, "previousAssignee", previousAssignee);
    return payload;
}

TaskAssigned TaskAssigned::fromPayload(const Json::Value& payload) {
    return TaskAssigned{requireString(payload, "taskId"),
                        requireString(payload, "assignee"),
                        requireString(payload, "assignedBy"),
                        optionalString(payload, "previousAssignee")};
}

Json::Value TaskUnassigned::toPayload() const {
    Json::Value payload(Json::objectValue);
    payload["taskId"] = taskId;
    payload["previousAssignee"] = previousAssignee;
    payload["unassignedBy"] = unassignedBy;
    return payload;
}

TaskUnassigned TaskUnassigned::fromPayload(const Json::Value& payload) {
    return TaskUnassigned{requireString(payload, "taskId"),
                          requireString(payload, "previousAssignee"),
                          requireString(payload, "unassignedBy")};
}

Json::Value TaskStatusChanged::toPayload() const {
    Json::Value payload(Json::objectValue);
    payload["taskId"] = taskId;
    payload["from"] = from;
    payload["to"] = to;
    payload["changedBy"] = changedBy;
    putOptional(payload, "reason", reason);
    putOptional(payload, "actualHours", actualHours);
    return payload;
}

TaskStatusChanged TaskStatusChanged::fromPayload(const Json::Value& payload) {
    return TaskStatusChanged{requireString(payload, "taskId"),
                             requireString(payload, "from"),
                             requireString(payload, "to"),
                             requireString(payload, "changedBy"),
                             optionalString(payload, "reason"),
                             optionalDouble(payload, "actualHours")};
}

Json::Value TaskRemoved::toPayload() const {
    Json::Value payload(Json::objectValue);
    payload["taskId"] = taskId;
    payload["removedBy"] = removedBy;
    payload["removedDependencies"] = removedDependencies;
    return payload;
}

TaskRemoved TaskRemoved::fromPayload(const Json::Value& payload) {
    return TaskRemoved{requireString(payload, "taskId"),
                       requireString(payload, "removedBy"),
                       optionalInt(payload, "removedDependencies").value_or(0)};
}

Json::Value DependencyAdded::toPayload() const {
    Json::Value payload(Json::objectValue);
    payload["taskId"] = taskId;
    payload["dependsOnId"] = dependsOnId;
    return payload;
}

DependencyAdded DependencyAdded::fromPayload(const Json::Value& payload) {
    return DependencyAdded{requireString(payload, "taskId"), requireString(payload, "dependsOnId")};
}

Json::Value DependencyRemoved::toPayload() const {
    Json::Value payload(Json::objectValue);
    payload["taskId"] = taskId;
    payload["dependsOnId"] = dependsOnId;
    return payload;
}

DependencyRemoved DependencyRemoved::fromPayload(const Json::Value& payload) {
    return DependencyRemoved{requireString(payload, "taskId"), requireString(payload, "dependsOnId")};
}

Json::Value TaskGraphArchived::toPayload() const {
    Json::Value payload(Json::objectValue);
    payload["projectId"] = projectId;
    payload["archivedBy"] = archivedBy;
    return payload;
}

TaskGraphArchived TaskGraphArchived::fromPayload(const Json::Value& payload) {
    return TaskGraphArchived{requireString(payload, "projectId"), requireString(payload, "archivedBy")};
}

namespace {

using Decoder = std::function<TaskEvent(const Json::Value&)>;

template<typename E>
std::pair<const std::string, Decoder> entry() {
    return {E::TYPE, [](const Json::Value& payload) -> TaskEvent { return E::fromPayload(payload); }};
}

const std::map<std::string, Decoder>& decoders() {
    static const std::map<std::string, Decoder> table{
        entry<TaskGraphCreated>(),
        entry<TaskCreated>(),
        entry<TaskUpdated>(),
        entry<TaskAssigned>(),
        entry<TaskUnassigned>(),
        entry<TaskStatusChanged>(),
        entry<TaskRemoved>(),
        entry<DependencyAdded>(),
        entry<DependencyRemoved>(),
        entry<TaskGraphArchived>(),
    };
    return table;
}

} // namespace

TaskEvent decodeTaskEvent(const shared::domain::DomainEvent& event) {
    auto it = decoders().find(event.getEventType());
    if (it == decoders().end()) {
        throw shared::exception::DomainException(
            "UNKNOWN_EVENT_TYPE",
            "Event type " + event.getEventType() + " does not belong to the task aggregate");
    }
    return it->second(event.getPayload());
}

bool isTaskEventType(const std::string& eventType) {
    return decoders().count(eventType) > 0;
}

std::vector<std::string> taskEventTypes() {
    std::vector<std::string> types;
    types.reserve(decoders().size());
    for (const auto& entry : decoders()) {
        types.push_back(entry.first);
    }
    return types;
}

} // namespace taskcore::taskmanagement::domain::event
