/**
 * @file TaskEvents.hpp
 * @brief Domain events raised by the task aggregate
 *
 * Every event type exposes its discriminator as TYPE, serializes itself with
 * toPayload() and is decoded by fromPayload(). TaskEvent is the closed set
 * replayed by TaskAggregate; decodeTaskEvent() maps a stored envelope onto it
 * through an explicit table.
 */

#pragma once

#include "taskcore/shared/domain/DomainEvent.hpp"

#include <json/json.h>

#include <chrono>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace taskcore::taskmanagement::domain::event {

using TimePoint = std::chrono::system_clock::time_point;

struct TaskGraphCreated {
    static constexpr const char* TYPE = "TaskGraphCreated";
    std::string projectId;
    std::string name;
    std::string createdBy;

    [[nodiscard]] Json::Value toPayload() const;
    static TaskGraphCreated fromPayload(const Json::Value& payload);
};

struct TaskCreated {
    static constexpr const char* TYPE = "TaskCreated";
    std::string taskId;
    std::string title;
    std::string description;
    std::string priority;
    std::string createdBy;
    std::optional<std::string> assignee;
    std::optional<TimePoint> dueDate;
    std::optional<double> estimatedHours;

    [[nodiscard]] Json::Value toPayload() const;
    static TaskCreated fromPayload(const Json::Value& payload);
};

struct TaskUpdated {
    static constexpr const char* TYPE = "TaskUpdated";
    std::string taskId;
    std::string title;
    std::string description;
    std::string priority;
    std::optional<TimePoint> dueDate;
    std::optional<double> estimatedHours;
    std::string updatedBy;

    [[nodiscard]] Json::Value toPayload() const;
    static TaskUpdated fromPayload(const Json::Value& payload);
};

struct TaskAssigned {
    static constexpr const char* TYPE = "TaskAssigned";
    std::string taskId;
    std::string assignee;
    std::string assignedBy;
    std::optional<std::string> previousAssignee;

    [[nodiscard]] Json::Value toPayload() const;
    static TaskAssigned fromPayload(const Json::Value& payload);
};

struct TaskUnassigned {
    static constexpr const char* TYPE = "TaskUnassigned";
    std::string taskId;
    std::string previousAssignee;
    std::string unassignedBy;

    [[nodiscard]] Json::Value toPayload() const;
    static TaskUnassigned fromPayload(const Json::Value& payload);
};

/**
 * @brief Workflow move (start, review, complete, cancel, reopen, pause)
 */
struct TaskStatusChanged {
    static constexpr const char* TYPE = "TaskStatusChanged";
    std::string taskId;
    std::string from;
    std::string to;
    std::string changedBy;
    std::optional<std::string> reason;
    std::optional<double> actualHours;

    [[nodiscard]] Json::Value toPayload() const;
    static TaskStatusChanged fromPayload(const Json::Value& payload);
};

/**
 * @brief Task deleted; its edges in both directions go with it
 */
struct TaskRemoved {
    static constexpr const char* TYPE = "TaskRemoved";
    std::string taskId;
    std::string removedBy;
    int removedDependencies = 0;

    [[nodiscard]] Json::Value toPayload() const;
    static TaskRemoved fromPayload(const Json::Value& payload);
};

struct DependencyAdded {
    static constexpr const char* TYPE = "TaskDependencyAdded";
    std::string taskId;
    std::string dependsOnId;

    [[nodiscard]] Json::Value toPayload() const;
    static DependencyAdded fromPayload(const Json::Value& payload);
};

struct DependencyRemoved {
    static constexpr const char* TYPE = "TaskDependencyRemoved";
    std::string taskId;
    std::string dependsOnId;

    [[nodiscard]] Json::Value toPayload() const;
    static DependencyRemoved fromPayload(const Json::Value& payload);
};

struct TaskGraphArchived {
    static constexpr const char* TYPE = "TaskGraphArchived";
    std::string projectId;
    std::string archivedBy;

    [[nodiscard]] Json::Value toPayload() const;
    static TaskGraphArchived fromPayload(const Json::Value& payload);
};

using TaskEvent = std::variant<
    TaskGraphCreated,
    TaskCreated,
    TaskUpdated,
    TaskAssigned,
    TaskUnassigned,
    TaskStatusChanged,
    TaskRemoved,
    DependencyAdded,
    DependencyRemoved,
    TaskGraphArchived>;

/**
 * @throws shared::exception::DomainException (UNKNOWN_EVENT_TYPE) for a type outside TaskEvent
 */
TaskEvent decodeTaskEvent(const shared::domain::DomainEvent& event);

[[nodiscard]] bool isTaskEventType(const std::string& eventType);

/**
 * @brief Every discriminator of TaskEvent, for handler registration
 */
std::vector<std::string> taskEventTypes();

} // namespace taskcore::taskmanagement::domain::event
