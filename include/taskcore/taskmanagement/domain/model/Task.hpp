/**
 * @file Task.hpp
 * @brief Task record held inside the task aggregate
 */

#pragma once

#include "TaskId.hpp"
#include "TaskPriority.hpp"
#include "TaskStatus.hpp"
#include "UserId.hpp"

#include <json/json.h>

#include <chrono>
#include <optional>
#include <string>

namespace taskcore::taskmanagement::domain::model {

/**
 * @brief One task of a project
 *
 * Plain record: every change goes through TaskAggregate, which validates it
 * and records the matching event.
 */
struct Task {
    TaskId id;
    std::string title;
    std::string description;
    TaskStatus status = TaskStatus::TODO;
    TaskPriority priority = TaskPriority::MEDIUM;
    std::optional<UserId> assignee;
    UserId createdBy;
    std::optional<std::chrono::system_clock::time_point> dueDate;
    std::optional<double> estimatedHours;
    std::optional<double> actualHours;
    std::chrono::system_clock::time_point createdAt{};
    std::optional<std::chrono::system_clock::time_point> startedAt;
    std::optional<std::chrono::system_clock::time_point> completedAt;

    Task(TaskId id, std::string title, UserId createdBy)
        : id(std::move(id)),
          title(std::move(title)),
          createdBy(std::move(createdBy)) {}

    [[nodiscard]] bool isCompleted() const noexcept {
        return status == TaskStatus::COMPLETED;
    }

    [[nodiscard]] bool isOpen() const noexcept {
        return status != TaskStatus::COMPLETED && status != TaskStatus::CANCELLED;
    }

    [[nodiscard]] bool isOverdue(std::chrono::system_clock::time_point now) const {
        return dueDate.has_value() && *dueDate < now && isOpen();
    }

    [[nodiscard]] bool isAssignedTo(const UserId& user) const {
        return assignee.has_value() && *assignee == user;
    }

    [[nodiscard]] Json::Value toJson() const;

    /**
     * @throws shared::exception::DomainException on a malformed record
     */
    static Task fromJson(const Json::Value& json);
};

} // namespace taskcore::taskmanagement::domain::model
