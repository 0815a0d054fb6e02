/**
 * @file TaskCommands.hpp
 * @brief Command DTOs for task graph operations
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace taskcore::taskmanagement::application::command {

struct CreateProjectCommand {
    std::string projectId;  ///< Empty to generate one
    std::string name;
    std::string createdBy;
};

struct CreateTaskCommand {
    std::string projectId;
    std::string title;
    std::string description;
    std::string priority = "MEDIUM";
    std::string createdBy;
    std::optional<std::string> assignee;
    std::optional<std::chrono::system_clock::time_point> dueDate;
    std::optional<double> estimatedHours;
};

struct UpdateTaskCommand {
    std::string projectId;
    std::string taskId;
    std::string updatedBy;
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<std::string> priority;
    std::optional<std::chrono::system_clock::time_point> dueDate;
    std::optional<double> estimatedHours;
};

struct AssignTaskCommand {
    std::string projectId;
    std::string taskId;
    std::string assignee;    ///< Empty to unassign
    std::string assignedBy;
};

enum class TaskAction {
    START,
    SUBMIT_FOR_REVIEW,
    COMPLETE,
    CANCEL,
    REOPEN,
    PAUSE
};

struct ChangeTaskStatusCommand {
    std::string projectId;
    std::string taskId;
    TaskAction action = TaskAction::START;
    std::string userId;
    std::string reason;                ///< CANCEL only
    std::optional<double> actualHours; ///< COMPLETE only
};

struct DependencyCommand {
    std::string projectId;
    std::string taskId;
    std::string dependsOnId;
};

struct RemoveTaskCommand {
    std::string projectId;
    std::string taskId;
    std::string removedBy;
};

struct ArchiveProjectCommand {
    std::string projectId;
    std::string archivedBy;
};

} // namespace taskcore::taskmanagement::application::command
