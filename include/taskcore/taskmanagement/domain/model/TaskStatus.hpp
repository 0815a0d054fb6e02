/**
 * @file TaskStatus.hpp
 * @brief Enum for task workflow status
 */

#pragma once

#include <stdexcept>
#include <string>

namespace taskcore::taskmanagement::domain::model {

enum class TaskStatus {
    TODO,
    IN_PROGRESS,
    IN_REVIEW,
    COMPLETED,    // Terminal
    CANCELLED     // Can be reopened to TODO
};

inline std::string toString(TaskStatus status) {
    switch (status) {
        case TaskStatus::TODO: return "TODO";
        case TaskStatus::IN_PROGRESS: return "IN_PROGRESS";
        case TaskStatus::IN_REVIEW: return "IN_REVIEW";
        case TaskStatus::COMPLETED: return "COMPLETED";
        case TaskStatus::CANCELLED: return "CANCELLED";
        default: throw std::invalid_argument("Unknown TaskStatus");
    }
}

inline TaskStatus parseTaskStatus(const std::string& str) {
    if (str == "TODO") return TaskStatus::TODO;
    if (str == "IN_PROGRESS") return TaskStatus::IN_PROGRESS;
    if (str == "IN_REVIEW") return TaskStatus::IN_REVIEW;
    if (str == "COMPLETED") return TaskStatus::COMPLETED;
    if (str == "CANCELLED") return TaskStatus::CANCELLED;
    throw std::invalid_argument("Unknown task status: " + str);
}

/**
 * @brief Check if status transition is valid
 */
inline bool isValidTransition(TaskStatus from, TaskStatus to) {
    switch (from) {
        case TaskStatus::TODO:
            return to == TaskStatus::IN_PROGRESS || to == TaskStatus::CANCELLED;
        case TaskStatus::IN_PROGRESS:
            return to == TaskStatus::IN_REVIEW || to == TaskStatus::COMPLETED ||
                   to == TaskStatus::CANCELLED || to == TaskStatus::TODO;
        case TaskStatus::IN_REVIEW:
            return to == TaskStatus::IN_PROGRESS || to == TaskStatus::COMPLETED ||
                   to == TaskStatus::CANCELLED;
        case TaskStatus::CANCELLED:
            return to == TaskStatus::TODO;
        case TaskStatus::COMPLETED:
            return false;
        default:
            return false;
    }
}

} // namespace taskcore::taskmanagement::domain::model
