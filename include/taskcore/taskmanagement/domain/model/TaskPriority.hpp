/**
 * @file TaskPriority.hpp
 * @brief Enum for task priority
 */

#pragma once

#include <stdexcept>
#include <string>

namespace taskcore::taskmanagement::domain::model {

enum class TaskPriority {
    LOW,
    MEDIUM,
    HIGH,
    URGENT
};

inline std::string toString(TaskPriority priority) {
    switch (priority) {
        case TaskPriority::LOW: return "LOW";
        case TaskPriority::MEDIUM: return "MEDIUM";
        case TaskPriority::HIGH: return "HIGH";
        case TaskPriority::URGENT: return "URGENT";
        default: throw std::invalid_argument("Unknown TaskPriority");
    }
}

inline TaskPriority parseTaskPriority(const std::string& str) {
    if (str == "LOW") return TaskPriority::LOW;
    if (str == "MEDIUM") return TaskPriority::MEDIUM;
    if (str == "HIGH") return TaskPriority::HIGH;
    if (str == "URGENT") return TaskPriority::URGENT;
    throw std::invalid_argument("Unknown task priority: " + str);
}

} // namespace taskcore::taskmanagement::domain::model
