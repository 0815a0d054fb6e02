/**
 * @file TaskRules.hpp
 * @brief Capacity bounds and field validation for tasks
 */

#pragma once

#include "taskcore/shared/config/EngineConfig.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace taskcore::taskmanagement::domain::model {

struct TaskRules {
    static constexpr std::size_t TITLE_MAX_LENGTH = 200;
    static constexpr std::size_t DESCRIPTION_MAX_LENGTH = 2000;
    static constexpr double MAX_HOURS = 1000.0;

    std::size_t maxTasksPerProject = 1000;
    std::size_t maxDependenciesPerTask = 10;

    static TaskRules fromConfig(const shared::config::EngineConfig& config);

    /**
     * @throws shared::exception::ValidationException
     */
    static void validateTitle(const std::string& title);
    static void validateDescription(const std::string& description);
    static void validateHours(const char* field, const std::optional<double>& hours);
};

} // namespace taskcore::taskmanagement::domain::model
