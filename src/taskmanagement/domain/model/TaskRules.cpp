#include "taskcore/taskmanagement/domain/model/TaskRules.hpp"
#include "taskcore/shared/exception/DomainException.hpp"

#include <algorithm>
#include <cctype>

namespace taskcore::taskmanagement::domain::model {

using shared::exception::ValidationException;

TaskRules TaskRules::fromConfig(const shared::config::EngineConfig& config) {
    TaskRules rules;
    rules.maxTasksPerProject = static_cast<std::size_t>(config.maxTasksPerProject);
    rules.maxDependenciesPerTask = static_cast<std::size_t>(config.maxDependenciesPerTask);
    return rules;
}

void TaskRules::validateTitle(const std::string& title) {
    const bool blank = std::all_of(title.begin(), title.end(),
                                   [](unsigned char c) { return std::isspace(c) != 0; });
    if (blank) {
        throw ValidationException("title", "Task title cannot be empty");
    }
    if (title.length() > TITLE_MAX_LENGTH) {
        throw ValidationException("title",
            "Task title cannot exceed " + std::to_string(TITLE_MAX_LENGTH) + " characters");
    }
}

void TaskRules::validateDescription(const std::string& description) {
    if (description.length() > DESCRIPTION_MAX_LENGTH) {
        throw ValidationException("description",
            "Task description cannot exceed " + std::to_string(DESCRIPTION_MAX_LENGTH) + " characters");
    }
}

void TaskRules::validateHours(const char* field, const std::optional<double>& hours) {
    if (!hours) {
        return;
    }
    if (*hours < 0.0 || *hours > MAX_HOURS) {
        throw ValidationException(field,
            std::string(field) + " must be between 0 and " + std::to_string(static_cast<int>(MAX_HOURS)));
    }
}

} // namespace taskcore::taskmanagement::domain::model
