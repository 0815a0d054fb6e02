/**
 * @file TaskResponse.hpp
 * @brief Response DTOs for task graph operations
 */

#pragma once

#include "taskcore/taskmanagement/domain/model/TaskAggregate.hpp"

#include <json/json.h>

#include <optional>
#include <string>

namespace taskcore::taskmanagement::application::response {

struct TaskResponse {
    std::string projectId;
    std::string taskId;
    std::string title;
    std::string status;
    std::string priority;
    std::optional<std::string> assignee;
    bool canStart = false;
    int projectVersion = 0;

    static TaskResponse fromDomain(const domain::model::TaskAggregate& aggregate,
                                   const domain::model::Task& task) {
        TaskResponse response;
        response.projectId = aggregate.aggregateId();
        response.taskId = task.id.toString();
        response.title = task.title;
        response.status = domain::model::toString(task.status);
        response.priority = domain::model::toString(task.priority);
        if (task.assignee) {
            response.assignee = task.assignee->toString();
        }
        response.canStart = aggregate.canStart(task.id);
        response.projectVersion = aggregate.getVersion();
        return response;
    }

    [[nodiscard]] Json::Value toJson() const {
        Json::Value json(Json::objectValue);
        json["projectId"] = projectId;
        json["taskId"] = taskId;
        json["title"] = title;
        json["status"] = status;
        json["priority"] = priority;
        json["assignee"] = assignee ? Json::Value(*assignee) : Json::Value(Json::nullValue);
        json["canStart"] = canStart;
        json["projectVersion"] = projectVersion;
        return json;
    }
};

struct ProjectResponse {
    std::string projectId;
    std::string name;
    std::size_t taskCount = 0;
    std::size_t dependencyCount = 0;
    double completionPercentage = 0.0;
    int version = 0;

    static ProjectResponse fromDomain(const domain::model::TaskAggregate& aggregate) {
        ProjectResponse response;
        response.projectId = aggregate.aggregateId();
        response.name = aggregate.getName();
        response.taskCount = aggregate.taskCount();
        response.dependencyCount = aggregate.dependencyCount();
        response.completionPercentage = aggregate.getCompletionStats().completionPercentage;
        response.version = aggregate.getVersion();
        return response;
    }
};

} // namespace taskcore::taskmanagement::application::response
