/**
 * @file TaskUseCases.hpp
 * @brief Use cases over the task aggregate
 */

#pragma once

#include "taskcore/shared/exception/DomainException.hpp"
#include "taskcore/shared/uow/AggregateUpdater.hpp"
#include "taskcore/taskmanagement/application/command/TaskCommands.hpp"
#include "taskcore/taskmanagement/application/response/TaskResponse.hpp"
#include "taskcore/taskmanagement/domain/repository/ITaskAggregateRepository.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <stdexcept>

namespace taskcore::taskmanagement::application::usecase {

using namespace taskcore::taskmanagement::domain::model;
using namespace taskcore::taskmanagement::application::command;
using namespace taskcore::taskmanagement::application::response;

using TaskGraphUpdater = shared::uow::AggregateUpdater<TaskAggregate, ProjectId>;

namespace detail {

inline TaskPriority parsePriority(const std::string& priority) {
    try {
        return parseTaskPriority(priority);
    } catch (const std::invalid_argument& e) {
        throw shared::exception::ValidationException("priority", e.what());
    }
}

} // namespace detail

/**
 * @brief Create the task graph of a new project
 */
class CreateProjectUseCase {
private:
    std::shared_ptr<TaskGraphUpdater> updater_;
    TaskRules rules_;

public:
    CreateProjectUseCase(std::shared_ptr<TaskGraphUpdater> updater, TaskRules rules)
        : updater_(std::move(updater)), rules_(rules) {}

    ProjectResponse execute(const CreateProjectCommand& command) {
        ProjectId projectId = command.projectId.empty() ? ProjectId::generate()
                                                        : ProjectId::of(command.projectId);
        auto aggregate = TaskAggregate::create(std::move(projectId), command.name,
                                               UserId::of(command.createdBy), rules_);
        updater_->insert(aggregate);

        spdlog::info("Project created: id={}, name={}", aggregate.aggregateId(), aggregate.getName());
        return ProjectResponse::fromDomain(aggregate);
    }
};

class CreateTaskUseCase {
private:
    std::shared_ptr<TaskGraphUpdater> updater_;

public:
    explicit CreateTaskUseCase(std::shared_ptr<TaskGraphUpdater> updater)
        : updater_(std::move(updater)) {}

    TaskResponse execute(const CreateTaskCommand& command) {
        const UserId createdBy = UserId::of(command.createdBy);
        TaskAggregate::NewTask newTask;
        newTask.title = command.title;
        newTask.description = command.description;
        newTask.priority = detail::parsePriority(command.priority);
        if (command.assignee) {
            newTask.assignee = UserId::of(*command.assignee);
        }
        newTask.dueDate = command.dueDate;
        newTask.estimatedHours = command.estimatedHours;

        std::optional<TaskId> taskId;
        auto aggregate = updater_->update(ProjectId::of(command.projectId), "CreateTask",
            [&](TaskAggregate& graph) { taskId = graph.createTask(createdBy, newTask); });

        return TaskResponse::fromDomain(aggregate, aggregate.getTask(*taskId));
    }
};

class UpdateTaskUseCase {
private:
    std::shared_ptr<TaskGraphUpdater> updater_;

public:
    explicit UpdateTaskUseCase(std::shared_ptr<TaskGraphUpdater> updater)
        : updater_(std::move(updater)) {}

    TaskResponse execute(const UpdateTaskCommand& command) {
        const TaskId taskId = TaskId::of(command.taskId);
        const UserId updatedBy = UserId::of(command.updatedBy);

        TaskAggregate::TaskChanges changes;
        changes.title = command.title;
        changes.description = command.description;
        if (command.priority) {
            changes.priority = detail::parsePriority(*command.priority);
        }
        changes.dueDate = command.dueDate;
        changes.estimatedHours = command.estimatedHours;

        auto aggregate = updater_->update(ProjectId::of(command.projectId), "UpdateTask",
            [&](TaskAggregate& graph) { graph.updateTask(taskId, changes, updatedBy); });
        return TaskResponse::fromDomain(aggregate, aggregate.getTask(taskId));
    }
};

class AssignTaskUseCase {
private:
    std::shared_ptr<TaskGraphUpdater> updater_;

public:
    explicit AssignTaskUseCase(std::shared_ptr<TaskGraphUpdater> updater)
        : updater_(std::move(updater)) {}

    TaskResponse execute(const AssignTaskCommand& command) {
        const TaskId taskId = TaskId::of(command.taskId);
        const UserId assignedBy = UserId::of(command.assignedBy);

        auto aggregate = updater_->update(ProjectId::of(command.projectId), "AssignTask",
            [&](TaskAggregate& graph) {
                if (command.assignee.empty()) {
                    graph.unassignTask(taskId, assignedBy);
                } else {
                    graph.assignTask(taskId, UserId::of(command.assignee), assignedBy);
                }
            });
        return TaskResponse::fromDomain(aggregate, aggregate.getTask(taskId));
    }
};

/**
 * @brief Move a task through its workflow
 */
class ChangeTaskStatusUseCase {
private:
    std::shared_ptr<TaskGraphUpdater> updater_;

public:
    explicit ChangeTaskStatusUseCase(std::shared_ptr<TaskGraphUpdater> updater)
        : updater_(std::move(updater)) {}

    TaskResponse execute(const ChangeTaskStatusCommand& command) {
        const TaskId taskId = TaskId::of(command.taskId);
        const UserId user = UserId::of(command.userId);

        auto aggregate = updater_->update(ProjectId::of(command.projectId), "ChangeTaskStatus",
            [&](TaskAggregate& graph) {
                switch (command.action) {
                    case TaskAction::START: graph.startTask(taskId, user); break;
                    case TaskAction::SUBMIT_FOR_REVIEW: graph.submitForReview(taskId, user); break;
                    case TaskAction::COMPLETE: graph.completeTask(taskId, user, command.actualHours); break;
                    case TaskAction::CANCEL: graph.cancelTask(taskId, user, command.reason); break;
                    case TaskAction::REOPEN: graph.reopenTask(taskId, user); break;
                    case TaskAction::PAUSE: graph.pauseTask(taskId, user); break;
                }
            });

        const Task& task = aggregate.getTask(taskId);
        spdlog::info("Task {} is now {} (project {}, version {})",
                     task.id.toString(), toString(task.status), aggregate.aggregateId(), aggregate.getVersion());
        return TaskResponse::fromDomain(aggregate, task);
    }
};

class AddDependencyUseCase {
private:
    std::shared_ptr<TaskGraphUpdater> updater_;

public:
    explicit AddDependencyUseCase(std::shared_ptr<TaskGraphUpdater> updater)
        : updater_(std::move(updater)) {}

    TaskResponse execute(const DependencyCommand& command) {
        const TaskId taskId = TaskId::of(command.taskId);
        const TaskId dependsOnId = TaskId::of(command.dependsOnId);

        auto aggregate = updater_->update(ProjectId::of(command.projectId), "AddDependency",
            [&](TaskAggregate& graph) { graph.addDependency(taskId, dependsOnId); });
        return TaskResponse::fromDomain(aggregate, aggregate.getTask(taskId));
    }
};

class RemoveDependencyUseCase {
private:
    std::shared_ptr<TaskGraphUpdater> updater_;

public:
    explicit RemoveDependencyUseCase(std::shared_ptr<TaskGraphUpdater> updater)
        : updater_(std::move(updater)) {}

    TaskResponse execute(const DependencyCommand& command) {
        const TaskId taskId = TaskId::of(command.taskId);
        const TaskId dependsOnId = TaskId::of(command.dependsOnId);

        auto aggregate = updater_->update(ProjectId::of(command.projectId), "RemoveDependency",
            [&](TaskAggregate& graph) { graph.removeDependency(taskId, dependsOnId); });
        return TaskResponse::fromDomain(aggregate, aggregate.getTask(taskId));
    }
};

class RemoveTaskUseCase {
private:
    std::shared_ptr<TaskGraphUpdater> updater_;

public:
    explicit RemoveTaskUseCase(std::shared_ptr<TaskGraphUpdater> updater)
        : updater_(std::move(updater)) {}

    ProjectResponse execute(const RemoveTaskCommand& command) {
        const TaskId taskId = TaskId::of(command.taskId);
        const UserId removedBy = UserId::of(command.removedBy);

        auto aggregate = updater_->update(ProjectId::of(command.projectId), "RemoveTask",
            [&](TaskAggregate& graph) { graph.removeTask(taskId, removedBy); });
        return ProjectResponse::fromDomain(aggregate);
    }
};

class ArchiveProjectUseCase {
private:
    std::shared_ptr<TaskGraphUpdater> updater_;

public:
    explicit ArchiveProjectUseCase(std::shared_ptr<TaskGraphUpdater> updater)
        : updater_(std::move(updater)) {}

    void execute(const ArchiveProjectCommand& command) {
        const UserId archivedBy = UserId::of(command.archivedBy);
        updater_->remove(ProjectId::of(command.projectId), "ArchiveProject",
            [&](TaskAggregate& graph) { graph.archive(archivedBy); });
        spdlog::info("Project archived: id={}, by={}", command.projectId, command.archivedBy);
    }
};

} // namespace taskcore::taskmanagement::application::usecase
