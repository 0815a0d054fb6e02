/**
 * @file TaskAggregate.cpp
 * @brief Task aggregate commands, replay and snapshots
 */

#include "taskcore/taskmanagement/domain/model/TaskAggregate.hpp"
#include "taskcore/shared/exception/DomainException.hpp"
#include "taskcore/shared/util/JsonUtil.hpp"
#include "taskcore/shared/util/TimeUtil.hpp"

#include <algorithm>
#include <cctype>
#include <variant>

namespace taskcore::taskmanagement::domain::model {

using namespace shared::exception;
using shared::domain::AggregateSnapshot;
using shared::domain::DomainEvents;
using shared::domain::PendingEvent;

namespace {

template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

std::string describe(const TaskId& taskId) {
    return "Task " + taskId.toString();
}

} // namespace

TaskAggregate::TaskAggregate(ProjectId projectId, TaskRules rules)
    : AggregateRoot<ProjectId>(std::move(projectId)),
      rules_(rules) {}

// ========================================================================
// Lifecycle
// ========================================================================

TaskAggregate TaskAggregate::create(ProjectId projectId, std::string name, const UserId& createdBy,
                                    TaskRules rules) {
    TaskAggregate aggregate(std::move(projectId), rules);
    const auto now = std::chrono::system_clock::now();

    aggregate.applyChange(aggregate.state_, [&](State& state) {
        const bool blank = std::all_of(name.begin(), name.end(),
                                       [](unsigned char c) { return std::isspace(c) != 0; });
        if (blank) {
            throw ValidationException("name", "Project name cannot be empty");
        }
        event::TaskGraphCreated created{aggregate.aggregateId(), name, createdBy.toString()};
        return std::vector<PendingEvent>{emit(state, created, now)};
    }, now);

    return aggregate;
}

TaskAggregate TaskAggregate::restoreFromSnapshot(const AggregateSnapshot& snapshot,
                                                 const DomainEvents& eventsSince,
                                                 TaskRules rules) {
    if (snapshot.aggregateType != AGGREGATE_TYPE) {
        throw DomainException("SNAPSHOT_TYPE_MISMATCH",
            "Snapshot of " + snapshot.aggregateType + " cannot restore a " + AGGREGATE_TYPE);
    }
    if (snapshot.schemaVersion < 1 || snapshot.schemaVersion > SNAPSHOT_SCHEMA_VERSION) {
        throw DomainException("UNSUPPORTED_SNAPSHOT_SCHEMA",
            "Unsupported task graph snapshot schema " + std::to_string(snapshot.schemaVersion));
    }

    const Json::Value state = upgradeSnapshotState(snapshot.state, snapshot.schemaVersion);

    TaskAggregate aggregate(ProjectId::of(snapshot.aggregateId), rules);
    aggregate.state_.name = state.get("name", "").asString();
    for (const auto& taskJson : state["tasks"]) {
        Task task = Task::fromJson(taskJson);
        const std::string id = task.id.toString();
        aggregate.state_.tasks.emplace(id, std::move(task));
    }
    aggregate.state_.graph = DependencyGraph::fromJson(state["dependencies"]);
    aggregate.setVersion(snapshot.version);
    aggregate.restoreDeleted(state.get("deleted", false).asBool());

    const auto createdAt = shared::util::optionalTime(state, "createdAt");
    const auto updatedAt = shared::util::optionalTime(state, "updatedAt");
    if (createdAt && updatedAt) {
        aggregate.restoreTimestamps(*createdAt, *updatedAt);
    }

    aggregate.replay(eventsSince, snapshot.version);
    aggregate.checkInvariants();
    return aggregate;
}

TaskAggregate TaskAggregate::fromHistory(const ProjectId& projectId, const DomainEvents& history,
                                         TaskRules rules) {
    TaskAggregate aggregate(projectId, rules);
    aggregate.replay(history, 0);
    aggregate.checkInvariants();
    return aggregate;
}

AggregateSnapshot TaskAggregate::createSnapshot() const {
    Json::Value state(Json::objectValue);
    state["name"] = state_.name;
    state["tasks"] = Json::Value(Json::arrayValue);
    for (const auto& entry : state_.tasks) {
        state["tasks"].append(entry.second.toJson());
    }
    state["dependencies"] = state_.graph.toJson();
    state["deleted"] = isDeleted();
    state["createdAt"] = shared::util::formatIso8601(getCreatedAt());
    state["updatedAt"] = shared::util::formatIso8601(getUpdatedAt());

    AggregateSnapshot snapshot;
    snapshot.aggregateType = AGGREGATE_TYPE;
    snapshot.aggregateId = aggregateId();
    snapshot.schemaVersion = SNAPSHOT_SCHEMA_VERSION;
    // Pending changes are part of the state, so the snapshot carries the
    // version their commit will produce
    snapshot.version = getNextVersion();
    snapshot.state = std::move(state);
    snapshot.takenAt = std::chrono::system_clock::now();
    return snapshot;
}

Json::Value TaskAggregate::upgradeSnapshotState(const Json::Value& state, int schemaVersion) {
    if (schemaVersion == SNAPSHOT_SCHEMA_VERSION) {
        return state;
    }

    // v1: {"projectName", "tasks": {id: task}, "dependencies": {id: [dependsOn...]}}
    Json::Value upgraded(Json::objectValue);
    upgraded["name"] = state.get("projectName", "").asString();
    upgraded["tasks"] = Json::Value(Json::arrayValue);
    for (const auto& id : state["tasks"].getMemberNames()) {
        Json::Value task = state["tasks"][id];
        task["id"] = id;
        upgraded["tasks"].append(task);
    }
    upgraded["dependencies"] = Json::Value(Json::arrayValue);
    for (const auto& id : state["dependencies"].getMemberNames()) {
        for (const auto& dependsOn : state["dependencies"][id]) {
            Json::Value edge(Json::objectValue);
            edge["task"] = id;
            edge["dependsOn"] = dependsOn.asString();
            upgraded["dependencies"].append(edge);
        }
    }
    upgraded["deleted"] = state.get("archived", false).asBool();
    return upgraded;
}

void TaskAggregate::replay(const DomainEvents& events, int afterVersion) {
    for (const auto& stored : events) {
        if (stored.getAggregateVersion() <= afterVersion) {
            continue;
        }
        if (stored.getAggregateId() != aggregateId()) {
            throw DomainException("FOREIGN_EVENT",
                "Event " + stored.getEventId() + " belongs to aggregate " + stored.getAggregateId());
        }
        if (stored.getAggregateVersion() < getVersion()) {
            throw DomainException("EVENT_OUT_OF_ORDER",
                "Event " + stored.getEventId() + " has version " +
                std::to_string(stored.getAggregateVersion()) + " below " + std::to_string(getVersion()));
        }

        const event::TaskEvent typed = event::decodeTaskEvent(stored);
        if (std::holds_alternative<event::TaskGraphArchived>(typed)) {
            restoreDeleted(true);
        } else {
            applyEvent(state_, typed, stored.getOccurredAt());
        }
        if (std::holds_alternative<event::TaskGraphCreated>(typed)) {
            restoreTimestamps(stored.getOccurredAt(), stored.getOccurredAt());
        } else {
            restoreTimestamps(getCreatedAt(), stored.getOccurredAt());
        }
        setVersion(stored.getAggregateVersion());
    }
}

// ========================================================================
// Event application (shared by commands and replay)
// ========================================================================

Task& TaskAggregate::taskIn(State& state, const std::string& taskId) {
    auto it = state.tasks.find(taskId);
    if (it == state.tasks.end()) {
        throw NotFoundException("Task " + taskId + " not found");
    }
    return it->second;
}

void TaskAggregate::applyEvent(State& state, const event::TaskEvent& taskEvent, TimePoint at) {
    std::visit(overloaded{
        [&](const event::TaskGraphCreated& e) {
            state.name = e.name;
        },
        [&](const event::TaskCreated& e) {
            Task task(TaskId::of(e.taskId), e.title, UserId::of(e.createdBy));
            task.description = e.description;
            task.priority = parseTaskPriority(e.priority);
            if (e.assignee) {
                task.assignee = UserId::of(*e.assignee);
            }
            task.dueDate = e.dueDate;
            task.estimatedHours = e.estimatedHours;
            task.createdAt = at;
            if (!state.tasks.emplace(e.taskId, std::move(task)).second) {
                throw InvariantViolationException("Task " + e.taskId + " already exists");
            }
        },
        [&](const event::TaskUpdated& e) {
            Task& task = taskIn(state, e.taskId);
            task.title = e.title;
            task.description = e.description;
            task.priority = parseTaskPriority(e.priority);
            task.dueDate = e.dueDate;
            task.estimatedHours = e.estimatedHours;
        },
        [&](const event::TaskAssigned& e) {
            taskIn(state, e.taskId).assignee = UserId::of(e.assignee);
        },
        [&](const event::TaskUnassigned& e) {
            taskIn(state, e.taskId).assignee.reset();
        },
        [&](const event::TaskStatusChanged& e) {
            Task& task = taskIn(state, e.taskId);
            task.status = parseTaskStatus(e.to);
            if (task.status == TaskStatus::IN_PROGRESS && !task.startedAt) {
                task.startedAt = at;
            }
            if (task.status == TaskStatus::COMPLETED) {
                task.completedAt = at;
                if (e.actualHours) {
                    task.actualHours = e.actualHours;
                }
            }
        },
        [&](const event::TaskRemoved& e) {
            state.graph.removeNode(e.taskId);
            state.tasks.erase(e.taskId);
        },
        [&](const event::DependencyAdded& e) {
            state.graph.addEdge(e.taskId, e.dependsOnId);
        },
        [&](const event::DependencyRemoved& e) {
            state.graph.removeEdge(e.taskId, e.dependsOnId);
        },
        [&](const event::TaskGraphArchived&) {
            // Tombstone only; tasks stay readable
        },
    }, taskEvent);
}

// ========================================================================
// Task commands
// ========================================================================

TaskId TaskAggregate::createTask(const UserId& createdBy, NewTask data) {
    const TaskId taskId = TaskId::generate();
    const auto now = std::chrono::system_clock::now();

    applyChange(state_, [&](State& state) {
        if (state.tasks.size() >= rules_.maxTasksPerProject) {
            throw TaskLimitExceededException(
                "Project " + aggregateId() + " cannot have more than " +
                std::to_string(rules_.maxTasksPerProject) + " tasks");
        }
        TaskRules::validateTitle(data.title);
        TaskRules::validateDescription(data.description);
        TaskRules::validateHours("estimatedHours", data.estimatedHours);

        event::TaskCreated created;
        created.taskId = taskId.toString();
        created.title = data.title;
        created.description = data.description;
        created.priority = toString(data.priority);
        created.createdBy = createdBy.toString();
        if (data.assignee) {
            created.assignee = data.assignee->toString();
        }
        created.dueDate = data.dueDate;
        created.estimatedHours = data.estimatedHours;
        return std::vector<PendingEvent>{emit(state, created, now)};
    }, now);

    return taskId;
}

void TaskAggregate::updateTask(const TaskId& taskId, const TaskChanges& changes, const UserId& updatedBy) {
    const auto now = std::chrono::system_clock::now();

    applyChange(state_, [&](State& state) {
        if (changes.isEmpty()) {
            throw ValidationException("changes", "No task field to update");
        }
        const Task& task = taskIn(state, taskId.toString());

        event::TaskUpdated updated;
        updated.taskId = taskId.toString();
        updated.title = changes.title.value_or(task.title);
        updated.description = changes.description.value_or(task.description);
        updated.priority = toString(changes.priority.value_or(task.priority));
        updated.dueDate = changes.dueDate ? changes.dueDate : task.dueDate;
        updated.estimatedHours = changes.estimatedHours ? changes.estimatedHours : task.estimatedHours;
        updated.updatedBy = updatedBy.toString();

        TaskRules::validateTitle(updated.title);
        TaskRules::validateDescription(updated.description);
        TaskRules::validateHours("estimatedHours", updated.estimatedHours);
        return std::vector<PendingEvent>{emit(state, updated, now)};
    }, now);
}

void TaskAggregate::assignTask(const TaskId& taskId, const UserId& assignee, const UserId& assignedBy) {
    const auto now = std::chrono::system_clock::now();

    applyChange(state_, [&](State& state) {
        const Task& task = taskIn(state, taskId.toString());
        if (!task.isOpen()) {
            throw InvalidStatusTransitionException(
                "Cannot assign " + describe(taskId) + " in status " + toString(task.status));
        }

        event::TaskAssigned assigned;
        assigned.taskId = taskId.toString();
        assigned.assignee = assignee.toString();
        assigned.assignedBy = assignedBy.toString();
        if (task.assignee) {
            assigned.previousAssignee = task.assignee->toString();
        }
        return std::vector<PendingEvent>{emit(state, assigned, now)};
    }, now);
}

void TaskAggregate::unassignTask(const TaskId& taskId, const UserId& unassignedBy) {
    const auto now = std::chrono::system_clock::now();

    applyChange(state_, [&](State& state) {
        const Task& task = taskIn(state, taskId.toString());
        if (!task.assignee) {
            throw NotFoundException(describe(taskId) + " has no assignee");
        }
        event::TaskUnassigned unassigned{taskId.toString(), task.assignee->toString(), unassignedBy.toString()};
        return std::vector<PendingEvent>{emit(state, unassigned, now)};
    }, now);
}

void TaskAggregate::startTask(const TaskId& taskId, const UserId& startedBy) {
    const auto now = std::chrono::system_clock::now();

    applyChange(state_, [&](State& state) {
        const Task& task = taskIn(state, taskId.toString());
        if (!isValidTransition(task.status, TaskStatus::IN_PROGRESS)) {
            throw InvalidStatusTransitionException(
                describe(taskId) + " cannot move from " + toString(task.status) + " to IN_PROGRESS");
        }

        std::vector<std::string> unfinished;
        for (const auto& dependency : state.graph.dependenciesOf(taskId.toString())) {
            if (!taskIn(state, dependency).isCompleted()) {
                unfinished.push_back(dependency);
            }
        }
        if (!unfinished.empty()) {
            std::string list;
            for (const auto& id : unfinished) {
                if (!list.empty()) list += ", ";
                list += id;
            }
            throw DependencyNotSatisfiedException(
                "Cannot start " + describe(taskId) + " until its dependencies are completed: " + list);
        }

        if (task.assignee && !(*task.assignee == startedBy)) {
            throw NotTaskAssigneeException(
                describe(taskId) + " is assigned to " + task.assignee->toString() +
                " and cannot be started by " + startedBy.toString());
        }

        std::vector<PendingEvent> events;
        const TaskStatus from = task.status;
        if (!task.assignee) {
            event::TaskAssigned assigned{taskId.toString(), startedBy.toString(), startedBy.toString(), std::nullopt};
            events.push_back(emit(state, assigned, now));
        }
        event::TaskStatusChanged started;
        started.taskId = taskId.toString();
        started.from = toString(from);
        started.to = toString(TaskStatus::IN_PROGRESS);
        started.changedBy = startedBy.toString();
        events.push_back(emit(state, started, now));
        return events;
    }, now);
}

void TaskAggregate::changeStatus(const TaskId& taskId, TaskStatus to, const UserId& by,
                                 std::optional<std::string> reason, std::optional<double> actualHours) {
    const auto now = std::chrono::system_clock::now();

    applyChange(state_, [&](State& state) {
        const Task& task = taskIn(state, taskId.toString());
        if (!isValidTransition(task.status, to)) {
            throw InvalidStatusTransitionException(
                describe(taskId) + " cannot move from " + toString(task.status) + " to " + toString(to));
        }

        event::TaskStatusChanged changed;
        changed.taskId = taskId.toString();
        changed.from = toString(task.status);
        changed.to = toString(to);
        changed.changedBy = by.toString();
        changed.reason = reason;
        changed.actualHours = actualHours;
        return std::vector<PendingEvent>{emit(state, changed, now)};
    }, now);
}

void TaskAggregate::submitForReview(const TaskId& taskId, const UserId& submittedBy) {
    changeStatus(taskId, TaskStatus::IN_REVIEW, submittedBy);
}

void TaskAggregate::completeTask(const TaskId& taskId, const UserId& completedBy,
                                 std::optional<double> actualHours) {
    TaskRules::validateHours("actualHours", actualHours);
    changeStatus(taskId, TaskStatus::COMPLETED, completedBy, std::nullopt, actualHours);
}

void TaskAggregate::cancelTask(const TaskId& taskId, const UserId& cancelledBy, std::string reason) {
    changeStatus(taskId, TaskStatus::CANCELLED, cancelledBy,
                 reason.empty() ? std::nullopt : std::optional<std::string>(std::move(reason)));
}

void TaskAggregate::reopenTask(const TaskId& taskId, const UserId& reopenedBy) {
    const Task& task = getTask(taskId);
    if (task.status != TaskStatus::CANCELLED) {
        throw InvalidStatusTransitionException(
            "Only cancelled tasks can be reopened; " + describe(taskId) + " is " + toString(task.status));
    }
    changeStatus(taskId, TaskStatus::TODO, reopenedBy);
}

void TaskAggregate::pauseTask(const TaskId& taskId, const UserId& pausedBy) {
    const Task& task = getTask(taskId);
    if (task.status != TaskStatus::IN_PROGRESS) {
        throw InvalidStatusTransitionException(
            "Only tasks in progress can be paused; " + describe(taskId) + " is " + toString(task.status));
    }
    changeStatus(taskId, TaskStatus::TODO, pausedBy);
}

void TaskAggregate::removeTask(const TaskId& taskId, const UserId& removedBy) {
    const auto now = std::chrono::system_clock::now();

    applyChange(state_, [&](State& state) {
        const std::string id = taskIn(state, taskId.toString()).id.toString();
        const std::size_t edges = state.graph.directDependencyCount(id) + state.graph.dependentsOf(id).size();
        event::TaskRemoved removed{id, removedBy.toString(), static_cast<int>(edges)};
        return std::vector<PendingEvent>{emit(state, removed, now)};
    }, now);
}

// ========================================================================
// Dependency commands
// ========================================================================

void TaskAggregate::addDependency(const TaskId& taskId, const TaskId& dependsOnId) {
    const auto now = std::chrono::system_clock::now();

    applyChange(state_, [&](State& state) {
        const std::string task = taskId.toString();
        const std::string dependsOn = dependsOnId.toString();

        if (state.tasks.count(task) == 0) {
            throw NotFoundException("Task " + task + " not found");
        }
        if (state.tasks.count(dependsOn) == 0) {
            throw NotFoundException("Dependency task " + dependsOn + " not found");
        }
        if (task == dependsOn) {
            throw CircularDependencyException("Task " + task + " cannot depend on itself");
        }
        if (state.graph.directDependencyCount(task) >= rules_.maxDependenciesPerTask) {
            throw FanInExceededException(
                "Task " + task + " cannot have more than " +
                std::to_string(rules_.maxDependenciesPerTask) + " dependencies");
        }
        if (state.graph.hasEdge(task, dependsOn)) {
            throw DuplicateEdgeException("Task " + task + " already depends on " + dependsOn);
        }
        if (state.graph.reaches(dependsOn, task)) {
            throw CircularDependencyException(
                "Adding " + task + " -> " + dependsOn + " would create a circular dependency");
        }

        return std::vector<PendingEvent>{emit(state, event::DependencyAdded{task, dependsOn}, now)};
    }, now);
}

void TaskAggregate::removeDependency(const TaskId& taskId, const TaskId& dependsOnId) {
    const auto now = std::chrono::system_clock::now();

    applyChange(state_, [&](State& state) {
        const std::string task = taskId.toString();
        const std::string dependsOn = dependsOnId.toString();
        if (!state.graph.hasEdge(task, dependsOn)) {
            throw NotFoundException("Task " + task + " does not depend on " + dependsOn);
        }
        return std::vector<PendingEvent>{emit(state, event::DependencyRemoved{task, dependsOn}, now)};
    }, now);
}

void TaskAggregate::archive(const UserId& archivedBy) {
    markDeleted(shared::domain::raise(event::TaskGraphArchived{aggregateId(), archivedBy.toString()}));
}

// ========================================================================
// Queries
// ========================================================================

const Task* TaskAggregate::findTask(const TaskId& taskId) const {
    auto it = state_.tasks.find(taskId.toString());
    return it == state_.tasks.end() ? nullptr : &it->second;
}

const Task& TaskAggregate::getTask(const TaskId& taskId) const {
    const Task* task = findTask(taskId);
    if (task == nullptr) {
        throw NotFoundException(describe(taskId) + " not found in project " + aggregateId());
    }
    return *task;
}

std::vector<Task> TaskAggregate::getTasks() const {
    std::vector<Task> tasks;
    tasks.reserve(state_.tasks.size());
    for (const auto& entry : state_.tasks) {
        tasks.push_back(entry.second);
    }
    return tasks;
}

std::vector<TaskId> TaskAggregate::getDependencies(const TaskId& taskId) const {
    std::vector<TaskId> ids;
    for (const auto& id : state_.graph.dependenciesOf(taskId.toString())) {
        ids.push_back(TaskId::of(id));
    }
    return ids;
}

std::vector<TaskId> TaskAggregate::getDependents(const TaskId& taskId) const {
    std::vector<TaskId> ids;
    for (const auto& id : state_.graph.dependentsOf(taskId.toString())) {
        ids.push_back(TaskId::of(id));
    }
    return ids;
}

bool TaskAggregate::hasDependency(const TaskId& taskId, const TaskId& dependsOnId) const {
    return state_.graph.hasEdge(taskId.toString(), dependsOnId.toString());
}

bool TaskAggregate::canStart(const TaskId& taskId) const {
    getTask(taskId);
    for (const auto& dependency : state_.graph.dependenciesOf(taskId.toString())) {
        auto it = state_.tasks.find(dependency);
        if (it == state_.tasks.end() || !it->second.isCompleted()) {
            return false;
        }
    }
    return true;
}

std::vector<TaskId> TaskAggregate::getBlockedTasks() const {
    std::vector<TaskId> blocked;
    for (const auto& [id, task] : state_.tasks) {
        if (task.status == TaskStatus::TODO && !canStart(task.id)) {
            blocked.push_back(task.id);
        }
    }
    return blocked;
}

std::vector<Task> TaskAggregate::getTasksByStatus(TaskStatus status) const {
    std::vector<Task> result;
    for (const auto& entry : state_.tasks) {
        if (entry.second.status == status) {
            result.push_back(entry.second);
        }
    }
    return result;
}

std::vector<Task> TaskAggregate::getTasksAssignedTo(const UserId& userId) const {
    std::vector<Task> result;
    for (const auto& entry : state_.tasks) {
        if (entry.second.isAssignedTo(userId)) {
            result.push_back(entry.second);
        }
    }
    return result;
}

std::vector<Task> TaskAggregate::getOverdueTasks(TimePoint now) const {
    std::vector<Task> result;
    for (const auto& entry : state_.tasks) {
        if (entry.second.isOverdue(now)) {
            result.push_back(entry.second);
        }
    }
    return result;
}

TaskAggregate::CompletionStats TaskAggregate::getCompletionStats() const {
    CompletionStats stats;
    stats.total = state_.tasks.size();
    for (const auto& entry : state_.tasks) {
        switch (entry.second.status) {
            case TaskStatus::TODO: ++stats.todo; break;
            case TaskStatus::IN_PROGRESS: ++stats.inProgress; break;
            case TaskStatus::IN_REVIEW: ++stats.inReview; break;
            case TaskStatus::COMPLETED: ++stats.completed; break;
            case TaskStatus::CANCELLED: ++stats.cancelled; break;
        }
    }
    if (stats.total > 0) {
        stats.completionPercentage = 100.0 * static_cast<double>(stats.completed) / static_cast<double>(stats.total);
    }
    return stats;
}

std::vector<std::string> TaskAggregate::taskIds() const {
    std::vector<std::string> ids;
    ids.reserve(state_.tasks.size());
    for (const auto& entry : state_.tasks) {
        ids.push_back(entry.first);
    }
    return ids;
}

std::vector<TaskId> TaskAggregate::getTopologicalOrder() const {
    std::vector<TaskId> order;
    for (const auto& id : state_.graph.topologicalOrder(taskIds())) {
        order.push_back(TaskId::of(id));
    }
    return order;
}

CriticalPath TaskAggregate::getCriticalPath() const {
    return state_.graph.criticalPath(taskIds(), [this](const std::string& id) {
        return state_.tasks.at(id).estimatedHours.value_or(0.0);
    });
}

// ========================================================================
// Invariants
// ========================================================================

void TaskAggregate::checkInvariants() const {
    if (state_.tasks.size() > rules_.maxTasksPerProject) {
        throw TaskLimitExceededException(
            "Project " + aggregateId() + " holds " + std::to_string(state_.tasks.size()) +
            " tasks, limit is " + std::to_string(rules_.maxTasksPerProject));
    }

    for (const auto& [task, targets] : state_.graph.edges()) {
        if (state_.tasks.count(task) == 0) {
            throw InvariantViolationException("Dependency edge from unknown task " + task);
        }
        for (const auto& dependsOn : targets) {
            if (state_.tasks.count(dependsOn) == 0) {
                throw InvariantViolationException(
                    "Task " + task + " depends on unknown task " + dependsOn);
            }
        }
        if (targets.size() > rules_.maxDependenciesPerTask) {
            throw FanInExceededException(
                "Task " + task + " has " + std::to_string(targets.size()) +
                " dependencies, limit is " + std::to_string(rules_.maxDependenciesPerTask));
        }
    }

    if (auto cycle = state_.graph.findCycle()) {
        std::string path;
        for (const auto& id : *cycle) {
            if (!path.empty()) path += " -> ";
            path += id;
        }
        throw CircularDependencyException("Dependency cycle: " + path);
    }
}

} // namespace taskcore::taskmanagement::domain::model
