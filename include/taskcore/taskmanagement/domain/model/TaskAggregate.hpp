/**
 * @file TaskAggregate.hpp
 * @brief Task aggregate root: one project's tasks and their dependency graph
 */

#pragma once

#include "DependencyGraph.hpp"
#include "ProjectId.hpp"
#include "Task.hpp"
#include "TaskId.hpp"
#include "TaskPriority.hpp"
#include "TaskRules.hpp"
#include "TaskStatus.hpp"
#include "UserId.hpp"
#include "taskcore/shared/domain/AggregateRoot.hpp"
#include "taskcore/shared/domain/Snapshot.hpp"
#include "taskcore/taskmanagement/domain/event/TaskEvents.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace taskcore::taskmanagement::domain::model {

/**
 * @brief Consistency boundary for a project's task set
 *
 * Invariants:
 * - the dependency graph is acyclic;
 * - every task id referenced by an edge is a task of this project;
 * - no task has more than rules.maxDependenciesPerTask direct dependencies;
 * - the project holds at most rules.maxTasksPerProject tasks.
 *
 * Every mutator validates first, applies its events to a copy-protected
 * state, re-checks the invariants and leaves the aggregate untouched if
 * anything throws. The same event application is used when replaying
 * persisted events on top of a snapshot.
 */
class TaskAggregate : public shared::domain::AggregateRoot<ProjectId> {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    static constexpr const char* AGGREGATE_TYPE = "TaskGraph";
    static constexpr int SNAPSHOT_SCHEMA_VERSION = 2;

    struct NewTask {
        std::string title;
        std::string description;
        TaskPriority priority = TaskPriority::MEDIUM;
        std::optional<UserId> assignee;
        std::optional<TimePoint> dueDate;
        std::optional<double> estimatedHours;
    };

    /**
     * @brief Partial update; unset fields keep their value
     */
    struct TaskChanges {
        std::optional<std::string> title;
        std::optional<std::string> description;
        std::optional<TaskPriority> priority;
        std::optional<TimePoint> dueDate;
        std::optional<double> estimatedHours;

        [[nodiscard]] bool isEmpty() const noexcept {
            return !title && !description && !priority && !dueDate && !estimatedHours;
        }
    };

    struct CompletionStats {
        std::size_t total = 0;
        std::size_t todo = 0;
        std::size_t inProgress = 0;
        std::size_t inReview = 0;
        std::size_t completed = 0;
        std::size_t cancelled = 0;
        double completionPercentage = 0.0;
    };

    /// @name Lifecycle

    /**
     * @brief New, empty task graph for a project (raises TaskGraphCreated)
     */
    static TaskAggregate create(ProjectId projectId, std::string name, const UserId& createdBy,
                                TaskRules rules = {});

    /**
     * @brief Rebuild from a snapshot plus the events committed after it
     *
     * Older snapshot schemas are upgraded first. Events whose aggregateVersion
     * is not above snapshot.version are skipped; the rest are applied in the
     * given order and the restored version is the last applied event's.
     * @throws shared::exception::DomainException on a foreign or unsupported snapshot
     * @throws shared::exception::InvariantViolationException if the result is inconsistent
     */
    static TaskAggregate restoreFromSnapshot(const shared::domain::AggregateSnapshot& snapshot,
                                             const shared::domain::DomainEvents& eventsSince,
                                             TaskRules rules = {});

    /**
     * @brief Rebuild from the complete event stream
     */
    static TaskAggregate fromHistory(const ProjectId& projectId,
                                     const shared::domain::DomainEvents& history,
                                     TaskRules rules = {});

    [[nodiscard]] shared::domain::AggregateSnapshot createSnapshot() const;

    /// @name Task commands

    /**
     * @throws shared::exception::TaskLimitExceededException when the project is full
     * @throws shared::exception::ValidationException on invalid fields
     */
    TaskId createTask(const UserId& createdBy, NewTask task);

    void updateTask(const TaskId& taskId, const TaskChanges& changes, const UserId& updatedBy);

    void assignTask(const TaskId& taskId, const UserId& assignee, const UserId& assignedBy);
    void unassignTask(const TaskId& taskId, const UserId& unassignedBy);

    /**
     * @brief Move to IN_PROGRESS
     *
     * Requires every direct dependency to be COMPLETED. Only the assignee may
     * start an assigned task; an unassigned task is assigned to the starter.
     * @throws shared::exception::DependencyNotSatisfiedException
     * @throws shared::exception::NotTaskAssigneeException
     * @throws shared::exception::InvalidStatusTransitionException
     */
    void startTask(const TaskId& taskId, const UserId& startedBy);

    void submitForReview(const TaskId& taskId, const UserId& submittedBy);

    /**
     * @brief Move to COMPLETED; dependents are not started
     */
    void completeTask(const TaskId& taskId, const UserId& completedBy,
                      std::optional<double> actualHours = std::nullopt);

    void cancelTask(const TaskId& taskId, const UserId& cancelledBy, std::string reason = "");

    /**
     * @brief CANCELLED -> TODO
     */
    void reopenTask(const TaskId& taskId, const UserId& reopenedBy);

    /**
     * @brief IN_PROGRESS -> TODO
     */
    void pauseTask(const TaskId& taskId, const UserId& pausedBy);

    /**
     * @brief Delete a task together with every edge into or out of it
     */
    void removeTask(const TaskId& taskId, const UserId& removedBy);

    /// @name Dependency commands

    /**
     * @brief Record that `taskId` depends on `dependsOnId`
     *
     * Checked in order, before anything changes: both tasks exist (NotFound),
     * no self edge (CircularDependency), fan-in bound (FanInExceeded), edge
     * not present yet (DuplicateEdge), `dependsOnId` does not already depend
     * on `taskId` transitively (CircularDependency).
     */
    void addDependency(const TaskId& taskId, const TaskId& dependsOnId);

    /**
     * @throws shared::exception::NotFoundException if the edge does not exist
     */
    void removeDependency(const TaskId& taskId, const TaskId& dependsOnId);

    /**
     * @brief Tombstone the whole task graph
     */
    void archive(const UserId& archivedBy);

    /// @name Queries

    [[nodiscard]] const std::string& getName() const noexcept { return state_.name; }
    [[nodiscard]] const TaskRules& getRules() const noexcept { return rules_; }
    [[nodiscard]] const DependencyGraph& getGraph() const noexcept { return state_.graph; }
    [[nodiscard]] std::size_t taskCount() const noexcept { return state_.tasks.size(); }
    [[nodiscard]] std::size_t dependencyCount() const noexcept { return state_.graph.edgeCount(); }

    [[nodiscard]] const Task* findTask(const TaskId& taskId) const;

    /**
     * @throws shared::exception::NotFoundException
     */
    [[nodiscard]] const Task& getTask(const TaskId& taskId) const;

    [[nodiscard]] std::vector<Task> getTasks() const;
    [[nodiscard]] std::vector<TaskId> getDependencies(const TaskId& taskId) const;
    [[nodiscard]] std::vector<TaskId> getDependents(const TaskId& taskId) const;
    [[nodiscard]] bool hasDependency(const TaskId& taskId, const TaskId& dependsOnId) const;

    /**
     * @brief True iff every direct dependency is COMPLETED
     * @throws shared::exception::NotFoundException
     */
    [[nodiscard]] bool canStart(const TaskId& taskId) const;

    /**
     * @brief TODO tasks waiting on at least one unfinished dependency
     */
    [[nodiscard]] std::vector<TaskId> getBlockedTasks() const;

    [[nodiscard]] std::vector<Task> getTasksByStatus(TaskStatus status) const;
    [[nodiscard]] std::vector<Task> getTasksAssignedTo(const UserId& userId) const;
    [[nodiscard]] std::vector<Task> getOverdueTasks(TimePoint now) const;
    [[nodiscard]] CompletionStats getCompletionStats() const;

    /**
     * @brief Every task, dependencies first
     */
    [[nodiscard]] std::vector<TaskId> getTopologicalOrder() const;

    /**
     * @brief Longest dependency chain by estimated hours
     */
    [[nodiscard]] CriticalPath getCriticalPath() const;

    /// @name AggregateRootBase

    [[nodiscard]] std::string aggregateType() const override { return AGGREGATE_TYPE; }
    void checkInvariants() const override;

private:
    struct State {
        std::string name;
        std::map<std::string, Task> tasks;
        DependencyGraph graph;
    };

    State state_;
    TaskRules rules_;

    TaskAggregate(ProjectId projectId, TaskRules rules);

    static void applyEvent(State& state, const event::TaskEvent& event, TimePoint at);

    template<typename E>
    static shared::domain::PendingEvent emit(State& state, const E& event, TimePoint at) {
        applyEvent(state, event::TaskEvent{event}, at);
        return shared::domain::raise(event);
    }

    static Task& taskIn(State& state, const std::string& taskId);
    void changeStatus(const TaskId& taskId, TaskStatus to, const UserId& by,
                      std::optional<std::string> reason = std::nullopt,
                      std::optional<double> actualHours = std::nullopt);
    void replay(const shared::domain::DomainEvents& events, int afterVersion);

    static Json::Value upgradeSnapshotState(const Json::Value& state, int schemaVersion);
    [[nodiscard]] std::vector<std::string> taskIds() const;
};

} // namespace taskcore::taskmanagement::domain::model
