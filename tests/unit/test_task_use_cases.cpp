/**
 * @file test_task_use_cases.cpp
 * @brief Unit tests for the task use cases over the in-memory infrastructure
 */

#include <gtest/gtest.h>

#include "taskcore/taskmanagement/application/usecase/TaskUseCases.hpp"
#include "test_helpers.h"

#include <thread>

using namespace taskcore::taskmanagement::application::usecase;
using namespace taskcore::shared::exception;
using taskcore::taskmanagement::domain::repository::ITaskAggregateRepository;
using namespace test_helpers;

// ============================================================================
// Test Fixture
// ============================================================================

class TaskUseCasesTest : public ::testing::Test {
protected:
    InMemoryEnvironment env_;
    std::shared_ptr<FailingRepository<TaskAggregate, ProjectId>> repository_ =
        std::make_shared<FailingRepository<TaskAggregate, ProjectId>>(env_.taskRepository);
    std::shared_ptr<TaskGraphUpdater> updater_ =
        std::make_shared<TaskGraphUpdater>(repository_, env_.directFactory());

    std::string projectId_;

    void SetUp() override {
        CreateProjectUseCase createProject(updater_, TaskRules{});
        projectId_ = createProject.execute(CreateProjectCommand{"project-1", "Apollo", "alice"}).projectId;
        env_.publisher->batches.clear();
        repository_->saveCalls = 0;
    }

    std::string createTask(const std::string& title, const std::string& priority = "MEDIUM") {
        CreateTaskUseCase useCase(updater_);
        CreateTaskCommand command;
        command.projectId = projectId_;
        command.title = title;
        command.priority = priority;
        command.createdBy = "alice";
        return useCase.execute(command).taskId;
    }

    TaskResponse changeStatus(const std::string& taskId, TaskAction action, const std::string& userId = "alice") {
        ChangeTaskStatusUseCase useCase(updater_);
        ChangeTaskStatusCommand command;
        command.projectId = projectId_;
        command.taskId = taskId;
        command.action = action;
        command.userId = userId;
        return useCase.execute(command);
    }

    TaskAggregate stored() {
        return env_.taskRepository->load(ProjectId::of(projectId_));
    }
};

// ============================================================================
// Project and task creation
// ============================================================================

TEST_F(TaskUseCasesTest, CreateProject_PersistsAndPublishes) {
    CreateProjectUseCase useCase(updater_, TaskRules{});

    auto response = useCase.execute(CreateProjectCommand{"project-2", "Gemini", "bob"});

    EXPECT_EQ(response.projectId, "project-2");
    EXPECT_EQ(response.name, "Gemini");
    EXPECT_EQ(response.taskCount, 0u);
    EXPECT_EQ(response.version, 1);
    EXPECT_EQ(env_.publisher->eventTypes(), std::vector<std::string>{"TaskGraphCreated"});
}

TEST_F(TaskUseCasesTest, CreateProject_GeneratesIdWhenEmpty) {
    CreateProjectUseCase useCase(updater_, TaskRules{});

    auto response = useCase.execute(CreateProjectCommand{"", "Gemini", "bob"});

    EXPECT_FALSE(response.projectId.empty());
    EXPECT_TRUE(env_.taskRepository->exists(ProjectId::of(response.projectId)));
}

TEST_F(TaskUseCasesTest, CreateProject_DuplicateIdConflicts) {
    CreateProjectUseCase useCase(updater_, TaskRules{});

    EXPECT_THROW(useCase.execute(CreateProjectCommand{"project-1", "Again", "bob"}),
                 ConcurrencyConflictException);
}

TEST_F(TaskUseCasesTest, CreateTask_ReturnsTaskAndAdvancesVersion) {
    CreateTaskUseCase useCase(updater_);
    CreateTaskCommand command;
    command.projectId = projectId_;
    command.title = "Design";
    command.priority = "HIGH";
    command.createdBy = "alice";
    command.assignee = "bob";

    auto response = useCase.execute(command);

    EXPECT_EQ(response.title, "Design");
    EXPECT_EQ(response.status, "TODO");
    EXPECT_EQ(response.priority, "HIGH");
    EXPECT_EQ(response.assignee, std::optional<std::string>("bob"));
    EXPECT_TRUE(response.canStart);
    EXPECT_EQ(response.projectVersion, 2);
    EXPECT_EQ(env_.publisher->eventTypes(), std::vector<std::string>{"TaskCreated"});
}

TEST_F(TaskUseCasesTest, CreateTask_InvalidPriorityRejectedBeforeWrite) {
    EXPECT_THROW(createTask("Design", "SOMEDAY"), ValidationException);
    EXPECT_EQ(repository_->saveCalls, 0);
    EXPECT_EQ(stored().getVersion(), 1);
}

TEST_F(TaskUseCasesTest, CreateTask_UnknownProjectNotFound) {
    CreateTaskUseCase useCase(updater_);
    CreateTaskCommand command;
    command.projectId = "missing";
    command.title = "Design";
    command.createdBy = "alice";

    EXPECT_THROW(useCase.execute(command), NotFoundException);
}

TEST_F(TaskUseCasesTest, UpdateTask_AppliesPartialChanges) {
    auto taskId = createTask("Design");
    UpdateTaskUseCase useCase(updater_);
    UpdateTaskCommand command;
    command.projectId = projectId_;
    command.taskId = taskId;
    command.updatedBy = "alice";
    command.priority = "URGENT";

    auto response = useCase.execute(command);

    EXPECT_EQ(response.title, "Design");
    EXPECT_EQ(response.priority, "URGENT");
}

TEST_F(TaskUseCasesTest, AssignTask_EmptyAssigneeUnassigns) {
    auto taskId = createTask("Design");
    AssignTaskUseCase useCase(updater_);

    auto assigned = useCase.execute(AssignTaskCommand{projectId_, taskId, "bob", "alice"});
    auto unassigned = useCase.execute(AssignTaskCommand{projectId_, taskId, "", "alice"});

    EXPECT_EQ(assigned.assignee, std::optional<std::string>("bob"));
    EXPECT_FALSE(unassigned.assignee.has_value());
    EXPECT_EQ(env_.publisher->eventTypes().back(), "TaskUnassigned");
}

// ============================================================================
// Workflow and dependencies
// ============================================================================

TEST_F(TaskUseCasesTest, Workflow_DependencyGatesStart) {
    auto design = createTask("Design");
    auto build = createTask("Build");
    AddDependencyUseCase addDependency(updater_);

    auto blocked = addDependency.execute(DependencyCommand{projectId_, build, design});
    EXPECT_FALSE(blocked.canStart);

    EXPECT_THROW(changeStatus(build, TaskAction::START), DependencyNotSatisfiedException);

    changeStatus(design, TaskAction::START);
    changeStatus(design, TaskAction::SUBMIT_FOR_REVIEW);
    auto completed = changeStatus(design, TaskAction::COMPLETE);
    EXPECT_EQ(completed.status, "COMPLETED");

    auto started = changeStatus(build, TaskAction::START);
    EXPECT_EQ(started.status, "IN_PROGRESS");
    EXPECT_EQ(started.assignee, std::optional<std::string>("alice"));
}

TEST_F(TaskUseCasesTest, Workflow_OnlyAssigneeMayStart) {
    auto taskId = createTask("Design");
    AssignTaskUseCase assign(updater_);
    assign.execute(AssignTaskCommand{projectId_, taskId, "bob", "alice"});

    EXPECT_THROW(changeStatus(taskId, TaskAction::START, "carol"), NotTaskAssigneeException);
    EXPECT_EQ(changeStatus(taskId, TaskAction::START, "bob").status, "IN_PROGRESS");
}

TEST_F(TaskUseCasesTest, Workflow_CancelReopenPause) {
    auto taskId = createTask("Design");

    EXPECT_EQ(changeStatus(taskId, TaskAction::CANCEL).status, "CANCELLED");
    EXPECT_EQ(changeStatus(taskId, TaskAction::REOPEN).status, "TODO");
    changeStatus(taskId, TaskAction::START);
    EXPECT_EQ(changeStatus(taskId, TaskAction::PAUSE).status, "TODO");
    EXPECT_THROW(changeStatus(taskId, TaskAction::REOPEN), InvalidStatusTransitionException);
}

TEST_F(TaskUseCasesTest, AddDependency_CycleRejectedAndNothingPersisted) {
    auto a = createTask("A");
    auto b = createTask("B");
    AddDependencyUseCase addDependency(updater_);
    addDependency.execute(DependencyCommand{projectId_, b, a});
    const int versionBefore = stored().getVersion();
    const int savesBefore = repository_->saveCalls;

    EXPECT_THROW(addDependency.execute(DependencyCommand{projectId_, a, b}), CircularDependencyException);

    EXPECT_EQ(stored().getVersion(), versionBefore);
    EXPECT_EQ(repository_->saveCalls, savesBefore);
    EXPECT_FALSE(stored().hasDependency(TaskId::of(a), TaskId::of(b)));
}

TEST_F(TaskUseCasesTest, RemoveDependency_UnblocksTask) {
    auto a = createTask("A");
    auto b = createTask("B");
    AddDependencyUseCase addDependency(updater_);
    RemoveDependencyUseCase removeDependency(updater_);
    addDependency.execute(DependencyCommand{projectId_, b, a});

    auto response = removeDependency.execute(DependencyCommand{projectId_, b, a});

    EXPECT_TRUE(response.canStart);
    EXPECT_THROW(removeDependency.execute(DependencyCommand{projectId_, b, a}), NotFoundException);
}

TEST_F(TaskUseCasesTest, RemoveTask_DropsEdges) {
    auto a = createTask("A");
    auto b = createTask("B");
    AddDependencyUseCase addDependency(updater_);
    addDependency.execute(DependencyCommand{projectId_, b, a});

    RemoveTaskUseCase removeTask(updater_);
    auto response = removeTask.execute(RemoveTaskCommand{projectId_, a, "alice"});

    EXPECT_EQ(response.taskCount, 1u);
    EXPECT_EQ(response.dependencyCount, 0u);
    EXPECT_TRUE(stored().canStart(TaskId::of(b)));
}

TEST_F(TaskUseCasesTest, ArchiveProject_DeletesAggregate) {
    createTask("A");
    ArchiveProjectUseCase archive(updater_);

    archive.execute(ArchiveProjectCommand{projectId_, "alice"});

    EXPECT_FALSE(env_.taskRepository->exists(ProjectId::of(projectId_)));
    EXPECT_EQ(env_.publisher->eventTypes().back(), "TaskGraphArchived");
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(TaskUseCasesTest, ConcurrentWriter_ReloadsAndReplaysCommand) {
    createTask("First");
    repository_->saveCalls = 0;
    repository_->beforeSave = [this] {
        // Competing writer commits version 3 while this command is in flight
        std::thread competitor([this] {
            auto project = env_.taskRepository->load(ProjectId::of(projectId_));
            addTask(project, "Competitor");
            env_.taskRepository->save(project, project.getVersion());
        });
        competitor.join();
    };

    auto response = [this] {
        CreateTaskUseCase useCase(updater_);
        CreateTaskCommand command;
        command.projectId = projectId_;
        command.title = "Mine";
        command.createdBy = "alice";
        return useCase.execute(command);
    }();

    EXPECT_EQ(repository_->saveCalls, 2);
    EXPECT_EQ(response.projectVersion, 4);
    EXPECT_EQ(stored().taskCount(), 3u);
}

TEST_F(TaskUseCasesTest, ConcurrentWriter_GivesUpAfterMaxAttempts) {
    auto updater = std::make_shared<TaskGraphUpdater>(repository_, env_.directFactory(), 1);
    repository_->beforeSave = [this] {
        std::thread competitor([this] {
            auto project = env_.taskRepository->load(ProjectId::of(projectId_));
            addTask(project, "Competitor");
            env_.taskRepository->save(project, project.getVersion());
        });
        competitor.join();
    };

    CreateTaskUseCase useCase(updater);
    CreateTaskCommand command;
    command.projectId = projectId_;
    command.title = "Mine";
    command.createdBy = "alice";

    EXPECT_THROW(useCase.execute(command), ConcurrencyConflictException);
    EXPECT_EQ(stored().taskCount(), 1u);
    EXPECT_TRUE(env_.publisher->batches.empty());
}

TEST_F(TaskUseCasesTest, AggregateUpdater_RejectsInvalidArguments) {
    EXPECT_THROW(TaskGraphUpdater(nullptr, env_.directFactory()), std::invalid_argument);
    EXPECT_THROW(TaskGraphUpdater(repository_, nullptr), std::invalid_argument);
    EXPECT_THROW(TaskGraphUpdater(repository_, env_.directFactory(), 0), std::invalid_argument);
}
