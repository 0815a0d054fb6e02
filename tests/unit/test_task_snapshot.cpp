/**
 * @file test_task_snapshot.cpp
 * @brief Unit tests for task graph snapshots, replay and schema upgrade
 */

#include <gtest/gtest.h>

#include "taskcore/shared/domain/Snapshot.hpp"
#include "taskcore/shared/exception/DomainException.hpp"
#include "taskcore/taskmanagement/domain/model/TaskAggregate.hpp"
#include "test_helpers.h"

using namespace taskcore::taskmanagement::domain::model;
using namespace taskcore::shared::exception;
using taskcore::shared::domain::AggregateSnapshot;
using taskcore::shared::domain::DomainEvents;
using namespace test_helpers;

// ============================================================================
// Test Fixture
// ============================================================================

class TaskSnapshotTest : public ::testing::Test {
protected:
    TaskAggregate project_ = makeProject("project-snap");
    DomainEvents history_;
    TaskId a_ = TaskId::of("placeholder");
    TaskId b_ = TaskId::of("placeholder");

    void SetUp() override {
        a_ = addTask(project_, "A", 5.0);
        b_ = addTask(project_, "B");
        commit();
    }

    // Acknowledge the pending batch, keeping its events as history
    void commit() {
        const auto& events = project_.getUncommittedEvents();
        history_.insert(history_.end(), events.begin(), events.end());
        project_.markCommitted();
    }
};

// ============================================================================
// Snapshot creation
// ============================================================================

TEST_F(TaskSnapshotTest, CreateSnapshot_CarriesCommittedVersion) {
    AggregateSnapshot snapshot = project_.createSnapshot();

    EXPECT_EQ(snapshot.aggregateType, "TaskGraph");
    EXPECT_EQ(snapshot.aggregateId, "project-snap");
    EXPECT_EQ(snapshot.schemaVersion, TaskAggregate::SNAPSHOT_SCHEMA_VERSION);
    EXPECT_EQ(snapshot.version, 1);
}

TEST_F(TaskSnapshotTest, CreateSnapshot_PendingBatchUsesNextVersion) {
    project_.addDependency(b_, a_);
    EXPECT_EQ(project_.createSnapshot().version, 2);
}

// ============================================================================
// Restore
// ============================================================================

TEST_F(TaskSnapshotTest, RestoreFromSnapshot_ReproducesState) {
    project_.addDependency(b_, a_);
    project_.startTask(a_, UserId::of("alice"));
    commit();

    const auto restored = TaskAggregate::restoreFromSnapshot(
        AggregateSnapshot::fromJson(project_.createSnapshot().toJson()), {});

    EXPECT_EQ(restored.getVersion(), 2);
    EXPECT_FALSE(restored.hasUncommittedChanges());
    EXPECT_EQ(restored.getName(), "Apollo");
    EXPECT_EQ(restored.getGraph(), project_.getGraph());
    EXPECT_EQ(restored.getTask(a_).status, TaskStatus::IN_PROGRESS);
    EXPECT_EQ(restored.getTask(a_).estimatedHours, std::optional<double>(5.0));
    EXPECT_EQ(restored.getTask(a_).assignee, std::optional<UserId>(UserId::of("alice")));
}

TEST_F(TaskSnapshotTest, RestoreFromSnapshot_ReplaysNewerEventsOnly) {
    const AggregateSnapshot snapshot = project_.createSnapshot();
    project_.addDependency(b_, a_);
    commit();
    project_.cancelTask(a_, UserId::of("alice"));
    commit();

    // history_ still holds the version-1 events; they must be skipped
    const auto restored = TaskAggregate::restoreFromSnapshot(snapshot, history_);

    EXPECT_EQ(restored.getVersion(), 3);
    EXPECT_TRUE(restored.hasDependency(b_, a_));
    EXPECT_EQ(restored.getTask(a_).status, TaskStatus::CANCELLED);
    EXPECT_EQ(restored.taskCount(), 2u);
}

TEST_F(TaskSnapshotTest, FromHistory_MatchesLiveAggregate) {
    project_.addDependency(b_, a_);
    commit();
    project_.removeTask(b_, UserId::of("alice"));
    commit();

    const auto replayed = TaskAggregate::fromHistory(ProjectId::of("project-snap"), history_);

    EXPECT_EQ(replayed.getVersion(), project_.getVersion());
    EXPECT_EQ(replayed.taskCount(), 1u);
    EXPECT_EQ(replayed.dependencyCount(), 0u);
    EXPECT_EQ(replayed.getName(), "Apollo");
}

TEST_F(TaskSnapshotTest, FromHistory_ArchiveTombstones) {
    project_.archive(UserId::of("alice"));
    commit();

    const auto replayed = TaskAggregate::fromHistory(ProjectId::of("project-snap"), history_);
    EXPECT_TRUE(replayed.isDeleted());
}

TEST_F(TaskSnapshotTest, RestoreFromSnapshot_RejectsForeignAggregateType) {
    AggregateSnapshot snapshot = project_.createSnapshot();
    snapshot.aggregateType = "Webhook";

    EXPECT_THROW(TaskAggregate::restoreFromSnapshot(snapshot, {}), DomainException);
}

TEST_F(TaskSnapshotTest, RestoreFromSnapshot_RejectsFutureSchema) {
    AggregateSnapshot snapshot = project_.createSnapshot();
    snapshot.schemaVersion = TaskAggregate::SNAPSHOT_SCHEMA_VERSION + 1;

    EXPECT_THROW(TaskAggregate::restoreFromSnapshot(snapshot, {}), DomainException);
}

TEST_F(TaskSnapshotTest, RestoreFromSnapshot_RejectsCyclicGraph) {
    AggregateSnapshot snapshot = project_.createSnapshot();
    Json::Value edges(Json::arrayValue);
    for (const auto& pair : {std::make_pair(a_, b_), std::make_pair(b_, a_)}) {
        Json::Value edge(Json::objectValue);
        edge["task"] = pair.first.toString();
        edge["dependsOn"] = pair.second.toString();
        edges.append(edge);
    }
    snapshot.state["dependencies"] = edges;

    EXPECT_THROW(TaskAggregate::restoreFromSnapshot(snapshot, {}), CircularDependencyException);
}

// ============================================================================
// Schema upgrade
// ============================================================================

TEST(TaskSnapshotUpgradeTest, SchemaOne_IsUpgradedOnRestore) {
    Json::Value design(Json::objectValue);
    design["title"] = "Design";
    design["createdBy"] = "alice";
    design["status"] = "COMPLETED";

    Json::Value build(Json::objectValue);
    build["title"] = "Build";
    build["createdBy"] = "alice";

    AggregateSnapshot snapshot;
    snapshot.aggregateType = "TaskGraph";
    snapshot.aggregateId = "legacy-project";
    snapshot.schemaVersion = 1;
    snapshot.version = 7;
    snapshot.state["projectName"] = "Legacy";
    snapshot.state["tasks"]["t-design"] = design;
    snapshot.state["tasks"]["t-build"] = build;
    snapshot.state["dependencies"]["t-build"].append("t-design");
    snapshot.state["archived"] = false;

    const auto restored = TaskAggregate::restoreFromSnapshot(snapshot, {});

    EXPECT_EQ(restored.getVersion(), 7);
    EXPECT_EQ(restored.getName(), "Legacy");
    EXPECT_EQ(restored.taskCount(), 2u);
    EXPECT_TRUE(restored.hasDependency(TaskId::of("t-build"), TaskId::of("t-design")));
    EXPECT_TRUE(restored.canStart(TaskId::of("t-build")));

    // Saved again, the state is written in the current schema
    const AggregateSnapshot current = restored.createSnapshot();
    EXPECT_EQ(current.schemaVersion, TaskAggregate::SNAPSHOT_SCHEMA_VERSION);
    EXPECT_TRUE(current.state["tasks"].isArray());
}
