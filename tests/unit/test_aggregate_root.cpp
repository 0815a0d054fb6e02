/**
 * @file test_aggregate_root.cpp
 * @brief Unit tests for the aggregate root contract: event buffer, versioning, tombstones
 */

#include <gtest/gtest.h>

#include "taskcore/shared/domain/DomainEvent.hpp"
#include "taskcore/shared/exception/DomainException.hpp"
#include "taskcore/taskmanagement/domain/model/TaskAggregate.hpp"
#include "test_helpers.h"

#include <type_traits>

using namespace taskcore::taskmanagement::domain::model;
using namespace taskcore::shared::exception;
using taskcore::shared::domain::DomainEvent;
using namespace test_helpers;

static_assert(!std::is_copy_constructible_v<TaskAggregate>, "aggregates are not copyable");
static_assert(std::is_move_constructible_v<TaskAggregate>, "aggregates are movable");

// ============================================================================
// Event buffer
// ============================================================================

TEST(AggregateRootTest, Create_BuffersCreationEvent) {
    auto project = makeProject("project-1");

    EXPECT_EQ(project.getVersion(), 0);
    EXPECT_EQ(project.getNextVersion(), 1);
    ASSERT_EQ(project.getUncommittedEvents().size(), 1u);

    const DomainEvent& event = project.getUncommittedEvents().front();
    EXPECT_EQ(event.getEventType(), "TaskGraphCreated");
    EXPECT_EQ(event.getAggregateId(), "project-1");
    EXPECT_EQ(event.getAggregateType(), "TaskGraph");
    EXPECT_EQ(event.getAggregateVersion(), 1);
    EXPECT_FALSE(event.getEventId().empty());
}

TEST(AggregateRootTest, Events_KeepMutatorOrder) {
    auto project = makeProject();
    addTask(project, "Design");
    addTask(project, "Build");

    const auto& events = project.getUncommittedEvents();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].getEventType(), "TaskGraphCreated");
    EXPECT_EQ(events[1].getEventType(), "TaskCreated");
    EXPECT_EQ(events[2].getEventType(), "TaskCreated");
    EXPECT_NE(events[1].getEventId(), events[2].getEventId());
}

// ============================================================================
// Versioning
// ============================================================================

TEST(AggregateRootTest, MarkCommitted_AdvancesVersionOncePerBatch) {
    auto project = makeProject();
    addTask(project, "Design");
    addTask(project, "Build");

    project.markCommitted();

    EXPECT_EQ(project.getVersion(), 1);
    EXPECT_FALSE(project.hasUncommittedChanges());
    EXPECT_EQ(project.taskCount(), 2u);
}

TEST(AggregateRootTest, MarkCommitted_WithoutEventsKeepsVersion) {
    auto project = makeProject();
    project.markCommitted();
    project.markCommitted();

    EXPECT_EQ(project.getVersion(), 1);
    EXPECT_EQ(project.getNextVersion(), 1);
}

TEST(AggregateRootTest, SecondBatch_EventsCarryNextVersion) {
    auto project = makeProject();
    project.markCommitted();

    addTask(project, "Design");

    ASSERT_EQ(project.getUncommittedEvents().size(), 1u);
    EXPECT_EQ(project.getUncommittedEvents().front().getAggregateVersion(), 2);
    EXPECT_EQ(project.getNextVersion(), 2);
}

TEST(AggregateRootTest, DiscardUncommittedEvents_KeepsVersionAndState) {
    auto project = makeProject();
    project.markCommitted();
    addTask(project, "Design");

    project.discardUncommittedEvents();

    EXPECT_EQ(project.getVersion(), 1);
    EXPECT_FALSE(project.hasUncommittedChanges());
    EXPECT_EQ(project.taskCount(), 1u);
}

// ============================================================================
// All-or-nothing mutators
// ============================================================================

TEST(AggregateRootTest, RejectedMutator_LeavesStateAndBufferUntouched) {
    auto project = makeProject();
    project.markCommitted();
    const TaskId design = addTask(project, "Design");
    const auto eventsBefore = project.getUncommittedEvents().size();

    EXPECT_THROW(project.addDependency(design, design), CircularDependencyException);
    EXPECT_THROW(project.addDependency(design, TaskId::of("missing")), NotFoundException);

    EXPECT_EQ(project.getUncommittedEvents().size(), eventsBefore);
    EXPECT_EQ(project.dependencyCount(), 0u);
    EXPECT_EQ(project.getVersion(), 1);
}

TEST(AggregateRootTest, Archive_RejectsLaterMutations) {
    auto project = makeProject();
    project.markCommitted();

    project.archive(UserId::of("alice"));

    EXPECT_TRUE(project.isDeleted());
    EXPECT_EQ(project.getUncommittedEvents().back().getEventType(), "TaskGraphArchived");
    EXPECT_THROW(addTask(project, "Too late"), AggregateDeletedException);
    EXPECT_THROW(project.archive(UserId::of("alice")), AggregateDeletedException);
}

// ============================================================================
// Event envelope
// ============================================================================

TEST(DomainEventTest, Json_PreservesEnvelope) {
    auto project = makeProject("project-7");
    const DomainEvent& original = project.getUncommittedEvents().front();

    const DomainEvent restored = DomainEvent::fromJson(original.toJson());

    EXPECT_EQ(restored.getEventId(), original.getEventId());
    EXPECT_EQ(restored.getAggregateId(), "project-7");
    EXPECT_EQ(restored.getAggregateType(), "TaskGraph");
    EXPECT_EQ(restored.getAggregateVersion(), 1);
    EXPECT_EQ(restored.getEventType(), "TaskGraphCreated");
    EXPECT_EQ(restored.getPayload(), original.getPayload());
}

TEST(DomainEventTest, FromJson_RejectsMissingFields) {
    Json::Value json(Json::objectValue);
    json["eventType"] = "TaskCreated";

    EXPECT_THROW(DomainEvent::fromJson(json), DomainException);
}
