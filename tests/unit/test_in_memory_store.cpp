/**
 * @file test_in_memory_store.cpp
 * @brief Unit tests for the in-memory aggregate store, transaction runner and repositories
 */

#include <gtest/gtest.h>

#include "taskcore/shared/exception/DomainException.hpp"
#include "test_helpers.h"

#include <stdexcept>
#include <thread>

using namespace taskcore::infrastructure::persistence;
using namespace taskcore::shared::exception;
using namespace taskcore::taskmanagement::domain::model;
using namespace test_helpers;

namespace {

StoredAggregate row(const std::string& id, int version) {
    StoredAggregate stored;
    stored.aggregateType = "TaskGraph";
    stored.aggregateId = id;
    stored.version = version;
    stored.snapshot = Json::Value(Json::objectValue);
    stored.snapshot["marker"] = version;
    return stored;
}

} // namespace

class InMemoryStoreTest : public ::testing::Test {
protected:
    std::shared_ptr<InMemoryAggregateStore> store_ = std::make_shared<InMemoryAggregateStore>();
};

// ============================================================================
// Rows and version checks
// ============================================================================

TEST_F(InMemoryStoreTest, Put_OutsideTransactionAppliesImmediately) {
    store_->put(row("p-1", 1), 0);

    auto found = store_->find("TaskGraph", "p-1");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->version, 1);
    EXPECT_EQ(store_->size(), 1u);
    EXPECT_FALSE(store_->find("Webhook", "p-1").has_value());
}

TEST_F(InMemoryStoreTest, Put_StaleExpectedVersionConflicts) {
    store_->put(row("p-1", 1), 0);
    store_->put(row("p-1", 2), 1);

    try {
        store_->put(row("p-1", 2), 1);
        FAIL() << "expected ConcurrencyConflictException";
    } catch (const ConcurrencyConflictException& e) {
        EXPECT_EQ(e.getAggregateId(), "TaskGraph p-1");
        EXPECT_EQ(e.getExpectedVersion(), 1);
        EXPECT_EQ(e.getActualVersion(), 2);
    }
}

TEST_F(InMemoryStoreTest, Put_RejectsMalformedRows) {
    EXPECT_THROW(store_->put(row("", 1), 0), PersistenceException);
    EXPECT_THROW(store_->put(row("p-1", 0), 0), PersistenceException);
}

TEST_F(InMemoryStoreTest, Erase_ChecksVersion) {
    store_->put(row("p-1", 1), 0);

    EXPECT_THROW(store_->erase("TaskGraph", "p-1", 3), ConcurrencyConflictException);
    store_->erase("TaskGraph", "p-1", 1);
    EXPECT_EQ(store_->size(), 0u);
}

// ============================================================================
// Transactions
// ============================================================================

TEST_F(InMemoryStoreTest, Commit_PublishesStagedWrites) {
    store_->begin();
    store_->put(row("p-1", 1), 0);

    EXPECT_TRUE(store_->inTransaction());
    EXPECT_TRUE(store_->find("TaskGraph", "p-1").has_value());
    EXPECT_EQ(store_->size(), 0u);

    store_->commit();
    EXPECT_FALSE(store_->inTransaction());
    EXPECT_EQ(store_->size(), 1u);
}

TEST_F(InMemoryStoreTest, Rollback_DiscardsStagedWritesAndOutbox) {
    store_->put(row("p-1", 1), 0);

    store_->begin();
    store_->put(row("p-1", 2), 1);
    store_->erase("TaskGraph", "p-1", 2);
    store_->appendOutbox({makeEvent("TaskCreated")});
    EXPECT_FALSE(store_->find("TaskGraph", "p-1").has_value());
    store_->rollback();

    EXPECT_EQ(store_->find("TaskGraph", "p-1")->version, 1);
    EXPECT_EQ(store_->outboxSize(), 0u);
}

TEST_F(InMemoryStoreTest, Begin_NestedOnSameThreadThrows) {
    store_->begin();
    EXPECT_THROW(store_->begin(), PersistenceException);
    store_->rollback();
}

TEST_F(InMemoryStoreTest, Commit_WithoutBeginThrows) {
    EXPECT_THROW(store_->commit(), PersistenceException);
    EXPECT_NO_THROW(store_->rollback());
}

TEST_F(InMemoryStoreTest, StagedWrites_InvisibleToOtherThreads) {
    store_->begin();
    store_->put(row("p-1", 1), 0);

    bool seenByOtherThread = true;
    std::thread reader([&] { seenByOtherThread = store_->find("TaskGraph", "p-1").has_value(); });
    reader.join();

    store_->commit();
    EXPECT_FALSE(seenByOtherThread);
}

TEST_F(InMemoryStoreTest, FindAll_MergesStagedRows) {
    store_->put(row("p-1", 1), 0);
    store_->put(row("p-2", 1), 0);

    store_->begin();
    store_->erase("TaskGraph", "p-1", 1);
    store_->put(row("p-3", 1), 0);
    auto visible = store_->findAll("TaskGraph");
    store_->rollback();

    ASSERT_EQ(visible.size(), 2u);
    EXPECT_EQ(visible[0].aggregateId, "p-2");
    EXPECT_EQ(visible[1].aggregateId, "p-3");
}

// ============================================================================
// Outbox
// ============================================================================

TEST_F(InMemoryStoreTest, Outbox_PendingInAppendOrderUntilDispatched) {
    auto first = makeEvent("TaskCreated", "p-1", "e-1");
    auto second = makeEvent("TaskUpdated", "p-1", "e-2");
    auto third = makeEvent("TaskAssigned", "p-1", "e-3");
    store_->appendOutbox({first, second, third});

    auto pending = store_->pendingOutbox(2);
    ASSERT_EQ(pending.size(), 2u);
    EXPECT_EQ(pending[0].getEventId(), "e-1");
    EXPECT_EQ(pending[1].getEventId(), "e-2");

    EXPECT_EQ(store_->markDispatched({"e-1", "e-2", "unknown"}), 2u);
    EXPECT_EQ(store_->markDispatched({"e-1"}), 0u);
    EXPECT_EQ(store_->pendingOutboxCount(), 1u);
    EXPECT_EQ(store_->pendingOutbox(10).front().getEventId(), "e-3");

    EXPECT_EQ(store_->purgeDispatched(), 2u);
    EXPECT_EQ(store_->outboxSize(), 1u);
}

TEST_F(InMemoryStoreTest, Outbox_FailedAttemptsCountedAndParkedEntriesSkipped) {
    store_->appendOutbox({makeEvent("TaskCreated", "p-1", "e-1"),
                          makeEvent("TaskUpdated", "p-1", "e-2")});

    EXPECT_EQ(store_->recordOutboxFailure({"e-1"}), 1);
    EXPECT_EQ(store_->recordOutboxFailure({"e-1", "e-2"}), 2);

    EXPECT_EQ(store_->parkOutbox({"e-1"}), 1u);
    EXPECT_EQ(store_->parkOutbox({"e-1"}), 0u);
    EXPECT_EQ(store_->parkedOutboxCount(), 1u);
    EXPECT_EQ(store_->pendingOutboxCount(), 1u);

    auto pending = store_->pendingOutbox(10);
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].getEventId(), "e-2");
    EXPECT_EQ(store_->outboxSize(), 2u);
}

// ============================================================================
// Transaction runner
// ============================================================================

TEST_F(InMemoryStoreTest, TransactionRunner_CommitsOnSuccess) {
    InMemoryTransactionRunner runner(store_);

    runner.run([&] { store_->put(row("p-1", 1), 0); });

    EXPECT_FALSE(store_->inTransaction());
    EXPECT_EQ(store_->size(), 1u);
}

TEST_F(InMemoryStoreTest, TransactionRunner_RollsBackAndRethrows) {
    InMemoryTransactionRunner runner(store_);

    EXPECT_THROW(runner.run([&] {
        store_->put(row("p-1", 1), 0);
        throw std::runtime_error("boom");
    }), std::runtime_error);

    EXPECT_FALSE(store_->inTransaction());
    EXPECT_EQ(store_->size(), 0u);
}

TEST_F(InMemoryStoreTest, TransactionRunner_NullStoreThrows) {
    EXPECT_THROW(InMemoryTransactionRunner(nullptr), std::invalid_argument);
}

// ============================================================================
// Repositories
// ============================================================================

TEST(InMemoryRepositoryTest, TaskRepository_SaveLoadRoundTripsState) {
    InMemoryEnvironment env;
    auto project = makeProject("project-1");
    auto design = addTask(project, "Design", 4.0);
    auto build = addTask(project, "Build");
    project.addDependency(build, design);

    env.taskRepository->save(project, 0);
    project.markCommitted();

    auto loaded = env.taskRepository->load(ProjectId::of("project-1"));
    EXPECT_EQ(loaded.getVersion(), 1);
    EXPECT_EQ(loaded.taskCount(), 2u);
    EXPECT_FALSE(loaded.hasUncommittedChanges());
    EXPECT_TRUE(loaded.getGraph().hasEdge(build.getValue(), design.getValue()));
}

TEST(InMemoryRepositoryTest, TaskRepository_MissingAggregate) {
    InMemoryEnvironment env;

    EXPECT_FALSE(env.taskRepository->findById(ProjectId::of("missing")).has_value());
    EXPECT_FALSE(env.taskRepository->persistedVersion(ProjectId::of("missing")).has_value());
    EXPECT_THROW(env.taskRepository->load(ProjectId::of("missing")), NotFoundException);
}

TEST(InMemoryRepositoryTest, WebhookRepository_Queries) {
    InMemoryEnvironment env;
    auto active = makeWebhook("webhook-1");
    auto suspended = makeWebhook("webhook-2");
    suspended.suspend("maintenance");
    auto busy = makeWebhook("webhook-3");
    busy.triggerDelivery("e-1", "TaskStatusChanged", Json::Value(Json::objectValue));

    for (auto* webhook : {&active, &suspended, &busy}) {
        env.webhookRepository->save(*webhook, 0);
        webhook->markCommitted();
    }

    auto subscribed = env.webhookRepository->findSubscribedTo("TaskStatusChanged");
    ASSERT_EQ(subscribed.size(), 2u);
    EXPECT_EQ(subscribed[0].getValue(), "webhook-1");
    EXPECT_EQ(subscribed[1].getValue(), "webhook-3");

    EXPECT_TRUE(env.webhookRepository->findSubscribedTo("TaskCreated").empty());

    auto open = env.webhookRepository->findWithOpenDeliveries();
    ASSERT_EQ(open.size(), 1u);
    EXPECT_EQ(open[0].getValue(), "webhook-3");

    EXPECT_EQ(env.webhookRepository->findByWorkspace("workspace-1").size(), 3u);
    EXPECT_TRUE(env.webhookRepository->findByWorkspace("workspace-2").empty());
}
