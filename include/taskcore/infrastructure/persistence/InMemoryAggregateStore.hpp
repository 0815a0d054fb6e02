/**
 * @file InMemoryAggregateStore.hpp
 * @brief Transactional in-memory storage for aggregate rows and outbox entries
 */

#pragma once

#include "taskcore/shared/domain/DomainEvent.hpp"

#include <json/json.h>

#include <chrono>
#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace taskcore::infrastructure::persistence {

/**
 * @brief One persisted aggregate: its serialized snapshot at a version
 */
struct StoredAggregate {
    std::string aggregateType;
    std::string aggregateId;
    int version = 0;
    Json::Value snapshot;
};

struct OutboxEntry {
    shared::domain::DomainEvent event;
    std::chrono::system_clock::time_point appendedAt;
    bool dispatched = false;
    int attempts = 0;
    bool parked = false;
};

/**
 * @brief Versioned row store with one writer transaction at a time
 *
 * Writes issued inside begin()/commit() are staged and become visible to
 * other threads only on commit(); rollback() discards them. The owning
 * thread reads its own staged writes. Writes outside a transaction apply
 * immediately. put() and erase() perform the optimistic version check
 * against the staged-or-committed version.
 *
 * Thread-safe.
 */
class InMemoryAggregateStore {
public:
    InMemoryAggregateStore() = default;

    InMemoryAggregateStore(const InMemoryAggregateStore&) = delete;
    InMemoryAggregateStore& operator=(const InMemoryAggregateStore&) = delete;

    /// @name Transactions

    /**
     * @brief Start a transaction; blocks while another thread holds one
     * @throws shared::exception::PersistenceException on a nested begin()
     */
    void begin();

    /**
     * @brief Apply every staged write and outbox entry at once
     * @throws shared::exception::PersistenceException without an open transaction
     */
    void commit();

    /**
     * @brief Discard staged writes; no-op without an open transaction
     */
    void rollback() noexcept;

    [[nodiscard]] bool inTransaction() const;

    /// @name Aggregate rows

    [[nodiscard]] std::optional<StoredAggregate> find(const std::string& aggregateType,
                                                      const std::string& aggregateId) const;

    [[nodiscard]] std::vector<StoredAggregate> findAll(const std::string& aggregateType) const;

    /**
     * @brief Insert or replace a row
     * @param expectedVersion Version currently stored; 0 when the row must not exist
     * @throws shared::exception::ConcurrencyConflictException
     */
    void put(StoredAggregate row, int expectedVersion);

    /**
     * @throws shared::exception::ConcurrencyConflictException
     */
    void erase(const std::string& aggregateType, const std::string& aggregateId, int expectedVersion);

    [[nodiscard]] std::size_t size() const;

    /// @name Outbox

    void appendOutbox(const shared::domain::DomainEvents& events);

    /**
     * @brief Oldest undispatched, unparked committed entries, in append order
     */
    [[nodiscard]] shared::domain::DomainEvents pendingOutbox(std::size_t limit) const;

    /**
     * @return Number of entries newly marked
     */
    std::size_t markDispatched(const std::vector<std::string>& eventIds);

    /**
     * @return Highest attempt count among the matching entries
     */
    int recordOutboxFailure(const std::vector<std::string>& eventIds);

    /**
     * @return Number of entries newly parked
     */
    std::size_t parkOutbox(const std::vector<std::string>& eventIds);

    [[nodiscard]] std::size_t pendingOutboxCount() const;
    [[nodiscard]] std::size_t parkedOutboxCount() const;
    [[nodiscard]] std::size_t outboxSize() const;

    /**
     * @brief Drop dispatched entries
     * @return Number of entries removed
     */
    std::size_t purgeDispatched();

private:
    using Key = std::pair<std::string, std::string>;

    mutable std::mutex mutex_;
    std::mutex transactionMutex_;
    std::unique_lock<std::mutex> transactionLock_;

    std::map<Key, StoredAggregate> rows_;
    std::deque<OutboxEntry> outbox_;

    bool inTransaction_ = false;
    std::thread::id owner_;
    std::map<Key, std::optional<StoredAggregate>> staged_;  // nullopt = erased
    shared::domain::DomainEvents stagedOutbox_;

    [[nodiscard]] bool ownsTransaction() const;
    [[nodiscard]] int currentVersion(const Key& key) const;
    void checkVersion(const Key& key, int expectedVersion) const;
    void clearTransaction();
};

} // namespace taskcore::infrastructure::persistence
