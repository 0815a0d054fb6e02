#include "taskcore/infrastructure/persistence/InMemoryAggregateStore.hpp"
#include "taskcore/shared/exception/InfrastructureException.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

namespace taskcore::infrastructure::persistence {

using shared::exception::ConcurrencyConflictException;
using shared::exception::PersistenceException;

bool InMemoryAggregateStore::ownsTransaction() const {
    return inTransaction_ && owner_ == std::this_thread::get_id();
}

void InMemoryAggregateStore::begin() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (ownsTransaction()) {
            throw PersistenceException("Nested transactions are not supported");
        }
    }

    std::unique_lock<std::mutex> transaction(transactionMutex_);

    std::lock_guard<std::mutex> lock(mutex_);
    transactionLock_ = std::move(transaction);
    inTransaction_ = true;
    owner_ = std::this_thread::get_id();
    staged_.clear();
    stagedOutbox_.clear();
}

void InMemoryAggregateStore::commit() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ownsTransaction()) {
        throw PersistenceException("Commit without an open transaction");
    }

    std::size_t written = 0;
    std::size_t erased = 0;
    for (auto& entry : staged_) {
        if (entry.second) {
            rows_[entry.first] = std::move(*entry.second);
            ++written;
        } else {
            rows_.erase(entry.first);
            ++erased;
        }
    }

    const auto now = std::chrono::system_clock::now();
    for (auto& event : stagedOutbox_) {
        outbox_.push_back(OutboxEntry{std::move(event), now, false});
    }

    spdlog::debug("Store transaction committed: {} row(s) written, {} erased, {} outbox entr(ies)",
                  written, erased, stagedOutbox_.size());
    clearTransaction();
}

void InMemoryAggregateStore::rollback() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ownsTransaction()) {
        return;
    }
    spdlog::debug("Store transaction rolled back: {} staged row(s), {} outbox entr(ies) discarded",
                  staged_.size(), stagedOutbox_.size());
    clearTransaction();
}

void InMemoryAggregateStore::clearTransaction() {
    staged_.clear();
    stagedOutbox_.clear();
    inTransaction_ = false;
    owner_ = std::thread::id();
    if (transactionLock_.owns_lock()) {
        transactionLock_.unlock();
    }
}

bool InMemoryAggregateStore::inTransaction() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inTransaction_;
}

int InMemoryAggregateStore::currentVersion(const Key& key) const {
    if (ownsTransaction()) {
        auto staged = staged_.find(key);
        if (staged != staged_.end()) {
            return staged->second ? staged->second->version : 0;
        }
    }
    auto it = rows_.find(key);
    return it == rows_.end() ? 0 : it->second.version;
}

void InMemoryAggregateStore::checkVersion(const Key& key, int expectedVersion) const {
    const int actual = currentVersion(key);
    if (actual != expectedVersion) {
        throw ConcurrencyConflictException(key.first + " " + key.second, expectedVersion, actual);
    }
}

std::optional<StoredAggregate> InMemoryAggregateStore::find(const std::string& aggregateType,
                                                            const std::string& aggregateId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Key key{aggregateType, aggregateId};

    if (ownsTransaction()) {
        auto staged = staged_.find(key);
        if (staged != staged_.end()) {
            return staged->second;
        }
    }
    auto it = rows_.find(key);
    if (it == rows_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<StoredAggregate> InMemoryAggregateStore::findAll(const std::string& aggregateType) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::map<Key, StoredAggregate> visible;
    for (const auto& entry : rows_) {
        if (entry.first.first == aggregateType) {
            visible.emplace(entry.first, entry.second);
        }
    }
    if (ownsTransaction()) {
        for (const auto& entry : staged_) {
            if (entry.first.first != aggregateType) {
                continue;
            }
            if (entry.second) {
                visible[entry.first] = *entry.second;
            } else {
                visible.erase(entry.first);
            }
        }
    }

    std::vector<StoredAggregate> result;
    result.reserve(visible.size());
    for (auto& entry : visible) {
        result.push_back(std::move(entry.second));
    }
    return result;
}

void InMemoryAggregateStore::put(StoredAggregate row, int expectedVersion) {
    if (row.aggregateType.empty() || row.aggregateId.empty()) {
        throw PersistenceException("Aggregate row requires a type and an id");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    Key key{row.aggregateType, row.aggregateId};
    checkVersion(key, expectedVersion);

    if (row.version < 1 || row.version < expectedVersion) {
        throw PersistenceException("Row " + key.first + " " + key.second + " version " +
                                   std::to_string(row.version) + " is behind " +
                                   std::to_string(expectedVersion));
    }

    if (ownsTransaction()) {
        staged_[key] = std::move(row);
    } else {
        rows_[key] = std::move(row);
    }
}

void InMemoryAggregateStore::erase(const std::string& aggregateType, const std::string& aggregateId,
                                   int expectedVersion) {
    std::lock_guard<std::mutex> lock(mutex_);
    Key key{aggregateType, aggregateId};
    checkVersion(key, expectedVersion);

    if (ownsTransaction()) {
        staged_[key] = std::nullopt;
    } else {
        rows_.erase(key);
    }
}

std::size_t InMemoryAggregateStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rows_.size();
}

void InMemoryAggregateStore::appendOutbox(const shared::domain::DomainEvents& events) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ownsTransaction()) {
        stagedOutbox_.insert(stagedOutbox_.end(), events.begin(), events.end());
        return;
    }
    const auto now = std::chrono::system_clock::now();
    for (const auto& event : events) {
        outbox_.push_back(OutboxEntry{event, now, false});
    }
}

shared::domain::DomainEvents InMemoryAggregateStore::pendingOutbox(std::size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    shared::domain::DomainEvents result;
    for (const auto& entry : outbox_) {
        if (result.size() >= limit) {
            break;
        }
        if (!entry.dispatched && !entry.parked) {
            result.push_back(entry.event);
        }
    }
    return result;
}

std::size_t InMemoryAggregateStore::markDispatched(const std::vector<std::string>& eventIds) {
    const std::set<std::string> ids(eventIds.begin(), eventIds.end());

    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t marked = 0;
    for (auto& entry : outbox_) {
        if (!entry.dispatched && ids.count(entry.event.getEventId()) > 0) {
            entry.dispatched = true;
            ++marked;
        }
    }
    return marked;
}

int InMemoryAggregateStore::recordOutboxFailure(const std::vector<std::string>& eventIds) {
    const std::set<std::string> ids(eventIds.begin(), eventIds.end());

    std::lock_guard<std::mutex> lock(mutex_);
    int highest = 0;
    for (auto& entry : outbox_) {
        if (!entry.dispatched && ids.count(entry.event.getEventId()) > 0) {
            highest = std::max(highest, ++entry.attempts);
        }
    }
    return highest;
}

std::size_t InMemoryAggregateStore::parkOutbox(const std::vector<std::string>& eventIds) {
    const std::set<std::string> ids(eventIds.begin(), eventIds.end());

    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t parked = 0;
    for (auto& entry : outbox_) {
        if (!entry.dispatched && !entry.parked && ids.count(entry.event.getEventId()) > 0) {
            entry.parked = true;
            ++parked;
        }
    }
    return parked;
}

std::size_t InMemoryAggregateStore::pendingOutboxCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(outbox_.begin(), outbox_.end(),
        [](const OutboxEntry& entry) { return !entry.dispatched && !entry.parked; }));
}

std::size_t InMemoryAggregateStore::parkedOutboxCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(outbox_.begin(), outbox_.end(),
        [](const OutboxEntry& entry) { return !entry.dispatched && entry.parked; }));
}

std::size_t InMemoryAggregateStore::outboxSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outbox_.size();
}

std::size_t InMemoryAggregateStore::purgeDispatched() {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::size_t before = outbox_.size();
    outbox_.erase(std::remove_if(outbox_.begin(), outbox_.end(),
                                 [](const OutboxEntry& entry) { return entry.dispatched; }),
                  outbox_.end());
    return before - outbox_.size();
}

} // namespace taskcore::infrastructure::persistence
