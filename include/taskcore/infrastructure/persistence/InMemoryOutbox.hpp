/**
 * @file InMemoryOutbox.hpp
 * @brief IOutbox over the entries of InMemoryAggregateStore
 */

#pragma once

#include "InMemoryAggregateStore.hpp"
#include "taskcore/shared/port/IOutbox.hpp"

#include <memory>
#include <stdexcept>

namespace taskcore::infrastructure::persistence {

/**
 * @brief Outbox sharing the store of the repositories
 *
 * append() joins the store transaction opened by InMemoryTransactionRunner,
 * so outbox entries commit or roll back together with the aggregate rows.
 */
class InMemoryOutbox : public shared::port::IOutbox {
private:
    std::shared_ptr<InMemoryAggregateStore> store_;

public:
    explicit InMemoryOutbox(std::shared_ptr<InMemoryAggregateStore> store)
        : store_(std::move(store))
    {
        if (!store_) {
            throw std::invalid_argument("InMemoryOutbox: store cannot be nullptr");
        }
    }

    void append(const shared::domain::DomainEvents& events) override {
        store_->appendOutbox(events);
    }

    shared::domain::DomainEvents pending(std::size_t limit) override {
        return store_->pendingOutbox(limit);
    }

    void markDispatched(const std::vector<std::string>& eventIds) override {
        store_->markDispatched(eventIds);
    }

    int recordFailedAttempt(const std::vector<std::string>& eventIds) override {
        return store_->recordOutboxFailure(eventIds);
    }

    void park(const std::vector<std::string>& eventIds) override {
        store_->parkOutbox(eventIds);
    }

    [[nodiscard]] std::size_t pendingCount() const override {
        return store_->pendingOutboxCount();
    }

    [[nodiscard]] std::size_t parkedCount() const override {
        return store_->parkedOutboxCount();
    }
};

} // namespace taskcore::infrastructure::persistence
