/**
 * @file AggregateRoot.hpp
 * @brief Base classes for Aggregate Roots in DDD
 */

#pragma once

#include "Entity.hpp"
#include "DomainEvent.hpp"
#include "taskcore/shared/exception/DomainException.hpp"
#include "taskcore/shared/util/UuidUtil.hpp"

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace taskcore::shared::domain {

/**
 * @brief Type-erased aggregate contract
 *
 * This is what the unit of work and the repositories see: identity, version,
 * the buffer of uncommitted events and the invariant check.
 *
 * Version semantics: the version counts committed change batches. Mutators
 * only append events; markCommitted() acknowledges the batch and advances the
 * version by exactly one, however many mutators ran inside it.
 */
class AggregateRootBase {
private:
    DomainEvents uncommittedEvents_;
    int version_ = 0;
    bool deleted_ = false;

protected:
    AggregateRootBase() = default;

    /**
     * @brief Hook invoked after every successfully applied change
     */
    virtual void onChangeApplied() {}

    /**
     * @brief Stamp and append a domain event
     */
    void registerEvent(PendingEvent event,
                       std::chrono::system_clock::time_point occurredAt = std::chrono::system_clock::now()) {
        uncommittedEvents_.emplace_back(
            util::UuidUtil::generate(),
            aggregateId(),
            aggregateType(),
            version_ + 1,
            occurredAt,
            std::move(event.eventType),
            std::move(event.payload));
    }

    void ensureNotDeleted() const {
        if (deleted_) {
            throw exception::AggregateDeletedException(
                aggregateType() + " " + aggregateId() + " has been deleted");
        }
    }

    /**
     * @brief Apply a change with all-or-nothing semantics
     *
     * `change` mutates `state` and returns the events describing what changed.
     * The invariants are re-checked afterwards; if the change or the check
     * throws, `state` is restored to its previous value and no event is kept.
     */
    template<typename State, typename Change>
    void applyChange(State& state, Change&& change,
                     std::chrono::system_clock::time_point occurredAt = std::chrono::system_clock::now()) {
        ensureNotDeleted();
        State previous = state;
        std::vector<PendingEvent> raised;
        try {
            raised = change(state);
            checkInvariants();
        } catch (...) {
            state = std::move(previous);
            throw;
        }
        for (auto& event : raised) {
            registerEvent(std::move(event), occurredAt);
        }
        onChangeApplied();
    }

    /**
     * @brief Tombstone the aggregate; later mutations are rejected
     */
    void markDeleted(PendingEvent event,
                     std::chrono::system_clock::time_point occurredAt = std::chrono::system_clock::now()) {
        ensureNotDeleted();
        deleted_ = true;
        registerEvent(std::move(event), occurredAt);
        onChangeApplied();
    }

    void restoreDeleted(bool deleted) noexcept {
        deleted_ = deleted;
    }

public:
    virtual ~AggregateRootBase() = default;

    AggregateRootBase(const AggregateRootBase&) = delete;
    AggregateRootBase& operator=(const AggregateRootBase&) = delete;
    AggregateRootBase(AggregateRootBase&&) noexcept = default;
    AggregateRootBase& operator=(AggregateRootBase&&) noexcept = default;

    [[nodiscard]] virtual std::string aggregateId() const = 0;
    [[nodiscard]] virtual std::string aggregateType() const = 0;

    /**
     * @throws exception::InvariantViolationException when any rule is broken
     */
    virtual void checkInvariants() const = 0;

    /**
     * @brief Get the aggregate version (for optimistic locking)
     */
    [[nodiscard]] int getVersion() const noexcept {
        return version_;
    }

    /**
     * @brief Version persisted by the pending change batch
     */
    [[nodiscard]] int getNextVersion() const noexcept {
        return hasUncommittedChanges() ? version_ + 1 : version_;
    }

    /**
     * @brief Set the aggregate version (used when loading from persistence)
     */
    void setVersion(int version) {
        version_ = version;
    }

    [[nodiscard]] bool hasUncommittedChanges() const noexcept {
        return !uncommittedEvents_.empty();
    }

    [[nodiscard]] const DomainEvents& getUncommittedEvents() const noexcept {
        return uncommittedEvents_;
    }

    /**
     * @brief Acknowledge a committed change batch
     *
     * Clears the event buffer and advances the version once if the batch held
     * any change. Domain state is untouched.
     */
    void markCommitted() {
        if (!uncommittedEvents_.empty()) {
            ++version_;
        }
        uncommittedEvents_.clear();
    }

    /**
     * @brief Drop uncommitted events without acknowledging them (rollback)
     */
    void discardUncommittedEvents() {
        uncommittedEvents_.clear();
    }

    [[nodiscard]] bool isDeleted() const noexcept {
        return deleted_;
    }
};

/**
 * @brief Base template class for Aggregate Roots
 *
 * Aggregate Roots are the entry point to an aggregate - a cluster of
 * domain objects that can be treated as a single unit.
 * All external access to the aggregate must go through the root.
 *
 * @tparam IdType Identifier type; must provide toString()
 */
template<typename IdType>
class AggregateRoot : public Entity<IdType>, public AggregateRootBase {
protected:
    using Entity<IdType>::Entity;

    void onChangeApplied() override {
        this->touch();
    }

public:
    [[nodiscard]] std::string aggregateId() const override {
        return this->id_.toString();
    }
};

} // namespace taskcore::shared::domain
