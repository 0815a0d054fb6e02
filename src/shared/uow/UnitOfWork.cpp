/**
 * @file UnitOfWork.cpp
 * @brief Unit of work commit/rollback implementation
 *
 * Commit sequence:
 *   1. Collect events (per-aggregate order preserved)
 *   2. Open transaction
 *   3. save NEW/DIRTY, remove DELETED (optimistic check in the repository),
 *      append events to the outbox when one is configured
 *   4. Publish the batch once the transaction has completed
 *   5. markCommitted() on every aggregate
 *   6. Set the committed flag
 */

#include "taskcore/shared/uow/UnitOfWork.hpp"
#include "taskcore/shared/exception/ApplicationException.hpp"
#include "taskcore/shared/exception/InfrastructureException.hpp"
#include "taskcore/shared/util/UuidUtil.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <stdexcept>

namespace taskcore::shared::uow {

std::string toString(RegistrationState state) {
    switch (state) {
        case RegistrationState::NEW: return "NEW";
        case RegistrationState::DIRTY: return "DIRTY";
        case RegistrationState::DELETED: return "DELETED";
    }
    return "UNKNOWN";
}

UnitOfWork::UnitOfWork(std::shared_ptr<port::ITransactionRunner> transactionRunner,
                       std::shared_ptr<port::IEventPublisher> publisher,
                       std::shared_ptr<port::IOutbox> outbox)
    : id_(util::UuidUtil::generate()),
      transactionRunner_(std::move(transactionRunner)),
      publisher_(std::move(publisher)),
      outbox_(std::move(outbox))
{
    if (!transactionRunner_) {
        throw std::invalid_argument("UnitOfWork: transactionRunner cannot be nullptr");
    }
    if (!publisher_) {
        throw std::invalid_argument("UnitOfWork: publisher cannot be nullptr");
    }
}

void UnitOfWork::ensureOpen(const char* operation) const {
    if (committed_ || rolledBack_) {
        throw exception::FinalizedUnitOfWorkException(
            std::string("Cannot ") + operation + ": unit of work " + id_ + " is already " +
            (committed_ ? "committed" : "rolled back"));
    }
}

void UnitOfWork::track(domain::AggregateRootBase& aggregate, RegistrationState state,
                       PersistFn save, PersistFn remove) {
    ensureOpen("register aggregate");

    const std::string aggregateId = aggregate.aggregateId();
    auto it = registrations_.find(aggregateId);

    if (it == registrations_.end()) {
        Registration registration;
        registration.aggregate = &aggregate;
        registration.state = state;
        registration.originalVersion = aggregate.getVersion();
        registration.persisted = state != RegistrationState::NEW;
        registration.save = std::move(save);
        registration.remove = std::move(remove);
        registrations_.emplace(aggregateId, std::move(registration));
        order_.push_back(aggregateId);

        spdlog::debug("[UnitOfWork {}] Registered {} {} as {} (version {})",
                      id_, aggregate.aggregateType(), aggregateId, toString(state),
                      aggregate.getVersion());
        return;
    }

    Registration& existing = it->second;
    if (state == RegistrationState::NEW) {
        throw exception::AlreadyRegisteredException(
            aggregate.aggregateType() + " " + aggregateId + " is already registered in unit of work " + id_);
    }
    if (existing.aggregate != &aggregate) {
        throw exception::AlreadyRegisteredException(
            aggregate.aggregateType() + " " + aggregateId +
            " is already registered in unit of work " + id_ + " through another instance");
    }

    // Re-registration updates the tracked state; the original version captured
    // at first registration stays the optimistic-concurrency reference.
    existing.save = std::move(save);
    existing.remove = std::move(remove);

    if (existing.state == RegistrationState::DELETED) {
        return;  // deletion is sticky
    }
    if (state == RegistrationState::DELETED) {
        existing.state = RegistrationState::DELETED;
    } else if (existing.state != RegistrationState::NEW) {
        existing.state = state;
    }

    spdlog::debug("[UnitOfWork {}] Re-registered {} {} as {}",
                  id_, aggregate.aggregateType(), aggregateId, toString(existing.state));
}

std::optional<RegistrationState> UnitOfWork::stateOf(const std::string& aggregateId) const {
    auto it = registrations_.find(aggregateId);
    if (it == registrations_.end()) {
        return std::nullopt;
    }
    return it->second.state;
}

std::optional<int> UnitOfWork::originalVersionOf(const std::string& aggregateId) const {
    auto it = registrations_.find(aggregateId);
    if (it == registrations_.end()) {
        return std::nullopt;
    }
    return it->second.originalVersion;
}

bool UnitOfWork::Registration::isTransient() const noexcept {
    return state == RegistrationState::DELETED && !persisted;
}

domain::DomainEvents UnitOfWork::collectEvents() const {
    domain::DomainEvents batch;
    for (const auto& aggregateId : order_) {
        const Registration& registration = registrations_.at(aggregateId);
        if (registration.isTransient()) {
            continue;  // never written, so its events never happened
        }
        const auto& events = registration.aggregate->getUncommittedEvents();
        batch.insert(batch.end(), events.begin(), events.end());
    }
    return batch;
}

void UnitOfWork::persistAll(const domain::DomainEvents& batch) {
    for (const auto& aggregateId : order_) {
        Registration& registration = registrations_.at(aggregateId);
        switch (registration.state) {
            case RegistrationState::NEW:
            case RegistrationState::DIRTY:
                registration.save(registration.originalVersion);
                break;
            case RegistrationState::DELETED:
                if (registration.persisted) {
                    registration.remove(registration.originalVersion);
                }
                break;
        }
    }

    if (outbox_ && !batch.empty()) {
        outbox_->append(batch);
    }
}

void UnitOfWork::commit() {
    ensureOpen("commit");

    discardTransientEvents();
    const domain::DomainEvents batch = collectEvents();
    spdlog::debug("[UnitOfWork {}] Commit started: {} aggregate(s), {} event(s)",
                  id_, order_.size(), batch.size());

    try {
        transactionRunner_->run([this, &batch]() { persistAll(batch); });
    } catch (const exception::ConcurrencyConflictException& e) {
        spdlog::warn("[UnitOfWork {}] Commit rejected by optimistic check: {}", id_, e.what());
        throw;
    } catch (const std::exception& e) {
        spdlog::error("[UnitOfWork {}] Commit aborted, transaction rolled back: {}", id_, e.what());
        throw;
    }

    spdlog::debug("[UnitOfWork {}] Transaction committed", id_);

    if (batch.empty()) {
        acknowledgeAll();
        return;
    }

    if (outbox_) {
        publishThroughOutbox(batch);
    } else {
        publishDirect(batch);
    }
}

void UnitOfWork::publishDirect(const domain::DomainEvents& batch) {
    try {
        publisher_->publishAll(batch);
    } catch (const std::exception& e) {
        // State is durable; acknowledge it before surfacing the inconsistency
        acknowledgeAll();
        spdlog::critical("[UnitOfWork {}] State committed but {} event(s) were NOT published: {}",
                         id_, batch.size(), e.what());
        for (const auto& event : batch) {
            spdlog::critical("[UnitOfWork {}] Undelivered event {} type={} aggregate={} version={}",
                             id_, event.getEventId(), event.getEventType(),
                             event.getAggregateId(), event.getAggregateVersion());
        }
        std::throw_with_nested(exception::PostCommitPublishException(batch, e.what()));
    } catch (...) {
        acknowledgeAll();
        spdlog::critical("[UnitOfWork {}] State committed but {} event(s) were NOT published: "
                         "publisher raised a non-standard exception",
                         id_, batch.size());
        throw;
    }

    spdlog::info("[UnitOfWork {}] Committed {} aggregate(s), published {} event(s)",
                 id_, order_.size(), batch.size());
    acknowledgeAll();
}

void UnitOfWork::publishThroughOutbox(const domain::DomainEvents& batch) {
    acknowledgeAll();

    try {
        publisher_->publishAll(batch);
    } catch (const std::exception& e) {
        spdlog::warn("[UnitOfWork {}] Immediate publish failed, {} event(s) left in outbox: {}",
                     id_, batch.size(), e.what());
        return;
    }

    std::vector<std::string> eventIds;
    eventIds.reserve(batch.size());
    for (const auto& event : batch) {
        eventIds.push_back(event.getEventId());
    }
    outbox_->markDispatched(eventIds);

    spdlog::info("[UnitOfWork {}] Committed {} aggregate(s), published {} event(s) via outbox",
                 id_, order_.size(), batch.size());
}

void UnitOfWork::discardTransientEvents() {
    for (const auto& aggregateId : order_) {
        Registration& registration = registrations_.at(aggregateId);
        if (!registration.isTransient()) {
            continue;
        }
        auto* aggregate = registration.aggregate;
        if (aggregate->hasUncommittedChanges()) {
            spdlog::debug("[UnitOfWork {}] Dropping {} event(s) of {} {}: created and deleted in the same unit",
                          id_, aggregate->getUncommittedEvents().size(), aggregate->aggregateType(), aggregateId);
            aggregate->discardUncommittedEvents();
        }
    }
}

void UnitOfWork::acknowledgeAll() {
    for (const auto& aggregateId : order_) {
        registrations_.at(aggregateId).aggregate->markCommitted();
    }
    committed_ = true;
}

void UnitOfWork::rollback() {
    if (committed_) {
        spdlog::debug("[UnitOfWork {}] Rollback after commit ignored", id_);
        return;
    }
    ensureOpen("rollback");

    std::size_t discarded = 0;
    for (const auto& aggregateId : order_) {
        auto* aggregate = registrations_.at(aggregateId).aggregate;
        discarded += aggregate->getUncommittedEvents().size();
        aggregate->discardUncommittedEvents();
    }
    rolledBack_ = true;

    spdlog::info("[UnitOfWork {}] Rolled back {} aggregate(s), discarded {} event(s)",
                 id_, order_.size(), discarded);
}

} // namespace taskcore::shared::uow
