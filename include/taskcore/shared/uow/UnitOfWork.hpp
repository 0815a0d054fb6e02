/**
 * @file UnitOfWork.hpp
 * @brief Atomic persistence of aggregate changes and their events
 */

#pragma once

#include "taskcore/shared/domain/AggregateRoot.hpp"
#include "taskcore/shared/domain/DomainEvent.hpp"
#include "taskcore/shared/port/IEventPublisher.hpp"
#include "taskcore/shared/port/IOutbox.hpp"
#include "taskcore/shared/port/ITransactionRunner.hpp"
#include "taskcore/shared/repository/IAggregateRepository.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace taskcore::shared::uow {

enum class RegistrationState {
    NEW,
    DIRTY,
    DELETED
};

std::string toString(RegistrationState state);

/**
 * @brief Coordinates one logical operation over several aggregates
 *
 * Aggregates are registered as new, dirty or deleted; commit() persists all
 * of them inside one transaction and hands their events to the publisher only
 * once the transaction has completed. The unit of work references aggregates
 * but never owns them: callers keep them alive until commit() or rollback()
 * returns.
 *
 * Not thread-safe. One instance serves one request or worker task.
 *
 * Usage:
 * @code
 *   auto uow = factory.create();
 *   aggregate.addDependency(a, b);
 *   uow.registerDirty(aggregate, repository);
 *   uow.commit();
 * @endcode
 */
class UnitOfWork {
public:
    /**
     * @param transactionRunner Persistence transaction boundary
     * @param publisher Event publisher
     * @param outbox Optional transactional outbox; when set, events are written
     *        inside the transaction and a failed immediate publish is left to
     *        the outbox relay instead of being fatal
     * @throws std::invalid_argument if transactionRunner or publisher is nullptr
     */
    UnitOfWork(std::shared_ptr<port::ITransactionRunner> transactionRunner,
               std::shared_ptr<port::IEventPublisher> publisher,
               std::shared_ptr<port::IOutbox> outbox = nullptr);

    UnitOfWork(const UnitOfWork&) = delete;
    UnitOfWork& operator=(const UnitOfWork&) = delete;
    UnitOfWork(UnitOfWork&&) noexcept = default;
    UnitOfWork& operator=(UnitOfWork&&) noexcept = default;

    /**
     * @throws exception::AlreadyRegisteredException if the id is already tracked
     * @throws exception::FinalizedUnitOfWorkException after commit or rollback
     */
    template<typename T, typename IdType>
    void registerNew(T& aggregate,
                     std::shared_ptr<repository::IAggregateRepository<T, IdType>> repository) {
        track(aggregate, RegistrationState::NEW, bindSave(aggregate, repository), bindRemove(aggregate, repository));
    }

    /**
     * @throws exception::AlreadyRegisteredException if another instance with the same id is tracked
     * @throws exception::FinalizedUnitOfWorkException after commit or rollback
     */
    template<typename T, typename IdType>
    void registerDirty(T& aggregate,
                       std::shared_ptr<repository::IAggregateRepository<T, IdType>> repository) {
        track(aggregate, RegistrationState::DIRTY, bindSave(aggregate, repository), bindRemove(aggregate, repository));
    }

    /**
     * A NEW registration deleted in the same unit is neither written nor
     * published; its events are discarded on commit().
     *
     * @throws exception::AlreadyRegisteredException if another instance with the same id is tracked
     * @throws exception::FinalizedUnitOfWorkException after commit or rollback
     */
    template<typename T, typename IdType>
    void registerDeleted(T& aggregate,
                         std::shared_ptr<repository::IAggregateRepository<T, IdType>> repository) {
        track(aggregate, RegistrationState::DELETED, bindSave(aggregate, repository), bindRemove(aggregate, repository));
    }

    /**
     * @brief Persist every registration atomically, then publish their events
     *
     * Persistence errors (including ConcurrencyConflictException) abort the
     * transaction and are rethrown unmodified; nothing is published and the
     * events stay on the aggregates. A publisher failure after the
     * transaction committed is thrown as PostCommitPublishException nested
     * with the original error (see std::rethrow_if_nested).
     */
    void commit();

    /**
     * @brief Discard all uncommitted events without persisting anything
     *
     * No-op after commit().
     */
    void rollback();

    [[nodiscard]] bool isCommitted() const noexcept { return committed_; }
    [[nodiscard]] bool isRolledBack() const noexcept { return rolledBack_; }
    [[nodiscard]] const std::string& getId() const noexcept { return id_; }
    [[nodiscard]] std::size_t registrationCount() const noexcept { return order_.size(); }

    [[nodiscard]] std::optional<RegistrationState> stateOf(const std::string& aggregateId) const;
    [[nodiscard]] std::optional<int> originalVersionOf(const std::string& aggregateId) const;

    /**
     * @brief Events of every registered aggregate, per-aggregate order preserved
     */
    [[nodiscard]] domain::DomainEvents collectEvents() const;

private:
    using PersistFn = std::function<void(int expectedVersion)>;

    struct Registration {
        domain::AggregateRootBase* aggregate = nullptr;
        RegistrationState state = RegistrationState::DIRTY;
        int originalVersion = 0;
        bool persisted = true;  // false while only registered as NEW
        PersistFn save;
        PersistFn remove;

        /// Created and deleted inside this unit: nothing to write, nothing to publish
        [[nodiscard]] bool isTransient() const noexcept;
    };

    std::string id_;
    std::shared_ptr<port::ITransactionRunner> transactionRunner_;
    std::shared_ptr<port::IEventPublisher> publisher_;
    std::shared_ptr<port::IOutbox> outbox_;

    std::vector<std::string> order_;
    std::unordered_map<std::string, Registration> registrations_;
    bool committed_ = false;
    bool rolledBack_ = false;

    template<typename T, typename IdType>
    static PersistFn bindSave(T& aggregate,
                              std::shared_ptr<repository::IAggregateRepository<T, IdType>> repository) {
        return [&aggregate, repository](int expectedVersion) {
            repository->save(aggregate, expectedVersion);
        };
    }

    template<typename T, typename IdType>
    static PersistFn bindRemove(T& aggregate,
                                std::shared_ptr<repository::IAggregateRepository<T, IdType>> repository) {
        return [id = aggregate.getId(), repository](int expectedVersion) {
            repository->remove(id, expectedVersion);
        };
    }

    void ensureOpen(const char* operation) const;
    void track(domain::AggregateRootBase& aggregate, RegistrationState state, PersistFn save, PersistFn remove);
    void persistAll(const domain::DomainEvents& batch);
    void publishDirect(const domain::DomainEvents& batch);
    void publishThroughOutbox(const domain::DomainEvents& batch);
    void discardTransientEvents();
    void acknowledgeAll();
};

} // namespace taskcore::shared::uow
