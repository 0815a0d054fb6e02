/**
 * @file AggregateUpdater.hpp
 * @brief Load, mutate and commit one aggregate inside its own unit of work
 */

#pragma once

#include "ConflictRetry.hpp"
#include "UnitOfWorkFactory.hpp"
#include "taskcore/shared/repository/IAggregateRepository.hpp"

#include <memory>
#include <stdexcept>
#include <string>

namespace taskcore::shared::uow {

/**
 * @brief Shared command pipeline of the use cases
 *
 * Each attempt loads the aggregate, applies the mutation, registers it and
 * commits. A concurrency conflict reloads and replays the mutation up to
 * maxAttempts times in total, so mutations must not have side effects
 * outside the aggregate.
 */
template<typename T, typename IdType>
class AggregateUpdater {
public:
    using Repository = repository::IAggregateRepository<T, IdType>;

    AggregateUpdater(std::shared_ptr<Repository> repository,
                     std::shared_ptr<UnitOfWorkFactory> unitOfWorkFactory,
                     int maxAttempts = 3)
        : repository_(std::move(repository)),
          unitOfWorkFactory_(std::move(unitOfWorkFactory)),
          maxAttempts_(maxAttempts)
    {
        if (!repository_) {
            throw std::invalid_argument("AggregateUpdater: repository cannot be nullptr");
        }
        if (!unitOfWorkFactory_) {
            throw std::invalid_argument("AggregateUpdater: unitOfWorkFactory cannot be nullptr");
        }
        if (maxAttempts_ < 1) {
            throw std::invalid_argument("AggregateUpdater: maxAttempts must be at least 1");
        }
    }

    /**
     * @return The committed aggregate
     */
    template<typename Mutation>
    T update(const IdType& id, const std::string& operation, Mutation&& mutate) {
        return retryOnConflict(maxAttempts_, operation, [&]() {
            T aggregate = repository_->load(id);
            mutate(aggregate);

            auto unitOfWork = unitOfWorkFactory_->create();
            unitOfWork.registerDirty(aggregate, repository_);
            unitOfWork.commit();
            return aggregate;
        });
    }

    /**
     * @brief Persist a freshly created aggregate (no retry: a conflict means the id is taken)
     */
    void insert(T& aggregate) {
        auto unitOfWork = unitOfWorkFactory_->create();
        unitOfWork.registerNew(aggregate, repository_);
        unitOfWork.commit();
    }

    /**
     * @brief Mutate then delete the aggregate in one unit of work
     * @return The tombstoned aggregate
     */
    template<typename Mutation>
    T remove(const IdType& id, const std::string& operation, Mutation&& mutate) {
        return retryOnConflict(maxAttempts_, operation, [&]() {
            T aggregate = repository_->load(id);
            mutate(aggregate);

            auto unitOfWork = unitOfWorkFactory_->create();
            unitOfWork.registerDeleted(aggregate, repository_);
            unitOfWork.commit();
            return aggregate;
        });
    }

    [[nodiscard]] std::shared_ptr<Repository> getRepository() const { return repository_; }
    [[nodiscard]] std::shared_ptr<UnitOfWorkFactory> getUnitOfWorkFactory() const { return unitOfWorkFactory_; }

private:
    std::shared_ptr<Repository> repository_;
    std::shared_ptr<UnitOfWorkFactory> unitOfWorkFactory_;
    int maxAttempts_;
};

} // namespace taskcore::shared::uow
