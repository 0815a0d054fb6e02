/**
 * @file IAggregateRepository.hpp
 * @brief Generic repository interface for one aggregate type
 */

#pragma once

#include <optional>

namespace taskcore::shared::repository {

/**
 * @brief Repository interface for aggregate type T
 *
 * save() and remove() perform the optimistic concurrency check: the version
 * currently persisted must equal expectedVersion, otherwise they throw
 * exception::ConcurrencyConflictException and write nothing. A new aggregate
 * is saved with expectedVersion 0 and must not exist yet.
 *
 * @tparam T Aggregate type
 * @tparam IdType Aggregate identifier type
 */
template<typename T, typename IdType>
class IAggregateRepository {
public:
    virtual ~IAggregateRepository() = default;

    /**
     * @brief Persist the aggregate at version aggregate.getNextVersion()
     * @throws exception::ConcurrencyConflictException, exception::PersistenceException
     */
    virtual void save(const T& aggregate, int expectedVersion) = 0;

    /**
     * @brief Delete by ID
     * @throws exception::ConcurrencyConflictException, exception::PersistenceException
     */
    virtual void remove(const IdType& id, int expectedVersion) = 0;

    /**
     * @brief Load by ID
     * @throws exception::NotFoundException if absent
     */
    virtual T load(const IdType& id) = 0;

    /**
     * @brief Find by ID
     * @return The aggregate if found
     */
    virtual std::optional<T> findById(const IdType& id) = 0;
};

} // namespace taskcore::shared::repository
