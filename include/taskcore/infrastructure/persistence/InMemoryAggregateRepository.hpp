/**
 * @file InMemoryAggregateRepository.hpp
 * @brief Snapshot-based repository over InMemoryAggregateStore
 */

#pragma once

#include "InMemoryAggregateStore.hpp"
#include "taskcore/shared/domain/Snapshot.hpp"
#include "taskcore/shared/exception/DomainException.hpp"
#include "taskcore/shared/repository/IAggregateRepository.hpp"

#include <spdlog/spdlog.h>

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace taskcore::infrastructure::persistence {

/**
 * @brief Stores each aggregate as its latest snapshot row
 *
 * T must expose AGGREGATE_TYPE, createSnapshot() and getNextVersion().
 * Rows are written at getNextVersion(), so a pending change batch is stored
 * under the version the aggregate reaches once it is acknowledged.
 *
 * @tparam Interface Repository interface implemented (a subclass of
 *         IAggregateRepository<T, IdType> for aggregate specific lookups)
 */
template<typename T, typename IdType,
         typename Interface = shared::repository::IAggregateRepository<T, IdType>>
class InMemoryAggregateRepository : public Interface {
public:
    using Restorer = std::function<T(const shared::domain::AggregateSnapshot&)>;

    /**
     * @param restorer Rebuilds the aggregate from a stored snapshot
     * @throws std::invalid_argument if store or restorer is empty
     */
    InMemoryAggregateRepository(std::shared_ptr<InMemoryAggregateStore> store, Restorer restorer)
        : store_(std::move(store)), restorer_(std::move(restorer))
    {
        if (!store_) {
            throw std::invalid_argument("InMemoryAggregateRepository: store cannot be nullptr");
        }
        if (!restorer_) {
            throw std::invalid_argument("InMemoryAggregateRepository: restorer cannot be empty");
        }
    }

    void save(const T& aggregate, int expectedVersion) override {
        const shared::domain::AggregateSnapshot snapshot = aggregate.createSnapshot();

        StoredAggregate row;
        row.aggregateType = snapshot.aggregateType;
        row.aggregateId = snapshot.aggregateId;
        row.version = snapshot.version;
        row.snapshot = snapshot.toJson();
        store_->put(std::move(row), expectedVersion);

        spdlog::debug("Saved {} {} at version {} (expected {})",
                      snapshot.aggregateType, snapshot.aggregateId, snapshot.version, expectedVersion);
    }

    void remove(const IdType& id, int expectedVersion) override {
        store_->erase(T::AGGREGATE_TYPE, id.toString(), expectedVersion);
        spdlog::debug("Removed {} {} (expected version {})", T::AGGREGATE_TYPE, id.toString(), expectedVersion);
    }

    T load(const IdType& id) override {
        auto row = store_->find(T::AGGREGATE_TYPE, id.toString());
        if (!row) {
            throw shared::exception::NotFoundException(
                std::string(T::AGGREGATE_TYPE) + " " + id.toString() + " not found");
        }
        return restore(*row);
    }

    std::optional<T> findById(const IdType& id) override {
        auto row = store_->find(T::AGGREGATE_TYPE, id.toString());
        if (!row) {
            return std::nullopt;
        }
        return restore(*row);
    }

    [[nodiscard]] bool exists(const IdType& id) const {
        return store_->find(T::AGGREGATE_TYPE, id.toString()).has_value();
    }

    [[nodiscard]] std::optional<int> persistedVersion(const IdType& id) const {
        auto row = store_->find(T::AGGREGATE_TYPE, id.toString());
        if (!row) {
            return std::nullopt;
        }
        return row->version;
    }

protected:
    [[nodiscard]] std::vector<T> loadAll() const {
        std::vector<T> aggregates;
        for (const auto& row : store_->findAll(T::AGGREGATE_TYPE)) {
            aggregates.push_back(restore(row));
        }
        return aggregates;
    }

private:
    std::shared_ptr<InMemoryAggregateStore> store_;
    Restorer restorer_;

    T restore(const StoredAggregate& row) const {
        T aggregate = restorer_(shared::domain::AggregateSnapshot::fromJson(row.snapshot));
        if (aggregate.getVersion() != row.version) {
            spdlog::warn("{} {} restored at version {} but stored at {}; using stored version",
                         row.aggregateType, row.aggregateId, aggregate.getVersion(), row.version);
            aggregate.setVersion(row.version);
        }
        return aggregate;
    }
};

} // namespace taskcore::infrastructure::persistence
