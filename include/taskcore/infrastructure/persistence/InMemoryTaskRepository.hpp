/**
 * @file InMemoryTaskRepository.hpp
 * @brief In-memory task graph repository
 */

#pragma once

#include "InMemoryAggregateRepository.hpp"
#include "taskcore/taskmanagement/domain/repository/ITaskAggregateRepository.hpp"

namespace taskcore::infrastructure::persistence {

class InMemoryTaskRepository
    : public InMemoryAggregateRepository<taskmanagement::domain::model::TaskAggregate,
                                         taskmanagement::domain::model::ProjectId> {
public:
    /**
     * @param rules Rules handed to every restored task graph
     */
    InMemoryTaskRepository(std::shared_ptr<InMemoryAggregateStore> store,
                           taskmanagement::domain::model::TaskRules rules)
        : InMemoryAggregateRepository(std::move(store),
              [rules](const shared::domain::AggregateSnapshot& snapshot) {
                  return taskmanagement::domain::model::TaskAggregate::restoreFromSnapshot(snapshot, {}, rules);
              }) {}
};

} // namespace taskcore::infrastructure::persistence
