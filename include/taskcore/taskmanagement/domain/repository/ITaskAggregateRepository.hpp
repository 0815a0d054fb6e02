/**
 * @file ITaskAggregateRepository.hpp
 * @brief Repository interface for task aggregates
 */

#pragma once

#include "taskcore/shared/repository/IAggregateRepository.hpp"
#include "taskcore/taskmanagement/domain/model/ProjectId.hpp"
#include "taskcore/taskmanagement/domain/model/TaskAggregate.hpp"

namespace taskcore::taskmanagement::domain::repository {

using ITaskAggregateRepository =
    shared::repository::IAggregateRepository<model::TaskAggregate, model::ProjectId>;

} // namespace taskcore::taskmanagement::domain::repository
