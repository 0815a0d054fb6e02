#include "taskcore/infrastructure/persistence/InMemoryTransactionRunner.hpp"

#include <stdexcept>

namespace taskcore::infrastructure::persistence {

InMemoryTransactionRunner::InMemoryTransactionRunner(std::shared_ptr<InMemoryAggregateStore> store)
    : store_(std::move(store))
{
    if (!store_) {
        throw std::invalid_argument("InMemoryTransactionRunner: store cannot be nullptr");
    }
}

void InMemoryTransactionRunner::runInTransaction(const std::function<void()>& body) {
    store_->begin();
    try {
        body();
    } catch (...) {
        store_->rollback();
        throw;
    }
    store_->commit();
}

} // namespace taskcore::infrastructure::persistence
