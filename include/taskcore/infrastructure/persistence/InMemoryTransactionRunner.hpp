/**
 * @file InMemoryTransactionRunner.hpp
 * @brief Transaction boundary over InMemoryAggregateStore
 */

#pragma once

#include "InMemoryAggregateStore.hpp"
#include "taskcore/shared/port/ITransactionRunner.hpp"

#include <functional>
#include <memory>

namespace taskcore::infrastructure::persistence {

class InMemoryTransactionRunner : public shared::port::ITransactionRunner {
public:
    /**
     * @throws std::invalid_argument if store is nullptr
     */
    explicit InMemoryTransactionRunner(std::shared_ptr<InMemoryAggregateStore> store);

protected:
    void runInTransaction(const std::function<void()>& body) override;

private:
    std::shared_ptr<InMemoryAggregateStore> store_;
};

} // namespace taskcore::infrastructure::persistence
