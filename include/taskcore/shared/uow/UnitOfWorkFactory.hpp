/**
 * @file UnitOfWorkFactory.hpp
 * @brief Creates units of work sharing one set of collaborators
 */

#pragma once

#include "UnitOfWork.hpp"

#include <memory>
#include <stdexcept>

namespace taskcore::shared::uow {

/**
 * @brief Unit of work factory
 *
 * Collaborators are injected once at wiring time; every create() call yields
 * an independent, open unit of work.
 */
class UnitOfWorkFactory {
private:
    std::shared_ptr<port::ITransactionRunner> transactionRunner_;
    std::shared_ptr<port::IEventPublisher> publisher_;
    std::shared_ptr<port::IOutbox> outbox_;

public:
    /**
     * @throws std::invalid_argument if transactionRunner or publisher is nullptr
     */
    UnitOfWorkFactory(std::shared_ptr<port::ITransactionRunner> transactionRunner,
                      std::shared_ptr<port::IEventPublisher> publisher,
                      std::shared_ptr<port::IOutbox> outbox = nullptr)
        : transactionRunner_(std::move(transactionRunner)),
          publisher_(std::move(publisher)),
          outbox_(std::move(outbox))
    {
        if (!transactionRunner_) {
            throw std::invalid_argument("UnitOfWorkFactory: transactionRunner cannot be nullptr");
        }
        if (!publisher_) {
            throw std::invalid_argument("UnitOfWorkFactory: publisher cannot be nullptr");
        }
    }

    [[nodiscard]] UnitOfWork create() const {
        return UnitOfWork(transactionRunner_, publisher_, outbox_);
    }

    [[nodiscard]] bool usesOutbox() const noexcept {
        return outbox_ != nullptr;
    }
};

} // namespace taskcore::shared::uow
