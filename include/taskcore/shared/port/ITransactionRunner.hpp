/**
 * @file ITransactionRunner.hpp
 * @brief Transaction boundary over the persistence layer
 */

#pragma once

#include <functional>
#include <optional>
#include <type_traits>
#include <utility>

namespace taskcore::shared::port {

/**
 * @brief Runs a body so that every persistence call inside it applies or none does
 *
 * Implementations commit when the body returns and roll back when it throws,
 * rethrowing the body's exception unmodified (including cancellation or
 * timeout errors raised by the storage driver).
 */
class ITransactionRunner {
public:
    virtual ~ITransactionRunner() = default;

    /**
     * @brief Run a body returning a value inside one transaction
     */
    template<typename Body>
    auto run(Body&& body) -> decltype(body()) {
        using Result = decltype(body());
        if constexpr (std::is_void_v<Result>) {
            runInTransaction([&body]() { body(); });
        } else {
            // Storage for the result; the body runs at most once
            std::optional<Result> result;
            runInTransaction([&body, &result]() { result.emplace(body()); });
            return std::move(*result);
        }
    }

protected:
    virtual void runInTransaction(const std::function<void()>& body) = 0;
};

} // namespace taskcore::shared::port
