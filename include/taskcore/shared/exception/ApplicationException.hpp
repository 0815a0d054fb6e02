/**
 * @file ApplicationException.hpp
 * @brief Application layer exception classes
 */

#pragma once

#include <stdexcept>
#include <string>

namespace taskcore::shared::exception {

/**
 * @brief Exception for application layer errors
 *
 * Used for use case execution errors and misuse of the unit of work.
 */
class ApplicationException : public std::runtime_error {
private:
    std::string code_;
    std::string message_;

public:
    ApplicationException(std::string code, std::string message)
        : std::runtime_error(message),
          code_(std::move(code)),
          message_(std::move(message)) {}

    [[nodiscard]] const std::string& getCode() const noexcept {
        return code_;
    }

    [[nodiscard]] const std::string& getMessage() const noexcept {
        return message_;
    }
};

class FinalizedUnitOfWorkException : public ApplicationException {
public:
    explicit FinalizedUnitOfWorkException(std::string message)
        : ApplicationException("FINALIZED_UNIT_OF_WORK", std::move(message)) {}
};

class AlreadyRegisteredException : public ApplicationException {
public:
    explicit AlreadyRegisteredException(std::string message)
        : ApplicationException("ALREADY_REGISTERED", std::move(message)) {}
};

} // namespace taskcore::shared::exception
