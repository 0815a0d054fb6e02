/**
 * @file UserId.hpp
 * @brief Value Object for user identifiers
 *
 * Users are owned by the authentication context; the task aggregate only
 * stores their opaque identifiers.
 */

#pragma once

#include "taskcore/shared/domain/ValueObject.hpp"
#include "taskcore/shared/exception/DomainException.hpp"

#include <string>

namespace taskcore::taskmanagement::domain::model {

class UserId : public shared::domain::StringValueObject {
private:
    explicit UserId(std::string value) : StringValueObject(std::move(value)) {
        validate();
    }

    void validate() const override {
        if (value_.empty()) {
            throw shared::exception::DomainException("INVALID_USER_ID", "User ID cannot be empty");
        }
    }

public:
    static UserId of(const std::string& value) {
        return UserId(value);
    }
};

} // namespace taskcore::taskmanagement::domain::model
