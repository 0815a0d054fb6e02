/**
 * @file TaskId.hpp
 * @brief Value Object for task identifiers
 */

#pragma once

#include "taskcore/shared/domain/ValueObject.hpp"
#include "taskcore/shared/exception/DomainException.hpp"
#include "taskcore/shared/util/UuidUtil.hpp"

#include <string>

namespace taskcore::taskmanagement::domain::model {

class TaskId : public shared::domain::StringValueObject {
private:
    static constexpr size_t MAX_LENGTH = 64;

    explicit TaskId(std::string value) : StringValueObject(std::move(value)) {
        validate();
    }

    void validate() const override {
        if (value_.empty() || value_.length() > MAX_LENGTH) {
            throw shared::exception::DomainException(
                "INVALID_TASK_ID",
                "Task ID must be 1 to " + std::to_string(MAX_LENGTH) + " characters: '" + value_ + "'");
        }
    }

public:
    static TaskId of(const std::string& value) {
        return TaskId(value);
    }

    static TaskId generate() {
        return TaskId(shared::util::UuidUtil::generate());
    }
};

} // namespace taskcore::taskmanagement::domain::model
