/**
 * @file ProjectId.hpp
 * @brief Value Object for project identifiers
 */

#pragma once

#include "taskcore/shared/domain/ValueObject.hpp"
#include "taskcore/shared/exception/DomainException.hpp"
#include "taskcore/shared/util/UuidUtil.hpp"

#include <string>

namespace taskcore::taskmanagement::domain::model {

class ProjectId : public shared::domain::StringValueObject {
private:
    static constexpr size_t MAX_LENGTH = 64;

    explicit ProjectId(std::string value) : StringValueObject(std::move(value)) {
        validate();
    }

    void validate() const override {
        if (value_.empty() || value_.length() > MAX_LENGTH) {
            throw shared::exception::DomainException(
                "INVALID_PROJECT_ID",
                "Project ID must be 1 to " + std::to_string(MAX_LENGTH) + " characters: '" + value_ + "'");
        }
    }

public:
    static ProjectId of(const std::string& value) {
        return ProjectId(value);
    }

    static ProjectId generate() {
        return ProjectId(shared::util::UuidUtil::generate());
    }
};

} // namespace taskcore::taskmanagement::domain::model
