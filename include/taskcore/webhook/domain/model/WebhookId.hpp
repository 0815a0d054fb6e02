/**
 * @file WebhookId.hpp
 * @brief Value Objects for webhook, delivery and workspace identifiers
 */

#pragma once

#include "taskcore/shared/domain/ValueObject.hpp"
#include "taskcore/shared/exception/DomainException.hpp"
#include "taskcore/shared/util/UuidUtil.hpp"

#include <string>

namespace taskcore::webhook::domain::model {

class WebhookId : public shared::domain::StringValueObject {
private:
    static constexpr size_t MAX_LENGTH = 64;

    explicit WebhookId(std::string value) : StringValueObject(std::move(value)) {
        validate();
    }

    void validate() const override {
        if (value_.empty() || value_.length() > MAX_LENGTH) {
            throw shared::exception::DomainException(
                "INVALID_WEBHOOK_ID",
                "Webhook ID must be 1 to " + std::to_string(MAX_LENGTH) + " characters: '" + value_ + "'");
        }
    }

public:
    static WebhookId of(const std::string& value) {
        return WebhookId(value);
    }

    static WebhookId generate() {
        return WebhookId(shared::util::UuidUtil::generate());
    }
};

/**
 * @brief Identifier of one delivery inside a webhook's history
 */
class DeliveryId : public shared::domain::StringValueObject {
private:
    explicit DeliveryId(std::string value) : StringValueObject(std::move(value)) {
        validate();
    }

    void validate() const override {
        if (value_.empty()) {
            throw shared::exception::DomainException("INVALID_DELIVERY_ID", "Delivery ID cannot be empty");
        }
    }

public:
    static DeliveryId of(const std::string& value) {
        return DeliveryId(value);
    }

    static DeliveryId generate() {
        return DeliveryId(shared::util::UuidUtil::generate());
    }
};

class WorkspaceId : public shared::domain::StringValueObject {
private:
    explicit WorkspaceId(std::string value) : StringValueObject(std::move(value)) {
        validate();
    }

    void validate() const override {
        if (value_.empty()) {
            throw shared::exception::DomainException("INVALID_WORKSPACE_ID", "Workspace ID cannot be empty");
        }
    }

public:
    static WorkspaceId of(const std::string& value) {
        return WorkspaceId(value);
    }
};

} // namespace taskcore::webhook::domain::model
