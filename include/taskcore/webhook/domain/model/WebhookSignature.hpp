/**
 * @file WebhookSignature.hpp
 * @brief HMAC-SHA256 signatures for webhook payloads
 */

#pragma once

#include <json/json.h>

#include <string>

namespace taskcore::webhook::domain::model {

/**
 * @brief Signs and verifies delivery bodies
 *
 * Format: "sha256=" followed by the lowercase hex HMAC-SHA256 of the body.
 * JSON payloads are signed over their compact serialization, which is also
 * the body the sender transmits.
 */
class WebhookSignature {
public:
    static constexpr const char* PREFIX = "sha256=";
    static constexpr const char* HEADER = "X-Webhook-Signature";

    /**
     * @throws shared::exception::DomainException (SIGNATURE_ERROR) if OpenSSL fails
     */
    static std::string sign(const std::string& secret, const std::string& body);

    static std::string signPayload(const std::string& secret, const Json::Value& payload);

    /**
     * @brief Constant-time comparison against a freshly computed signature
     */
    static bool verify(const std::string& secret, const std::string& body, const std::string& signature);

    /**
     * @brief Random 32-byte secret, hex encoded
     */
    static std::string generateSecret();
};

} // namespace taskcore::webhook::domain::model
