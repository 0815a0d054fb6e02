/**
 * @file IWebhookSender.hpp
 * @brief Outbound port for the HTTP call of a delivery
 */

#pragma once

#include <map>
#include <string>

namespace taskcore::webhook::application::port {

struct SendResult {
    int httpStatus = 0;
    std::string body;

    [[nodiscard]] bool isSuccess() const noexcept {
        return httpStatus >= 200 && httpStatus < 300;
    }
};

/**
 * @brief Transport for webhook deliveries
 *
 * Implementations POST `body` to `url` with `headers` and report the HTTP
 * status. Transport errors (DNS, TLS, timeout) are thrown as exceptions
 * derived from std::exception; they count as failed attempts.
 */
class IWebhookSender {
public:
    virtual ~IWebhookSender() = default;

    virtual SendResult send(const std::string& url,
                            const std::map<std::string, std::string>& headers,
                            const std::string& body) = 0;
};

} // namespace taskcore::webhook::application::port
