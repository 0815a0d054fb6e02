/**
 * @file WebhookCommands.hpp
 * @brief Command DTOs for webhook operations
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace taskcore::webhook::application::command {

struct RegisterWebhookCommand {
    std::string webhookId;  ///< Empty to generate one
    std::string workspaceId;
    std::string name;
    std::string url;
    std::vector<std::string> events;
    std::map<std::string, std::string> headers;
    std::string secret;     ///< Empty for unsigned deliveries
    std::optional<int> maxRetries;
    std::optional<int> maxFailures;
    std::string createdBy;
};

enum class WebhookAction {
    ACTIVATE,
    SUSPEND,
    DEACTIVATE,
    UPDATE_URL,
    UPDATE_SUBSCRIPTIONS,
    ROTATE_SECRET,
    REMOVE
};

struct ManageWebhookCommand {
    std::string webhookId;
    WebhookAction action = WebhookAction::ACTIVATE;
    std::string userId;
    std::string reason;                 ///< SUSPEND
    std::string url;                    ///< UPDATE_URL
    std::vector<std::string> events;    ///< UPDATE_SUBSCRIPTIONS
    std::optional<std::string> secret;  ///< ROTATE_SECRET; generated when unset
};

} // namespace taskcore::webhook::application::command
