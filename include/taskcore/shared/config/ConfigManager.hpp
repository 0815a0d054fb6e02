/**
 * @file ConfigManager.hpp
 * @brief Process-wide configuration lookup
 *
 * Values come from explicit overrides first, then from the environment.
 * Typed getters fall back to the supplied default when a value is missing
 * or cannot be parsed.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace taskcore::shared::config {

/**
 * @brief Configuration Manager (Singleton)
 */
class ConfigManager {
private:
    std::map<std::string, std::string> overrides_;
    mutable std::mutex mutex_;

    static std::unique_ptr<ConfigManager> instance_;
    static std::once_flag initFlag_;

    ConfigManager();

public:
    static ConfigManager& getInstance();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    int getInt(const std::string& key, int defaultValue = 0) const;

    /**
     * @brief Accepts true/false, 1/0, yes/no, on/off (case-insensitive)
     */
    bool getBool(const std::string& key, bool defaultValue = false) const;

    bool has(const std::string& key) const;

    /**
     * @brief Override a value for the rest of the process (or until unset)
     */
    void set(const std::string& key, const std::string& value);

    void unset(const std::string& key);

    /**
     * @brief Drop every override; environment lookups are unaffected
     */
    void clearOverrides();

    /**
     * @brief Copy every known TASKCORE_* and logging key present in the environment
     */
    void loadFromEnvironment();

    static std::string getEnv(const std::string& key, const std::string& defaultValue = "");

    /// @name Configuration keys

    // Task aggregate
    static constexpr const char* MAX_DEPENDENCIES_PER_TASK = "TASKCORE_MAX_DEPENDENCIES_PER_TASK";
    static constexpr const char* MAX_TASKS_PER_PROJECT = "TASKCORE_MAX_TASKS_PER_PROJECT";

    // Webhook delivery
    static constexpr const char* WEBHOOK_BASE_DELAY_SECONDS = "TASKCORE_WEBHOOK_BASE_DELAY_SECONDS";
    static constexpr const char* WEBHOOK_MAX_DELAY_SECONDS = "TASKCORE_WEBHOOK_MAX_DELAY_SECONDS";
    static constexpr const char* WEBHOOK_MAX_RETRIES = "TASKCORE_WEBHOOK_MAX_RETRIES";
    static constexpr const char* WEBHOOK_MAX_FAILURES = "TASKCORE_WEBHOOK_MAX_FAILURES";

    // Unit of work / outbox
    static constexpr const char* OUTBOX_ENABLED = "TASKCORE_OUTBOX_ENABLED";
    static constexpr const char* OUTBOX_BATCH_SIZE = "TASKCORE_OUTBOX_BATCH_SIZE";
    static constexpr const char* OUTBOX_MAX_ATTEMPTS = "TASKCORE_OUTBOX_MAX_ATTEMPTS";
    static constexpr const char* CONFLICT_RETRY_ATTEMPTS = "TASKCORE_CONFLICT_RETRY_ATTEMPTS";

    // Logging
    static constexpr const char* LOG_LEVEL = "LOG_LEVEL";
    static constexpr const char* LOG_FILE = "LOG_FILE";
};

} // namespace taskcore::shared::config
