/**
 * @file ConfigManager.cpp
 * @brief Implementation of Configuration Manager
 */

#include "taskcore/shared/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace taskcore::shared::config {

std::unique_ptr<ConfigManager> ConfigManager::instance_ = nullptr;
std::once_flag ConfigManager::initFlag_;

ConfigManager::ConfigManager() {
    loadFromEnvironment();
}

ConfigManager& ConfigManager::getInstance() {
    std::call_once(initFlag_, []() {
        instance_.reset(new ConfigManager());
    });
    return *instance_;
}

std::string ConfigManager::getString(const std::string& key, const std::string& defaultValue) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = overrides_.find(key);
        if (it != overrides_.end()) {
            return it->second;
        }
    }
    return getEnv(key, defaultValue);
}

int ConfigManager::getInt(const std::string& key, int defaultValue) const {
    const std::string value = getString(key);
    if (value.empty()) {
        return defaultValue;
    }

    try {
        std::size_t consumed = 0;
        const int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            spdlog::warn("Trailing characters in integer config '{}': {} (using default: {})",
                         key, value, defaultValue);
            return defaultValue;
        }
        return parsed;
    } catch (const std::exception& e) {
        spdlog::warn("Failed to parse integer config '{}': {} (using default: {})",
                     key, e.what(), defaultValue);
        return defaultValue;
    }
}

bool ConfigManager::getBool(const std::string& key, bool defaultValue) const {
    std::string value = getString(key);
    if (value.empty()) {
        return defaultValue;
    }

    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (value == "true" || value == "1" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "false" || value == "0" || value == "no" || value == "off") {
        return false;
    }

    spdlog::warn("Invalid boolean config '{}': {} (using default: {})", key, value, defaultValue);
    return defaultValue;
}

bool ConfigManager::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return overrides_.count(key) > 0 || std::getenv(key.c_str()) != nullptr;
}

void ConfigManager::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    overrides_[key] = value;
    spdlog::debug("Config set: {} = {}", key, value);
}

void ConfigManager::unset(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    overrides_.erase(key);
}

void ConfigManager::clearOverrides() {
    std::lock_guard<std::mutex> lock(mutex_);
    overrides_.clear();
}

void ConfigManager::loadFromEnvironment() {
    static constexpr const char* kKeys[] = {
        MAX_DEPENDENCIES_PER_TASK, MAX_TASKS_PER_PROJECT,
        WEBHOOK_BASE_DELAY_SECONDS, WEBHOOK_MAX_DELAY_SECONDS,
        WEBHOOK_MAX_RETRIES, WEBHOOK_MAX_FAILURES,
        OUTBOX_ENABLED, OUTBOX_BATCH_SIZE, OUTBOX_MAX_ATTEMPTS, CONFLICT_RETRY_ATTEMPTS,
        LOG_LEVEL, LOG_FILE,
    };

    int loaded = 0;
    for (const char* key : kKeys) {
        if (const char* env = std::getenv(key)) {
            set(key, env);
            ++loaded;
        }
    }
    spdlog::debug("Configuration loaded from environment: {} key(s)", loaded);
}

std::string ConfigManager::getEnv(const std::string& key, const std::string& defaultValue) {
    const char* env = std::getenv(key.c_str());
    return env ? std::string(env) : defaultValue;
}

} // namespace taskcore::shared::config
