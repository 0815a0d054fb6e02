/**
 * @file Logger.hpp
 * @brief spdlog setup for the engine and its host process
 *
 * Installs a default logger so engine code can log through the free
 * spdlog::info/warn/error/critical functions.
 */

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace taskcore::shared::logging {

class Logger {
public:
    /**
     * @brief Map a level name to spdlog's level; unknown names mean info
     */
    static spdlog::level::level_enum parseLevel(const std::string& level) {
        if (level == "trace") return spdlog::level::trace;
        if (level == "debug") return spdlog::level::debug;
        if (level == "warn" || level == "warning") return spdlog::level::warn;
        if (level == "error") return spdlog::level::err;
        if (level == "critical") return spdlog::level::critical;
        if (level == "off") return spdlog::level::off;
        return spdlog::level::info;
    }

    /**
     * @brief Install the default logger
     * @param serviceName Logger name shown in every line
     * @param logLevel trace, debug, info, warn, error, critical or off
     * @param logFile Rotating file sink path; empty for console only
     * @return false if a sink could not be created (console-only fallback kept)
     */
    static bool initialize(const std::string& serviceName,
                           const std::string& logLevel = "info",
                           const std::string& logFile = "") {
        std::vector<spdlog::sink_ptr> sinks;

        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v");
        sinks.push_back(console);

        bool fileSinkReady = true;
        if (!logFile.empty()) {
            try {
                auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    logFile, kMaxFileSize, kMaxFiles);
                file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] [%t] %v");
                sinks.push_back(file);
            } catch (const spdlog::spdlog_ex& ex) {
                std::cerr << "Log file sink unavailable (" << logFile << "): " << ex.what() << std::endl;
                fileSinkReady = false;
            }
        }

        auto logger = std::make_shared<spdlog::logger>(serviceName, sinks.begin(), sinks.end());
        logger->set_level(parseLevel(logLevel));
        spdlog::set_default_logger(logger);
        spdlog::flush_on(spdlog::level::warn);

        spdlog::info("Logger initialized: service={}, level={}, file={}",
                     serviceName, logLevel, logFile.empty() || !fileSinkReady ? "none" : logFile);
        return fileSinkReady;
    }

    static void setLevel(const std::string& level) {
        spdlog::set_level(parseLevel(level));
        spdlog::info("Log level changed to: {}", level);
    }

    static void flush() {
        spdlog::default_logger()->flush();
    }

private:
    static constexpr std::size_t kMaxFileSize = 10 * 1024 * 1024;
    static constexpr std::size_t kMaxFiles = 3;
};

} // namespace taskcore::shared::logging
