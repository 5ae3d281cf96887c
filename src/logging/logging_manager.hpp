/*
 * logging_manager.hpp
 *
 * Copyright (C) 2025 Frostguard Authors
 */

/*************************************************

Date: 2025-2-18

Description: Process-wide spdlog setup

**************************************************/

#ifndef FROSTGUARD_LOGGING_LOGGING_MANAGER_HPP
#define FROSTGUARD_LOGGING_LOGGING_MANAGER_HPP

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include <spdlog/spdlog.h>

#include "types.hpp"

namespace frostguard::logging {

/**
 * @brief Central logging manager with spdlog integration
 *
 * Builds the configured sinks, installs a default logger over them so plain
 * `spdlog::info(...)` calls reach every sink, and hands out named loggers
 * sharing the same sinks.
 */
class LoggingManager {
public:
    static auto getInstance() -> LoggingManager&;

    /**
     * @brief Initialize logging system with configuration. Calling it again
     * replaces the previous setup.
     */
    void initialize(const LoggingConfig& config);

    /**
     * @brief Flushes and drops every logger.
     */
    void shutdown();

    [[nodiscard]] auto isInitialized() const -> bool;

    /**
     * @brief Get or create a named logger over the configured sinks.
     */
    auto getLogger(const std::string& name) -> std::shared_ptr<spdlog::logger>;

    void setGlobalLevel(spdlog::level::level_enum level);

    void flush();

    [[nodiscard]] auto getConfig() const -> LoggingConfig;

private:
    LoggingManager() = default;
    ~LoggingManager();

    LoggingManager(const LoggingManager&) = delete;
    LoggingManager& operator=(const LoggingManager&) = delete;

    void setupDefaultLogger();

    mutable std::shared_mutex mutex_;
    LoggingConfig config_;
    bool initialized_{false};

    std::unordered_map<std::string, spdlog::sink_ptr> sinks_;
    std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> loggers_;
};

}  // namespace frostguard::logging

#endif  // FROSTGUARD_LOGGING_LOGGING_MANAGER_HPP
