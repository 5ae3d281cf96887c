/*
 * logging_manager.cpp
 *
 * Copyright (C) 2025 Frostguard Authors
 */

/*************************************************

Date: 2025-2-18

Description: Process-wide spdlog setup

**************************************************/

#include "logging_manager.hpp"

#include <filesystem>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "exception/exception.hpp"

namespace frostguard::logging {

namespace {
void ensureDirectoryExists(const std::string& file_path) {
    std::filesystem::path path(file_path);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
}

auto createSink(const SinkConfig& config, const std::string& defaultPattern)
    -> spdlog::sink_ptr {
    spdlog::sink_ptr sink;
    try {
        if (config.type == "console") {
            sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        } else if (config.type == "file") {
            ensureDirectoryExists(config.file_path);
            sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                config.file_path);
        } else if (config.type == "rotating_file") {
            ensureDirectoryExists(config.file_path);
            sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file_path, config.max_file_size, config.max_files);
        } else {
            THROW_BAD_CONFIG_EXCEPTION("Unknown sink type: " + config.type);
        }
    } catch (const spdlog::spdlog_ex& e) {
        THROW_BAD_CONFIG_EXCEPTION("Failed to create sink '" + config.name +
                                   "': " + e.what());
    } catch (const std::filesystem::filesystem_error& e) {
        THROW_BAD_CONFIG_EXCEPTION("Failed to create sink '" + config.name +
                                   "': " + e.what());
    }

    sink->set_level(config.level);
    sink->set_pattern(config.pattern.empty() ? defaultPattern : config.pattern);
    return sink;
}
}  // namespace

auto LoggingManager::getInstance() -> LoggingManager& {
    static LoggingManager instance;
    return instance;
}

LoggingManager::~LoggingManager() {
    if (initialized_) {
        shutdown();
    }
}

void LoggingManager::initialize(const LoggingConfig& config) {
    // Sinks carry the patterns; loggers only pick the level
    std::unordered_map<std::string, spdlog::sink_ptr> sinks;
    if (config.sinks.empty()) {
        sinks["console"] = createSink(
            SinkConfig{.name = "console", .type = "console"},
            config.default_pattern);
    }
    for (const auto& sink_config : config.sinks) {
        sinks[sink_config.name] =
            createSink(sink_config, config.default_pattern);
    }

    std::unique_lock lock(mutex_);
    if (initialized_) {
        spdlog::drop_all();
        loggers_.clear();
    }

    config_ = config;
    sinks_ = std::move(sinks);
    setupDefaultLogger();

    initialized_ = true;
    spdlog::debug("LoggingManager initialized with {} sinks", sinks_.size());
}

void LoggingManager::shutdown() {
    std::unique_lock lock(mutex_);

    if (!initialized_) {
        return;
    }

    for (const auto& [name, logger] : loggers_) {
        logger->flush();
    }
    spdlog::default_logger()->flush();
    spdlog::drop_all();
    // Later spdlog calls still need a default logger
    spdlog::set_default_logger(
        std::make_shared<spdlog::logger>(
            "frostguard",
            std::make_shared<spdlog::sinks::stderr_color_sink_mt>()));

    loggers_.clear();
    sinks_.clear();
    initialized_ = false;
}

auto LoggingManager::isInitialized() const -> bool {
    std::shared_lock lock(mutex_);
    return initialized_;
}

auto LoggingManager::getLogger(const std::string& name)
    -> std::shared_ptr<spdlog::logger> {
    std::unique_lock lock(mutex_);

    if (auto it = loggers_.find(name); it != loggers_.end()) {
        return it->second;
    }

    std::vector<spdlog::sink_ptr> sink_list;
    for (const auto& [sink_name, sink] : sinks_) {
        sink_list.push_back(sink);
    }

    auto logger = std::make_shared<spdlog::logger>(name, sink_list.begin(),
                                                   sink_list.end());
    logger->set_level(config_.default_level);
    loggers_[name] = logger;
    return logger;
}

void LoggingManager::setGlobalLevel(spdlog::level::level_enum level) {
    std::unique_lock lock(mutex_);

    for (const auto& [name, logger] : loggers_) {
        logger->set_level(level);
    }
    spdlog::set_level(level);
    config_.default_level = level;
    spdlog::debug("Global log level set to {}", levelToString(level));
}

void LoggingManager::flush() {
    std::shared_lock lock(mutex_);
    for (const auto& [name, logger] : loggers_) {
        logger->flush();
    }
    spdlog::default_logger()->flush();
}

auto LoggingManager::getConfig() const -> LoggingConfig {
    std::shared_lock lock(mutex_);
    return config_;
}

void LoggingManager::setupDefaultLogger() {
    std::vector<spdlog::sink_ptr> sink_list;
    for (const auto& [name, sink] : sinks_) {
        sink_list.push_back(sink);
    }

    auto default_logger = std::make_shared<spdlog::logger>(
        "frostguard", sink_list.begin(), sink_list.end());

    default_logger->set_level(config_.default_level);

    spdlog::set_default_logger(default_logger);
}

}  // namespace frostguard::logging
