/*
 * types.cpp
 *
 * Copyright (C) 2025 Frostguard Authors
 */

/*************************************************

Date: 2025-2-18

Description: Logging configuration types

**************************************************/

#include "types.hpp"

#include "exception/exception.hpp"

namespace frostguard::logging {

namespace {
auto readLevel(const nlohmann::json& j, const char* key,
               spdlog::level::level_enum fallback)
    -> spdlog::level::level_enum {
    if (!j.contains(key)) {
        return fallback;
    }
    if (!j[key].is_string()) {
        THROW_BAD_CONFIG_EXCEPTION(std::string("Log level '") + key +
                                   "' must be a string");
    }
    auto name = j[key].get<std::string>();
    auto level = levelFromString(name);
    if (!level) {
        THROW_BAD_CONFIG_EXCEPTION("Unknown log level: " + name);
    }
    return *level;
}
}  // namespace

// ============================================================================
// SinkConfig Implementation
// ============================================================================

auto SinkConfig::toJson() const -> nlohmann::json {
    nlohmann::json j = {{"name", name},
                        {"type", type},
                        {"level", levelToString(level)},
                        {"pattern", pattern}};
    if (type != "console") {
        j["file_path"] = file_path;
    }
    if (type == "rotating_file") {
        j["max_file_size"] = max_file_size;
        j["max_files"] = max_files;
    }
    return j;
}

auto SinkConfig::fromJson(const nlohmann::json& j) -> SinkConfig {
    if (!j.is_object()) {
        THROW_BAD_CONFIG_EXCEPTION("Sink entry must be an object");
    }
    SinkConfig config;
    try {
        config.type = j.value("type", "console");
        config.name = j.value("name", config.type);
        config.pattern = j.value("pattern", "");
        config.file_path = j.value("file_path", "");
        config.max_file_size =
            j.value("max_file_size", size_t{10 * 1024 * 1024});
        config.max_files = j.value("max_files", size_t{5});
    } catch (const nlohmann::json::exception& e) {
        THROW_BAD_CONFIG_EXCEPTION(std::string("Malformed sink entry: ") +
                                   e.what());
    }
    config.level = readLevel(j, "level", spdlog::level::trace);

    if (config.type != "console" && config.type != "file" &&
        config.type != "rotating_file") {
        THROW_BAD_CONFIG_EXCEPTION("Unknown sink type: " + config.type);
    }
    if (config.type != "console" && config.file_path.empty()) {
        THROW_BAD_CONFIG_EXCEPTION("Sink '" + config.name +
                                   "' needs a file_path");
    }
    return config;
}

// ============================================================================
// LoggingConfig Implementation
// ============================================================================

auto LoggingConfig::toJson() const -> nlohmann::json {
    nlohmann::json sinks_json = nlohmann::json::array();
    for (const auto& sink : sinks) {
        sinks_json.push_back(sink.toJson());
    }

    return {{"default_level", levelToString(default_level)},
            {"default_pattern", default_pattern},
            {"sinks", sinks_json}};
}

auto LoggingConfig::fromJson(const nlohmann::json& j) -> LoggingConfig {
    if (!j.is_object()) {
        THROW_BAD_CONFIG_EXCEPTION("Logging section must be an object");
    }
    LoggingConfig config;
    config.default_level = readLevel(j, "default_level", config.default_level);
    if (j.contains("default_pattern")) {
        if (!j["default_pattern"].is_string()) {
            THROW_BAD_CONFIG_EXCEPTION("default_pattern must be a string");
        }
        config.default_pattern = j["default_pattern"].get<std::string>();
    }

    if (j.contains("sinks")) {
        if (!j["sinks"].is_array()) {
            THROW_BAD_CONFIG_EXCEPTION("Logging sinks must be an array");
        }
        for (const auto& sink_json : j["sinks"]) {
            config.sinks.push_back(SinkConfig::fromJson(sink_json));
        }
    }

    return config;
}

// ============================================================================
// Level Conversion Functions
// ============================================================================

auto levelFromString(std::string_view level)
    -> std::optional<spdlog::level::level_enum> {
    if (level == "trace")
        return spdlog::level::trace;
    if (level == "debug")
        return spdlog::level::debug;
    if (level == "info")
        return spdlog::level::info;
    if (level == "warn" || level == "warning")
        return spdlog::level::warn;
    if (level == "error" || level == "err")
        return spdlog::level::err;
    if (level == "critical")
        return spdlog::level::critical;
    if (level == "off")
        return spdlog::level::off;
    return std::nullopt;
}

auto levelToString(spdlog::level::level_enum level) -> std::string {
    switch (level) {
        case spdlog::level::trace:
            return "trace";
        case spdlog::level::debug:
            return "debug";
        case spdlog::level::info:
            return "info";
        case spdlog::level::warn:
            return "warn";
        case spdlog::level::err:
            return "error";
        case spdlog::level::critical:
            return "critical";
        case spdlog::level::off:
            return "off";
        default:
            return "info";
    }
}

}  // namespace frostguard::logging
