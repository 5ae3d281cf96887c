/*
 * types.hpp
 *
 * Copyright (C) 2025 Frostguard Authors
 */

/*************************************************

Date: 2025-2-18

Description: Logging configuration types

**************************************************/

#ifndef FROSTGUARD_LOGGING_TYPES_HPP
#define FROSTGUARD_LOGGING_TYPES_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace frostguard::logging {

/**
 * @brief Sink configuration structure
 */
struct SinkConfig {
    std::string name;
    std::string type;  // "console", "file", "rotating_file"
    spdlog::level::level_enum level{spdlog::level::trace};
    std::string pattern;

    // File sink options
    std::string file_path;
    size_t max_file_size{10 * 1024 * 1024};
    size_t max_files{5};

    [[nodiscard]] auto toJson() const -> nlohmann::json;

    /**
     * @throws BadConfigException on an unknown type or level.
     */
    [[nodiscard]] static auto fromJson(const nlohmann::json& j) -> SinkConfig;
};

/**
 * @brief Logging manager configuration. With no sinks configured a single
 * console sink is used.
 */
struct LoggingConfig {
    spdlog::level::level_enum default_level{spdlog::level::info};
    std::string default_pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v"};
    std::vector<SinkConfig> sinks;

    [[nodiscard]] auto toJson() const -> nlohmann::json;

    /**
     * @throws BadConfigException on malformed entries.
     */
    [[nodiscard]] static auto fromJson(const nlohmann::json& j)
        -> LoggingConfig;
};

[[nodiscard]] auto levelFromString(std::string_view level)
    -> std::optional<spdlog::level::level_enum>;

[[nodiscard]] auto levelToString(spdlog::level::level_enum level)
    -> std::string;

}  // namespace frostguard::logging

#endif  // FROSTGUARD_LOGGING_TYPES_HPP
