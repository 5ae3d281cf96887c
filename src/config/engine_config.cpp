/*
 * engine_config.cpp
 *
 * Copyright (C) 2025 Frostguard Authors
 */

/*************************************************

Date: 2025-2-18

Description: Typed engine settings read from the configuration store

**************************************************/

#include "engine_config.hpp"

#include <cmath>
#include <cstdint>
#include <optional>
#include <format>

#include <spdlog/spdlog.h>

#include "exception/exception.hpp"
#include "weather/source.hpp"

namespace frostguard {

namespace {
class SectionReader {
public:
    SectionReader(const ConfigManager& manager, std::string_view root)
        : manager_(manager), root_(root) {}

    void number(std::string_view key, double& target) const {
        if (auto value = lookup(key)) {
            if (!value->is_number()) {
                THROW_BAD_CONFIG_EXCEPTION(path(key) + " must be a number");
            }
            target = value->get<double>();
        }
    }

    template <typename Integer>
    void integer(std::string_view key, Integer& target) const {
        if (auto value = lookup(key)) {
            if (!value->is_number_integer()) {
                THROW_BAD_CONFIG_EXCEPTION(path(key) + " must be an integer");
            }
            auto raw = value->get<long long>();
            if (raw < 0) {
                THROW_BAD_CONFIG_EXCEPTION(path(key) + " must not be negative");
            }
            target = static_cast<Integer>(raw);
        }
    }

    void string(std::string_view key, std::string& target) const {
        if (auto value = lookup(key)) {
            if (!value->is_string()) {
                THROW_BAD_CONFIG_EXCEPTION(path(key) + " must be a string");
            }
            target = value->get<std::string>();
        }
    }

    [[nodiscard]] auto lookup(std::string_view key) const
        -> std::optional<json> {
        return manager_.get(path(key));
    }

    [[nodiscard]] auto path(std::string_view key) const -> std::string {
        return root_ + "/" + std::string(key);
    }

private:
    const ConfigManager& manager_;
    std::string root_;
};

void require(bool condition, std::string_view message) {
    if (!condition) {
        THROW_BAD_CONFIG_EXCEPTION(std::string(message));
    }
}
}  // namespace

auto EngineConfig::fromConfig(const ConfigManager& manager,
                              std::string_view root) -> EngineConfig {
    EngineConfig config;
    SectionReader reader(manager, root);

    if (!manager.has(root)) {
        spdlog::warn("No '{}' configuration section, using defaults", root);
        return config;
    }

    reader.integer("normalizer/minHourlyRecords",
                   config.normalizer.minHourlyRecords);

    reader.number("cooling/decayConstant", config.cooling.decayConstant);
    reader.number("cooling/windCoefficient", config.cooling.windCoefficient);
    reader.number("cooling/humidityCoefficient",
                  config.cooling.humidityCoefficient);
    reader.number("cooling/floorC", config.cooling.floorC);
    reader.integer("cooling/sunriseHour", config.cooling.sunriseHour);
    reader.integer("cooling/trendWindowHours",
                   config.cooling.trendWindowHours);
    reader.number("cooling/orchardDeltaC", config.cooling.orchardDeltaC);

    reader.number("risk/medium", config.risk.medium);
    reader.number("risk/high", config.risk.high);

    int64_t ttlSeconds = config.currentDayTtl.count();
    reader.integer("cache/currentDayTtlSeconds", ttlSeconds);
    config.currentDayTtl = std::chrono::seconds(ttlSeconds);

    int64_t timeoutMs = config.upstreamTimeout.count();
    reader.integer("upstream/timeoutMs", timeoutMs);
    config.upstreamTimeout = std::chrono::milliseconds(timeoutMs);
    reader.string("upstream/dataDir", config.dataDir);
    reader.string("upstream/defaultStation", config.defaultStation);

    if (auto crops = reader.lookup("crops")) {
        config.stages = model::StageParameterTable::fromJson(*crops);
    }
    if (auto loggingNode = reader.lookup("logging")) {
        config.logging = logging::LoggingConfig::fromJson(*loggingNode);
    }

    config.validate();
    spdlog::debug("Engine configuration loaded from '{}'", root);
    return config;
}

void EngineConfig::validate() const {
    require(normalizer.minHourlyRecords >= 1 &&
                normalizer.minHourlyRecords <= 24,
            "normalizer/minHourlyRecords must be within 1..24");

    require(std::isfinite(cooling.decayConstant) && cooling.decayConstant > 0.0,
            "cooling/decayConstant must be positive");
    require(std::isfinite(cooling.windCoefficient) &&
                cooling.windCoefficient >= 0.0,
            "cooling/windCoefficient must not be negative");
    require(std::isfinite(cooling.humidityCoefficient) &&
                cooling.humidityCoefficient >= 0.0,
            "cooling/humidityCoefficient must not be negative");
    require(std::isfinite(cooling.floorC), "cooling/floorC must be finite");
    require(cooling.sunriseHour >= 0 && cooling.sunriseHour <= 23,
            "cooling/sunriseHour must be within 0..23");
    require(cooling.trendWindowHours >= 2 && cooling.trendWindowHours <= 24,
            "cooling/trendWindowHours must be within 2..24");
    require(std::isfinite(cooling.orchardDeltaC) && cooling.orchardDeltaC >= 0.0,
            "cooling/orchardDeltaC must not be negative");

    require(risk.medium > 0.0 && risk.medium < risk.high && risk.high <= 1.0,
            std::format("risk breakpoints must satisfy 0 < medium < high <= 1 "
                        "(medium={}, high={})",
                        risk.medium, risk.high));

    require(upstreamTimeout.count() > 0, "upstream/timeoutMs must be positive");
    require(weather::isValidStationId(defaultStation),
            "upstream/defaultStation must be letters, digits, '-' or '_'");
    require(!dataDir.empty(), "upstream/dataDir is empty");
    require(!stages.crops().empty(), "crops table is empty");
}

auto EngineConfig::toJson() const -> json {
    return {
        {"normalizer", {{"minHourlyRecords", normalizer.minHourlyRecords}}},
        {"cooling",
         {{"decayConstant", cooling.decayConstant},
          {"windCoefficient", cooling.windCoefficient},
          {"humidityCoefficient", cooling.humidityCoefficient},
          {"floorC", cooling.floorC},
          {"sunriseHour", cooling.sunriseHour},
          {"trendWindowHours", cooling.trendWindowHours},
          {"orchardDeltaC", cooling.orchardDeltaC}}},
        {"risk", {{"medium", risk.medium}, {"high", risk.high}}},
        {"cache", {{"currentDayTtlSeconds", currentDayTtl.count()}}},
        {"upstream",
         {{"timeoutMs", upstreamTimeout.count()},
          {"dataDir", dataDir},
          {"defaultStation", defaultStation}}},
        {"crops", stages.toJson()},
        {"logging", logging.toJson()}};
}

}  // namespace frostguard
