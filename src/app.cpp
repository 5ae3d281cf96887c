/*
 * app.cpp
 *
 * Copyright (C) 2025 Frostguard Authors
 */

/*************************************************

Date: 2025-2-18

Description: Command line entry: one frost risk request per run

**************************************************/

#include <any>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "atom/utils/argsview.hpp"

#include "config/configor.hpp"
#include "config/engine_config.hpp"
#include "engine/engine.hpp"
#include "exception/exception.hpp"
#include "logging/logging_manager.hpp"
#include "weather/source.hpp"

using namespace std::string_literals;
namespace fs = std::filesystem;

namespace {
auto parseCoordinate(const std::string& text, const char* name) -> double {
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::logic_error& e) {
        THROW_OUT_OF_DOMAIN(std::string("Invalid ") + name + ": '" + text +
                            "' (" + e.what() + ")");
    }
    if (consumed != text.size()) {
        THROW_OUT_OF_DOMAIN(std::string("Invalid ") + name + ": '" + text + "'");
    }
    return value;
}
}  // namespace

int main(int argc, char *argv[]) {
    // Console logging until the configuration is known
    frostguard::logging::LoggingManager::getInstance().initialize({});

    atom::utils::ArgumentParser program("frostguard"s);

    // NOTE: command line values take priority over the config file
    program.addArgument("config", atom::utils::ArgumentParser::ArgType::STRING,
                        false, "config/frostguard.json"s,
                        "Path to the config file", {"c"});
    program.addArgument("lat", atom::utils::ArgumentParser::ArgType::STRING,
                        true, ""s, "Field latitude", {"y"});
    program.addArgument("lon", atom::utils::ArgumentParser::ArgType::STRING,
                        true, ""s, "Field longitude", {"x"});
    program.addArgument("date", atom::utils::ArgumentParser::ArgType::STRING,
                        true, ""s, "Assessment date (YYYY-MM-DD)", {"t"});
    program.addArgument("crop", atom::utils::ArgumentParser::ArgType::STRING,
                        false, "almond"s, "Crop identifier");
    program.addArgument("variety", atom::utils::ArgumentParser::ArgType::STRING,
                        false, "nonpareil"s, "Variety identifier", {"v"});
    program.addArgument("station", atom::utils::ArgumentParser::ArgType::STRING,
                        false, ""s, "Station override", {"s"});
    program.addArgument("stage", atom::utils::ArgumentParser::ArgType::STRING,
                        false, ""s, "Phenological stage (Pinkbud, ...)");
    program.addArgument("location", atom::utils::ArgumentParser::ArgType::STRING,
                        false, ""s, "Display name of the field");
    program.addArgument("data-dir",
                        atom::utils::ArgumentParser::ArgType::STRING, false,
                        ""s, "Directory of station observation files", {"d"});
    program.addArgument("log-level",
                        atom::utils::ArgumentParser::ArgType::STRING, false,
                        ""s, "Log level (trace/debug/info/warn/error)", {"l"});

    program.addDescription("Frost risk assessment for bloom-stage orchards:");
    program.addEpilog("Prints a GeoJSON feature, or an error document.");

    std::vector<std::string> args(argv, argv + argc);
    program.parse(argc, args);

    frostguard::ConfigManager configManager;
    frostguard::engine::AssessmentRequest request;
    std::string configRoot = "frostguard";
    std::string dataDirOverride;
    std::string logLevelOverride;

    try {
        fs::path configPath =
            program.get<std::string>("config").value_or("config/frostguard.json"s);
        configRoot = configPath.stem().string();
        if (fs::exists(configPath)) {
            if (!configManager.loadFromFile(configPath)) {
                spdlog::error("Could not load configuration {}",
                              configPath.string());
                return 1;
            }
        } else {
            spdlog::warn("No configuration file at {}, using defaults",
                         configPath.string());
        }

        request.date = program.get<std::string>("date").value_or(""s);
        request.crop = program.get<std::string>("crop").value_or("almond"s);
        request.variety =
            program.get<std::string>("variety").value_or("nonpareil"s);
        if (auto station = program.get<std::string>("station");
            station && !station->empty()) {
            request.stationId = *station;
        }
        if (auto stage = program.get<std::string>("stage");
            stage && !stage->empty()) {
            request.stage = *stage;
        }
        if (auto location = program.get<std::string>("location");
            location && !location->empty()) {
            request.locationName = *location;
        }
        dataDirOverride = program.get<std::string>("data-dir").value_or(""s);
        logLevelOverride = program.get<std::string>("log-level").value_or(""s);

        request.latitude = parseCoordinate(
            program.get<std::string>("lat").value_or(""s), "latitude");
        request.longitude = parseCoordinate(
            program.get<std::string>("lon").value_or(""s), "longitude");
    } catch (const std::bad_any_cast &e) {
        spdlog::error("Invalid args format! Error: {}", e.what());
        return 1;
    } catch (const frostguard::FrostError &e) {
        std::cout << frostguard::engine::errorToJson(e.kind(), e.what()).dump(2)
                  << std::endl;
        return 2;
    }

    try {
        if (!dataDirOverride.empty()) {
            configManager.set(configRoot + "/upstream/dataDir", dataDirOverride);
        }
        if (!logLevelOverride.empty()) {
            configManager.set(configRoot + "/logging/default_level",
                              logLevelOverride);
        }

        auto config = frostguard::EngineConfig::fromConfig(configManager, configRoot);
        frostguard::logging::LoggingManager::getInstance().initialize(
            config.logging);

        auto source =
            std::make_shared<frostguard::weather::FileWeatherSource>(
                config.dataDir);
        frostguard::engine::FrostRiskEngine engine(std::move(config), source);

        auto response = engine.handle(request);
        std::cout << response.dump(2) << std::endl;

        frostguard::logging::LoggingManager::getInstance().shutdown();
        return response.contains("error") ? 2 : 0;
    } catch (const frostguard::BadConfigException &e) {
        spdlog::error("Configuration error: {}", e.what());
        std::cout << frostguard::engine::errorToJson(e.kind(), e.what()).dump(2)
                  << std::endl;
        return 1;
    }
}
