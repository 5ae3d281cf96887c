/*
 * engine.cpp
 *
 * Copyright (C) 2025 Frostguard Authors
 */

/*************************************************

Date: 2025-2-18

Description: Frost risk engine: request validation, caching and the
computation chain from observations to a classified assessment

**************************************************/

#include "engine.hpp"

#include <algorithm>
#include <format>

#include <spdlog/spdlog.h>

#include "model/cooling.hpp"
#include "model/damage.hpp"
#include "weather/normalizer.hpp"

namespace frostguard::engine {

auto errorToJson(ErrorKind kind, std::string_view reason) -> json {
    return json{{"error", std::string(errorKindName(kind))},
                {"reason", std::string(reason)},
                {"status", errorKindStatus(kind)}};
}

FrostRiskEngine::FrostRiskEngine(EngineConfig config,
                                 std::shared_ptr<weather::WeatherSource> source,
                                 weather::DateProvider today)
    : config_(std::move(config)),
      source_(std::move(source)),
      today_(std::move(today)),
      cache_(today_, config_.currentDayTtl) {
    if (!source_) {
        THROW_BAD_CONFIG_EXCEPTION("Frost risk engine needs a weather source");
    }
    config_.validate();
    spdlog::info("Frost risk engine ready: default station {}, cache TTL {}s",
                 config_.defaultStation, config_.currentDayTtl.count());
}

auto FrostRiskEngine::assess(const AssessmentRequest& request)
    -> FrostRiskAssessment {
    const auto date = weather::parseDate(request.date);
    const auto today = today_();
    if (date > today) {
        THROW_INVALID_DATE(std::format("Date {} is after the processing date {}",
                                       request.date,
                                       weather::formatDate(today)));
    }

    if (!(request.latitude >= -90.0 && request.latitude <= 90.0) ||
        !(request.longitude >= -180.0 && request.longitude <= 180.0)) {
        THROW_OUT_OF_DOMAIN(std::format("Coordinates ({}, {}) are off the globe",
                                        request.latitude, request.longitude));
    }

    // Reject unknown crop/variety/stage before any upstream work
    auto known = config_.stages.stagesFor(request.crop, request.variety);
    std::optional<model::Stage> stage;
    if (request.stage) {
        stage = model::parseStage(*request.stage);
        if (!stage) {
            THROW_UNKNOWN_STAGE_PARAMETERS("Unknown stage: " + *request.stage);
        }
        if (std::ranges::find(known, *stage) == known.end()) {
            THROW_UNKNOWN_STAGE_PARAMETERS(std::format(
                "No {} parameters for {}/{}", model::stageName(*stage),
                request.crop, request.variety));
        }
    }

    const std::string station =
        request.stationId && !request.stationId->empty()
            ? *request.stationId
            : config_.defaultStation;
    if (!weather::isValidStationId(station)) {
        THROW_OUT_OF_DOMAIN("Station id must be letters, digits, '-' or '_': " +
                            station);
    }
    auto key = AssessmentKey::make(station, date, request.crop, request.variety);

    auto base = cache_.getOrCompute(
        key, [this, key] { return computeBase(key); }, config_.upstreamTimeout);

    FrostRiskAssessment result = stage ? selectStage(*base, *stage,
                                                     config_.stages,
                                                     config_.risk)
                                       : *base;
    result.location = Location{request.latitude, request.longitude,
                               request.locationName.value_or("Unknown")};

    spdlog::info("Assessment {} stage {}: p={:.3f} ({}), LT10={:.2f} "
                 "LT90={:.2f}",
                 key.toString(), model::stageName(result.drivingStage),
                 result.probability, model::riskLevelName(result.riskLevel),
                 result.lt10, result.lt90);
    return result;
}

auto FrostRiskEngine::handle(const AssessmentRequest& request) -> json {
    try {
        return toGeoJson(assess(request));
    } catch (const FrostError& e) {
        spdlog::error("Request for {} on {} failed ({}): {}",
                      request.stationId.value_or(config_.defaultStation),
                      request.date, errorKindName(e.kind()), e.what());
        return errorToJson(e.kind(), e.what());
    }
}

auto FrostRiskEngine::computeBase(const AssessmentKey& key)
    -> cache::AssessmentPtr {
    auto raw = source_->fetchHourly(key.stationId, key.date);
    spdlog::debug("Fetched {} raw records for station {} on {}", raw.size(),
                  key.stationId, weather::formatDate(key.date));

    auto day = weather::normalize(key.stationId, key.date, raw,
                                  config_.normalizer);
    auto cooling = model::estimateCooling(day.observations, config_.cooling);
    auto stages = model::evaluateAllStages(config_.stages, key.crop,
                                           key.variety,
                                           cooling.blossomTemperature);

    return std::make_shared<const FrostRiskAssessment>(assembleAssessment(
        key, day, cooling, std::move(stages), config_.risk));
}

}  // namespace frostguard::engine
