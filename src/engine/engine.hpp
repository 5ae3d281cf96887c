/*
 * engine.hpp
 *
 * Copyright (C) 2025 Frostguard Authors
 */

/*************************************************

Date: 2025-2-18

Description: Frost risk engine: request validation, caching and the
computation chain from observations to a classified assessment

**************************************************/

#ifndef FROSTGUARD_ENGINE_ENGINE_HPP
#define FROSTGUARD_ENGINE_ENGINE_HPP

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "assessment.hpp"
#include "cache/assessment_cache.hpp"
#include "config/engine_config.hpp"
#include "exception/exception.hpp"
#include "weather/date.hpp"
#include "weather/source.hpp"

namespace frostguard::engine {

struct AssessmentRequest {
    double latitude{0.0};
    double longitude{0.0};
    std::string date;  ///< YYYY-MM-DD
    std::string crop{"almond"};
    std::string variety{"nonpareil"};
    std::optional<std::string> stationId;  ///< Overrides the default station
    std::optional<std::string> stage;      ///< Reclassify for this stage
    std::optional<std::string> locationName;
};

/**
 * @brief Boundary document for a failed request.
 */
auto errorToJson(ErrorKind kind, std::string_view reason) -> json;

class FrostRiskEngine {
public:
    FrostRiskEngine(EngineConfig config,
                    std::shared_ptr<weather::WeatherSource> source,
                    weather::DateProvider today = weather::systemToday);

    /**
     * @brief Computes, or serves from cache, the assessment for a request.
     *
     * @throws InvalidDate for malformed or future dates.
     * @throws OutOfDomain for coordinates off the globe or unusable
     * psychrometric inputs.
     * @throws UnknownStageParameters for unknown crop, variety or stage.
     * @throws InsufficientData, UpstreamUnavailable, UpstreamTimeout from
     * the weather side.
     */
    auto assess(const AssessmentRequest& request) -> FrostRiskAssessment;

    /**
     * @brief Runs assess() and renders either the GeoJSON feature or an
     * error document `{error, reason, status}`.
     */
    auto handle(const AssessmentRequest& request) -> json;

    [[nodiscard]] auto config() const -> const EngineConfig& {
        return config_;
    }

    [[nodiscard]] auto assessmentCache() -> cache::AssessmentCache& {
        return cache_;
    }

private:
    auto computeBase(const AssessmentKey& key) -> cache::AssessmentPtr;

    EngineConfig config_;
    std::shared_ptr<weather::WeatherSource> source_;
    weather::DateProvider today_;
    cache::AssessmentCache cache_;  // Last: joins computations that use the members above
};

}  // namespace frostguard::engine

#endif  // FROSTGUARD_ENGINE_ENGINE_HPP
