/*
 * assessment.hpp
 *
 * Copyright (C) 2025 Frostguard Authors
 */

/*************************************************

Date: 2025-2-18

Description: Frost risk assessment record and its GeoJSON form

**************************************************/

#ifndef FROSTGUARD_ENGINE_ASSESSMENT_HPP
#define FROSTGUARD_ENGINE_ASSESSMENT_HPP

#include <optional>
#include <span>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "model/cooling.hpp"
#include "model/damage.hpp"
#include "model/risk.hpp"
#include "weather/types.hpp"

namespace frostguard::engine {

using json = nlohmann::json;

/**
 * @brief Identity of a cached assessment. Crop and variety are stored
 * lowercase.
 */
struct AssessmentKey {
    std::string stationId;
    weather::Date date;
    std::string crop;
    std::string variety;

    static auto make(std::string stationId, const weather::Date& date,
                     std::string_view crop, std::string_view variety)
        -> AssessmentKey;

    [[nodiscard]] auto toString() const -> std::string;

    auto operator==(const AssessmentKey&) const -> bool = default;
};

struct Location {
    double latitude{0.0};
    double longitude{0.0};
    std::string name{"Unknown"};
};

/**
 * @brief Per-hour transparency figures carried in the output.
 */
struct HourlyDetail {
    int hour;
    double airTemperature;
    std::optional<double> relativeHumidity;
    std::optional<double> dewPoint;
    std::optional<double> wetBulb;
    std::optional<double> windSpeed;
    double coolingRate;
};

/**
 * @brief Frost risk for one station-day and crop variety.
 *
 * The headline figures (probability, index, level, LT10/LT90) belong to
 * `drivingStage`: the requested stage, or the stage with the highest kill
 * probability when none was requested.
 */
struct FrostRiskAssessment {
    AssessmentKey key;
    std::optional<model::Stage> requestedStage;
    model::Stage drivingStage{model::Stage::Pinkbud};
    Location location;

    double probability{0.0};
    double frostProbabilityIndex{0.0};
    model::RiskLevel riskLevel{model::RiskLevel::Low};
    double lt10{0.0};
    double lt90{0.0};

    model::CoolingEstimate cooling;
    std::vector<model::StageDamage> stages;
    weather::StationDailySummary summary;
    std::vector<HourlyDetail> hours;
};

/**
 * @brief Builds per-hour details; moisture figures are left empty where
 * the psychrometric formulas do not apply.
 */
auto buildHourlyDetails(std::span<const weather::WeatherObservation> observations)
    -> std::vector<HourlyDetail>;

/**
 * @brief Assembles a base assessment (no stage selected) whose headline is
 * the worst stage.
 * @pre stages is non-empty.
 */
auto assembleAssessment(AssessmentKey key, const weather::NormalizedDay& day,
                        const model::CoolingEstimate& cooling,
                        std::vector<model::StageDamage> stages,
                        const model::RiskBreakpoints& breakpoints)
    -> FrostRiskAssessment;

/**
 * @brief Re-runs damage and classification for a chosen stage over an
 * existing cooling estimate. No weather data is touched.
 * @throws UnknownStageParameters if the stage is not defined for the
 * variety.
 */
auto selectStage(const FrostRiskAssessment& base, model::Stage stage,
                 const model::StageParameterTable& table,
                 const model::RiskBreakpoints& breakpoints)
    -> FrostRiskAssessment;

/**
 * @brief GeoJSON point feature consumed by the map front end.
 */
auto toGeoJson(const FrostRiskAssessment& assessment) -> json;

auto summaryToJson(const weather::StationDailySummary& summary) -> json;
auto coolingToJson(const model::CoolingEstimate& cooling) -> json;

}  // namespace frostguard::engine

#endif  // FROSTGUARD_ENGINE_ASSESSMENT_HPP
