/*
 * assessment.cpp
 *
 * Copyright (C) 2025 Frostguard Authors
 */

/*************************************************

Date: 2025-2-18

Description: Frost risk assessment record and its GeoJSON form

**************************************************/

#include "assessment.hpp"

#include <algorithm>
#include <cctype>

#include "model/psychrometrics.hpp"
#include "weather/date.hpp"

namespace frostguard::engine {

namespace {
auto lower(std::string_view text) -> std::string {
    std::string result(text);
    std::ranges::transform(result, result.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return result;
}

auto optional(const std::optional<double>& value) -> json {
    return value ? json(*value) : json(nullptr);
}

auto inRange(double value, double low, double high) -> bool {
    return value >= low && value <= high;
}

void applyHeadline(FrostRiskAssessment& assessment,
                   const model::StageDamage& damage,
                   const model::RiskBreakpoints& breakpoints) {
    assessment.drivingStage = damage.stage;
    assessment.probability = damage.probability;
    assessment.frostProbabilityIndex = damage.frostProbabilityIndex;
    assessment.lt10 = damage.lt10;
    assessment.lt90 = damage.lt90;
    assessment.riskLevel = model::classify(damage.probability, breakpoints);
}
}  // namespace

auto AssessmentKey::make(std::string stationId, const weather::Date& date,
                         std::string_view crop, std::string_view variety)
    -> AssessmentKey {
    return {std::move(stationId), date, lower(crop), lower(variety)};
}

auto AssessmentKey::toString() const -> std::string {
    return stationId + "|" + weather::formatDate(date) + "|" + crop + "|" +
           variety;
}

auto buildHourlyDetails(std::span<const weather::WeatherObservation> observations)
    -> std::vector<HourlyDetail> {
    using Domain = model::PsychrometricDomain;

    auto rates = model::hourlyCoolingRates(observations);
    std::vector<HourlyDetail> details;
    details.reserve(observations.size());

    for (size_t i = 0; i < observations.size(); ++i) {
        const auto& obs = observations[i];
        HourlyDetail detail{obs.hour,         obs.airTemperature,
                            obs.relativeHumidity, obs.dewPoint,
                            std::nullopt,     obs.windSpeed,
                            rates[i]};

        const bool temperatureOk = inRange(obs.airTemperature,
                                           Domain::MIN_TEMPERATURE,
                                           Domain::MAX_TEMPERATURE);
        if (temperatureOk && obs.relativeHumidity) {
            const double rh = *obs.relativeHumidity;
            if (!detail.dewPoint && rh > 0.0) {
                detail.dewPoint = model::dewPoint(obs.airTemperature, rh);
            }
            if (inRange(rh, Domain::MIN_WET_BULB_HUMIDITY,
                        Domain::MAX_WET_BULB_HUMIDITY)) {
                detail.wetBulb = model::wetBulb(obs.airTemperature, rh);
            }
        }
        details.push_back(detail);
    }
    return details;
}

auto assembleAssessment(AssessmentKey key, const weather::NormalizedDay& day,
                        const model::CoolingEstimate& cooling,
                        std::vector<model::StageDamage> stages,
                        const model::RiskBreakpoints& breakpoints)
    -> FrostRiskAssessment {
    FrostRiskAssessment assessment;
    assessment.key = std::move(key);
    assessment.cooling = cooling;
    assessment.summary = day.summary;
    assessment.hours = buildHourlyDetails(day.observations);
    assessment.stages = std::move(stages);

    // Worst case first; ties go to the earlier stage
    const auto& worst = *std::ranges::max_element(
        assessment.stages, [](const auto& lhs, const auto& rhs) {
            return lhs.probability < rhs.probability;
        });
    applyHeadline(assessment, worst, breakpoints);
    return assessment;
}

auto selectStage(const FrostRiskAssessment& base, model::Stage stage,
                 const model::StageParameterTable& table,
                 const model::RiskBreakpoints& breakpoints)
    -> FrostRiskAssessment {
    auto damage = model::evaluateStage(table, base.key.crop, base.key.variety,
                                       stage,
                                       base.cooling.blossomTemperature);
    FrostRiskAssessment selected = base;
    selected.requestedStage = stage;
    applyHeadline(selected, damage, breakpoints);

    auto it = std::ranges::find(selected.stages, stage,
                                &model::StageDamage::stage);
    if (it != selected.stages.end()) {
        *it = damage;
    } else {
        selected.stages.push_back(damage);
    }
    return selected;
}

auto summaryToJson(const weather::StationDailySummary& summary) -> json {
    return json{{"stationId", summary.stationId},
                {"stationName", summary.stationName},
                {"date", weather::formatDate(summary.date)},
                {"airTempMin", summary.airTempMin},
                {"airTempMax", summary.airTempMax},
                {"dewPointMin", optional(summary.dewPointMin)},
                {"dewPointMax", optional(summary.dewPointMax)},
                {"humidityMin", optional(summary.humidityMin)},
                {"humidityMax", optional(summary.humidityMax)},
                {"windSpeedAvg", optional(summary.windSpeedAvg)},
                {"et0", optional(summary.et0)},
                {"recordCount", summary.recordCount}};
}

auto coolingToJson(const model::CoolingEstimate& cooling) -> json {
    return json{{"anchorTemperature", cooling.anchorTemperature},
                {"anchorHour", cooling.anchorHour},
                {"observedTrend", cooling.observedTrend},
                {"coolingRate", cooling.coolingRate},
                {"horizonHours", cooling.horizonHours},
                {"predictedMinimum", cooling.predictedMinimum},
                {"minimumHour", cooling.minimumHour ? json(*cooling.minimumHour)
                                                    : json(nullptr)},
                {"humidity", optional(cooling.humidity)},
                {"blossomTemperature", cooling.blossomTemperature},
                {"confidence", std::string(model::confidenceName(cooling.confidence))}};
}

auto toGeoJson(const FrostRiskAssessment& assessment) -> json {
    json stages = json::object();
    for (const auto& damage : assessment.stages) {
        stages[std::string(model::stageName(damage.stage))] = {
            {"probability", damage.probability},
            {"frostProbabilityIndex", damage.frostProbabilityIndex},
            {"lt10", damage.lt10},
            {"lt90", damage.lt90},
            {"parameterA", damage.parameterA},
            {"parameterB", damage.parameterB}};
    }

    json records = json::array();
    for (const auto& hour : assessment.hours) {
        records.push_back({{"hour", hour.hour},
                           {"airTemperature", hour.airTemperature},
                           {"relativeHumidity", optional(hour.relativeHumidity)},
                           {"dewPoint", optional(hour.dewPoint)},
                           {"wetBulb", optional(hour.wetBulb)},
                           {"windSpeed", optional(hour.windSpeed)},
                           {"coolingRate", hour.coolingRate}});
    }

    json cimis = summaryToJson(assessment.summary);
    cimis["raw"] = {{"records", std::move(records)}};

    json properties = {
        {"temp", assessment.cooling.predictedMinimum},
        {"riskLevel", std::string(model::riskLevelName(assessment.riskLevel))},
        {"probability", assessment.probability},
        {"frostProbabilityIndex", assessment.frostProbabilityIndex},
        {"lt10", assessment.lt10},
        {"lt90", assessment.lt90},
        {"stage", std::string(model::stageName(assessment.drivingStage))},
        {"location", assessment.location.name},
        {"crop",
         {{"name", assessment.key.crop},
          {"variety", assessment.key.variety},
          {"stages", std::move(stages)}}},
        {"cimis", std::move(cimis)},
        {"cooling", coolingToJson(assessment.cooling)}};

    return json{{"type", "Feature"},
                {"properties", std::move(properties)},
                {"geometry",
                 {{"type", "Point"},
                  {"coordinates",
                   json::array({assessment.location.longitude,
                                assessment.location.latitude})}}}};
}

}  // namespace frostguard::engine
