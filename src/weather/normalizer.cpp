/*
 * normalizer.cpp
 *
 * Copyright (C) 2025 Frostguard Authors
 */

/*************************************************

Date: 2025-2-18

Description: Weather observation normalizer

**************************************************/

#include "normalizer.hpp"

#include <algorithm>
#include <bitset>
#include <cmath>
#include <format>

#include <spdlog/spdlog.h>

#include "date.hpp"
#include "exception/exception.hpp"
#include "model/psychrometrics.hpp"

namespace frostguard::weather {

namespace {
constexpr int FIRST_HOUR = 1;
constexpr int LAST_HOUR = 24;
constexpr double MPH_TO_MS = 0.44704;
constexpr double INCH_TO_MM = 25.4;

auto toCelsius(double value, TemperatureUnit unit) -> double {
    return unit == TemperatureUnit::Fahrenheit ? fahrenheitToCelsius(value)
                                               : value;
}

auto finite(const std::optional<double>& value) -> std::optional<double> {
    if (value && std::isfinite(*value)) {
        return value;
    }
    return std::nullopt;
}

auto clampPercent(double value) -> double {
    return std::clamp(value, 0.0, 100.0);
}

// Dew point used for aggregation only: measured, else derived when the
// inputs fall inside the Magnus domain.
auto aggregateDewPoint(const WeatherObservation& obs) -> std::optional<double> {
    if (obs.dewPoint) {
        return obs.dewPoint;
    }
    if (!obs.relativeHumidity || *obs.relativeHumidity <= 0.0 ||
        obs.airTemperature < model::PsychrometricDomain::MIN_TEMPERATURE ||
        obs.airTemperature > model::PsychrometricDomain::MAX_TEMPERATURE) {
        return std::nullopt;
    }
    return model::dewPoint(obs.airTemperature, *obs.relativeHumidity);
}

void extend(std::optional<double>& minValue, std::optional<double>& maxValue,
            double value) {
    minValue = minValue ? std::min(*minValue, value) : value;
    maxValue = maxValue ? std::max(*maxValue, value) : value;
}
}  // namespace

auto fahrenheitToCelsius(double fahrenheit) -> double {
    return (fahrenheit - 32.0) * 5.0 / 9.0;
}

auto milesPerHourToMetersPerSecond(double mph) -> double {
    return mph * MPH_TO_MS;
}

auto inchesToMillimeters(double inches) -> double {
    return inches * INCH_TO_MM;
}

auto normalize(const std::string& stationId, const Date& date,
               std::span<const RawObservation> raw,
               const NormalizerPolicy& policy) -> NormalizedDay {
    std::vector<WeatherObservation> observations;
    observations.reserve(LAST_HOUR);
    std::bitset<LAST_HOUR + 1> seenHours;
    size_t gaps = 0;

    for (const auto& record : raw) {
        if (record.stationId != stationId || record.date != date) {
            continue;
        }
        if (record.hour < FIRST_HOUR || record.hour > LAST_HOUR) {
            spdlog::warn("Station {} {}: dropping record with hour {}",
                         stationId, formatDate(date), record.hour);
            continue;
        }
        auto airTemperature = finite(record.airTemperature);
        if (!airTemperature) {
            ++gaps;
            continue;
        }
        if (seenHours.test(static_cast<size_t>(record.hour))) {
            spdlog::debug("Station {} {}: duplicate hour {} ignored", stationId,
                          formatDate(date), record.hour);
            continue;
        }
        seenHours.set(static_cast<size_t>(record.hour));

        WeatherObservation obs;
        obs.date = date;
        obs.hour = record.hour;
        obs.airTemperature = toCelsius(*airTemperature, record.airTemperatureUnit);
        if (auto rh = finite(record.relativeHumidity)) {
            obs.relativeHumidity = clampPercent(*rh);
        }
        if (auto td = finite(record.dewPoint)) {
            obs.dewPoint = toCelsius(*td, record.dewPointUnit);
        }
        if (auto wind = finite(record.windSpeed); wind && *wind >= 0.0) {
            obs.windSpeed = record.windSpeedUnit == SpeedUnit::MilesPerHour
                                ? milesPerHourToMetersPerSecond(*wind)
                                : *wind;
        }
        if (auto solar = finite(record.solarRadiation)) {
            obs.solarRadiation = std::max(0.0, *solar);
        }
        if (auto et = finite(record.referenceEt)) {
            obs.referenceEt = record.referenceEtUnit == DepthUnit::Inches
                                  ? inchesToMillimeters(*et)
                                  : *et;
        }
        observations.push_back(obs);
    }

    if (observations.size() < policy.minHourlyRecords) {
        THROW_INSUFFICIENT_DATA(std::format(
            "Station {} on {} has {} valid hourly records, {} required",
            stationId, formatDate(date), observations.size(),
            policy.minHourlyRecords));
    }

    std::ranges::sort(observations, {}, &WeatherObservation::hour);

    if (gaps > 0) {
        spdlog::warn("Station {} {}: {} hourly records without air temperature",
                     stationId, formatDate(date), gaps);
    }

    NormalizedDay day;
    day.summary = summarize(stationId, date, observations);
    day.observations = std::move(observations);
    return day;
}

auto summarize(const std::string& stationId, const Date& date,
               std::span<const WeatherObservation> observations)
    -> StationDailySummary {
    if (observations.empty()) {
        THROW_INSUFFICIENT_DATA("No observations to summarize for station " +
                                stationId + " on " + formatDate(date));
    }
    StationDailySummary summary;
    summary.stationId = stationId;
    summary.stationName = "CIMIS Station " + stationId;
    summary.date = date;
    summary.recordCount = observations.size();
    summary.airTempMin = observations.front().airTemperature;
    summary.airTempMax = observations.front().airTemperature;

    double windSum = 0.0;
    size_t windCount = 0;
    double etSum = 0.0;
    size_t etCount = 0;

    for (const auto& obs : observations) {
        summary.airTempMin = std::min(summary.airTempMin, obs.airTemperature);
        summary.airTempMax = std::max(summary.airTempMax, obs.airTemperature);
        if (obs.relativeHumidity) {
            extend(summary.humidityMin, summary.humidityMax,
                   *obs.relativeHumidity);
        }
        if (auto td = aggregateDewPoint(obs)) {
            extend(summary.dewPointMin, summary.dewPointMax, *td);
        }
        if (obs.windSpeed) {
            windSum += *obs.windSpeed;
            ++windCount;
        }
        if (obs.referenceEt) {
            etSum += *obs.referenceEt;
            ++etCount;
        }
    }

    if (windCount > 0) {
        summary.windSpeedAvg = windSum / static_cast<double>(windCount);
    }
    if (etCount > 0) {
        summary.et0 = etSum;
    }
    return summary;
}

}  // namespace frostguard::weather
