/*
 * normalizer.hpp
 *
 * Copyright (C) 2025 Frostguard Authors
 */

/*************************************************

Date: 2025-2-18

Description: Weather observation normalizer

**************************************************/

#ifndef FROSTGUARD_WEATHER_NORMALIZER_HPP
#define FROSTGUARD_WEATHER_NORMALIZER_HPP

#include <span>
#include <string>

#include "types.hpp"

namespace frostguard::weather {

/**
 * @brief Tunables of the normalizer.
 */
struct NormalizerPolicy {
    size_t minHourlyRecords{12};  ///< Valid hours required out of 24
};

/**
 * @brief Canonicalizes one station-day of raw upstream records.
 *
 * Converts units to metric, clamps percentages into [0, 100], drops
 * records belonging to other stations or days, treats a missing air
 * temperature as a gap, keeps the first record of a duplicated hour and
 * orders the result by hour. Missing dew points stay absent.
 *
 * @param stationId Station being assessed.
 * @param date Calendar day being assessed.
 * @param raw Upstream records; may contain foreign or malformed entries.
 * @param policy Normalizer tunables.
 * @return Ordered observations and their daily summary.
 * @throws InsufficientData if fewer than policy.minHourlyRecords remain.
 */
auto normalize(const std::string& stationId, const Date& date,
               std::span<const RawObservation> raw,
               const NormalizerPolicy& policy = {}) -> NormalizedDay;

/**
 * @brief Reduces validated observations to a daily summary.
 *
 * @throws InsufficientData if observations is empty.
 */
auto summarize(const std::string& stationId, const Date& date,
               std::span<const WeatherObservation> observations)
    -> StationDailySummary;

auto fahrenheitToCelsius(double fahrenheit) -> double;
auto milesPerHourToMetersPerSecond(double mph) -> double;
auto inchesToMillimeters(double inches) -> double;

}  // namespace frostguard::weather

#endif  // FROSTGUARD_WEATHER_NORMALIZER_HPP
