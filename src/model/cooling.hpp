/*
 * cooling.hpp
 *
 * Copyright (C) 2025 Frostguard Authors
 */

/*************************************************

Date: 2025-2-18

Description: Overnight cooling extrapolation

**************************************************/

#ifndef FROSTGUARD_MODEL_COOLING_HPP
#define FROSTGUARD_MODEL_COOLING_HPP

#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "weather/types.hpp"

namespace frostguard::model {

/**
 * @brief Calibration of the cooling curve.
 */
struct CoolingPolicy {
    double decayConstant{0.25};       ///< Per hour, > 0
    double windCoefficient{0.1};      ///< Rate damping per m/s of wind
    double humidityCoefficient{0.5};  ///< Rate damping at 100% humidity
    double floorC{-15.0};             ///< Lower bound of extrapolation
    int sunriseHour{7};               ///< Local hour the night ends
    size_t trendWindowHours{6};       ///< Trailing observations for the trend
    double orchardDeltaC{1.0};        ///< Bud tissue below wet-bulb
};

enum class Confidence { Measured, Derived };

[[nodiscard]] constexpr auto confidenceName(Confidence confidence) noexcept
    -> std::string_view {
    return confidence == Confidence::Measured ? "measured" : "derived";
}

/**
 * @brief Predicted overnight minimum for one station-day.
 */
struct CoolingEstimate {
    double anchorTemperature{0.0};  ///< Last observed temperature, Celsius
    int anchorHour{0};
    double observedTrend{0.0};   ///< Observed drop, Celsius per hour (>= 0)
    double coolingRate{0.0};     ///< Initial slope of the curve (>= 0)
    double horizonHours{0.0};    ///< Anchor to sunrise
    double predictedMinimum{0.0};    ///< Celsius
    std::optional<int> minimumHour;  ///< Observed hour colder than the curve
    std::optional<double> humidity;  ///< Humidity used for blossom temperature
    double blossomTemperature{0.0};  ///< Celsius
    Confidence confidence{Confidence::Derived};
};

/**
 * @brief Temperature drop per hour between consecutive observations.
 * The first entry is 0.
 */
auto hourlyCoolingRates(std::span<const weather::WeatherObservation> observations)
    -> std::vector<double>;

/**
 * @brief Hours from the anchor hour to the next sunrise.
 */
auto horizonHours(int anchorHour, int sunriseHour) -> double;

/**
 * @brief Evaluates the cooling curve
 * `T(t) = T0 - (rate / k) * (1 - exp(-k * t))`, bounded below by the floor.
 */
auto curveTemperature(double anchorTemperature, double coolingRate,
                      double hours, const CoolingPolicy& policy) -> double;

/**
 * @brief Samples the cooling curve from 0 to horizon (inclusive) every
 * step hours.
 */
auto coolingCurve(double anchorTemperature, double coolingRate,
                  double horizon, double step, const CoolingPolicy& policy)
    -> std::vector<double>;

/**
 * @brief Bud tissue temperature: wet-bulb at the given air temperature
 * minus the orchard offset. Without humidity, the air temperature minus the
 * offset.
 * @throws OutOfDomain if the wet-bulb inputs are out of range.
 */
auto blossomTemperature(double airTemperature,
                        std::optional<double> relativeHumidity,
                        double orchardDeltaC) -> double;

/**
 * @brief Extrapolates the overnight minimum from the evening observations.
 *
 * The trend is the mean hourly drop over the trailing window. With wind
 * and humidity present for every window hour, the rate is damped by both
 * and the estimate is `measured`; otherwise the raw trend is used and the
 * estimate is `derived`. The minimum is the colder of the curve end and
 * the coldest observed hour of the day; in the latter case that hour's
 * humidity feeds the blossom temperature.
 *
 * @pre observations is ordered by hour.
 * @throws InsufficientData if observations is empty.
 * @throws OutOfDomain if the blossom temperature cannot be computed.
 */
auto estimateCooling(std::span<const weather::WeatherObservation> observations,
                     const CoolingPolicy& policy = {}) -> CoolingEstimate;

}  // namespace frostguard::model

#endif  // FROSTGUARD_MODEL_COOLING_HPP
