/*
 * psychrometrics.hpp
 *
 * Copyright (C) 2025 Frostguard Authors
 */

/*************************************************

Date: 2025-2-18

Description: Dew point and wet-bulb temperature

**************************************************/

#ifndef FROSTGUARD_MODEL_PSYCHROMETRICS_HPP
#define FROSTGUARD_MODEL_PSYCHROMETRICS_HPP

#include "weather/types.hpp"

namespace frostguard::model {

/**
 * @brief Moisture state derived from a single observation.
 */
struct PsychrometricState {
    double dewPoint;   ///< Celsius
    bool dewPointDerived;  ///< True when computed rather than measured
    double wetBulb;    ///< Celsius
};

/**
 * @brief Validated input range of the closed-form formulas.
 */
struct PsychrometricDomain {
    static constexpr double MIN_TEMPERATURE = -20.0;
    static constexpr double MAX_TEMPERATURE = 50.0;
    static constexpr double MIN_WET_BULB_HUMIDITY = 5.0;
    static constexpr double MAX_WET_BULB_HUMIDITY = 99.0;
};

/**
 * @brief Dew point by the Magnus-Tetens approximation
 * (a = 17.62, b = 243.12 C).
 *
 * @param temperature Air temperature in Celsius, within [-20, 50].
 * @param relativeHumidity Relative humidity in percent, within (0, 100].
 * @return Dew point in Celsius.
 * @throws OutOfDomain when an input is outside its range.
 */
auto dewPoint(double temperature, double relativeHumidity) -> double;

/**
 * @brief Wet-bulb temperature by Stull's (2011) empirical regression.
 *
 * @param temperature Air temperature in Celsius, within [-20, 50].
 * @param relativeHumidity Relative humidity in percent, within [5, 99].
 * @return Wet-bulb temperature in Celsius.
 * @throws OutOfDomain when an input is outside its range.
 */
auto wetBulb(double temperature, double relativeHumidity) -> double;

/**
 * @brief Dew point (measured when available) and wet-bulb for an
 * observation.
 * @throws OutOfDomain if humidity is missing or a formula is out of range.
 */
auto computeState(const weather::WeatherObservation& observation)
    -> PsychrometricState;

}  // namespace frostguard::model

#endif  // FROSTGUARD_MODEL_PSYCHROMETRICS_HPP
