/*
 * psychrometrics.cpp
 *
 * Copyright (C) 2025 Frostguard Authors
 */

/*************************************************

Date: 2025-2-18

Description: Dew point and wet-bulb temperature

**************************************************/

#include "psychrometrics.hpp"

#include <cmath>
#include <format>

#include <spdlog/spdlog.h>

#include "exception/exception.hpp"

namespace frostguard::model {

namespace {
constexpr double MAGNUS_A = 17.62;
constexpr double MAGNUS_B = 243.12;  // Celsius

// Stull (2011), J. Appl. Meteor. Climatol. 50, 2267-2269
constexpr double STULL_C1 = 0.151977;
constexpr double STULL_C2 = 8.313659;
constexpr double STULL_C3 = 1.676331;
constexpr double STULL_C4 = 0.00391838;
constexpr double STULL_C5 = 0.023101;
constexpr double STULL_C6 = 4.686035;

void checkTemperature(double temperature) {
    if (!std::isfinite(temperature) ||
        temperature < PsychrometricDomain::MIN_TEMPERATURE ||
        temperature > PsychrometricDomain::MAX_TEMPERATURE) {
        THROW_OUT_OF_DOMAIN(
            std::format("Temperature {:.2f} C outside [{}, {}]", temperature,
                        PsychrometricDomain::MIN_TEMPERATURE,
                        PsychrometricDomain::MAX_TEMPERATURE));
    }
}
}  // namespace

auto dewPoint(double temperature, double relativeHumidity) -> double {
    checkTemperature(temperature);
    if (!std::isfinite(relativeHumidity) || relativeHumidity <= 0.0 ||
        relativeHumidity > 100.0) {
        THROW_OUT_OF_DOMAIN(std::format(
            "Relative humidity {:.2f}% outside (0, 100]", relativeHumidity));
    }

    double gamma = std::log(relativeHumidity / 100.0) +
                   MAGNUS_A * temperature / (MAGNUS_B + temperature);
    return MAGNUS_B * gamma / (MAGNUS_A - gamma);
}

auto wetBulb(double temperature, double relativeHumidity) -> double {
    checkTemperature(temperature);
    if (!std::isfinite(relativeHumidity) ||
        relativeHumidity < PsychrometricDomain::MIN_WET_BULB_HUMIDITY ||
        relativeHumidity > PsychrometricDomain::MAX_WET_BULB_HUMIDITY) {
        THROW_OUT_OF_DOMAIN(std::format(
            "Relative humidity {:.2f}% outside [{}, {}] for wet-bulb",
            relativeHumidity, PsychrometricDomain::MIN_WET_BULB_HUMIDITY,
            PsychrometricDomain::MAX_WET_BULB_HUMIDITY));
    }

    const double rh = relativeHumidity;
    return temperature * std::atan(STULL_C1 * std::sqrt(rh + STULL_C2)) +
           std::atan(temperature + rh) - std::atan(rh - STULL_C3) +
           STULL_C4 * std::pow(rh, 1.5) * std::atan(STULL_C5 * rh) - STULL_C6;
}

auto computeState(const weather::WeatherObservation& observation)
    -> PsychrometricState {
    if (!observation.relativeHumidity) {
        THROW_OUT_OF_DOMAIN(std::format(
            "Observation at hour {} has no relative humidity",
            observation.hour));
    }

    const double t = observation.airTemperature;
    const double rh = *observation.relativeHumidity;

    PsychrometricState state{};
    if (observation.dewPoint) {
        state.dewPoint = *observation.dewPoint;
        state.dewPointDerived = false;
    } else {
        state.dewPoint = dewPoint(t, rh);
        state.dewPointDerived = true;
    }
    state.wetBulb = wetBulb(t, rh);

    spdlog::debug("Psychrometrics: T={:.2f} RH={:.1f} Td={:.2f}{} Tw={:.2f}",
                  t, rh, state.dewPoint, state.dewPointDerived ? " (derived)" : "",
                  state.wetBulb);
    return state;
}

}  // namespace frostguard::model
