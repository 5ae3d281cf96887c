/*
 * cooling.cpp
 *
 * Copyright (C) 2025 Frostguard Authors
 */

/*************************************************

Date: 2025-2-18

Description: Overnight cooling extrapolation

**************************************************/

#include "cooling.hpp"

#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>

#include "exception/exception.hpp"
#include "psychrometrics.hpp"

namespace frostguard::model {

namespace {
constexpr int HOURS_PER_DAY = 24;
}  // namespace

auto hourlyCoolingRates(std::span<const weather::WeatherObservation> observations)
    -> std::vector<double> {
    std::vector<double> rates;
    rates.reserve(observations.size());
    for (size_t i = 0; i < observations.size(); ++i) {
        if (i == 0) {
            rates.push_back(0.0);
            continue;
        }
        const auto& prev = observations[i - 1];
        const auto& curr = observations[i];
        double dt = static_cast<double>(curr.hour - prev.hour);
        if (dt <= 0.0) {
            dt = 1.0;
        }
        rates.push_back((prev.airTemperature - curr.airTemperature) / dt);
    }
    return rates;
}

auto horizonHours(int anchorHour, int sunriseHour) -> double {
    if (anchorHour < sunriseHour) {
        return static_cast<double>(sunriseHour - anchorHour);
    }
    return static_cast<double>(HOURS_PER_DAY - anchorHour + sunriseHour);
}

auto curveTemperature(double anchorTemperature, double coolingRate,
                      double hours, const CoolingPolicy& policy) -> double {
    const double rate = std::max(0.0, coolingRate);
    const double t = std::max(0.0, hours);
    // -expm1(-kt) == 1 - exp(-kt) without cancellation for small kt
    double drop = rate / policy.decayConstant *
                  -std::expm1(-policy.decayConstant * t);
    return std::max(policy.floorC, anchorTemperature - drop);
}

auto coolingCurve(double anchorTemperature, double coolingRate,
                  double horizon, double step, const CoolingPolicy& policy)
    -> std::vector<double> {
    std::vector<double> samples;
    if (step <= 0.0 || horizon < 0.0) {
        return samples;
    }
    auto count = static_cast<size_t>(std::floor(horizon / step));
    samples.reserve(count + 2);
    for (size_t i = 0; i <= count; ++i) {
        samples.push_back(curveTemperature(
            anchorTemperature, coolingRate, static_cast<double>(i) * step,
            policy));
    }
    if (static_cast<double>(count) * step < horizon) {
        samples.push_back(
            curveTemperature(anchorTemperature, coolingRate, horizon, policy));
    }
    return samples;
}

auto blossomTemperature(double airTemperature,
                        std::optional<double> relativeHumidity,
                        double orchardDeltaC) -> double {
    if (!relativeHumidity) {
        return airTemperature - orchardDeltaC;
    }
    return wetBulb(airTemperature, *relativeHumidity) - orchardDeltaC;
}

auto estimateCooling(std::span<const weather::WeatherObservation> observations,
                     const CoolingPolicy& policy) -> CoolingEstimate {
    if (observations.empty()) {
        THROW_INSUFFICIENT_DATA("No observations to extrapolate from");
    }
    const size_t windowSize =
        std::min(observations.size(), std::max<size_t>(policy.trendWindowHours, 2));
    auto window = observations.last(windowSize);
    const auto& anchor = window.back();

    CoolingEstimate estimate;
    estimate.anchorTemperature = anchor.airTemperature;
    estimate.anchorHour = anchor.hour;
    estimate.horizonHours = horizonHours(anchor.hour, policy.sunriseHour);

    if (window.size() >= 2) {
        double elapsed =
            static_cast<double>(window.back().hour - window.front().hour);
        if (elapsed > 0.0) {
            estimate.observedTrend = std::max(
                0.0, (window.front().airTemperature - anchor.airTemperature) /
                         elapsed);
        }
    }

    bool measured = std::ranges::all_of(window, [](const auto& obs) {
        return obs.windSpeed.has_value() && obs.relativeHumidity.has_value();
    });

    if (measured) {
        double windSum = 0.0;
        double humiditySum = 0.0;
        for (const auto& obs : window) {
            windSum += *obs.windSpeed;
            humiditySum += *obs.relativeHumidity;
        }
        const auto n = static_cast<double>(window.size());
        const double meanWind = windSum / n;
        const double meanHumidity = humiditySum / n;

        estimate.coolingRate =
            estimate.observedTrend /
            (1.0 + policy.windCoefficient * meanWind) /
            (1.0 + policy.humidityCoefficient * meanHumidity / 100.0);
        estimate.humidity = meanHumidity;
        estimate.confidence = Confidence::Measured;
    } else {
        estimate.coolingRate = estimate.observedTrend;
        for (auto it = observations.rbegin(); it != observations.rend(); ++it) {
            if (it->relativeHumidity) {
                estimate.humidity = it->relativeHumidity;
                break;
            }
        }
        estimate.confidence = Confidence::Derived;
    }

    double curveEnd =
        curveTemperature(estimate.anchorTemperature, estimate.coolingRate,
                         estimate.horizonHours, policy);
    // An hour already observed colder than the curve end drives the minimum
    const auto& coldest = *std::ranges::min_element(
        observations, {}, &weather::WeatherObservation::airTemperature);
    if (coldest.airTemperature < curveEnd) {
        estimate.predictedMinimum = coldest.airTemperature;
        estimate.minimumHour = coldest.hour;
        if (coldest.relativeHumidity) {
            estimate.humidity = coldest.relativeHumidity;
        }
    } else {
        estimate.predictedMinimum = curveEnd;
    }
    estimate.predictedMinimum =
        std::max(policy.floorC, estimate.predictedMinimum);

    estimate.blossomTemperature = blossomTemperature(
        estimate.predictedMinimum, estimate.humidity, policy.orchardDeltaC);

    spdlog::debug(
        "Cooling: anchor {:.2f} C at hour {}, trend {:.3f} C/h, rate {:.3f} "
        "C/h, horizon {:.0f} h, minimum {:.2f} C, blossom {:.2f} C ({})",
        estimate.anchorTemperature, estimate.anchorHour, estimate.observedTrend,
        estimate.coolingRate, estimate.horizonHours, estimate.predictedMinimum,
        estimate.blossomTemperature, confidenceName(estimate.confidence));
    return estimate;
}

}  // namespace frostguard::model
