/*
 * types.hpp
 *
 * Copyright (C) 2025 Frostguard Authors
 */

/*************************************************

Date: 2025-2-18

Description: Weather observation and station-day types

**************************************************/

#ifndef FROSTGUARD_WEATHER_TYPES_HPP
#define FROSTGUARD_WEATHER_TYPES_HPP

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace frostguard::weather {

using Date = std::chrono::year_month_day;

enum class TemperatureUnit { Celsius, Fahrenheit };
enum class SpeedUnit { MetersPerSecond, MilesPerHour };
enum class DepthUnit { Millimeters, Inches };

/**
 * @brief One upstream hourly record, before unit conversion and validation.
 *
 * Hours follow the CIMIS convention: 1..24, where 24 closes the day.
 */
struct RawObservation {
    std::string stationId;
    Date date;
    int hour{0};

    std::optional<double> airTemperature;
    TemperatureUnit airTemperatureUnit{TemperatureUnit::Celsius};

    std::optional<double> relativeHumidity;  ///< Percent

    std::optional<double> dewPoint;
    TemperatureUnit dewPointUnit{TemperatureUnit::Celsius};

    std::optional<double> windSpeed;
    SpeedUnit windSpeedUnit{SpeedUnit::MetersPerSecond};

    std::optional<double> solarRadiation;  ///< W/m^2

    std::optional<double> referenceEt;
    DepthUnit referenceEtUnit{DepthUnit::Millimeters};
};

/**
 * @brief Canonical hourly observation. Metric units throughout.
 */
struct WeatherObservation {
    Date date;
    int hour{0};                        ///< 1..24
    double airTemperature{0.0};         ///< Celsius
    std::optional<double> relativeHumidity;  ///< Percent in [0, 100]
    std::optional<double> dewPoint;     ///< Celsius, absent when not measured
    std::optional<double> windSpeed;    ///< m/s
    std::optional<double> solarRadiation;
    std::optional<double> referenceEt;  ///< mm
};

/**
 * @brief Aggregated view of one station-day.
 */
struct StationDailySummary {
    std::string stationId;
    std::string stationName;
    Date date;
    double airTempMin{0.0};
    double airTempMax{0.0};
    std::optional<double> dewPointMin;
    std::optional<double> dewPointMax;
    std::optional<double> humidityMin;
    std::optional<double> humidityMax;
    std::optional<double> windSpeedAvg;
    std::optional<double> et0;
    size_t recordCount{0};
};

/**
 * @brief Output of the normalizer: summary plus ordered observations.
 */
struct NormalizedDay {
    StationDailySummary summary;
    std::vector<WeatherObservation> observations;
};

}  // namespace frostguard::weather

#endif  // FROSTGUARD_WEATHER_TYPES_HPP
