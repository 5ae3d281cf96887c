/*
 * observations.hpp
 *
 * Copyright (C) 2025 Frostguard Authors
 */

/*************************************************

Date: 2025-2-18

Description: Hourly observation builders shared by the tests

**************************************************/

#ifndef FROSTGUARD_TESTS_COMMON_OBSERVATIONS_HPP
#define FROSTGUARD_TESTS_COMMON_OBSERVATIONS_HPP

#include <string>
#include <vector>

#include "weather/date.hpp"
#include "weather/types.hpp"

namespace frostguard::test {

inline auto rawHour(const std::string& station, const weather::Date& date,
                    int hour, double temperature, double humidity = 80.0,
                    double wind = 0.5) -> weather::RawObservation {
    weather::RawObservation obs;
    obs.stationId = station;
    obs.date = date;
    obs.hour = hour;
    obs.airTemperature = temperature;
    obs.relativeHumidity = humidity;
    obs.windSpeed = wind;
    return obs;
}

/**
 * @brief Afternoon-to-midnight records (hours 12..23) of a clear, calm
 * night falling from 8 C to -2 C at 80% humidity.
 */
inline auto frostNight(const std::string& station, const weather::Date& date)
    -> std::vector<weather::RawObservation> {
    const std::vector<double> temperatures = {8.0, 7.0, 6.0, 5.0, 4.0, 3.0,
                                              2.0, 1.0, 0.5, 0.0, -1.0, -2.0};
    std::vector<weather::RawObservation> records;
    for (size_t i = 0; i < temperatures.size(); ++i) {
        records.push_back(rawHour(station, date, 12 + static_cast<int>(i),
                                  temperatures[i]));
    }
    return records;
}

/**
 * @brief A mild day (hours 1..24) that never approaches freezing.
 */
inline auto mildDay(const std::string& station, const weather::Date& date)
    -> std::vector<weather::RawObservation> {
    std::vector<weather::RawObservation> records;
    for (int hour = 1; hour <= 24; ++hour) {
        double temperature = hour <= 15 ? 10.0 + 0.5 * hour
                                        : 17.5 - 0.25 * (hour - 15);
        records.push_back(rawHour(station, date, hour, temperature, 60.0, 2.0));
    }
    return records;
}

/**
 * @brief A day (hours 1..24) with a -4 C frost until 07:00, a warm
 * afternoon peaking at 16 C and a mild +6 C evening.
 */
inline auto dawnFrostDay(const std::string& station, const weather::Date& date)
    -> std::vector<weather::RawObservation> {
    std::vector<weather::RawObservation> records;
    for (int hour = 1; hour <= 24; ++hour) {
        double temperature = -4.0;
        if (hour > 7 && hour <= 15) {
            temperature = -4.0 + 2.5 * (hour - 7);
        } else if (hour > 15) {
            temperature = 16.0 - (10.0 / 9.0) * (hour - 15);
        }
        records.push_back(rawHour(station, date, hour, temperature));
    }
    return records;
}

inline auto toObservations(const std::vector<weather::RawObservation>& raw)
    -> std::vector<weather::WeatherObservation> {
    std::vector<weather::WeatherObservation> observations;
    for (const auto& record : raw) {
        observations.push_back({record.date, record.hour,
                                record.airTemperature.value_or(0.0),
                                record.relativeHumidity, record.dewPoint,
                                record.windSpeed, record.solarRadiation,
                                record.referenceEt});
    }
    return observations;
}

inline const weather::Date ASSESSMENT_DAY = weather::parseDate("2025-02-18");

}  // namespace frostguard::test

#endif  // FROSTGUARD_TESTS_COMMON_OBSERVATIONS_HPP
