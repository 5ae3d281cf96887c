/*
 * source.hpp
 *
 * Copyright (C) 2025 Frostguard Authors
 */

/*************************************************

Date: 2025-2-18

Description: Upstream weather observation sources

**************************************************/

#ifndef FROSTGUARD_WEATHER_SOURCE_HPP
#define FROSTGUARD_WEATHER_SOURCE_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace frostguard::weather {

namespace fs = std::filesystem;

/**
 * @brief True for a non-empty id of ASCII letters, digits, '-' and '_'.
 * Station ids name directories, so nothing else is accepted.
 */
[[nodiscard]] auto isValidStationId(std::string_view stationId) -> bool;

/**
 * @brief Supplier of hourly station records.
 *
 * Implementations are best-effort: an absent day yields an empty batch,
 * a broken upstream raises UpstreamUnavailable. Implementations must be
 * safe to call from several threads at once.
 */
class WeatherSource {
public:
    virtual ~WeatherSource() = default;

    /**
     * @brief Fetches the hourly records of one station-day.
     * @throws UpstreamUnavailable when the upstream cannot be read.
     */
    virtual auto fetchHourly(const std::string& stationId, const Date& date)
        -> std::vector<RawObservation> = 0;
};

/**
 * @brief Reads CIMIS-shaped JSON documents laid out as
 * `<dataDir>/<stationId>/<YYYY-MM-DD>.json`.
 */
class FileWeatherSource : public WeatherSource {
public:
    explicit FileWeatherSource(fs::path dataDir);

    auto fetchHourly(const std::string& stationId, const Date& date)
        -> std::vector<RawObservation> override;

    /**
     * @throws UpstreamUnavailable if stationId is not a valid station id.
     */
    [[nodiscard]] auto pathFor(const std::string& stationId,
                               const Date& date) const -> fs::path;

private:
    fs::path dataDir_;
};

}  // namespace frostguard::weather

#endif  // FROSTGUARD_WEATHER_SOURCE_HPP
