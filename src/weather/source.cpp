/*
 * source.cpp
 *
 * Copyright (C) 2025 Frostguard Authors
 */

/*************************************************

Date: 2025-2-18

Description: Upstream weather observation sources

**************************************************/

#include "source.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

#include <spdlog/spdlog.h>

#include "cimis.hpp"
#include "date.hpp"
#include "exception/exception.hpp"

namespace frostguard::weather {

auto isValidStationId(std::string_view stationId) -> bool {
    return !stationId.empty() &&
           std::ranges::all_of(stationId, [](unsigned char c) {
               return std::isalnum(c) != 0 || c == '-' || c == '_';
           });
}

FileWeatherSource::FileWeatherSource(fs::path dataDir)
    : dataDir_(std::move(dataDir)) {}

auto FileWeatherSource::pathFor(const std::string& stationId,
                                const Date& date) const -> fs::path {
    if (!isValidStationId(stationId)) {
        THROW_UPSTREAM_UNAVAILABLE("Refusing station id '" + stationId + "'");
    }
    return dataDir_ / stationId / (formatDate(date) + ".json");
}

auto FileWeatherSource::fetchHourly(const std::string& stationId,
                                    const Date& date)
    -> std::vector<RawObservation> {
    std::error_code ec;
    if (!fs::is_directory(dataDir_, ec)) {
        THROW_UPSTREAM_UNAVAILABLE("Weather data directory not available: " +
                                   dataDir_.string());
    }

    auto path = pathFor(stationId, date);
    if (!fs::exists(path, ec)) {
        spdlog::warn("No observations for station {} on {} ({})", stationId,
                     formatDate(date), path.string());
        return {};
    }

    std::ifstream ifs(path);
    if (!ifs) {
        THROW_UPSTREAM_UNAVAILABLE("Failed to open " + path.string());
    }

    std::vector<RawObservation> rows;
    try {
        rows = cimis::parseHourlyRecords(cimis::json::parse(ifs));
    } catch (const cimis::json::exception& e) {
        THROW_UPSTREAM_UNAVAILABLE("Malformed CIMIS document " +
                                   path.string() + ": " + e.what());
    }
    spdlog::debug("Loaded {} hourly records from {}", rows.size(),
                  path.string());
    return rows;
}

}  // namespace frostguard::weather
