/*
 * cimis.hpp
 *
 * Copyright (C) 2025 Frostguard Authors
 */

/*************************************************

Date: 2025-2-18

Description: CIMIS hourly payload parser

**************************************************/

#ifndef FROSTGUARD_WEATHER_CIMIS_HPP
#define FROSTGUARD_WEATHER_CIMIS_HPP

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "types.hpp"

namespace frostguard::weather::cimis {

using json = nlohmann::json;

/**
 * @brief A single CIMIS data item: `{"Value": "12.3", "Qc": " ", "Unit": "(C)"}`.
 */
struct DataItem {
    std::optional<double> value;
    std::string qc;
    std::string unit;
};

/**
 * @brief Converts a CIMIS hour label ("0100" ... "2400", or "1" ... "24")
 * to an hour number.
 * @return Hour in 0..24, or nullopt when the label is malformed.
 */
auto parseHour(std::string_view label) -> std::optional<int>;

/**
 * @brief Reads the first present data item among the given keys.
 *
 * Values flagged missing ("M") or rejected ("R") by CIMIS quality control
 * are reported without a value.
 */
auto readItem(const json& record, std::initializer_list<std::string_view> keys)
    -> std::optional<DataItem>;

/**
 * @brief Flattens a CIMIS hourly document (`Data.Providers[].Records[]`)
 * into raw observations, ordered by station, date and hour.
 *
 * Records with a malformed date or hour are skipped.
 *
 * @throws UpstreamUnavailable if the document lacks the CIMIS envelope.
 */
auto parseHourlyRecords(const json& document) -> std::vector<RawObservation>;

/**
 * @brief Builds a CIMIS-shaped document from raw observations. Used to
 * export station data in the upstream format.
 */
auto toHourlyDocument(const std::vector<RawObservation>& observations,
                      std::string_view providerName = "frostguard") -> json;

}  // namespace frostguard::weather::cimis

#endif  // FROSTGUARD_WEATHER_CIMIS_HPP
