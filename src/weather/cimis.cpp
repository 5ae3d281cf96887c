/*
 * cimis.cpp
 *
 * Copyright (C) 2025 Frostguard Authors
 */

/*************************************************

Date: 2025-2-18

Description: CIMIS hourly payload parser

**************************************************/

#include "cimis.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <tuple>

#include <spdlog/spdlog.h>

#include "date.hpp"
#include "exception/exception.hpp"

namespace frostguard::weather::cimis {

namespace {
constexpr double LANGLEY_PER_DAY_TO_WATTS = 0.4843;

auto parseNumber(std::string_view text) -> std::optional<double> {
    while (!text.empty() && text.front() == ' ') {
        text.remove_prefix(1);
    }
    while (!text.empty() && text.back() == ' ') {
        text.remove_suffix(1);
    }
    if (text.empty()) {
        return std::nullopt;
    }
    double value = 0.0;
    auto [ptr, ec] =
        std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

auto upper(std::string text) -> std::string {
    std::ranges::transform(text, text.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return text;
}

auto temperatureUnit(const DataItem& item) -> TemperatureUnit {
    return upper(item.unit).find('F') != std::string::npos
               ? TemperatureUnit::Fahrenheit
               : TemperatureUnit::Celsius;
}

auto speedUnit(const DataItem& item) -> SpeedUnit {
    return upper(item.unit).find("MPH") != std::string::npos
               ? SpeedUnit::MilesPerHour
               : SpeedUnit::MetersPerSecond;
}

auto depthUnit(const DataItem& item) -> DepthUnit {
    return upper(item.unit).find("IN") != std::string::npos
               ? DepthUnit::Inches
               : DepthUnit::Millimeters;
}

auto stationOf(const json& record, const json& provider) -> std::string {
    if (auto it = record.find("Station"); it != record.end()) {
        if (it->is_string()) {
            return it->get<std::string>();
        }
        if (it->is_number_integer()) {
            return std::to_string(it->get<long long>());
        }
    }
    if (auto it = provider.find("Station");
        it != provider.end() && it->is_object()) {
        if (auto nbr = it->find("StationNbr"); nbr != it->end()) {
            return nbr->is_string() ? nbr->get<std::string>() : nbr->dump();
        }
    }
    return {};
}

// Non-string members read as absent
auto stringField(const json& object, const char* key) -> std::string {
    auto it = object.find(key);
    return it != object.end() && it->is_string() ? it->get<std::string>()
                                                 : std::string{};
}

auto formatValue(double value) -> std::string {
    return std::format("{:.2f}", value);
}
}  // namespace

auto parseHour(std::string_view label) -> std::optional<int> {
    auto number = parseNumber(label);
    if (!number || *number != static_cast<int>(*number)) {
        return std::nullopt;
    }
    int value = static_cast<int>(*number);
    // "0100" style labels carry minutes in the last two digits
    if (label.size() == 4) {
        if (value % 100 != 0) {
            return std::nullopt;
        }
        value /= 100;
    }
    if (value < 0 || value > 24) {
        return std::nullopt;
    }
    return value;
}

auto readItem(const json& record, std::initializer_list<std::string_view> keys)
    -> std::optional<DataItem> {
    for (auto key : keys) {
        auto it = record.find(std::string(key));
        if (it == record.end() || !it->is_object()) {
            continue;
        }

        DataItem item;
        item.qc = stringField(*it, "Qc");
        item.unit = stringField(*it, "Unit");

        auto value = it->find("Value");
        if (value != it->end()) {
            if (value->is_number()) {
                item.value = value->get<double>();
            } else if (value->is_string()) {
                item.value = parseNumber(value->get<std::string>());
            }
        }

        auto qc = upper(item.qc);
        if (qc.find('M') != std::string::npos ||
            qc.find('R') != std::string::npos) {
            item.value.reset();
        }
        return item;
    }
    return std::nullopt;
}

auto parseHourlyRecords(const json& document) -> std::vector<RawObservation> {
    if (!document.is_object() || !document.contains("Data") ||
        !document["Data"].is_object()) {
        THROW_UPSTREAM_UNAVAILABLE("CIMIS payload has no Data envelope");
    }
    const auto& data = document["Data"];
    auto providers = data.find("Providers");
    if (providers == data.end() || !providers->is_array()) {
        THROW_UPSTREAM_UNAVAILABLE("CIMIS payload has no Providers list");
    }

    std::vector<RawObservation> rows;
    for (const auto& provider : *providers) {
        auto records = provider.find("Records");
        if (records == provider.end() || !records->is_array()) {
            continue;
        }
        for (const auto& record : *records) {
            if (!record.is_object()) {
                continue;
            }
            auto dateText = stringField(record, "Date");
            auto hourIt = record.find("Hour");
            if (dateText.empty() || hourIt == record.end()) {
                continue;
            }

            RawObservation row;
            try {
                row.date = parseDate(dateText);
            } catch (const InvalidDate& e) {
                spdlog::warn("Skipping CIMIS record: {}", e.what());
                continue;
            }

            std::optional<int> hour =
                hourIt->is_string()
                    ? parseHour(hourIt->get<std::string>())
                    : (hourIt->is_number_integer()
                           ? std::optional<int>(hourIt->get<int>())
                           : std::nullopt);
            if (!hour) {
                spdlog::warn("Skipping CIMIS record on {} with hour {}",
                             dateText, hourIt->dump());
                continue;
            }
            row.hour = *hour;
            row.stationId = stationOf(record, provider);

            if (auto item = readItem(record, {"HlyAirTmp", "hly-air-tmp"})) {
                row.airTemperature = item->value;
                row.airTemperatureUnit = temperatureUnit(*item);
            }
            if (auto item = readItem(record, {"HlyRelHum", "hly-rel-hum"})) {
                row.relativeHumidity = item->value;
            }
            if (auto item = readItem(record, {"HlyDewPnt", "hly-dew-pnt"})) {
                row.dewPoint = item->value;
                row.dewPointUnit = temperatureUnit(*item);
            }
            if (auto item = readItem(record, {"HlyWindSpd", "hly-wind-spd"})) {
                row.windSpeed = item->value;
                row.windSpeedUnit = speedUnit(*item);
            }
            if (auto item = readItem(record, {"HlySolRad", "hly-sol-rad"})) {
                row.solarRadiation = item->value;
                if (row.solarRadiation &&
                    upper(item->unit).find("LY") != std::string::npos) {
                    *row.solarRadiation *= LANGLEY_PER_DAY_TO_WATTS;
                }
            }
            if (auto item = readItem(record, {"HlyEto", "HlyAsceEto",
                                              "hly-eto", "hly-asce-eto"})) {
                row.referenceEt = item->value;
                row.referenceEtUnit = depthUnit(*item);
            }
            rows.push_back(std::move(row));
        }
    }

    std::ranges::sort(rows, [](const RawObservation& a,
                               const RawObservation& b) {
        return std::tie(a.stationId, a.date, a.hour) <
               std::tie(b.stationId, b.date, b.hour);
    });
    return rows;
}

auto toHourlyDocument(const std::vector<RawObservation>& observations,
                      std::string_view providerName) -> json {
    json records = json::array();
    for (const auto& obs : observations) {
        json record = {{"Station", obs.stationId},
                       {"Date", formatDate(obs.date)},
                       {"Hour", std::format("{:02d}00", obs.hour)},
                       {"Scope", "hourly"}};
        if (obs.airTemperature) {
            record["HlyAirTmp"] = {
                {"Value", formatValue(*obs.airTemperature)},
                {"Qc", " "},
                {"Unit", obs.airTemperatureUnit == TemperatureUnit::Fahrenheit
                             ? "(F)"
                             : "(C)"}};
        }
        if (obs.relativeHumidity) {
            record["HlyRelHum"] = {
                {"Value", std::format("{:.0f}", *obs.relativeHumidity)},
                {"Qc", " "},
                {"Unit", "(%)"}};
        }
        if (obs.dewPoint) {
            record["HlyDewPnt"] = {
                {"Value", formatValue(*obs.dewPoint)},
                {"Qc", " "},
                {"Unit", obs.dewPointUnit == TemperatureUnit::Fahrenheit
                             ? "(F)"
                             : "(C)"}};
        }
        if (obs.windSpeed) {
            record["HlyWindSpd"] = {
                {"Value", formatValue(*obs.windSpeed)},
                {"Qc", " "},
                {"Unit", obs.windSpeedUnit == SpeedUnit::MilesPerHour
                             ? "(MPH)"
                             : "(m/s)"}};
        }
        if (obs.solarRadiation) {
            record["HlySolRad"] = {{"Value", formatValue(*obs.solarRadiation)},
                                   {"Qc", " "},
                                   {"Unit", "(W/sq.m)"}};
        }
        if (obs.referenceEt) {
            record["HlyEto"] = {
                {"Value", formatValue(*obs.referenceEt)},
                {"Qc", " "},
                {"Unit",
                 obs.referenceEtUnit == DepthUnit::Inches ? "(in)" : "(mm)"}};
        }
        records.push_back(std::move(record));
    }

    return json{{"Data",
                 {{"Providers",
                   json::array({{{"Name", std::string(providerName)},
                                 {"Type", "station"},
                                 {"Owner", "water.ca.gov"},
                                 {"Records", std::move(records)}}})}}}};
}

}  // namespace frostguard::weather::cimis
