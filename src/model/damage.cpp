/*
 * damage.cpp
 *
 * Copyright (C) 2025 Frostguard Authors
 */

/*************************************************

Date: 2025-2-18

Description: Phenological frost damage model

**************************************************/

#include "damage.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <format>

#include <spdlog/spdlog.h>

#include "exception/exception.hpp"

namespace frostguard::model {

namespace {
constexpr double LT10_PROBABILITY = 0.10;
constexpr double LT90_PROBABILITY = 0.90;

// Fitted so that LT10/LT90 match the UC almond bloom thresholds:
// Pinkbud -3.5/-5.5, Fullbloom -3.0/-4.5, Petalfall -2.8/-5.0,
// Fruitset -2.5/-4.7, Smallnut -2.8/-4.5 C.
const StageParameterTable::StageMap ALMOND_STAGES = {
    {Stage::Pinkbud, {-9.8875, -2.1972}},
    {Stage::Fullbloom, {-10.9861, -2.9296}},
    {Stage::Petalfall, {-7.7902, -1.9975}},
    {Stage::Fruitset, {-7.1909, -1.9975}},
    {Stage::Smallnut, {-9.4351, -2.5850}},
};

constexpr std::array<std::string_view, 5> ALMOND_VARIETIES = {
    "nonpareil", "monterey", "independence", "butte", "carmel"};

auto lower(std::string_view text) -> std::string {
    std::string result(text);
    std::ranges::transform(result, result.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return result;
}

auto readStageMap(const json& node, std::string_view where)
    -> StageParameterTable::StageMap {
    StageParameterTable::StageMap stages;
    if (!node.is_object()) {
        THROW_BAD_CONFIG_EXCEPTION("Stage table for " + std::string(where) +
                                   " must be an object");
    }
    for (const auto& [name, entry] : node.items()) {
        auto stage = parseStage(name);
        if (!stage) {
            THROW_BAD_CONFIG_EXCEPTION("Unknown stage '" + name + "' in " +
                                       std::string(where));
        }
        if (!entry.is_object() || !entry.contains("a") || !entry.contains("b") ||
            !entry["a"].is_number() || !entry["b"].is_number()) {
            THROW_BAD_CONFIG_EXCEPTION("Stage '" + name + "' in " +
                                       std::string(where) +
                                       " needs numeric 'a' and 'b'");
        }
        stages[*stage] = {entry["a"].get<double>(), entry["b"].get<double>()};
    }
    return stages;
}
}  // namespace

auto stageName(Stage stage) -> std::string_view {
    switch (stage) {
        case Stage::Pinkbud:
            return "Pinkbud";
        case Stage::Fullbloom:
            return "Fullbloom";
        case Stage::Petalfall:
            return "Petalfall";
        case Stage::Fruitset:
            return "Fruitset";
        case Stage::Smallnut:
            return "Smallnut";
    }
    return "Unknown";
}

auto parseStage(std::string_view name) -> std::optional<Stage> {
    auto key = lower(name);
    for (auto stage : ALL_STAGES) {
        if (lower(stageName(stage)) == key) {
            return stage;
        }
    }
    return std::nullopt;
}

//------------------------------------------------------------------------------
// StageParameterTable Implementation
//------------------------------------------------------------------------------

auto StageParameterTable::defaults() -> StageParameterTable {
    StageParameterTable table;
    for (auto variety : ALMOND_VARIETIES) {
        table.add("almond", variety, ALMOND_STAGES);
    }
    return table;
}

auto StageParameterTable::fromJson(const json& crops) -> StageParameterTable {
    if (!crops.is_object()) {
        THROW_BAD_CONFIG_EXCEPTION("Crop table must be an object");
    }

    StageParameterTable table;
    for (const auto& [crop, cropNode] : crops.items()) {
        if (!cropNode.is_object()) {
            THROW_BAD_CONFIG_EXCEPTION("Crop '" + crop + "' must be an object");
        }
        StageMap shared;
        if (auto it = cropNode.find("stages"); it != cropNode.end()) {
            shared = readStageMap(*it, crop);
        }
        auto varieties = cropNode.find("varieties");
        if (varieties == cropNode.end() || !varieties->is_object() ||
            varieties->empty()) {
            THROW_BAD_CONFIG_EXCEPTION("Crop '" + crop +
                                       "' lists no varieties");
        }
        for (const auto& [variety, varietyNode] : varieties->items()) {
            StageMap stages = shared;
            for (const auto& [stage, params] :
                 readStageMap(varietyNode, crop + "/" + variety)) {
                stages[stage] = params;
            }
            if (stages.empty()) {
                THROW_BAD_CONFIG_EXCEPTION("Variety '" + crop + "/" + variety +
                                           "' has no stage parameters");
            }
            table.add(crop, variety, stages);
        }
    }
    return table;
}

void StageParameterTable::add(std::string_view crop, std::string_view variety,
                              const StageMap& stages) {
    for (const auto& [stage, params] : stages) {
        if (!std::isfinite(params.a) || !std::isfinite(params.b) ||
            params.b >= 0.0) {
            THROW_BAD_CONFIG_EXCEPTION(std::format(
                "Invalid parameters for {}/{}/{}: a={} b={} (b must be "
                "negative)",
                crop, variety, stageName(stage), params.a, params.b));
        }
    }
    table_[lower(crop)][lower(variety)] = stages;
}

auto StageParameterTable::find(std::string_view crop, std::string_view variety,
                               Stage stage) const
    -> std::optional<StageParameters> {
    auto cropIt = table_.find(lower(crop));
    if (cropIt == table_.end()) {
        return std::nullopt;
    }
    auto varietyIt = cropIt->second.find(lower(variety));
    if (varietyIt == cropIt->second.end()) {
        return std::nullopt;
    }
    auto stageIt = varietyIt->second.find(stage);
    if (stageIt == varietyIt->second.end()) {
        return std::nullopt;
    }
    return stageIt->second;
}

auto StageParameterTable::at(std::string_view crop, std::string_view variety,
                             Stage stage) const -> StageParameters {
    auto params = find(crop, variety, stage);
    if (!params) {
        THROW_UNKNOWN_STAGE_PARAMETERS(std::format(
            "No damage parameters for {}/{}/{}", crop, variety,
            stageName(stage)));
    }
    return *params;
}

auto StageParameterTable::stagesFor(std::string_view crop,
                                    std::string_view variety) const
    -> std::vector<Stage> {
    auto cropIt = table_.find(lower(crop));
    if (cropIt == table_.end()) {
        THROW_UNKNOWN_STAGE_PARAMETERS("Unknown crop: " + std::string(crop));
    }
    auto varietyIt = cropIt->second.find(lower(variety));
    if (varietyIt == cropIt->second.end()) {
        THROW_UNKNOWN_STAGE_PARAMETERS(std::format(
            "Unknown variety '{}' for crop '{}'", variety, crop));
    }
    std::vector<Stage> stages;
    for (const auto& [stage, params] : varietyIt->second) {
        stages.push_back(stage);
    }
    return stages;
}

auto StageParameterTable::crops() const -> std::vector<std::string> {
    std::vector<std::string> names;
    for (const auto& [crop, varieties] : table_) {
        names.push_back(crop);
    }
    return names;
}

auto StageParameterTable::varieties(std::string_view crop) const
    -> std::vector<std::string> {
    std::vector<std::string> names;
    if (auto it = table_.find(lower(crop)); it != table_.end()) {
        for (const auto& [variety, stages] : it->second) {
            names.push_back(variety);
        }
    }
    return names;
}

auto StageParameterTable::toJson() const -> json {
    json crops = json::object();
    for (const auto& [crop, varieties] : table_) {
        json varietyNode = json::object();
        for (const auto& [variety, stages] : varieties) {
            json stageNode = json::object();
            for (const auto& [stage, params] : stages) {
                stageNode[std::string(stageName(stage))] = {{"a", params.a},
                                                            {"b", params.b}};
            }
            varietyNode[variety] = std::move(stageNode);
        }
        crops[crop] = {{"varieties", std::move(varietyNode)}};
    }
    return crops;
}

//------------------------------------------------------------------------------
// Dose-response curve
//------------------------------------------------------------------------------

auto damageProbability(double temperature, const StageParameters& params)
    -> double {
    const double z = params.a + params.b * temperature;
    if (z >= 0.0) {
        return 1.0 / (1.0 + std::exp(-z));
    }
    const double e = std::exp(z);
    return e / (1.0 + e);
}

auto lethalTemperature(double probability, const StageParameters& params)
    -> double {
    if (!(probability > 0.0 && probability < 1.0)) {
        THROW_OUT_OF_DOMAIN(
            std::format("Probability {} outside (0, 1)", probability));
    }
    if (params.b == 0.0) {
        THROW_OUT_OF_DOMAIN("Damage curve slope is zero");
    }
    return (std::log(probability / (1.0 - probability)) - params.a) / params.b;
}

auto frostProbabilityIndex(double probability) -> double {
    return std::round(probability * 1000.0) / 10.0;
}

auto evaluateStage(const StageParameterTable& table, std::string_view crop,
                   std::string_view variety, Stage stage, double temperature)
    -> StageDamage {
    auto params = table.at(crop, variety, stage);
    double probability = damageProbability(temperature, params);

    StageDamage damage{stage,
                       probability,
                       frostProbabilityIndex(probability),
                       lethalTemperature(LT10_PROBABILITY, params),
                       lethalTemperature(LT90_PROBABILITY, params),
                       params.a,
                       params.b};
    spdlog::debug("Damage {}/{}/{} at {:.2f} C: p={:.4f} LT10={:.2f} LT90={:.2f}",
                  crop, variety, stageName(stage), temperature, probability,
                  damage.lt10, damage.lt90);
    return damage;
}

auto evaluateAllStages(const StageParameterTable& table, std::string_view crop,
                       std::string_view variety, double temperature)
    -> std::vector<StageDamage> {
    std::vector<StageDamage> result;
    for (auto stage : table.stagesFor(crop, variety)) {
        result.push_back(evaluateStage(table, crop, variety, stage, temperature));
    }
    return result;
}

}  // namespace frostguard::model
