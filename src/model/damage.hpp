/*
 * damage.hpp
 *
 * Copyright (C) 2025 Frostguard Authors
 */

/*************************************************

Date: 2025-2-18

Description: Phenological frost damage model

**************************************************/

#ifndef FROSTGUARD_MODEL_DAMAGE_HPP
#define FROSTGUARD_MODEL_DAMAGE_HPP

#include <array>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace frostguard::model {

using json = nlohmann::json;

/**
 * @brief Bloom development phases, earliest first.
 */
enum class Stage { Pinkbud, Fullbloom, Petalfall, Fruitset, Smallnut };

inline constexpr std::array<Stage, 5> ALL_STAGES = {
    Stage::Pinkbud, Stage::Fullbloom, Stage::Petalfall, Stage::Fruitset,
    Stage::Smallnut};

/**
 * @brief Display name of a stage ("Pinkbud", "Fullbloom", ...).
 */
[[nodiscard]] auto stageName(Stage stage) -> std::string_view;

/**
 * @brief Case-insensitive stage lookup.
 */
[[nodiscard]] auto parseStage(std::string_view name) -> std::optional<Stage>;

/**
 * @brief Logistic dose-response coefficients. `b` is negative, so colder
 * temperatures raise the kill probability.
 */
struct StageParameters {
    double a;
    double b;
};

/**
 * @brief Damage figures of one stage at one temperature.
 */
struct StageDamage {
    Stage stage;
    double probability;
    double frostProbabilityIndex;
    double lt10;
    double lt90;
    double parameterA;
    double parameterB;
};

/**
 * @brief Immutable (crop, variety, stage) -> parameters lookup.
 *
 * Crop and variety names are matched case-insensitively.
 */
class StageParameterTable {
public:
    using StageMap = std::map<Stage, StageParameters>;

    StageParameterTable() = default;

    /**
     * @brief Built-in almond table.
     */
    static auto defaults() -> StageParameterTable;

    /**
     * @brief Builds a table from configuration.
     *
     * Expected shape:
     * @code
     * { "almond": { "stages": { "Pinkbud": {"a": -9.8875, "b": -2.1972} },
     *               "varieties": { "nonpareil": {},
     *                              "butte": { "Pinkbud": {"a": ..., "b": ...} } } } }
     * @endcode
     * Crop-level stages apply to every variety; variety entries override
     * them stage by stage.
     *
     * @throws BadConfigException on malformed entries or a non-negative b.
     */
    static auto fromJson(const json& crops) -> StageParameterTable;

    /**
     * @brief Registers or replaces the stages of a variety.
     * @throws BadConfigException if a parameter is not finite or b >= 0.
     */
    void add(std::string_view crop, std::string_view variety,
             const StageMap& stages);

    [[nodiscard]] auto find(std::string_view crop, std::string_view variety,
                            Stage stage) const -> std::optional<StageParameters>;

    /**
     * @throws UnknownStageParameters if the combination is not in the table.
     */
    [[nodiscard]] auto at(std::string_view crop, std::string_view variety,
                          Stage stage) const -> StageParameters;

    /**
     * @brief Stages defined for a variety, earliest first.
     * @throws UnknownStageParameters if the crop or variety is unknown.
     */
    [[nodiscard]] auto stagesFor(std::string_view crop,
                                 std::string_view variety) const
        -> std::vector<Stage>;

    [[nodiscard]] auto crops() const -> std::vector<std::string>;
    [[nodiscard]] auto varieties(std::string_view crop) const
        -> std::vector<std::string>;

    [[nodiscard]] auto toJson() const -> json;

private:
    std::map<std::string, std::map<std::string, StageMap>> table_;
};

/**
 * @brief `1 / (1 + exp(-(a + b * T)))`, evaluated without overflow.
 */
[[nodiscard]] auto damageProbability(double temperature,
                                     const StageParameters& params) -> double;

/**
 * @brief Temperature at which the curve reaches the given probability.
 * @throws OutOfDomain if probability is not in (0, 1) or b is zero.
 */
[[nodiscard]] auto lethalTemperature(double probability,
                                     const StageParameters& params) -> double;

/**
 * @brief Display index: the probability as a percentage rounded to one
 * decimal place.
 */
[[nodiscard]] auto frostProbabilityIndex(double probability) -> double;

/**
 * @brief Damage figures for one stage at a predicted temperature.
 * @throws UnknownStageParameters if the combination is unknown.
 */
auto evaluateStage(const StageParameterTable& table, std::string_view crop,
                   std::string_view variety, Stage stage, double temperature)
    -> StageDamage;

/**
 * @brief Damage figures for every stage of a variety.
 * @throws UnknownStageParameters if the crop or variety is unknown.
 */
auto evaluateAllStages(const StageParameterTable& table, std::string_view crop,
                       std::string_view variety, double temperature)
    -> std::vector<StageDamage>;

}  // namespace frostguard::model

#endif  // FROSTGUARD_MODEL_DAMAGE_HPP
