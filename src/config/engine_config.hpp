/*
 * engine_config.hpp
 *
 * Copyright (C) 2025 Frostguard Authors
 */

/*************************************************

Date: 2025-2-18

Description: Typed engine settings read from the configuration store

**************************************************/

#ifndef FROSTGUARD_CONFIG_ENGINE_CONFIG_HPP
#define FROSTGUARD_CONFIG_ENGINE_CONFIG_HPP

#include <chrono>
#include <string>
#include <string_view>

#include "configor.hpp"
#include "logging/types.hpp"
#include "model/cooling.hpp"
#include "model/damage.hpp"
#include "model/risk.hpp"
#include "weather/normalizer.hpp"

namespace frostguard {

/**
 * @brief Everything the frost risk engine needs, with working defaults.
 */
struct EngineConfig {
    weather::NormalizerPolicy normalizer;
    model::CoolingPolicy cooling;
    model::RiskBreakpoints risk;

    std::chrono::seconds currentDayTtl{600};
    std::chrono::milliseconds upstreamTimeout{5000};
    std::string dataDir{"data"};
    std::string defaultStation{"145"};

    model::StageParameterTable stages = model::StageParameterTable::defaults();
    logging::LoggingConfig logging;

    /**
     * @brief Reads `<root>/...` keys over the defaults.
     * @throws BadConfigException if a present value is of the wrong type or
     * out of range.
     */
    static auto fromConfig(const ConfigManager& manager,
                           std::string_view root = "frostguard")
        -> EngineConfig;

    /**
     * @brief Checks cross-field constraints.
     * @throws BadConfigException
     */
    void validate() const;

    [[nodiscard]] auto toJson() const -> json;
};

}  // namespace frostguard

#endif  // FROSTGUARD_CONFIG_ENGINE_CONFIG_HPP
