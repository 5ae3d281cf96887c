/*
 * risk.hpp
 *
 * Copyright (C) 2025 Frostguard Authors
 */

/*************************************************

Date: 2025-2-18

Description: Frost risk classification

**************************************************/

#ifndef FROSTGUARD_MODEL_RISK_HPP
#define FROSTGUARD_MODEL_RISK_HPP

#include <string_view>

namespace frostguard::model {

enum class RiskLevel { Low, Medium, High };

/**
 * @brief Lower bounds (inclusive) of the medium and high categories.
 */
struct RiskBreakpoints {
    double medium{0.3};
    double high{0.6};
};

[[nodiscard]] auto riskLevelName(RiskLevel level) -> std::string_view;

/**
 * @brief Maps a kill probability to a category.
 * @throws OutOfDomain if probability is not in [0, 1].
 */
[[nodiscard]] auto classify(double probability,
                            const RiskBreakpoints& breakpoints = {})
    -> RiskLevel;

}  // namespace frostguard::model

#endif  // FROSTGUARD_MODEL_RISK_HPP
