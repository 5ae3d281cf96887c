/*
 * risk.cpp
 *
 * Copyright (C) 2025 Frostguard Authors
 */

/*************************************************

Date: 2025-2-18

Description: Frost risk classification

**************************************************/

#include "risk.hpp"

#include <format>

#include "exception/exception.hpp"

namespace frostguard::model {

auto riskLevelName(RiskLevel level) -> std::string_view {
    switch (level) {
        case RiskLevel::Low:
            return "low";
        case RiskLevel::Medium:
            return "medium";
        case RiskLevel::High:
            return "high";
    }
    return "unknown";
}

auto classify(double probability, const RiskBreakpoints& breakpoints)
    -> RiskLevel {
    if (!(probability >= 0.0 && probability <= 1.0)) {
        THROW_OUT_OF_DOMAIN(
            std::format("Probability {} outside [0, 1]", probability));
    }
    if (probability >= breakpoints.high) {
        return RiskLevel::High;
    }
    if (probability >= breakpoints.medium) {
        return RiskLevel::Medium;
    }
    return RiskLevel::Low;
}

}  // namespace frostguard::model
