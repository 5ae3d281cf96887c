/*
 * cache_entry.hpp
 *
 * Copyright (C) 2025 Frostguard Authors
 */

/*************************************************

Date: 2025-2-18

Description: Stored assessment with its expiry

**************************************************/

#ifndef FROSTGUARD_CACHE_CACHE_ENTRY_HPP
#define FROSTGUARD_CACHE_CACHE_ENTRY_HPP

#include <chrono>
#include <memory>
#include <optional>

#include "engine/assessment.hpp"

namespace frostguard::cache {

using AssessmentPtr = std::shared_ptr<const engine::FrostRiskAssessment>;

/**
 * @brief A computed assessment. Entries for past dates never expire.
 */
struct CacheEntry {
    AssessmentPtr value;  ///< The cached assessment.
    std::optional<std::chrono::steady_clock::time_point>
        expiry;  ///< Empty for immutable days.

    [[nodiscard]] auto expired(
        std::chrono::steady_clock::time_point now) const -> bool {
        return expiry && now >= *expiry;
    }
};

}  // namespace frostguard::cache

#endif  // FROSTGUARD_CACHE_CACHE_ENTRY_HPP
