/*
 * assessment_cache.hpp
 *
 * Copyright (C) 2025 Frostguard Authors
 */

/*************************************************

Date: 2025-2-18

Description: Single-flight assessment cache with per-day expiry

**************************************************/

#ifndef FROSTGUARD_CACHE_ASSESSMENT_CACHE_HPP
#define FROSTGUARD_CACHE_ASSESSMENT_CACHE_HPP

#include "cache_entry.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <unordered_map>

#include "weather/date.hpp"

namespace frostguard::cache {

/**
 * @brief Runs the task on a new detached thread.
 * @throws std::system_error if the thread cannot be started.
 */
void spawnDetached(std::function<void()> task);

/**
 * @brief Thread-safe store of computed assessments keyed by
 * (station, date, crop, variety).
 *
 * Concurrent requests for the same key share one computation. Past days are
 * immutable and kept until removed; the current day expires after a TTL so
 * late observations are picked up. Failed computations are never stored.
 */
class AssessmentCache {
public:
    using Compute = std::function<AssessmentPtr()>;
    using TimeSource = std::function<std::chrono::steady_clock::time_point()>;
    /// Starts a computation; must not run the task on the calling thread.
    using Spawn = std::function<void(std::function<void()>)>;

    struct Statistics {
        uint64_t hits{0};
        uint64_t misses{0};
        uint64_t joins{0};  ///< Requests that attached to a running computation.
        uint64_t computations{0};
        uint64_t failures{0};
    };

    /**
     * @param today Supplies the processing date used to tell past days from
     * the current one.
     * @param currentDayTtl Lifetime of current-day entries. Zero disables
     * caching of the current day.
     * @param clock Monotonic time source for expiry checks.
     * @param spawn Starts each computation off the calling thread.
     */
    AssessmentCache(weather::DateProvider today,
                    std::chrono::seconds currentDayTtl,
                    TimeSource clock = std::chrono::steady_clock::now,
                    Spawn spawn = spawnDetached);

    /**
     * @brief Blocks until every running computation has settled.
     */
    ~AssessmentCache();

    AssessmentCache(const AssessmentCache&) = delete;
    auto operator=(const AssessmentCache&) -> AssessmentCache& = delete;

    /**
     * @brief Returns the cached assessment, or runs `compute` once for all
     * concurrent callers of the same key.
     *
     * The computation runs on its own thread. A caller that waits longer
     * than `timeout` gets UpstreamTimeout while the computation carries on
     * and stores its result for later callers. A non-positive timeout waits
     * without limit.
     *
     * @throws Whatever `compute` throws, rethrown to every waiter.
     * @throws UpstreamTimeout if the result is not ready in time.
     * @throws UpstreamUnavailable if the computation cannot be started.
     */
    auto getOrCompute(const engine::AssessmentKey& key, const Compute& compute,
                      std::chrono::milliseconds timeout) -> AssessmentPtr;

    /**
     * @brief Looks up a stored, unexpired assessment without computing.
     */
    [[nodiscard]] auto get(const engine::AssessmentKey& key)
        -> std::optional<AssessmentPtr>;

    auto remove(const engine::AssessmentKey& key) -> bool;

    void clear();

    /**
     * @brief Drops expired current-day entries.
     * @return Number of entries removed.
     */
    auto purgeExpired() -> size_t;

    [[nodiscard]] auto size() const -> size_t;
    [[nodiscard]] auto inFlight() const -> size_t;
    [[nodiscard]] auto statistics() const -> Statistics;

    void setCurrentDayTtl(std::chrono::seconds ttl);

private:
    struct Flight {
        uint64_t id;
        std::shared_future<AssessmentPtr> future;
    };

    auto launch(const std::string& key, const weather::Date& date,
                const Compute& compute) -> std::shared_future<AssessmentPtr>;
    void settle(const std::string& key, uint64_t id,
                const weather::Date& date, const AssessmentPtr& value);

    weather::DateProvider today_;
    TimeSource clock_;
    Spawn spawn_;
    std::chrono::seconds currentDayTtl_;

    mutable std::mutex mutex_;
    std::condition_variable idle_;
    std::unordered_map<std::string, CacheEntry> entries_;
    std::unordered_map<std::string, Flight> flights_;
    uint64_t nextFlightId_{0};
    size_t running_{0};
    Statistics stats_;
};

}  // namespace frostguard::cache

#endif  // FROSTGUARD_CACHE_ASSESSMENT_CACHE_HPP
