/*
 * assessment_cache.cpp
 *
 * Copyright (C) 2025 Frostguard Authors
 */

/*************************************************

Date: 2025-2-18

Description: Single-flight assessment cache with per-day expiry

**************************************************/

#include "assessment_cache.hpp"

#include <exception>
#include <memory>
#include <thread>

#include <spdlog/spdlog.h>

#include "exception/exception.hpp"

namespace frostguard::cache {

void spawnDetached(std::function<void()> task) {
    std::thread(std::move(task)).detach();
}

//------------------------------------------------------------------------------
// AssessmentCache Implementation
//------------------------------------------------------------------------------

AssessmentCache::AssessmentCache(weather::DateProvider today,
                                 std::chrono::seconds currentDayTtl,
                                 TimeSource clock, Spawn spawn)
    : today_(std::move(today)),
      clock_(std::move(clock)),
      spawn_(std::move(spawn)),
      currentDayTtl_(currentDayTtl) {}

AssessmentCache::~AssessmentCache() {
    std::unique_lock lock(mutex_);
    if (running_ > 0) {
        spdlog::debug("Waiting for {} assessment computations to finish",
                      running_);
    }
    idle_.wait(lock, [this] { return running_ == 0; });
}

auto AssessmentCache::getOrCompute(const engine::AssessmentKey& key,
                                   const Compute& compute,
                                   std::chrono::milliseconds timeout)
    -> AssessmentPtr {
    const auto cacheKey = key.toString();
    std::shared_future<AssessmentPtr> future;
    {
        std::unique_lock lock(mutex_);
        if (auto it = entries_.find(cacheKey); it != entries_.end()) {
            if (!it->second.expired(clock_())) {
                ++stats_.hits;
                spdlog::debug("Cache hit for {}", cacheKey);
                return it->second.value;
            }
            entries_.erase(it);
        }

        ++stats_.misses;
        if (auto it = flights_.find(cacheKey); it != flights_.end()) {
            ++stats_.joins;
            spdlog::debug("Joining running computation for {}", cacheKey);
            future = it->second.future;
        } else {
            future = launch(cacheKey, key.date, compute);
        }
    }

    if (timeout.count() > 0 &&
        future.wait_for(timeout) != std::future_status::ready) {
        spdlog::warn("Assessment for {} not ready after {} ms", cacheKey,
                     timeout.count());
        THROW_UPSTREAM_TIMEOUT("Assessment for " + cacheKey +
                               " timed out after " +
                               std::to_string(timeout.count()) + " ms");
    }
    return future.get();
}

// Called with mutex_ held.
auto AssessmentCache::launch(const std::string& key, const weather::Date& date,
                             const Compute& compute)
    -> std::shared_future<AssessmentPtr> {
    const auto id = nextFlightId_ + 1;
    auto promise = std::make_shared<std::promise<AssessmentPtr>>();
    auto future = promise->get_future().share();

    // Workers settle under mutex_, held here, so the flight can be
    // registered after the worker has started
    try {
        spawn_([this, key, date, id, compute, promise] {
            try {
                auto value = compute();
                settle(key, id, date, value);
                promise->set_value(std::move(value));
            } catch (...) {
                settle(key, id, date, nullptr);
                promise->set_exception(std::current_exception());
            }

            std::lock_guard lock(mutex_);
            --running_;
            idle_.notify_all();
        });
    } catch (const std::system_error& e) {
        ++stats_.failures;
        spdlog::error("Cannot start computation for {}: {}", key, e.what());
        THROW_UPSTREAM_UNAVAILABLE("Cannot start computation for " + key +
                                   ": " + e.what());
    }

    nextFlightId_ = id;
    flights_[key] = Flight{id, future};
    ++stats_.computations;
    ++running_;
    spdlog::debug("Computing assessment for {} (flight {})", key, id);

    return future;
}

void AssessmentCache::settle(const std::string& key, uint64_t id,
                             const weather::Date& date,
                             const AssessmentPtr& value) {
    std::lock_guard lock(mutex_);
    if (auto it = flights_.find(key); it != flights_.end() && it->second.id == id) {
        flights_.erase(it);
    }

    if (!value) {
        ++stats_.failures;
        spdlog::debug("Computation for {} failed; nothing stored", key);
        return;
    }

    if (date < today_()) {
        entries_[key] = CacheEntry{value, std::nullopt};
    } else if (currentDayTtl_.count() > 0) {
        entries_[key] = CacheEntry{value, clock_() + currentDayTtl_};
    }
}

auto AssessmentCache::get(const engine::AssessmentKey& key)
    -> std::optional<AssessmentPtr> {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(key.toString());
    if (it == entries_.end()) {
        return std::nullopt;
    }
    if (it->second.expired(clock_())) {
        entries_.erase(it);
        return std::nullopt;
    }
    return it->second.value;
}

auto AssessmentCache::remove(const engine::AssessmentKey& key) -> bool {
    std::lock_guard lock(mutex_);
    return entries_.erase(key.toString()) > 0;
}

void AssessmentCache::clear() {
    std::lock_guard lock(mutex_);
    entries_.clear();
}

auto AssessmentCache::purgeExpired() -> size_t {
    const auto now = clock_();
    size_t removedCount = 0;

    std::lock_guard lock(mutex_);
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.expired(now)) {
            it = entries_.erase(it);
            removedCount++;
        } else {
            ++it;
        }
    }
    if (removedCount > 0) {
        spdlog::info("Cache purge: removed {} expired entries", removedCount);
    }
    return removedCount;
}

auto AssessmentCache::size() const -> size_t {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

auto AssessmentCache::inFlight() const -> size_t {
    std::lock_guard lock(mutex_);
    return flights_.size();
}

auto AssessmentCache::statistics() const -> Statistics {
    std::lock_guard lock(mutex_);
    return stats_;
}

void AssessmentCache::setCurrentDayTtl(std::chrono::seconds ttl) {
    std::lock_guard lock(mutex_);
    currentDayTtl_ = ttl;
}

}  // namespace frostguard::cache
