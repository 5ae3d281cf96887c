/*
 * test_assessment_cache.cpp
 *
 * Copyright (C) 2025 Frostguard Authors
 *
 * Tests for the AssessmentCache class
 * - Hits after a computation
 * - One computation shared by concurrent callers
 * - Failed computations are not stored
 * - Timeouts leave the computation running
 * - Past days never expire, the current day honours the TTL
 * - PurgeExpired cleanup
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <functional>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <vector>

#include "cache/assessment_cache.hpp"
#include "common/observations.hpp"
#include "exception/exception.hpp"

using namespace frostguard;
using namespace frostguard::cache;
using namespace std::chrono_literals;
using frostguard::test::ASSESSMENT_DAY;

class AssessmentCacheTest : public ::testing::Test {
protected:
    auto makeCache(std::chrono::seconds ttl = 600s)
        -> std::unique_ptr<AssessmentCache> {
        return std::make_unique<AssessmentCache>(
            [] { return ASSESSMENT_DAY; }, ttl, [this] { return now_.load(); });
    }

    static auto keyFor(const weather::Date& date) -> engine::AssessmentKey {
        return engine::AssessmentKey::make("170", date, "almond", "nonpareil");
    }

    auto counting(double probability = 0.5) -> AssessmentCache::Compute {
        return [this, probability] {
            ++computeCalls_;
            auto assessment = std::make_shared<engine::FrostRiskAssessment>();
            assessment->probability = probability;
            return AssessmentPtr(std::move(assessment));
        };
    }

    // Polls until the condition holds or a second passes.
    template <typename Predicate>
    static auto eventually(Predicate predicate) -> bool {
        for (int i = 0; i < 200; ++i) {
            if (predicate()) {
                return true;
            }
            std::this_thread::sleep_for(5ms);
        }
        return predicate();
    }

    std::atomic<std::chrono::steady_clock::time_point> now_{
        std::chrono::steady_clock::time_point{} + 1h};
    std::atomic<int> computeCalls_{0};
    const engine::AssessmentKey today_ = keyFor(ASSESSMENT_DAY);
    const engine::AssessmentKey yesterday_ =
        keyFor(weather::addDays(ASSESSMENT_DAY, -1));
};

TEST_F(AssessmentCacheTest, SecondRequestIsServedFromCache) {
    auto cache = makeCache();

    auto first = cache->getOrCompute(today_, counting(), 0ms);
    auto second = cache->getOrCompute(today_, counting(), 0ms);

    EXPECT_EQ(first, second);
    EXPECT_EQ(computeCalls_.load(), 1);
    auto stats = cache->statistics();
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_EQ(stats.computations, 1u);
    EXPECT_EQ(cache->size(), 1u);
}

TEST_F(AssessmentCacheTest, KeysDistinguishVarietyCaseInsensitively) {
    auto cache = makeCache();
    auto upper = engine::AssessmentKey::make("170", ASSESSMENT_DAY, "Almond",
                                             "NONPAREIL");
    auto other = engine::AssessmentKey::make("170", ASSESSMENT_DAY, "almond",
                                             "butte");

    cache->getOrCompute(today_, counting(), 0ms);
    cache->getOrCompute(upper, counting(), 0ms);
    cache->getOrCompute(other, counting(), 0ms);

    EXPECT_EQ(upper, today_);
    EXPECT_EQ(computeCalls_.load(), 2);
}

TEST_F(AssessmentCacheTest, ConcurrentCallersShareOneComputation) {
    auto cache = makeCache();
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();

    AssessmentCache::Compute slow = [this, gate] {
        gate.wait();
        ++computeCalls_;
        return AssessmentPtr(std::make_shared<engine::FrostRiskAssessment>());
    };

    constexpr int CALLERS = 8;
    std::vector<std::future<AssessmentPtr>> results;
    for (int i = 0; i < CALLERS; ++i) {
        results.push_back(std::async(std::launch::async, [&] {
            return cache->getOrCompute(today_, slow, 0ms);
        }));
    }

    EXPECT_TRUE(eventually(
        [&] { return cache->statistics().misses == CALLERS; }));
    EXPECT_EQ(cache->inFlight(), 1u);
    release.set_value();

    AssessmentPtr shared;
    for (auto& result : results) {
        auto value = result.get();
        ASSERT_NE(value, nullptr);
        if (!shared) {
            shared = value;
        }
        EXPECT_EQ(value, shared);
    }
    EXPECT_EQ(computeCalls_.load(), 1);
    EXPECT_EQ(cache->statistics().joins, static_cast<uint64_t>(CALLERS - 1));
    EXPECT_EQ(cache->inFlight(), 0u);
}

TEST_F(AssessmentCacheTest, FailureIsRethrownAndNotStored) {
    auto cache = makeCache();
    AssessmentCache::Compute failing = [this]() -> AssessmentPtr {
        ++computeCalls_;
        THROW_INSUFFICIENT_DATA("Station 170 has 6 valid hourly records");
    };

    EXPECT_THROW(cache->getOrCompute(today_, failing, 0ms), InsufficientData);
    EXPECT_EQ(cache->size(), 0u);
    EXPECT_FALSE(cache->get(today_).has_value());
    EXPECT_EQ(cache->statistics().failures, 1u);

    // The next request tries again
    auto value = cache->getOrCompute(today_, counting(), 0ms);
    EXPECT_NE(value, nullptr);
    EXPECT_EQ(computeCalls_.load(), 2);
}

TEST_F(AssessmentCacheTest, ForeignExceptionsReachTheCaller) {
    auto cache = makeCache();
    AssessmentCache::Compute failing = []() -> AssessmentPtr {
        throw std::runtime_error("socket closed");
    };
    EXPECT_THROW(cache->getOrCompute(today_, failing, 0ms), std::runtime_error);
    EXPECT_EQ(cache->inFlight(), 0u);
}

TEST_F(AssessmentCacheTest, TimeoutLeavesComputationRunning) {
    auto cache = makeCache();
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    AssessmentCache::Compute slow = [gate] {
        gate.wait();
        return AssessmentPtr(std::make_shared<engine::FrostRiskAssessment>());
    };

    try {
        cache->getOrCompute(today_, slow, 20ms);
        FAIL() << "Expected UpstreamTimeout";
    } catch (const FrostError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UpstreamTimeout);
        EXPECT_EQ(errorKindStatus(e.kind()), 504);
    }

    release.set_value();
    ASSERT_TRUE(eventually([&] { return cache->inFlight() == 0; }));
    EXPECT_TRUE(cache->get(today_).has_value());
}

TEST_F(AssessmentCacheTest, ThreadStartFailureLeavesNoFlight) {
    std::atomic<int> attempts{0};
    auto cache = std::make_unique<AssessmentCache>(
        [] { return ASSESSMENT_DAY; }, 600s, [this] { return now_.load(); },
        [&attempts](std::function<void()>) {
            ++attempts;
            throw std::system_error(
                std::make_error_code(std::errc::resource_unavailable_try_again));
        });

    EXPECT_THROW(cache->getOrCompute(today_, counting(), 100ms),
                 UpstreamUnavailable);
    EXPECT_EQ(cache->inFlight(), 0u);

    // A retry starts afresh instead of joining a dead flight
    EXPECT_THROW(cache->getOrCompute(today_, counting(), 100ms),
                 UpstreamUnavailable);
    EXPECT_EQ(attempts.load(), 2);
    EXPECT_EQ(computeCalls_.load(), 0);

    auto stats = cache->statistics();
    EXPECT_EQ(stats.computations, 0u);
    EXPECT_EQ(stats.failures, 2u);

    // Nothing is running, so destruction returns at once
    cache.reset();
}

TEST_F(AssessmentCacheTest, ZeroTtlSkipsCurrentDay) {
    auto cache = makeCache(0s);

    cache->getOrCompute(today_, counting(), 0ms);
    cache->getOrCompute(today_, counting(), 0ms);
    EXPECT_EQ(computeCalls_.load(), 2);
    EXPECT_EQ(cache->size(), 0u);

    // Past days are still kept
    cache->getOrCompute(yesterday_, counting(), 0ms);
    cache->getOrCompute(yesterday_, counting(), 0ms);
    EXPECT_EQ(computeCalls_.load(), 3);
}

TEST_F(AssessmentCacheTest, CurrentDayExpiresAfterTtl) {
    auto cache = makeCache(60s);
    cache->getOrCompute(today_, counting(), 0ms);
    cache->getOrCompute(yesterday_, counting(), 0ms);

    now_ = now_.load() + 59s;
    EXPECT_TRUE(cache->get(today_).has_value());

    now_ = now_.load() + 1s;
    EXPECT_FALSE(cache->get(today_).has_value());
    cache->getOrCompute(today_, counting(), 0ms);
    EXPECT_EQ(computeCalls_.load(), 3);
}

TEST_F(AssessmentCacheTest, PastDayNeverExpires) {
    auto cache = makeCache(1s);
    cache->getOrCompute(yesterday_, counting(), 0ms);

    now_ = now_.load() + 24h * 365;
    EXPECT_TRUE(cache->get(yesterday_).has_value());
    EXPECT_EQ(cache->purgeExpired(), 0u);
}

TEST_F(AssessmentCacheTest, PurgeRemovesOnlyExpiredEntries) {
    auto cache = makeCache(10s);
    cache->getOrCompute(today_, counting(), 0ms);
    cache->getOrCompute(yesterday_, counting(), 0ms);
    ASSERT_EQ(cache->size(), 2u);

    now_ = now_.load() + 11s;
    EXPECT_EQ(cache->purgeExpired(), 1u);
    EXPECT_EQ(cache->size(), 1u);
    EXPECT_TRUE(cache->get(yesterday_).has_value());
}

TEST_F(AssessmentCacheTest, RemoveAndClear) {
    auto cache = makeCache();
    cache->getOrCompute(today_, counting(), 0ms);
    cache->getOrCompute(yesterday_, counting(), 0ms);

    EXPECT_TRUE(cache->remove(today_));
    EXPECT_FALSE(cache->remove(today_));
    EXPECT_EQ(cache->size(), 1u);

    cache->clear();
    EXPECT_EQ(cache->size(), 0u);
}

TEST_F(AssessmentCacheTest, TtlCanBeChanged) {
    auto cache = makeCache(0s);
    cache->setCurrentDayTtl(30s);
    cache->getOrCompute(today_, counting(), 0ms);
    EXPECT_EQ(cache->size(), 1u);
}
