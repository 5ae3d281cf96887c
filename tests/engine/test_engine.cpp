/*
 * test_engine.cpp
 *
 * Copyright (C) 2025 Frostguard Authors
 */

/*************************************************

Date: 2025-2-18

Description: End-to-end tests of the frost risk engine
- Request validation before any upstream work
- Computation chain from station records to the GeoJSON feature
- Single flight and caching of station-days
- Error documents

**************************************************/

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "common/observations.hpp"
#include "engine/engine.hpp"
#include "exception/exception.hpp"
#include "weather/cimis.hpp"

using namespace frostguard;
using namespace frostguard::engine;
using namespace std::chrono_literals;
using frostguard::test::ASSESSMENT_DAY;
using frostguard::test::dawnFrostDay;
using frostguard::test::frostNight;
namespace fs = std::filesystem;

namespace {

/**
 * @brief In-memory source that counts fetches and can hold them at a gate.
 */
class RecordingSource : public weather::WeatherSource {
public:
    auto fetchHourly(const std::string& stationId, const weather::Date& date)
        -> std::vector<weather::RawObservation> override {
        {
            std::lock_guard lock(mutex_);
            stations_.push_back(stationId);
        }
        ++fetches;
        if (gate_) {
            gate_->wait();
        }
        if (unavailable) {
            THROW_UPSTREAM_UNAVAILABLE("CIMIS answered 503");
        }
        auto records = dawnFrost ? dawnFrostDay(stationId, date)
                                 : frostNight(stationId, date);
        records.resize(std::min(records.size(), recordLimit));
        return records;
    }

    void hold(std::shared_future<void> gate) { gate_ = std::move(gate); }

    auto stations() -> std::vector<std::string> {
        std::lock_guard lock(mutex_);
        return stations_;
    }

    std::atomic<int> fetches{0};
    std::atomic<bool> unavailable{false};
    std::atomic<bool> dawnFrost{false};
    size_t recordLimit{24};

private:
    std::optional<std::shared_future<void>> gate_;
    std::mutex mutex_;
    std::vector<std::string> stations_;
};

auto stationRequest(std::string station = "170") -> AssessmentRequest {
    AssessmentRequest request;
    request.latitude = 37.8;
    request.longitude = -121.2;
    request.date = "2025-02-18";
    request.stationId = std::move(station);
    return request;
}

}  // namespace

class FrostRiskEngineTest : public ::testing::Test {
protected:
    void SetUp() override { source_ = std::make_shared<RecordingSource>(); }

    auto makeEngine(EngineConfig config = {}) -> std::unique_ptr<FrostRiskEngine> {
        return std::make_unique<FrostRiskEngine>(
            std::move(config), source_, [] { return ASSESSMENT_DAY; });
    }

    std::shared_ptr<RecordingSource> source_;
};

TEST_F(FrostRiskEngineTest, PinkbudAtStation170IsHighRisk) {
    auto dataDir = fs::temp_directory_path() / "frostguard_engine_test";
    fs::remove_all(dataDir);
    fs::create_directories(dataDir / "170");
    {
        std::ofstream ofs(dataDir / "170" / "2025-02-18.json");
        ofs << weather::cimis::toHourlyDocument(frostNight("170", ASSESSMENT_DAY))
                   .dump();
    }

    EngineConfig config;
    config.dataDir = dataDir.string();
    FrostRiskEngine engine(
        config, std::make_shared<weather::FileWeatherSource>(dataDir),
        [] { return ASSESSMENT_DAY; });

    auto request = stationRequest("170");
    request.stage = "Pinkbud";
    auto feature = engine.handle(request);

    ASSERT_FALSE(feature.contains("error")) << feature.dump();
    const auto& properties = feature["properties"];
    EXPECT_EQ(properties["riskLevel"], "high");
    EXPECT_EQ(properties["stage"], "Pinkbud");
    EXPECT_NEAR(properties["lt10"].get<double>(), -3.5, 0.01);
    EXPECT_NEAR(properties["lt90"].get<double>(), -5.5, 0.01);
    EXPECT_NEAR(properties["probability"].get<double>(), 0.9848, 1e-3);
    EXPECT_EQ(properties["location"], "Unknown");

    fs::remove_all(dataDir);
}

TEST_F(FrostRiskEngineTest, RequiresWeatherSource) {
    EXPECT_THROW(FrostRiskEngine(EngineConfig{}, nullptr), BadConfigException);
}

TEST_F(FrostRiskEngineTest, RejectsInvalidConfig) {
    EngineConfig config;
    config.risk.medium = 0.9;
    EXPECT_THROW(makeEngine(config), BadConfigException);
}

TEST_F(FrostRiskEngineTest, UsesDefaultStation) {
    auto engine = makeEngine();
    auto request = stationRequest();
    request.stationId.reset();

    auto assessment = engine->assess(request);

    EXPECT_EQ(assessment.key.stationId, "145");
    EXPECT_EQ(source_->stations(), std::vector<std::string>{"145"});
}

TEST_F(FrostRiskEngineTest, HeadlineWithoutStageIsWorstStage) {
    auto engine = makeEngine();
    auto assessment = engine->assess(stationRequest());

    EXPECT_FALSE(assessment.requestedStage.has_value());
    EXPECT_EQ(assessment.drivingStage, model::Stage::Fullbloom);
    EXPECT_EQ(assessment.riskLevel, model::RiskLevel::High);
    EXPECT_NEAR(assessment.cooling.predictedMinimum, -3.8823, 1e-3);
}

TEST_F(FrostRiskEngineTest, DawnFrostDrivesRiskOverMildEvening) {
    source_->dawnFrost = true;
    auto engine = makeEngine();
    auto request = stationRequest();
    request.stage = "Pinkbud";

    auto assessment = engine->assess(request);

    EXPECT_NEAR(assessment.summary.airTempMin, -4.0, 1e-9);
    EXPECT_NEAR(assessment.cooling.predictedMinimum, -4.0, 1e-9);
    EXPECT_EQ(assessment.cooling.minimumHour, std::optional<int>(1));
    EXPECT_LT(assessment.cooling.blossomTemperature, -5.5);
    EXPECT_EQ(assessment.riskLevel, model::RiskLevel::High);
    EXPECT_GT(assessment.probability, 0.9);

    auto feature = toGeoJson(assessment);
    EXPECT_NEAR(feature["properties"]["temp"].get<double>(), -4.0, 1e-9);
}

TEST_F(FrostRiskEngineTest, StationIdIsRejectedBeforeFetching) {
    auto engine = makeEngine();

    for (const char* station : {"x/../elsewhere", "..", "170/", "a b"}) {
        auto response = engine->handle(stationRequest(station));
        EXPECT_EQ(response["error"], "OutOfDomain") << station;
        EXPECT_EQ(response["status"], 422) << station;
    }
    EXPECT_EQ(source_->fetches.load(), 0);
}

TEST_F(FrostRiskEngineTest, MistypedUpstreamDocumentIsBadGateway) {
    auto dataDir = fs::temp_directory_path() / "frostguard_engine_mistyped";
    fs::remove_all(dataDir);
    fs::create_directories(dataDir / "170");
    {
        std::ofstream ofs(dataDir / "170" / "2025-02-18.json");
        ofs << R"({"Data": {"Providers": [{"Records": [)"
            << R"({"Date": 20250218, "Hour": "0100"}]}]}})";
    }
    FrostRiskEngine engine(
        EngineConfig{}, std::make_shared<weather::FileWeatherSource>(dataDir),
        [] { return ASSESSMENT_DAY; });

    nlohmann::json response;
    ASSERT_NO_THROW(response = engine.handle(stationRequest("170")));
    EXPECT_EQ(response["error"], "InsufficientData");
    EXPECT_EQ(response["status"], 404);

    {
        std::ofstream ofs(dataDir / "170" / "2025-02-18.json");
        ofs << R"({"Data": {"Providers": {"Records": 1}}})";
    }
    engine.assessmentCache().clear();
    ASSERT_NO_THROW(response = engine.handle(stationRequest("170")));
    EXPECT_EQ(response["error"], "UpstreamUnavailable");
    EXPECT_EQ(response["status"], 502);

    fs::remove_all(dataDir);
}

TEST_F(FrostRiskEngineTest, FutureDateIsRejected) {
    auto engine = makeEngine();
    auto request = stationRequest();
    request.date = "2025-02-19";

    EXPECT_THROW(engine->assess(request), InvalidDate);
    EXPECT_EQ(source_->fetches.load(), 0);
}

TEST_F(FrostRiskEngineTest, MalformedDateIsRejected) {
    auto engine = makeEngine();
    auto request = stationRequest();
    request.date = "18/02/2025";
    EXPECT_THROW(engine->assess(request), InvalidDate);
}

TEST_F(FrostRiskEngineTest, CoordinatesMustBeOnTheGlobe) {
    auto engine = makeEngine();
    auto request = stationRequest();
    request.latitude = 91.0;
    EXPECT_THROW(engine->assess(request), OutOfDomain);

    request.latitude = 37.8;
    request.longitude = -180.5;
    EXPECT_THROW(engine->assess(request), OutOfDomain);
    EXPECT_EQ(source_->fetches.load(), 0);
}

TEST_F(FrostRiskEngineTest, UnknownVarietyFailsBeforeFetching) {
    auto engine = makeEngine();
    auto request = stationRequest();
    request.variety = "padre";
    EXPECT_THROW(engine->assess(request), UnknownStageParameters);

    request.variety = "nonpareil";
    request.stage = "dormant";
    EXPECT_THROW(engine->assess(request), UnknownStageParameters);
    EXPECT_EQ(source_->fetches.load(), 0);
}

TEST_F(FrostRiskEngineTest, StageMissingFromVarietyIsUnknown) {
    EngineConfig config;
    config.stages = model::StageParameterTable{};
    config.stages.add("almond", "nonpareil",
                      {{model::Stage::Pinkbud, {-9.8875, -2.1972}}});
    auto engine = makeEngine(config);

    auto request = stationRequest();
    request.stage = "Fullbloom";
    EXPECT_THROW(engine->assess(request), UnknownStageParameters);
}

TEST_F(FrostRiskEngineTest, SparseDayIsInsufficientAndNotCached) {
    source_->recordLimit = 6;
    auto engine = makeEngine();

    auto response = engine->handle(stationRequest());

    EXPECT_EQ(response["error"], "InsufficientData");
    EXPECT_EQ(response["status"], 404);
    EXPECT_FALSE(response["reason"].get<std::string>().empty());
    EXPECT_EQ(engine->assessmentCache().size(), 0u);

    source_->recordLimit = 24;
    EXPECT_NO_THROW(engine->assess(stationRequest()));
    EXPECT_EQ(source_->fetches.load(), 2);
}

TEST_F(FrostRiskEngineTest, UpstreamFailureMapsToBadGateway) {
    source_->unavailable = true;
    auto engine = makeEngine();

    auto response = engine->handle(stationRequest());

    EXPECT_EQ(response["error"], "UpstreamUnavailable");
    EXPECT_EQ(response["status"], 502);
}

TEST_F(FrostRiskEngineTest, ErrorDocumentsCarryStatus) {
    auto engine = makeEngine();
    auto request = stationRequest();
    request.date = "2025-02-30";
    auto response = engine->handle(request);
    EXPECT_EQ(response["error"], "InvalidDate");
    EXPECT_EQ(response["status"], 400);

    request = stationRequest();
    request.longitude = 200.0;
    response = engine->handle(request);
    EXPECT_EQ(response["error"], "OutOfDomain");
    EXPECT_EQ(response["status"], 422);
}

TEST_F(FrostRiskEngineTest, RepeatRequestIsServedFromCache) {
    auto engine = makeEngine();
    auto first = engine->assess(stationRequest());
    auto second = engine->assess(stationRequest());

    EXPECT_EQ(source_->fetches.load(), 1);
    EXPECT_DOUBLE_EQ(first.probability, second.probability);
    EXPECT_EQ(engine->assessmentCache().statistics().hits, 1u);
}

TEST_F(FrostRiskEngineTest, StageChangeReusesWeather) {
    auto engine = makeEngine();
    auto request = stationRequest();

    request.stage = "Pinkbud";
    auto pinkbud = engine->assess(request);
    request.stage = "petalfall";
    auto petalfall = engine->assess(request);
    request.stage.reset();
    auto headline = engine->assess(request);

    EXPECT_EQ(source_->fetches.load(), 1);
    EXPECT_EQ(pinkbud.drivingStage, model::Stage::Pinkbud);
    EXPECT_EQ(petalfall.drivingStage, model::Stage::Petalfall);
    EXPECT_NEAR(petalfall.probability, 0.99326, 1e-4);
    EXPECT_EQ(headline.drivingStage, model::Stage::Fullbloom);
}

TEST_F(FrostRiskEngineTest, LocationComesFromRequest) {
    auto engine = makeEngine();
    auto request = stationRequest();
    request.locationName = "Ripon block 4";
    auto first = engine->assess(request);

    request.latitude = 36.5;
    request.locationName.reset();
    auto second = engine->assess(request);

    EXPECT_EQ(first.location.name, "Ripon block 4");
    EXPECT_EQ(second.location.name, "Unknown");
    EXPECT_DOUBLE_EQ(second.location.latitude, 36.5);
}

TEST_F(FrostRiskEngineTest, ConcurrentRequestsFetchOnce) {
    std::promise<void> release;
    source_->hold(release.get_future().share());
    auto engine = makeEngine();

    constexpr int CALLERS = 6;
    std::vector<std::future<FrostRiskAssessment>> results;
    for (int i = 0; i < CALLERS; ++i) {
        results.push_back(std::async(std::launch::async, [&engine] {
            return engine->assess(stationRequest());
        }));
    }
    for (int i = 0; i < 200 &&
                    engine->assessmentCache().statistics().misses < CALLERS;
         ++i) {
        std::this_thread::sleep_for(5ms);
    }
    release.set_value();

    for (auto& result : results) {
        EXPECT_EQ(result.get().drivingStage, model::Stage::Fullbloom);
    }
    EXPECT_EQ(source_->fetches.load(), 1);
}

TEST_F(FrostRiskEngineTest, SlowUpstreamTimesOut) {
    std::promise<void> release;
    source_->hold(release.get_future().share());
    EngineConfig config;
    config.upstreamTimeout = 20ms;
    auto engine = makeEngine(config);

    auto response = engine->handle(stationRequest());
    EXPECT_EQ(response["error"], "UpstreamTimeout");
    EXPECT_EQ(response["status"], 504);

    release.set_value();
    for (int i = 0; i < 200 && engine->assessmentCache().inFlight() > 0; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    // The finished computation now serves the request
    EXPECT_NO_THROW(engine->assess(stationRequest()));
    EXPECT_EQ(source_->fetches.load(), 1);
}
