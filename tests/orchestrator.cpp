/**
 * Copyright (c) 2017 Melown Technologies SE
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * *  Redistributions of source code must retain the above copyright notice,
 *    this list of conditions and the following disclaimer.
 *
 * *  Redistributions in binary form must reproduce the above copyright
 *    notice, this list of conditions and the following disclaimer in the
 *    documentation and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 * IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
 * ARE DISCLAIMED.  IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
 * LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 * CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 * SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 * INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 * CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 * ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 * POSSIBILITY OF SUCH DAMAGE.
 */
#include <atomic>
#include <cmath>
#include <functional>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "wildfire/geohash.hpp"
#include "wildfire/orchestrator.hpp"

#include "support/manualclock.hpp"

using namespace wildfire;
using wildfire::test::ManualClock;

namespace {

typedef std::chrono::milliseconds ms;
typedef Result<RawIndexReading, TransportError> Reading;

const GeoCoordinate Edinburgh(55.9533, -3.1883);
const GeoCoordinate London(51.5074, -0.1278);

class FakeSource : public IndexSource {
public:
    typedef std::shared_ptr<FakeSource> pointer;
    typedef std::function<Reading(const GeoCoordinate&, const ms&)> Handler;

    FakeSource(const std::string &name, const Handler &handler)
        : name_(name), handler_(handler), calls_(0)
    {}

    virtual std::string name() const { return name_; }

    virtual Reading query(const GeoCoordinate &coordinate
                          , const ms &timeout)
    {
        ++calls_;
        return handler_(coordinate, timeout);
    }

    int calls() const { return calls_; }

private:
    std::string name_;
    Handler handler_;
    std::atomic<int> calls_;
};

FakeSource::Handler returns(double index)
{
    return [=](const GeoCoordinate&, const ms&) -> Reading
    {
        return RawIndexReading(index);
    };
}

FakeSource::Handler fails(const TransportError &error)
{
    return [=](const GeoCoordinate&, const ms&) -> Reading
    {
        return error;
    };
}

class RecordingTelemetry : public Telemetry {
public:
    virtual void attemptStart(Stage stage) {
        add("start:" + str(stage));
    }

    virtual void attemptEnd(Stage stage, const ms&, bool success) {
        add("end:" + str(stage) + (success ? ":ok" : ":fail"));
    }

    virtual void fallbackDepth(int depth) {
        add("depth:" + std::to_string(depth));
    }

    virtual void complete(Stage stage, const ms&) {
        add("complete:" + str(stage));
    }

    std::vector<std::string> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

private:
    static std::string str(Stage stage) {
        std::ostringstream os;
        os << stage;
        return os.str();
    }

    void add(const std::string &event) {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    mutable std::mutex mutex_;
    std::vector<std::string> events_;
};

class OrchestratorTest : public ::testing::Test {
protected:
    OrchestratorTest()
        : clock(std::make_shared<ManualClock>())
        , cache(std::make_shared<Geocache>
                (std::make_shared<MemoryCacheStore>(), clock))
        , telemetry(std::make_shared<RecordingTelemetry>())
    {}

    RiskOrchestrator orchestrator(const FakeSource::pointer &primary
                                  , const FakeSource::pointer &secondary
                                  , const RiskOrchestrator::Options &options
                                  = RiskOrchestrator::Options()
                                  , SyntheticGenerator::Strategy strategy
                                  = SyntheticGenerator::Strategy::fixed)
    {
        return RiskOrchestrator
            (primary, secondary, cache
             , std::make_shared<SyntheticGenerator>(clock, strategy)
             , Fetcher(clock), options, telemetry, clock);
    }

    ManualClock::pointer clock;
    Geocache::pointer cache;
    std::shared_ptr<RecordingTelemetry> telemetry;
};

TEST_F(OrchestratorTest, InvalidCoordinateAttemptsNothing)
{
    auto primary(std::make_shared<FakeSource>("primary", returns(10)));
    auto secondary(std::make_shared<FakeSource>("secondary", returns(10)));
    const auto o(orchestrator(primary, secondary));

    for (const auto &c : { GeoCoordinate(91.0, 0.0)
                           , GeoCoordinate(0.0, -181.0)
                           , GeoCoordinate(std::nan(""), 0.0) })
    {
        const auto result(o.resolve(c));
        ASSERT_FALSE(result.ok());
        EXPECT_EQ(ErrorCategory::validation, result.error().category);
    }

    EXPECT_EQ(0, primary->calls());
    EXPECT_EQ(0, secondary->calls());
    EXPECT_TRUE(telemetry->events().empty());
}

TEST_F(OrchestratorTest, PrimarySuccessIsLive)
{
    auto primary(std::make_shared<FakeSource>("primary", returns(25.0)));
    auto secondary(std::make_shared<FakeSource>("secondary", returns(10)));

    const auto result(orchestrator(primary, secondary).resolve(Edinburgh));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(RiskLevel::high, result->level());
    EXPECT_EQ(25.0, *result->index());
    EXPECT_EQ(DataSource::primary, result->source());
    EXPECT_EQ(Freshness::live, result->freshness());
    EXPECT_EQ(0, secondary->calls());

    const std::vector<std::string> expected{
        "start:primary", "end:primary:ok", "depth:0", "complete:primary"
    };
    EXPECT_EQ(expected, telemetry->events());

    // written through to the cache
    const auto cached(cache->get("gcvwr"));
    ASSERT_TRUE(bool(cached));
    EXPECT_EQ(DataSource::primary, cached->source());
}

TEST_F(OrchestratorTest, SecondaryInsideRegion)
{
    auto primary(std::make_shared<FakeSource>
                 ("primary", fails(TransportError::http(404, "none"))));
    auto secondary(std::make_shared<FakeSource>("secondary", returns(15)));

    const auto result(orchestrator(primary, secondary).resolve(Edinburgh));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(RiskLevel::moderate, result->level());
    EXPECT_EQ(DataSource::secondary, result->source());
    EXPECT_EQ(Freshness::live, result->freshness());
    EXPECT_EQ(1, primary->calls());
    EXPECT_EQ(1, secondary->calls());

    const std::vector<std::string> expected{
        "start:primary", "end:primary:fail"
        , "start:secondary", "end:secondary:ok"
        , "depth:1", "complete:secondary"
    };
    EXPECT_EQ(expected, telemetry->events());
}

TEST_F(OrchestratorTest, SecondaryNeverAttemptedOutsideRegion)
{
    auto primary(std::make_shared<FakeSource>
                 ("primary", fails(TransportError::http(404, "none"))));
    auto secondary(std::make_shared<FakeSource>("secondary", returns(15)));

    const auto result(orchestrator(primary, secondary).resolve(London));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(DataSource::synthetic, result->source());
    EXPECT_EQ(0, secondary->calls());

    const std::vector<std::string> expected{
        "start:primary", "end:primary:fail"
        , "start:cache", "end:cache:fail"
        , "start:synthetic", "end:synthetic:ok"
        , "depth:2", "complete:synthetic"
    };
    EXPECT_EQ(expected, telemetry->events());
}

TEST_F(OrchestratorTest, CacheHitKeepsOriginalSource)
{
    ASSERT_TRUE(cache->set(Edinburgh, RiskObservation::live
                           (RiskLevel::veryHigh, 40.0
                            , DataSource::secondary, clock->now())).ok());
    clock->advance(std::chrono::hours(1));

    auto primary(std::make_shared<FakeSource>
                 ("primary", fails(TransportError::parse("junk"))));
    auto secondary(std::make_shared<FakeSource>
                   ("secondary", fails(TransportError::http(400, "no"))));

    const auto result(orchestrator(primary, secondary).resolve(Edinburgh));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(RiskLevel::veryHigh, result->level());
    EXPECT_EQ(DataSource::secondary, result->source());
    EXPECT_EQ(Freshness::cached, result->freshness());

    const auto events(telemetry->events());
    ASSERT_EQ(8u, events.size());
    EXPECT_EQ("start:cache", events[4]);
    EXPECT_EQ("end:cache:ok", events[5]);
    EXPECT_EQ("depth:2", events[6]);
}

TEST_F(OrchestratorTest, SyntheticWhenEverythingFails)
{
    auto primary(std::make_shared<FakeSource>
                 ("primary", fails(TransportError::http(404, "none"))));
    auto secondary(std::make_shared<FakeSource>
                   ("secondary", fails(TransportError::http(404, "none"))));

    const auto result(orchestrator(primary, secondary).resolve(Edinburgh));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(DataSource::synthetic, result->source());
    EXPECT_EQ(Freshness::synthetic, result->freshness());
    EXPECT_EQ(RiskLevel::moderate, result->level());
    EXPECT_FALSE(result->index());

    // synthetic data is never cached
    EXPECT_FALSE(cache->get("gcvwr"));
}

TEST_F(OrchestratorTest, ExceptionIsStageFailure)
{
    auto primary(std::make_shared<FakeSource>
                 ("primary", [](const GeoCoordinate&, const ms&) -> Reading
                  {
                      throw std::runtime_error("driver crashed");
                  }));
    auto secondary(std::make_shared<FakeSource>("secondary", returns(3)));

    RiskOrchestrator::Options options;
    options.maxRetries = 0;

    const auto result(orchestrator(primary, secondary, options)
                      .resolve(Edinburgh));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(DataSource::secondary, result->source());
    EXPECT_EQ(RiskLevel::veryLow, result->level());
    EXPECT_EQ(1, primary->calls());
}

TEST_F(OrchestratorTest, UnknownExceptionIsStageFailure)
{
    auto primary(std::make_shared<FakeSource>
                 ("primary", [](const GeoCoordinate&, const ms&) -> Reading
                  {
                      throw 42;
                  }));

    RiskOrchestrator::Options options;
    options.maxRetries = 2;

    const auto result(orchestrator(primary, FakeSource::pointer(), options)
                      .resolve(GeoCoordinate(40.0, 10.0)));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(DataSource::synthetic, result->source());

    // counted as network fault: retried
    EXPECT_EQ(3, primary->calls());

    const std::vector<std::string> expected{
        "start:primary", "end:primary:fail"
        , "start:cache", "end:cache:fail"
        , "start:synthetic", "end:synthetic:ok"
        , "depth:2", "complete:synthetic"
    };
    EXPECT_EQ(expected, telemetry->events());
}

/** Store failing with something that is not std::exception.
 */
class ThrowingStore : public CacheStore {
public:
    virtual boost::optional<std::string> get(const std::string&) {
        throw 42;
    }
    virtual void set(const std::string&, const std::string&) { throw 42; }
    virtual void remove(const std::string&) {}
    virtual std::vector<std::string> keys() {
        return std::vector<std::string>();
    }
};

TEST_F(OrchestratorTest, UnknownCacheFailureIsStageFailure)
{
    cache = std::make_shared<Geocache>(std::make_shared<ThrowingStore>()
                                       , clock);

    auto failing(std::make_shared<FakeSource>
                 ("primary", fails(TransportError::http(404, "none"))));
    const auto fallback(orchestrator(failing, FakeSource::pointer())
                        .resolve(London));
    ASSERT_TRUE(fallback.ok());
    EXPECT_EQ(DataSource::synthetic, fallback->source());

    // write-through failure does not hide the live result
    auto primary(std::make_shared<FakeSource>("primary", returns(8.0)));
    const auto live(orchestrator(primary, FakeSource::pointer())
                    .resolve(London));
    ASSERT_TRUE(live.ok());
    EXPECT_EQ(DataSource::primary, live->source());
    EXPECT_EQ(RiskLevel::low, live->level());
}

TEST_F(OrchestratorTest, TransientFailureIsRetried)
{
    std::atomic<int> attempt(0);
    auto primary(std::make_shared<FakeSource>
                 ("primary", [&](const GeoCoordinate&, const ms&) -> Reading
                  {
                      if (!attempt++) {
                          return TransportError::http(503, "busy");
                      }
                      return RawIndexReading(60.0);
                  }));

    const auto result(orchestrator(primary, FakeSource::pointer())
                      .resolve(London));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(DataSource::primary, result->source());
    EXPECT_EQ(RiskLevel::extreme, result->level());
    EXPECT_EQ(2, primary->calls());

    const std::vector<ms> expected{ ms(1000) };
    EXPECT_EQ(expected, clock->sleeps());
}

TEST_F(OrchestratorTest, ReportedLevelWins)
{
    auto primary(std::make_shared<FakeSource>
                 ("primary", [](const GeoCoordinate&, const ms&) -> Reading
                  {
                      RawIndexReading reading(3.0);
                      reading.level = RiskLevel::high;
                      reading.observedAt = fromMillis(1600000000000);
                      return reading;
                  }));

    const auto result(orchestrator(primary, FakeSource::pointer())
                      .resolve(London));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(RiskLevel::high, result->level());
    EXPECT_EQ(fromMillis(1600000000000), result->observedAt());
}

TEST_F(OrchestratorTest, SlowSourceLosesToBudget)
{
    auto primary(std::make_shared<FakeSource>
                 ("primary", [](const GeoCoordinate&, const ms&) -> Reading
                  {
                      std::this_thread::sleep_for(ms(500));
                      return RawIndexReading(10.0);
                  }));
    auto secondary(std::make_shared<FakeSource>("secondary", returns(30)));

    RiskOrchestrator::Options options;
    options.primaryBudget = ms(50);

    const auto result(orchestrator(primary, secondary, options)
                      .resolve(Edinburgh));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(DataSource::secondary, result->source());

    const auto events(telemetry->events());
    ASSERT_LE(2u, events.size());
    EXPECT_EQ("end:primary:fail", events[1]);
}

TEST_F(OrchestratorTest, ElapsedDeadlineGoesStraightToSynthetic)
{
    auto primary(std::make_shared<FakeSource>("primary", returns(25.0)));
    auto secondary(std::make_shared<FakeSource>("secondary", returns(25.0)));

    const auto result(orchestrator(primary, secondary)
                      .resolve(Edinburgh, ms(0)));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(DataSource::synthetic, result->source());
    EXPECT_EQ(0, primary->calls());
    EXPECT_EQ(0, secondary->calls());
}

TEST_F(OrchestratorTest, NeverFailsForValidCoordinates)
{
    auto primary(std::make_shared<FakeSource>
                 ("primary", fails(TransportError::http(404, "none"))));
    auto secondary(std::make_shared<FakeSource>
                   ("secondary", fails(TransportError::parse("junk"))));
    const auto o(orchestrator(primary, secondary));

    for (double lat(-90.0); lat <= 90.0; lat += 22.5) {
        for (double lon(-180.0); lon <= 180.0; lon += 45.0) {
            const auto result(o.resolve(GeoCoordinate(lat, lon)));
            ASSERT_TRUE(result.ok()) << lat << "," << lon;
        }
    }
}

TEST(SyntheticGenerator, GeohashStrategyIsStable)
{
    const auto clock(std::make_shared<ManualClock>());
    const SyntheticGenerator generator
        (clock, SyntheticGenerator::Strategy::geohash);

    // CRC-32 of the precision-5 cell picks the tier
    EXPECT_EQ(RiskLevel::moderate, generator.generate(Edinburgh).level());
    EXPECT_EQ(RiskLevel::low, generator.generate(London).level());
    EXPECT_EQ(RiskLevel::high
              , generator.generate(GeoCoordinate(57.2, -3.8)).level());

    EXPECT_EQ(generator.generate(Edinburgh), generator.generate(Edinburgh));
}

TEST(SyntheticGenerator, FixedStrategy)
{
    const auto clock(std::make_shared<ManualClock>());
    const SyntheticGenerator generator
        (clock, SyntheticGenerator::Strategy::fixed, RiskLevel::low);

    const auto o(generator.generate(Edinburgh));
    EXPECT_EQ(RiskLevel::low, o.level());
    EXPECT_EQ(DataSource::synthetic, o.source());
    EXPECT_EQ(Freshness::synthetic, o.freshness());
    EXPECT_FALSE(o.index());
    EXPECT_EQ(clock->now(), o.observedAt());
}

} // namespace
