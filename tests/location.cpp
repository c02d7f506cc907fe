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
#include <functional>
#include <stdexcept>
#include <thread>

#include <boost/optional/optional_io.hpp>

#include <gtest/gtest.h>

#include "wildfire/location.hpp"

#include "support/manualclock.hpp"

using namespace wildfire;
using wildfire::test::ManualClock;

namespace {

typedef std::chrono::milliseconds ms;
typedef Result<GeoCoordinate, SensorError> Fix;

const GeoCoordinate Edinburgh(55.9533, -3.1883);
const GeoCoordinate Inverness(57.4778, -4.2247);

class FakeSensor : public PositionSensor {
public:
    typedef std::shared_ptr<FakeSensor> pointer;
    typedef std::function<Fix(const ms&)> Handler;

    FakeSensor(bool available = true)
        : available_(available), liveCalls_(0)
        , handler_([](const ms&) -> Fix
                   {
                       return SensorError(SensorError::Type::permissionDenied
                                          , "denied");
                   })
    {}

    virtual bool available() const { return available_; }

    virtual boost::optional<GeoCoordinate> lastKnown() { return lastKnown_; }

    virtual Fix current(const ms &timeout) {
        ++liveCalls_;
        return handler_(timeout);
    }

    void setLastKnown(const GeoCoordinate &c) { lastKnown_ = c; }
    void setHandler(const Handler &handler) { handler_ = handler; }
    int liveCalls() const { return liveCalls_; }

private:
    bool available_;
    boost::optional<GeoCoordinate> lastKnown_;
    std::atomic<int> liveCalls_;
    Handler handler_;
};

class LocationTest : public ::testing::Test {
protected:
    LocationTest()
        : clock(std::make_shared<ManualClock>())
        , prefs(std::make_shared<MemoryPreferenceStore>())
        , sensor(std::make_shared<FakeSensor>())
    {}

    LocationResolver resolver(const LocationOptions &options
                              = LocationOptions()) const
    {
        return LocationResolver(sensor, prefs, options, clock);
    }

    ManualClock::pointer clock;
    std::shared_ptr<MemoryPreferenceStore> prefs;
    FakeSensor::pointer sensor;
};

TEST_F(LocationTest, LastKnownWins)
{
    sensor->setLastKnown(Edinburgh);

    const auto location(resolver().resolve());
    ASSERT_TRUE(location.ok());
    EXPECT_EQ(LocationSource::lastKnown, location->source);
    EXPECT_EQ(Edinburgh.latitude, location->coordinates.latitude);
    EXPECT_EQ(0, sensor->liveCalls());
}

TEST_F(LocationTest, LiveFixWhenNoLastKnown)
{
    sensor->setHandler([](const ms&) -> Fix { return Inverness; });

    const auto location(resolver().resolve());
    ASSERT_TRUE(location.ok());
    EXPECT_EQ(LocationSource::liveFix, location->source);
    EXPECT_EQ(Inverness.longitude, location->coordinates.longitude);
    EXPECT_EQ(1, sensor->liveCalls());
}

TEST_F(LocationTest, LiveFixBudgetIsCapped)
{
    ms seen(0);
    sensor->setHandler([&](const ms &timeout) -> Fix
    {
        seen = timeout;
        return Inverness;
    });

    LocationOptions options;
    options.liveFixBudget = ms(5000);
    options.totalBudget = ms(1500);

    ASSERT_TRUE(resolver(options).resolve().ok());
    EXPECT_GT(seen.count(), 0);
    EXPECT_LE(seen.count(), 1500);
}

TEST_F(LocationTest, DeniedFixFallsBackToManual)
{
    const auto r(resolver());
    ASSERT_TRUE(r.saveManual(Inverness, std::string("Inverness")).ok());
    clock->advance(std::chrono::minutes(30));

    const auto location(r.resolve());
    ASSERT_TRUE(location.ok());
    EXPECT_EQ(LocationSource::cachedManual, location->source);
    EXPECT_EQ(std::string("Inverness"), *location->placeName);
    EXPECT_EQ(Inverness.latitude, location->coordinates.latitude);
}

TEST_F(LocationTest, ManualEntryExpiresAtOneHour)
{
    const auto r(resolver());
    ASSERT_TRUE(r.saveManual(Inverness).ok());

    clock->advance(std::chrono::hours(1) - ms(1));
    EXPECT_TRUE(bool(r.loadManual()));

    clock->advance(ms(1));
    EXPECT_FALSE(r.loadManual());

    // stale slot is cleared
    EXPECT_FALSE(prefs->getDouble("manual_location_lat"));

    const auto location(r.resolve());
    ASSERT_TRUE(location.ok());
    EXPECT_EQ(LocationSource::persistedDefault, location->source);
}

TEST_F(LocationTest, ManualEntryWithoutTimestampIsAbsent)
{
    prefs->setString("manual_location_version", "1.0");
    prefs->setDouble("manual_location_lat", Inverness.latitude);
    prefs->setDouble("manual_location_lon", Inverness.longitude);

    EXPECT_FALSE(resolver().loadManual());
    EXPECT_FALSE(prefs->getString("manual_location_version"));
}

TEST_F(LocationTest, ManualEntryOfOtherVersionIsAbsent)
{
    const auto r(resolver());
    ASSERT_TRUE(r.saveManual(Inverness).ok());
    prefs->setString("manual_location_version", "0.9");

    EXPECT_FALSE(r.loadManual());
}

TEST_F(LocationTest, SaveManualOverwritesSlot)
{
    const auto r(resolver());
    ASSERT_TRUE(r.saveManual(Inverness, std::string("Inverness")).ok());
    ASSERT_TRUE(r.saveManual(Edinburgh).ok());

    const auto manual(r.loadManual());
    ASSERT_TRUE(bool(manual));
    EXPECT_EQ(Edinburgh.latitude, manual->coordinates.latitude);
    EXPECT_FALSE(manual->placeName);
    EXPECT_EQ(std::int64_t(ManualClock::DefaultStart)
              , *prefs->getInt("manual_location_timestamp"));
}

TEST_F(LocationTest, SaveManualRejectsInvalidCoordinate)
{
    const auto saved(resolver().saveManual(GeoCoordinate(95.0, 0.0)));
    ASSERT_FALSE(saved.ok());
    EXPECT_EQ(ErrorCategory::validation, saved.error().category);
    EXPECT_FALSE(prefs->getString("manual_location_version"));
}

TEST_F(LocationTest, ClearManual)
{
    const auto r(resolver());
    ASSERT_TRUE(r.saveManual(Inverness, std::string("Inverness")).ok());
    ASSERT_TRUE(r.clearManual().ok());

    EXPECT_FALSE(r.loadManual());
    EXPECT_FALSE(prefs->getString("manual_location_place"));
}

TEST_F(LocationTest, DefaultWhenNothingElseWorks)
{
    const auto location(resolver().resolve(true));
    ASSERT_TRUE(location.ok());
    EXPECT_EQ(LocationSource::persistedDefault, location->source);
    EXPECT_EQ(55.8642, location->coordinates.latitude);
    EXPECT_EQ(-4.2518, location->coordinates.longitude);
    EXPECT_EQ(1, sensor->liveCalls());
}

TEST_F(LocationTest, NoDefaultMeansError)
{
    const auto location(resolver().resolve(false));
    ASSERT_FALSE(location.ok());
    EXPECT_EQ(ErrorCategory::validation, location.error().category);
    EXPECT_EQ(ErrorKind::permissionDenied, location.error().kind);
}

TEST_F(LocationTest, UnavailableSensorIsSkipped)
{
    sensor = std::make_shared<FakeSensor>(false);
    sensor->setLastKnown(Edinburgh);

    const auto location(resolver().resolve());
    ASSERT_TRUE(location.ok());
    EXPECT_EQ(LocationSource::persistedDefault, location->source);
    EXPECT_EQ(0, sensor->liveCalls());

    const LocationResolver headless(PositionSensor::pointer(), prefs
                                    , LocationOptions(), clock);
    ASSERT_TRUE(headless.saveManual(Inverness).ok());
    EXPECT_EQ(LocationSource::cachedManual, headless.resolve()->source);
}

TEST_F(LocationTest, SlowFixLosesToBudget)
{
    sensor->setHandler([](const ms&) -> Fix
    {
        std::this_thread::sleep_for(ms(400));
        return Inverness;
    });

    LocationOptions options;
    options.liveFixBudget = ms(50);

    const auto location(resolver(options).resolve());
    ASSERT_TRUE(location.ok());
    EXPECT_EQ(LocationSource::persistedDefault, location->source);
}

TEST_F(LocationTest, ThrowingSensorIsTierFailure)
{
    sensor->setHandler([](const ms&) -> Fix
    {
        throw std::runtime_error("gps chip on fire");
    });

    const auto location(resolver().resolve());
    ASSERT_TRUE(location.ok());
    EXPECT_EQ(LocationSource::persistedDefault, location->source);
}

/** Sensor failing with something that is not std::exception.
 */
class BrokenSensor : public FakeSensor {
public:
    BrokenSensor() {
        setHandler([](const ms&) -> Fix { throw 1; });
    }

    virtual boost::optional<GeoCoordinate> lastKnown() { throw 1; }
};

TEST_F(LocationTest, UnknownSensorFailureIsTierFailure)
{
    const LocationResolver r(std::make_shared<BrokenSensor>(), prefs
                             , LocationOptions(), clock);

    const auto location(r.resolve());
    ASSERT_TRUE(location.ok());
    EXPECT_EQ(LocationSource::persistedDefault, location->source);

    ASSERT_TRUE(r.saveManual(Inverness).ok());
    const auto manual(r.resolve(false));
    ASSERT_TRUE(manual.ok());
    EXPECT_EQ(LocationSource::cachedManual, manual->source);
}

class FlakyPreferences : public MemoryPreferenceStore {
public:
    FlakyPreferences() : failing(false) {}

    virtual void setDouble(const std::string &key, double value) {
        if (failing && (key == "manual_location_longitude")) {
            throw std::runtime_error("storage full");
        }
        MemoryPreferenceStore::setDouble(key, value);
    }

    bool failing;
};

TEST_F(LocationTest, InterruptedSaveLeavesNoManualEntry)
{
    const auto flaky(std::make_shared<FlakyPreferences>());
    const LocationResolver r(FakeSensor::pointer(), flaky
                             , LocationOptions(), clock);

    ASSERT_TRUE(r.saveManual(Inverness).ok());
    ASSERT_TRUE(bool(r.loadManual()));

    flaky->failing = true;
    clock->advance(ms(1000));
    const auto saved(r.saveManual(Edinburgh));
    ASSERT_FALSE(saved.ok());

    // new latitude next to old longitude must never be returned
    EXPECT_FALSE(r.loadManual());
    const auto location(r.resolve());
    ASSERT_TRUE(location.ok());
    EXPECT_EQ(LocationSource::persistedDefault, location->source);
}

TEST(Location, DefaultLocations)
{
    EXPECT_EQ(57.2, defaultLocation(true).latitude);
    EXPECT_EQ(-3.8, defaultLocation(true).longitude);
    EXPECT_EQ(55.8642, defaultLocation(false).latitude);
    EXPECT_EQ(-4.2518, defaultLocation(false).longitude);
}

} // namespace
