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
#include <limits>
#include <stdexcept>

#include <boost/optional/optional_io.hpp>

#include <gtest/gtest.h>

#include "wildfire/risk.hpp"

using wildfire::RiskLevel;
using wildfire::RiskObservation;
using wildfire::DataSource;
using wildfire::Freshness;

namespace {

const auto When(wildfire::fromMillis(1700000000000));

TEST(Risk, LevelThresholds)
{
    const struct {
        double index;
        RiskLevel level;
    } cases[] = {
        { 0.0, RiskLevel::veryLow }, { 4.99, RiskLevel::veryLow }
        , { 5.0, RiskLevel::low }, { 11.9, RiskLevel::low }
        , { 12.0, RiskLevel::moderate }, { 20.9, RiskLevel::moderate }
        , { 21.0, RiskLevel::high }, { 37.9, RiskLevel::high }
        , { 38.0, RiskLevel::veryHigh }, { 49.9, RiskLevel::veryHigh }
        , { 50.0, RiskLevel::extreme }, { 120.0, RiskLevel::extreme }
    };

    for (const auto &c : cases) {
        const auto level(wildfire::levelFromIndex(c.index));
        ASSERT_TRUE(level.ok()) << c.index;
        EXPECT_EQ(c.level, level.value()) << c.index;
    }
}

TEST(Risk, LevelRejectsInvalidIndex)
{
    for (const auto index : { -0.1, std::numeric_limits<double>::quiet_NaN()
                              , std::numeric_limits<double>::infinity() })
    {
        const auto level(wildfire::levelFromIndex(index));
        ASSERT_FALSE(level.ok());
        EXPECT_EQ(wildfire::ErrorCategory::validation
                  , level.error().category);
    }
}

TEST(Risk, ObservationRejectsNegativeIndex)
{
    EXPECT_THROW(RiskObservation::live(RiskLevel::low, -1.0
                                       , DataSource::primary, When)
                 , std::invalid_argument);
    EXPECT_NO_THROW(RiskObservation::live(RiskLevel::low, boost::none
                                          , DataSource::primary, When));
}

TEST(Risk, ObservationTimeHasMillisecondPrecision)
{
    const auto fine(When + std::chrono::duration_cast
                    <std::chrono::system_clock::duration>
                    (std::chrono::microseconds(1500)));

    const auto o(RiskObservation::live(RiskLevel::low, 7.0
                                       , DataSource::primary, fine));
    EXPECT_EQ(wildfire::fromMillis(1700000000001), o.observedAt());
    EXPECT_EQ(o, RiskObservation::live(RiskLevel::low, 7.0
                                       , DataSource::primary
                                       , wildfire::fromMillis
                                       (1700000000001)));
}

TEST(Risk, SyntheticHasNoIndex)
{
    const auto o(RiskObservation::synthetic(RiskLevel::moderate, When));
    EXPECT_FALSE(o.index());
    EXPECT_EQ(DataSource::synthetic, o.source());
    EXPECT_EQ(Freshness::synthetic, o.freshness());
}

TEST(Risk, WithFreshnessKeepsEverythingElse)
{
    const auto live(RiskObservation::live(RiskLevel::high, 25.5
                                          , DataSource::secondary, When));
    const auto cached(live.withFreshness(Freshness::cached));

    EXPECT_EQ(Freshness::live, live.freshness());
    EXPECT_EQ(Freshness::cached, cached.freshness());
    EXPECT_EQ(live.level(), cached.level());
    EXPECT_EQ(live.index(), cached.index());
    EXPECT_EQ(live.source(), cached.source());
    EXPECT_EQ(live.observedAt(), cached.observedAt());
    EXPECT_NE(live, cached);
}

TEST(Risk, JsonKeepsSourceAndTime)
{
    const auto o(RiskObservation::live(RiskLevel::veryHigh, 42.0
                                       , DataSource::secondary, When));
    const auto json(asJson(o));

    EXPECT_EQ("veryHigh", json["level"].asString());
    EXPECT_EQ("secondary", json["source"].asString());
    EXPECT_EQ(1700000000000, json["observedAt"].asInt64());
    EXPECT_FALSE(json.isMember("freshness"));

    EXPECT_EQ(o, wildfire::observationFromJson(json));
}

TEST(Risk, JsonWithoutSourceIsAttributedToCache)
{
    Json::Value json(Json::objectValue);
    json["level"] = "low";
    json["observedAt"] = Json::Int64(1700000000000);

    const auto o(wildfire::observationFromJson(json));
    EXPECT_EQ(DataSource::cache, o.source());
    EXPECT_FALSE(o.index());
}

TEST(Risk, MalformedJsonThrows)
{
    Json::Value json(Json::objectValue);
    json["level"] = "scorching";
    json["observedAt"] = Json::Int64(1700000000000);
    EXPECT_THROW(wildfire::observationFromJson(json), std::runtime_error);

    json["level"] = "low";
    json["index"] = -3.0;
    EXPECT_THROW(wildfire::observationFromJson(json), std::runtime_error);

    json.removeMember("index");
    json["observedAt"] = "yesterday";
    EXPECT_THROW(wildfire::observationFromJson(json), std::runtime_error);

    EXPECT_THROW(wildfire::observationFromJson(Json::Value("low"))
                 , std::runtime_error);
}

} // namespace
