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
#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <boost/filesystem.hpp>

#include <gtest/gtest.h>

#include "wildfire/cachestore.hpp"
#include "wildfire/geocache.hpp"
#include "wildfire/preferences.hpp"

#include "support/manualclock.hpp"

namespace fs = boost::filesystem;

using wildfire::FileCacheStore;
using wildfire::FilePreferenceStore;

namespace {

class FileStoreTest : public ::testing::Test {
protected:
    FileStoreTest()
        : root(fs::temp_directory_path()
               / fs::unique_path("wildfire-test-%%%%-%%%%-%%%%"))
    {}

    ~FileStoreTest() {
        boost::system::error_code ec;
        fs::remove_all(root, ec);
    }

    fs::path root;
};

TEST_F(FileStoreTest, SetGetRemove)
{
    FileCacheStore store(root / "cache");

    EXPECT_FALSE(store.get("gcvwr"));

    store.set("gcvwr", "{\"a\":1}");
    EXPECT_EQ(std::string("{\"a\":1}"), *store.get("gcvwr"));

    store.set("gcvwr", "{\"a\":2}");
    EXPECT_EQ(std::string("{\"a\":2}"), *store.get("gcvwr"));

    store.remove("gcvwr");
    EXPECT_FALSE(store.get("gcvwr"));
    EXPECT_NO_THROW(store.remove("gcvwr"));
}

TEST_F(FileStoreTest, KeysSkipTemporaryFiles)
{
    FileCacheStore store(root / "cache");
    store.set("gcvwr", "x");
    store.set("gfjm3", "y");

    // leftover of an interrupted write
    std::ofstream(((root / "cache") / "stale.tmp").string()) << "z";

    auto keys(store.keys());
    std::sort(keys.begin(), keys.end());
    ASSERT_EQ(2u, keys.size());
    EXPECT_EQ("gcvwr", keys[0]);
    EXPECT_EQ("gfjm3", keys[1]);
}

TEST_F(FileStoreTest, ConcurrentWritersOfOneKey)
{
    FileCacheStore store(root / "cache");

    const int writers(8);
    std::vector<std::thread> threads;
    for (int i(0); i < writers; ++i) {
        threads.emplace_back([&store, i]()
        {
            const std::string value(1 << 16, char('a' + i));
            for (int round(0); round < 20; ++round) {
                store.set("gcvwr", value);
            }
        });
    }
    for (auto &thread : threads) { thread.join(); }

    // whole record of exactly one writer
    const auto value(store.get("gcvwr"));
    ASSERT_TRUE(bool(value));
    ASSERT_EQ(std::size_t(1 << 16), value->size());
    EXPECT_EQ(std::string::npos
              , value->find_first_not_of(value->front()));

    for (fs::recursive_directory_iterator i(root / "cache"), e; i != e; ++i)
    {
        EXPECT_NE(".tmp", i->path().extension().string());
    }
    EXPECT_EQ(std::vector<std::string>{ "gcvwr" }, store.keys());
}

TEST_F(FileStoreTest, RejectsUnsafeKeys)
{
    FileCacheStore store(root / "cache");
    EXPECT_THROW(store.set("../escape", "x"), std::invalid_argument);
    EXPECT_THROW(store.get(""), std::invalid_argument);
    EXPECT_THROW(store.set("a.tmp", "x"), std::invalid_argument);
}

TEST_F(FileStoreTest, GeocacheSurvivesRestart)
{
    const auto clock(std::make_shared<wildfire::test::ManualClock>());
    const auto observation(wildfire::RiskObservation::live
                           (wildfire::RiskLevel::extreme, 61.0
                            , wildfire::DataSource::primary, clock->now()));

    {
        wildfire::Geocache cache
            (std::make_shared<FileCacheStore>(root / "cache"), clock);
        ASSERT_TRUE(cache.set("gcvwr", observation).ok());
    }

    wildfire::Geocache cache
        (std::make_shared<FileCacheStore>(root / "cache"), clock);
    EXPECT_EQ(1u, cache.metadata().totalEntries);

    const auto hit(cache.get("gcvwr"));
    ASSERT_TRUE(bool(hit));
    EXPECT_EQ(observation.withFreshness(wildfire::Freshness::cached), *hit);
}

TEST_F(FileStoreTest, PreferencesPersist)
{
    const auto file(root / "prefs.json");

    {
        FilePreferenceStore prefs(file);
        EXPECT_FALSE(prefs.getString("name"));
        prefs.setString("name", "Aviemore");
        prefs.setDouble("lat", 57.2);
        prefs.setInt("ts", 1700000000000);
    }

    FilePreferenceStore prefs(file);
    EXPECT_EQ(std::string("Aviemore"), *prefs.getString("name"));
    EXPECT_DOUBLE_EQ(57.2, *prefs.getDouble("lat"));
    EXPECT_EQ(1700000000000, *prefs.getInt("ts"));

    // type mismatch reads as absent
    EXPECT_FALSE(prefs.getInt("name"));
    EXPECT_FALSE(prefs.getString("lat"));

    prefs.remove("name");
    EXPECT_FALSE(FilePreferenceStore(file).getString("name"));
}

TEST_F(FileStoreTest, MalformedPreferencesAreIgnored)
{
    fs::create_directories(root);
    std::ofstream(((root / "prefs.json")).string()) << "{broken";

    FilePreferenceStore prefs(root / "prefs.json");
    EXPECT_FALSE(prefs.getString("name"));

    prefs.setString("name", "Edinburgh");
    EXPECT_EQ(std::string("Edinburgh")
              , *FilePreferenceStore(root / "prefs.json").getString("name"));
}

} // namespace
