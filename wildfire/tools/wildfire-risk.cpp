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
#include <cstdlib>
#include <iostream>

#include <boost/optional/optional_io.hpp>

#include "dbglog/dbglog.hpp"
#include "service/cmdline.hpp"

#include "wildfire/config.hpp"
#include "wildfire/cachestore.hpp"
#include "wildfire/geocache.hpp"
#include "wildfire/location.hpp"
#include "wildfire/orchestrator.hpp"
#include "wildfire/preferences.hpp"
#include "wildfire/sources.hpp"

namespace po = boost::program_options;
namespace wf = wildfire;

class WildfireRisk : public service::Cmdline {
public:
    WildfireRisk()
        : service::Cmdline("wildfire-risk", "1.0")
        , allowDefault_(true), saveManual_(false), clearCache_(false)
        , cacheInfo_(false)
    {}

private:
    void configuration(po::options_description &cmdline
                       , po::options_description &config
                       , po::positional_options_description &pd);

    void configure(const po::variables_map &vm);

    int run();

    wf::Geocache::pointer cache(const wf::Clock::pointer &clock) const;

    wf::LocationResolver resolver(const wf::Clock::pointer &clock) const;

    int cacheInfo(const wf::Geocache &cache) const;

    wf::Config config_;
    boost::optional<wf::GeoCoordinate> coordinate_;
    boost::optional<std::string> place_;
    bool allowDefault_;
    bool saveManual_;
    bool clearCache_;
    bool cacheInfo_;
};

void WildfireRisk::configuration(po::options_description &cmdline
                                 , po::options_description &config
                                 , po::positional_options_description &pd)
{
    cmdline.add_options()
        ("lat", po::value<double>()
         , "Latitude of the query point (decimal degrees).")
        ("lon", po::value<double>()
         , "Longitude of the query point (decimal degrees).")
        ("allow-default", po::value(&allowDefault_)
         ->default_value(allowDefault_)
         , "Fall back to default location when no location is known.")
        ("save-manual", "Save --lat/--lon as manual location and exit.")
        ("place", po::value<std::string>()
         , "Place name stored with manual location.")
        ("clear-cache", "Empty the risk cache and exit.")
        ("cache-info", "Print risk cache metadata and exit.")
        ;

    wf::configuration(config);

    (void) pd;
}

void WildfireRisk::configure(const po::variables_map &vm)
{
    config_ = wf::configure(vm);

    const bool hasLat(vm.count("lat")), hasLon(vm.count("lon"));
    if (hasLat != hasLon) {
        LOGTHROW(err1, std::runtime_error)
            << "Both --lat and --lon must be given.";
    }
    if (hasLat) {
        coordinate_ = wf::GeoCoordinate(vm["lat"].as<double>()
                                        , vm["lon"].as<double>());
    }

    if (vm.count("place")) { place_ = vm["place"].as<std::string>(); }

    saveManual_ = vm.count("save-manual");
    clearCache_ = vm.count("clear-cache");
    cacheInfo_ = vm.count("cache-info");

    if (saveManual_ && !coordinate_) {
        LOGTHROW(err1, std::runtime_error)
            << "--save-manual needs --lat and --lon.";
    }
}

wf::Geocache::pointer
WildfireRisk::cache(const wf::Clock::pointer &clock) const
{
    wf::CacheStore::pointer store;
    if (config_.cacheDir) {
        store = std::make_shared<wf::FileCacheStore>(*config_.cacheDir);
    } else {
        store = std::make_shared<wf::MemoryCacheStore>();
    }
    return std::make_shared<wf::Geocache>(store, clock, config_.cache);
}

wf::LocationResolver
WildfireRisk::resolver(const wf::Clock::pointer &clock) const
{
    wf::PreferenceStore::pointer preferences;
    if (config_.preferences) {
        preferences = std::make_shared<wf::FilePreferenceStore>
            (*config_.preferences);
    } else {
        preferences = std::make_shared<wf::MemoryPreferenceStore>();
    }

    // command line has no position sensor
    return wf::LocationResolver(wf::PositionSensor::pointer(), preferences
                                , config_.location, clock);
}

int WildfireRisk::cacheInfo(const wf::Geocache &cache) const
{
    const auto metadata(cache.metadata());

    std::cout << "entries: " << metadata.totalEntries << "\n";
    for (const auto &item : metadata.accessLog) {
        std::cout << "  " << item.first << " "
                  << wf::formatUtc(item.second) << "\n";
    }
    std::cout << "lru: "
              << (metadata.lruCandidate ? *metadata.lruCandidate : "none")
              << std::endl;
    return EXIT_SUCCESS;
}

int WildfireRisk::run()
{
    const auto clock(wf::SystemClock::instance());
    const auto geocache(cache(clock));

    if (clearCache_) {
        geocache->clear();
        std::cout << "Cache cleared." << std::endl;
        return EXIT_SUCCESS;
    }

    if (cacheInfo_) { return cacheInfo(*geocache); }

    const auto locations(resolver(clock));

    if (saveManual_) {
        const auto saved(locations.saveManual(*coordinate_, place_));
        if (!saved) {
            std::cerr << "Cannot save manual location: " << saved.error()
                      << std::endl;
            return EXIT_FAILURE;
        }
        std::cout << "Manual location saved: " << *coordinate_
                  << std::endl;
        return EXIT_SUCCESS;
    }

    auto coordinate(coordinate_);
    if (!coordinate) {
        const auto location(locations.resolve(allowDefault_));
        if (!location) {
            std::cerr << "Cannot resolve location: " << location.error()
                      << std::endl;
            return EXIT_FAILURE;
        }
        std::cout << "location: " << *location << "\n";
        coordinate = location->coordinates;
    }

    const auto http(std::make_shared<wf::detail::HttpClient>
                    (config_.proxy));

    wf::IndexSource::pointer secondary;
    if (config_.secondaryUrl) {
        secondary = std::make_shared<wf::PointIndexSource>
            (http, *config_.secondaryUrl);
    }

    const wf::RiskOrchestrator orchestrator
        (std::make_shared<wf::WmsIndexSource>
         (http, config_.primaryUrl, config_.primaryLayer)
         , secondary, geocache
         , std::make_shared<wf::SyntheticGenerator>
         (clock, config_.synthetic, config_.syntheticLevel)
         , wf::Fetcher(clock, config_.fetch), config_.risk
         , wf::Telemetry::pointer(), clock);

    const auto risk(orchestrator.resolve(*coordinate));
    if (!risk) {
        std::cerr << "Cannot resolve risk: " << risk.error() << std::endl;
        return EXIT_FAILURE;
    }

    std::cout << "level: " << risk->level() << "\n"
              << "index: " << risk->index() << "\n"
              << "source: " << risk->source() << "\n"
              << "freshness: " << risk->freshness() << "\n"
              << "observedAt: " << wf::formatUtc(risk->observedAt())
              << std::endl;

    return EXIT_SUCCESS;
}

int main(int argc, char *argv[])
{
    return WildfireRisk()(argc, argv);
}
