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
#include <fstream>

#include "dbglog/dbglog.hpp"

#include "./config.hpp"

namespace po = boost::program_options;
namespace fs = boost::filesystem;

namespace wildfire {

namespace {

const char *DefaultPrimaryUrl("https://ies-ows.jrc.ec.europa.eu/gwis");

std::chrono::milliseconds duration(const po::variables_map &vm
                                   , const char *name, bool positive)
{
    const auto value(vm[name].as<long>());
    if ((value < 0) || (positive && !value)) {
        LOGTHROW(err1, std::runtime_error)
            << "Configuration option <" << name << "> must be "
            << (positive ? "positive" : "non-negative") << ", got "
            << value << ".";
    }
    return std::chrono::milliseconds(value);
}

template <typename T>
boost::optional<T> optionalValue(const po::variables_map &vm
                                 , const char *name)
{
    if (!vm.count(name)) { return boost::none; }
    const auto &value(vm[name].as<T>());
    if (value.empty()) { return boost::none; }
    return value;
}

} // namespace

Config::Config()
    : devMode(false), primaryUrl(DefaultPrimaryUrl)
    , primaryLayer("ecmwf.fwi")
    , synthetic(SyntheticGenerator::Strategy::fixed)
    , syntheticLevel(RiskLevel::moderate)
{}

void configuration(po::options_description &config)
{
    const Config defaults;
    const auto region(scotland());

    config.add_options()
        ("risk.deadline", po::value<long>()
         ->default_value(defaults.risk.deadline.count())
         , "Overall risk resolution deadline (ms).")
        ("risk.primaryBudget", po::value<long>()
         ->default_value(defaults.risk.primaryBudget.count())
         , "Primary source budget (ms).")
        ("risk.secondaryBudget", po::value<long>()
         ->default_value(defaults.risk.secondaryBudget.count())
         , "Secondary source budget (ms).")
        ("risk.cacheBudget", po::value<long>()
         ->default_value(defaults.risk.cacheBudget.count())
         , "Cache lookup budget (ms).")

        ("fetch.maxRetries", po::value<int>()
         ->default_value(defaults.fetch.maxRetries)
         , "Retries after the first attempt (0-10).")
        ("fetch.baseDelay", po::value<long>()
         ->default_value(defaults.fetch.baseDelay.count())
         , "Delay before first retry, doubled for each next one (ms).")
        ("fetch.jitter", po::value<double>()
         ->default_value(defaults.fetch.jitter)
         , "Relative backoff jitter, 0 disables it.")

        ("cache.capacity", po::value<std::size_t>()
         ->default_value(defaults.cache.capacity)
         , "Maximum number of cached cells.")
        ("cache.ttl", po::value<long>()
         ->default_value(defaults.cache.ttl.count())
         , "Cached observation time to live (ms).")
        ("cache.dir", po::value<std::string>()
         , "Persistent cache directory, in-memory cache if not set.")

        ("location.devMode", po::value<bool>()
         ->default_value(defaults.devMode)
         , "Use development default location (Aviemore) instead of "
         "Scotland centroid.")
        ("location.liveFixBudget", po::value<long>()
         ->default_value(defaults.location.liveFixBudget.count())
         , "Live position fix budget (ms).")
        ("location.totalBudget", po::value<long>()
         ->default_value(defaults.location.totalBudget.count())
         , "Overall location resolution budget (ms).")
        ("location.manualMaxAge", po::value<long>()
         ->default_value(defaults.location.manualMaxAge.count())
         , "Maximum age of saved manual location (ms).")
        ("location.preferences", po::value<std::string>()
         , "Preferences file, in-memory preferences if not set.")

        ("region.minLatitude", po::value<double>()
         ->default_value(region.minLatitude)
         , "Secondary source coverage, southern bound.")
        ("region.maxLatitude", po::value<double>()
         ->default_value(region.maxLatitude)
         , "Secondary source coverage, northern bound.")
        ("region.minLongitude", po::value<double>()
         ->default_value(region.minLongitude)
         , "Secondary source coverage, western bound.")
        ("region.maxLongitude", po::value<double>()
         ->default_value(region.maxLongitude)
         , "Secondary source coverage, eastern bound.")

        ("sources.primaryUrl", po::value<std::string>()
         ->default_value(defaults.primaryUrl)
         , "Primary WMS endpoint.")
        ("sources.primaryLayer", po::value<std::string>()
         ->default_value(defaults.primaryLayer)
         , "Primary WMS layer.")
        ("sources.secondaryUrl", po::value<std::string>()
         , "Regional point service endpoint, none if not set.")
        ("sources.proxy", po::value<std::string>()
         , "HTTP proxy.")
        ("sources.synthetic", po::value<SyntheticGenerator::Strategy>()
         ->default_value(defaults.synthetic)
         , "Synthetic data strategy: fixed, geohash.")
        ("sources.syntheticLevel", po::value<RiskLevel>()
         ->default_value(defaults.syntheticLevel)
         , "Level produced by the fixed synthetic strategy.")
        ;
}

Config configure(const po::variables_map &vm)
{
    Config cfg;

    cfg.risk.deadline = duration(vm, "risk.deadline", true);
    cfg.risk.primaryBudget = duration(vm, "risk.primaryBudget", true);
    cfg.risk.secondaryBudget = duration(vm, "risk.secondaryBudget", true);
    cfg.risk.cacheBudget = duration(vm, "risk.cacheBudget", true);

    cfg.fetch.maxRetries = vm["fetch.maxRetries"].as<int>();
    if ((cfg.fetch.maxRetries < 0) || (cfg.fetch.maxRetries > MaxRetries)) {
        LOGTHROW(err1, std::runtime_error)
            << "Configuration option <fetch.maxRetries> must be between 0 "
            "and " << MaxRetries << ".";
    }
    cfg.risk.maxRetries = cfg.fetch.maxRetries;
    cfg.fetch.baseDelay = duration(vm, "fetch.baseDelay", false);
    cfg.fetch.timeout = cfg.risk.primaryBudget;
    cfg.fetch.jitter = vm["fetch.jitter"].as<double>();
    if ((cfg.fetch.jitter < 0.0) || (cfg.fetch.jitter > 1.0)) {
        LOGTHROW(err1, std::runtime_error)
            << "Configuration option <fetch.jitter> must be between 0 "
            "and 1.";
    }

    cfg.cache.capacity = vm["cache.capacity"].as<std::size_t>();
    if (!cfg.cache.capacity) {
        LOGTHROW(err1, std::runtime_error)
            << "Configuration option <cache.capacity> must be positive.";
    }
    cfg.cache.ttl = duration(vm, "cache.ttl", false);
    if (const auto dir = optionalValue<std::string>(vm, "cache.dir")) {
        cfg.cacheDir = fs::path(*dir);
    }

    cfg.devMode = vm["location.devMode"].as<bool>();
    cfg.location.defaultLocation = defaultLocation(cfg.devMode);
    cfg.location.liveFixBudget = duration(vm, "location.liveFixBudget"
                                          , true);
    cfg.location.totalBudget = duration(vm, "location.totalBudget", true);
    cfg.location.manualMaxAge = duration(vm, "location.manualMaxAge", true);
    if (const auto file
        = optionalValue<std::string>(vm, "location.preferences"))
    {
        cfg.preferences = fs::path(*file);
    }

    cfg.risk.region = Region(vm["region.minLatitude"].as<double>()
                             , vm["region.maxLatitude"].as<double>()
                             , vm["region.minLongitude"].as<double>()
                             , vm["region.maxLongitude"].as<double>());
    if ((cfg.risk.region.minLatitude > cfg.risk.region.maxLatitude)
        || (cfg.risk.region.minLongitude > cfg.risk.region.maxLongitude))
    {
        LOGTHROW(err1, std::runtime_error)
            << "Configured region " << cfg.risk.region << " is empty.";
    }

    cfg.primaryUrl = vm["sources.primaryUrl"].as<std::string>();
    cfg.primaryLayer = vm["sources.primaryLayer"].as<std::string>();
    cfg.secondaryUrl
        = optionalValue<std::string>(vm, "sources.secondaryUrl");
    cfg.proxy = optionalValue<std::string>(vm, "sources.proxy");
    cfg.synthetic = vm["sources.synthetic"]
        .as<SyntheticGenerator::Strategy>();
    cfg.syntheticLevel = vm["sources.syntheticLevel"].as<RiskLevel>();

    return cfg;
}

Config loadConfig(std::istream &is, const std::string &name)
{
    po::options_description config("wildfire");
    configuration(config);

    po::variables_map vm;
    try {
        po::store(po::parse_config_file(is, config), vm);
        po::notify(vm);
    } catch (const po::error &e) {
        LOGTHROW(err1, std::runtime_error)
            << "Cannot parse configuration " << name << ": " << e.what()
            << ".";
    }

    return configure(vm);
}

Config loadConfig(const fs::path &path)
{
    std::ifstream f;
    f.exceptions(std::ifstream::failbit | std::ifstream::badbit);
    try {
        f.open(path.string());
    } catch (const std::exception&) {
        LOGTHROW(err1, std::runtime_error)
            << "Cannot open configuration file " << path << ".";
    }
    f.exceptions(std::ifstream::badbit);

    LOG(info2) << "Loading configuration from " << path << ".";
    return loadConfig(f, path.string());
}

} // namespace wildfire
