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
/**
 * @file config.hpp
 *
 * INI configuration of the whole risk/location stack.
 *
 * Sections and keys (durations in milliseconds):
 *
 *    [risk]     deadline, primaryBudget, secondaryBudget, cacheBudget
 *    [fetch]    maxRetries, baseDelay, jitter
 *    [cache]    capacity, ttl, dir
 *    [location] devMode, liveFixBudget, totalBudget, manualMaxAge,
 *               preferences
 *    [region]   minLatitude, maxLatitude, minLongitude, maxLongitude
 *    [sources]  primaryUrl, primaryLayer, secondaryUrl, proxy, synthetic,
 *               syntheticLevel
 */

#ifndef wildfire_config_hpp_included_
#define wildfire_config_hpp_included_

#include <iosfwd>
#include <string>

#include <boost/optional.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/program_options.hpp>

#include "./fetcher.hpp"
#include "./geocache.hpp"
#include "./location.hpp"
#include "./orchestrator.hpp"
#include "./synthetic.hpp"

namespace wildfire {

struct Config {
    RiskOrchestrator::Options risk;
    RetryPolicy fetch;

    Geocache::Options cache;

    /** Persistent cache directory, in-memory cache when not set.
     */
    boost::optional<boost::filesystem::path> cacheDir;

    bool devMode;
    LocationOptions location;

    /** Preferences file, in-memory preferences when not set.
     */
    boost::optional<boost::filesystem::path> preferences;

    std::string primaryUrl;
    std::string primaryLayer;

    /** Regional source endpoint, no secondary source when not set.
     */
    boost::optional<std::string> secondaryUrl;

    boost::optional<std::string> proxy;

    SyntheticGenerator::Strategy synthetic;
    RiskLevel syntheticLevel;

    Config();
};

/** Registers all configuration options (with defaults) in given
 *  description.
 */
void configuration(boost::program_options::options_description &config);

/** Builds configuration from parsed options. Throws std::runtime_error on
 *  values out of range.
 */
Config configure(const boost::program_options::variables_map &vm);

/** Parses INI configuration from stream. Throws std::runtime_error on
 *  malformed input.
 */
Config loadConfig(std::istream &is, const std::string &name = "<stream>");

/** Parses INI configuration file.
 */
Config loadConfig(const boost::filesystem::path &path);

} // namespace wildfire

#endif // wildfire_config_hpp_included_
