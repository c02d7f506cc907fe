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
 * @file orchestrator.hpp
 *
 * Risk orchestrator: ranked fallback chain that always produces a risk
 * observation for a valid coordinate.
 *
 * Stages, strictly sequential:
 *
 *    1. primary source through Fetcher (3 s)
 *    2. secondary source through Fetcher (2 s), only inside region gate
 *    3. geocache lookup (1 s)
 *    4. synthetic generator (cannot fail)
 *
 * A stage that throws, returns an error or runs out of its budget is a
 * failed stage and the chain moves on. Live results are written through to
 * the cache. Invalid coordinate is the only error ever returned.
 */

#ifndef wildfire_orchestrator_hpp_included_
#define wildfire_orchestrator_hpp_included_

#include <chrono>
#include <memory>

#include <boost/optional.hpp>

#include "./clock.hpp"
#include "./fetcher.hpp"
#include "./geo.hpp"
#include "./geocache.hpp"
#include "./result.hpp"
#include "./risk.hpp"
#include "./source.hpp"
#include "./synthetic.hpp"
#include "./telemetry.hpp"

namespace wildfire {

class RiskOrchestrator {
public:
    typedef std::shared_ptr<RiskOrchestrator> pointer;

    struct Options {
        /** Overall deadline. Stages are not started once it elapses (except
         *  the synthetic one) and no stage runs past it.
         */
        std::chrono::milliseconds deadline;

        std::chrono::milliseconds primaryBudget;
        std::chrono::milliseconds secondaryBudget;
        std::chrono::milliseconds cacheBudget;

        /** Retries inside one network stage.
         */
        int maxRetries;

        /** Secondary source coverage.
         */
        Region region;

        Options()
            : deadline(8000), primaryBudget(3000), secondaryBudget(2000)
            , cacheBudget(1000), maxRetries(3), region(scotland())
        {}
    };

    /** Primary source and synthetic generator are mandatory, secondary
     *  source and cache may be null (stage is then skipped). Null telemetry
     *  means LogTelemetry.
     */
    RiskOrchestrator(const IndexSource::pointer &primary
                     , const IndexSource::pointer &secondary
                     , const Geocache::pointer &cache
                     , const SyntheticGenerator::pointer &synthetic
                     , const Fetcher &fetcher
                     , const Options &options = Options()
                     , const Telemetry::pointer &telemetry
                     = Telemetry::pointer()
                     , const Clock::pointer &clock = Clock::pointer());

    /** Resolves risk using the configured deadline.
     */
    Result<RiskObservation> resolve(const GeoCoordinate &coordinate) const;

    /** Resolves risk within given deadline.
     */
    Result<RiskObservation>
    resolve(const GeoCoordinate &coordinate
            , const std::chrono::milliseconds &deadline) const;

    const Options& options() const { return options_; }

private:
    typedef std::chrono::steady_clock Steady;

    boost::optional<RiskObservation>
    live(Stage stage, const IndexSource::pointer &source, DataSource tag
         , const GeoCoordinate &coordinate
         , const std::chrono::milliseconds &budget) const;

    boost::optional<RiskObservation>
    cached(const GeoCoordinate &coordinate
           , const std::chrono::milliseconds &budget) const;

    RiskObservation synthetic(const GeoCoordinate &coordinate) const;

    void store(const GeoCoordinate &coordinate
               , const RiskObservation &observation) const;

    IndexSource::pointer primary_;
    IndexSource::pointer secondary_;
    Geocache::pointer cache_;
    SyntheticGenerator::pointer synthetic_;
    Fetcher fetcher_;
    Options options_;
    Telemetry::pointer telemetry_;
    Clock::pointer clock_;
};

} // namespace wildfire

#endif // wildfire_orchestrator_hpp_included_
