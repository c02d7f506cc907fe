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
#include <atomic>
#include <stdexcept>

#include "dbglog/dbglog.hpp"

#include "./detail/timebox.hpp"
#include "./orchestrator.hpp"

namespace wildfire {

namespace {

std::chrono::milliseconds
since(const std::chrono::steady_clock::time_point &start)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>
        (std::chrono::steady_clock::now() - start);
}

/** Turns raw reading into live observation.
 */
Result<RiskObservation> observation(const RawIndexReading &reading
                                    , DataSource source
                                    , const Timestamp &now)
{
    auto level(reading.level);
    if (!level) {
        const auto derived(levelFromIndex(reading.index));
        if (!derived) { return derived.error(); }
        level = derived.value();
    }

    try {
        return RiskObservation::live
            (*level, reading.index, source
             , reading.observedAt ? *reading.observedAt : now);
    } catch (const std::invalid_argument &e) {
        return ServiceError(ErrorCategory::parse, e.what());
    }
}

} // namespace

RiskOrchestrator::RiskOrchestrator(const IndexSource::pointer &primary
                                   , const IndexSource::pointer &secondary
                                   , const Geocache::pointer &cache
                                   , const SyntheticGenerator::pointer
                                   &synthetic
                                   , const Fetcher &fetcher
                                   , const Options &options
                                   , const Telemetry::pointer &telemetry
                                   , const Clock::pointer &clock)
    : primary_(primary), secondary_(secondary), cache_(cache)
    , synthetic_(synthetic), fetcher_(fetcher), options_(options)
    , telemetry_(telemetry ? telemetry
                 : std::make_shared<LogTelemetry>())
    , clock_(clock ? clock : SystemClock::instance())
{
    if (!primary_) {
        LOGTHROW(err2, std::invalid_argument)
            << "Risk orchestrator needs a primary source.";
    }

    if (!synthetic_) {
        LOGTHROW(err2, std::invalid_argument)
            << "Risk orchestrator needs a synthetic generator.";
    }

    if ((options_.maxRetries < 0) || (options_.maxRetries > MaxRetries)) {
        LOGTHROW(err2, std::invalid_argument)
            << "Risk orchestrator retry count " << options_.maxRetries
            << " out of range 0.." << MaxRetries << ".";
    }
}

Result<RiskObservation>
RiskOrchestrator::resolve(const GeoCoordinate &coordinate) const
{
    return resolve(coordinate, options_.deadline);
}

Result<RiskObservation>
RiskOrchestrator::resolve(const GeoCoordinate &coordinate
                          , const std::chrono::milliseconds &deadline)
    const
{
    const auto validated(validate(coordinate));
    if (!validated) {
        LOG(warn2) << "Refusing to resolve risk: "
                   << validated.error().message;
        return validated.error();
    }

    const auto start(Steady::now());
    const auto remaining([&]() { return deadline - since(start); });

    LOG(info2) << "Resolving risk at " << coordinate << ".";

    int depth(0);
    const auto done([&](Stage stage, const RiskObservation &result)
                    -> Result<RiskObservation>
    {
        telemetry_->fallbackDepth(depth);
        telemetry_->complete(stage, since(start));
        LOG(info2) << "Risk at " << coordinate << ": " << result << ".";
        return result;
    });

    try {
        // 1. primary source
        if (auto result = live(Stage::primary, primary_, DataSource::primary
                               , coordinate
                               , std::min(options_.primaryBudget
                                          , remaining())))
        {
            store(coordinate, *result);
            return done(Stage::primary, *result);
        }
        ++depth;

        // 2. secondary source, region gated
        if (secondary_ && options_.region.contains(coordinate)) {
            if (auto result = live(Stage::secondary, secondary_
                                   , DataSource::secondary, coordinate
                                   , std::min(options_.secondaryBudget
                                              , remaining())))
            {
                store(coordinate, *result);
                return done(Stage::secondary, *result);
            }
            ++depth;
        } else if (secondary_) {
            LOG(info1) << "Location " << coordinate
                       << " outside secondary source coverage "
                       << options_.region << ", skipping.";
        }

        // 3. cache
        if (cache_) {
            if (auto result = cached(coordinate
                                     , std::min(options_.cacheBudget
                                                , remaining())))
            {
                return done(Stage::cache, *result);
            }
            ++depth;
        }
    } catch (const std::exception &e) {
        LOG(err2) << "Unexpected failure in fallback chain: " << e.what()
                  << "; falling back to synthetic data.";
    } catch (...) {
        LOG(err2) << "Unknown failure in fallback chain; falling back to "
            "synthetic data.";
    }

    // 4. synthetic
    return done(Stage::synthetic, synthetic(coordinate));
}

boost::optional<RiskObservation>
RiskOrchestrator::live(Stage stage, const IndexSource::pointer &source
                       , DataSource tag, const GeoCoordinate &coordinate
                       , const std::chrono::milliseconds &budget) const
{
    if (budget.count() <= 0) {
        LOG(warn2) << "No time left for stage <" << stage << ">, skipping.";
        return boost::none;
    }

    telemetry_->attemptStart(stage);
    const auto start(Steady::now());

    boost::optional<RiskObservation> result;
    try {
        // everything the worker touches is owned by the worker: it may
        // outlive this call when the budget elapses
        const auto fetcher(fetcher_);
        const auto clock(clock_);
        const auto retries(options_.maxRetries);
        auto abandoned(std::make_shared<std::atomic<bool>>(false));

        const auto outcome(detail::runWithin<Result<RiskObservation>>
                           (budget, [=]() -> Result<RiskObservation>
        {
            const auto attempt([=](const std::chrono::milliseconds &timeout)
                               -> Result<RawIndexReading, TransportError>
            {
                const auto left(budget - since(start));
                if (*abandoned || (left.count() <= 0)) {
                    return TransportError::timeout
                        ("Stage budget exhausted.");
                }
                return source->query(coordinate, std::min(timeout, left));
            });

            const auto reading(fetcher.fetch(attempt, retries, budget));
            if (!reading) { return reading.error(); }
            return observation(reading.value(), tag, clock->now());
        }));

        if (!outcome) {
            *abandoned = true;
            LOG(warn2) << "Source <" << source->name() << "> did not answer"
                       " within " << budget.count() << " ms.";
        } else if (!*outcome) {
            LOG(warn2) << "Source <" << source->name() << "> failed: "
                       << outcome->error() << ".";
        } else {
            result = outcome->value();
        }
    } catch (const std::exception &e) {
        LOG(warn2) << "Source <" << source->name() << "> failed: "
                   << e.what() << ".";
    } catch (...) {
        LOG(warn2) << "Source <" << source->name()
                   << "> failed with unknown error.";
    }

    telemetry_->attemptEnd(stage, since(start), bool(result));
    return result;
}

boost::optional<RiskObservation>
RiskOrchestrator::cached(const GeoCoordinate &coordinate
                         , const std::chrono::milliseconds &budget) const
{
    if (budget.count() <= 0) {
        LOG(warn2) << "No time left for cache lookup, skipping.";
        return boost::none;
    }

    telemetry_->attemptStart(Stage::cache);
    const auto start(Steady::now());

    boost::optional<RiskObservation> result;
    try {
        const auto cache(cache_);
        const auto outcome
            (detail::runWithin<boost::optional<RiskObservation>>
             (budget, [=]() { return cache->getFor(coordinate); }));

        if (!outcome) {
            LOG(warn2) << "Cache lookup did not finish within "
                       << budget.count() << " ms.";
        } else {
            result = *outcome;
        }
    } catch (const std::exception &e) {
        LOG(warn2) << "Cache lookup failed: " << e.what() << ".";
    } catch (...) {
        LOG(warn2) << "Cache lookup failed with unknown error.";
    }

    telemetry_->attemptEnd(Stage::cache, since(start), bool(result));
    return result;
}

RiskObservation
RiskOrchestrator::synthetic(const GeoCoordinate &coordinate) const
{
    telemetry_->attemptStart(Stage::synthetic);
    const auto start(Steady::now());

    boost::optional<RiskObservation> result;
    try {
        result = synthetic_->generate(coordinate);
    } catch (const std::exception &e) {
        LOG(err2) << "Synthetic generator failed: " << e.what()
                  << "; using fixed level.";
    } catch (...) {
        LOG(err2) << "Synthetic generator failed with unknown error; "
            "using fixed level.";
    }

    if (!result) {
        result = RiskObservation::synthetic(RiskLevel::moderate
                                            , clock_->now());
    }

    telemetry_->attemptEnd(Stage::synthetic, since(start), true);
    return *result;
}

void RiskOrchestrator::store(const GeoCoordinate &coordinate
                             , const RiskObservation &observation) const
{
    if (!cache_) { return; }

    try {
        const auto stored(cache_->set(coordinate, observation));
        if (!stored) {
            LOG(warn2) << "Failed to cache observation: "
                       << stored.error() << ".";
        }
    } catch (const std::exception &e) {
        LOG(warn2) << "Failed to cache observation: " << e.what() << ".";
    } catch (...) {
        LOG(warn2) << "Failed to cache observation: unknown error.";
    }
}

} // namespace wildfire
