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
#include <ostream>
#include <stdexcept>

#include "dbglog/dbglog.hpp"

#include "./detail/timebox.hpp"
#include "./location.hpp"

namespace wildfire {

namespace {

const char *VersionKey("manual_location_version");
const char *LatitudeKey("manual_location_lat");
const char *LongitudeKey("manual_location_lon");
const char *PlaceKey("manual_location_place");
const char *TimestampKey("manual_location_timestamp");

std::chrono::milliseconds
since(const std::chrono::steady_clock::time_point &start)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>
        (std::chrono::steady_clock::now() - start);
}

} // namespace

const std::string LocationResolver::ManualFormatVersion("1.0");

GeoCoordinate defaultLocation(bool devMode)
{
    if (devMode) { return GeoCoordinate(57.2, -3.8); }
    return GeoCoordinate(55.8642, -4.2518);
}

LocationResolver::LocationResolver(const PositionSensor::pointer &sensor
                                   , const PreferenceStore::pointer
                                   &preferences
                                   , const LocationOptions &options
                                   , const Clock::pointer &clock)
    : sensor_(sensor), preferences_(preferences), options_(options)
    , clock_(clock ? clock : SystemClock::instance())
{
    if (!preferences_) {
        LOGTHROW(err2, std::invalid_argument)
            << "Location resolver needs a preference store.";
    }

    if (!valid(options_.defaultLocation)) {
        LOGTHROW(err2, std::invalid_argument)
            << "Invalid default location.";
    }
}

Result<ResolvedLocation> LocationResolver::resolve(bool allowDefault) const
{
    const auto start(Steady::now());

    try {
        if (auto location = fromSensor(start)) {
            LOG(info2) << "Location resolved: " << *location << ".";
            return *location;
        }

        if (auto location = loadManual()) {
            LOG(info2) << "Location resolved: " << *location << ".";
            return *location;
        }
    } catch (const std::exception &e) {
        LOG(err2) << "Location resolution failed: " << e.what() << ".";
    } catch (...) {
        LOG(err2) << "Location resolution failed with unknown error.";
    }

    LOG(info1) << "Location resolution took " << since(start).count()
               << " ms.";

    if (!allowDefault) {
        LOG(info2) << "No location available and default not allowed.";
        return ServiceError(ErrorCategory::validation
                            , "Location unavailable, manual entry required."
                            , boost::none, ErrorKind::permissionDenied);
    }

    const ResolvedLocation location(options_.defaultLocation
                                    , LocationSource::persistedDefault);
    LOG(info2) << "Location resolved: " << location << ".";
    return location;
}

boost::optional<ResolvedLocation>
LocationResolver::fromSensor(const Steady::time_point &start) const
{
    if (!sensor_ || !sensor_->available()) {
        LOG(info1) << "No position sensor, skipping sensor tiers.";
        return boost::none;
    }

    // tier 1: last known position
    try {
        if (const auto position = sensor_->lastKnown()) {
            if (valid(*position)) {
                return ResolvedLocation(*position, LocationSource::lastKnown);
            }
            LOG(warn1) << "Ignoring invalid last known position.";
        }
    } catch (const std::exception &e) {
        LOG(warn2) << "Cannot read last known position: " << e.what()
                   << ".";
    } catch (...) {
        LOG(warn2) << "Cannot read last known position: unknown error.";
    }

    // tier 2: live fix
    const auto budget(std::min(options_.liveFixBudget
                               , options_.totalBudget - since(start)));
    if (budget.count() <= 0) {
        LOG(warn2) << "No time left for live fix, skipping.";
        return boost::none;
    }

    try {
        const auto sensor(sensor_);
        const auto fix(detail::runWithin<Result<GeoCoordinate, SensorError>>
                       (budget, [=]() { return sensor->current(budget); }));

        if (!fix) {
            LOG(warn2) << "Live fix did not arrive within "
                       << budget.count() << " ms.";
        } else if (!*fix) {
            LOG(warn2) << "Live fix failed <" << fix->error().type << ">: "
                       << fix->error().message << ".";
        } else if (!valid(fix->value())) {
            LOG(warn2) << "Ignoring invalid live fix.";
        } else {
            return ResolvedLocation(fix->value(), LocationSource::liveFix);
        }
    } catch (const std::exception &e) {
        LOG(warn2) << "Live fix failed: " << e.what() << ".";
    } catch (...) {
        LOG(warn2) << "Live fix failed with unknown error.";
    }

    return boost::none;
}

Result<Unit>
LocationResolver::saveManual(const GeoCoordinate &coordinate
                             , const boost::optional<std::string> &placeName)
    const
{
    const auto validated(validate(coordinate));
    if (!validated) { return validated.error(); }

    try {
        // slot without timestamp reads as absent until fully written
        preferences_->remove(TimestampKey);
        preferences_->setString(VersionKey, ManualFormatVersion);
        preferences_->setDouble(LatitudeKey, coordinate.latitude);
        preferences_->setDouble(LongitudeKey, coordinate.longitude);
        if (placeName) {
            preferences_->setString(PlaceKey, *placeName);
        } else {
            preferences_->remove(PlaceKey);
        }
        preferences_->setInt(TimestampKey, toMillis(clock_->now()));
    } catch (const std::exception &e) {
        LOG(err2) << "Cannot save manual location: " << e.what() << ".";
        return ServiceError(ErrorCategory::general
                            , std::string("Failed to save manual location: ")
                            + e.what());
    }

    LOG(info2) << "Saved manual location " << coordinate
               << (placeName ? " (" + *placeName + ")" : std::string())
               << ".";
    return Unit();
}

Result<Unit> LocationResolver::clearManual() const
{
    try {
        for (const auto *key : { VersionKey, LatitudeKey, LongitudeKey
                                 , PlaceKey, TimestampKey })
        {
            preferences_->remove(key);
        }
    } catch (const std::exception &e) {
        LOG(err2) << "Cannot clear manual location: " << e.what() << ".";
        return ServiceError(ErrorCategory::general
                            , std::string("Failed to clear manual "
                                          "location: ") + e.what());
    }

    LOG(info1) << "Manual location cleared.";
    return Unit();
}

boost::optional<ResolvedLocation> LocationResolver::loadManual() const
{
    const auto version(preferences_->getString(VersionKey));
    if (!version || (*version != ManualFormatVersion)) {
        if (version) {
            LOG(info1) << "Ignoring manual location of unsupported version <"
                       << *version << ">.";
        }
        return boost::none;
    }

    const auto timestamp(preferences_->getInt(TimestampKey));
    if (!timestamp) {
        LOG(info1) << "Manual location has no timestamp, discarding.";
        discardManual();
        return boost::none;
    }

    const auto age(toMillis(clock_->now()) - *timestamp);
    if ((age < 0) || (age >= options_.manualMaxAge.count())) {
        LOG(info1) << "Manual location expired (age " << (age / 60000)
                   << " min), discarding.";
        discardManual();
        return boost::none;
    }

    const auto latitude(preferences_->getDouble(LatitudeKey));
    const auto longitude(preferences_->getDouble(LongitudeKey));
    if (!latitude || !longitude) {
        LOG(warn1) << "Manual location is incomplete, ignoring.";
        return boost::none;
    }

    const GeoCoordinate coordinate(*latitude, *longitude);
    if (!valid(coordinate)) {
        LOG(warn1) << "Manual location is invalid, ignoring.";
        return boost::none;
    }

    return ResolvedLocation(coordinate, LocationSource::cachedManual
                            , preferences_->getString(PlaceKey));
}

void LocationResolver::discardManual() const
{
    const auto cleared(clearManual());
    if (!cleared) {
        LOG(warn2) << "Stale manual location left in store: "
                   << cleared.error() << ".";
    }
}

std::ostream& operator<<(std::ostream &os, const ResolvedLocation &location)
{
    os << location.coordinates << " (" << location.source;
    if (location.placeName) { os << ", " << *location.placeName; }
    return os << ")";
}

} // namespace wildfire
