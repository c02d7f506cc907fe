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
 * @file location.hpp
 *
 * Location resolver: best-effort device location within a bounded time.
 *
 * Tiers, in order:
 *
 *    1. last known sensor position (cheap, non-blocking)
 *    2. live sensor fix (2 s, capped by what is left of the 2.5 s total)
 *    3. manual location saved by the user less than 1 hour ago
 *    4. persisted default location, only if the caller allows it
 *
 * Tiers 1 and 2 are skipped when there is no sensor or the sensor reports
 * itself unavailable. Sensor failures are tier failures, never errors.
 */

#ifndef wildfire_location_hpp_included_
#define wildfire_location_hpp_included_

#include <chrono>
#include <iosfwd>
#include <memory>
#include <string>

#include <boost/optional.hpp>

#include "utility/enum-io.hpp"

#include "./clock.hpp"
#include "./geo.hpp"
#include "./preferences.hpp"
#include "./result.hpp"

namespace wildfire {

enum class LocationSource {
    lastKnown, liveFix, cachedManual, persistedDefault
};

struct ResolvedLocation {
    GeoCoordinate coordinates;
    LocationSource source;

    /** Only for manual locations saved with a place name.
     */
    boost::optional<std::string> placeName;

    ResolvedLocation(const GeoCoordinate &coordinates, LocationSource source
                     , const boost::optional<std::string> &placeName
                     = boost::none)
        : coordinates(coordinates), source(source), placeName(placeName)
    {}
};

struct SensorError {
    enum class Type { permissionDenied, serviceDisabled, timeout, hardware };

    Type type;
    std::string message;

    SensorError(Type type, const std::string &message)
        : type(type), message(message)
    {}
};

/** Platform position sensor.
 */
class PositionSensor {
public:
    typedef std::shared_ptr<PositionSensor> pointer;

    virtual ~PositionSensor() {}

    /** Capability check: false on platforms without positioning hardware.
     */
    virtual bool available() const = 0;

    /** Last fix known to the platform, must not block.
     */
    virtual boost::optional<GeoCoordinate> lastKnown() = 0;

    /** Fresh fix, bounded by timeout.
     */
    virtual Result<GeoCoordinate, SensorError>
    current(const std::chrono::milliseconds &timeout) = 0;
};

/** Default location used when nothing better is known: Aviemore
 *  (57.2, -3.8) in development mode, Scotland centroid (55.8642, -4.2518)
 *  otherwise.
 */
GeoCoordinate defaultLocation(bool devMode);

struct LocationOptions {
    GeoCoordinate defaultLocation;
    std::chrono::milliseconds liveFixBudget;
    std::chrono::milliseconds totalBudget;

    /** Manual locations this old or older are ignored.
     */
    std::chrono::milliseconds manualMaxAge;

    LocationOptions()
        : defaultLocation(wildfire::defaultLocation(false))
        , liveFixBudget(2000), totalBudget(2500)
        , manualMaxAge(std::chrono::hours(1))
    {}
};

class LocationResolver {
public:
    typedef std::shared_ptr<LocationResolver> pointer;

    /** Version of the persisted manual location slot.
     */
    static const std::string ManualFormatVersion;

    /** Sensor may be null (no positioning on this platform).
     */
    LocationResolver(const PositionSensor::pointer &sensor
                     , const PreferenceStore::pointer &preferences
                     , const LocationOptions &options = LocationOptions()
                     , const Clock::pointer &clock = Clock::pointer());

    /** Resolves location. With allowDefault false and every other tier
     *  failing the result is a validation error of kind permissionDenied.
     */
    Result<ResolvedLocation> resolve(bool allowDefault = true) const;

    /** Overwrites the manual location slot with coordinate, optional place
     *  name and current time.
     */
    Result<Unit> saveManual(const GeoCoordinate &coordinate
                            , const boost::optional<std::string> &placeName
                            = boost::none) const;

    /** Removes the manual location slot.
     */
    Result<Unit> clearManual() const;

    /** Manual location if present, of current version, not expired and
     *  valid. Stale or broken slot is cleared.
     */
    boost::optional<ResolvedLocation> loadManual() const;

    const LocationOptions& options() const { return options_; }

private:
    typedef std::chrono::steady_clock Steady;

    boost::optional<ResolvedLocation>
    fromSensor(const Steady::time_point &start) const;

    void discardManual() const;

    PositionSensor::pointer sensor_;
    PreferenceStore::pointer preferences_;
    LocationOptions options_;
    Clock::pointer clock_;
};

std::ostream& operator<<(std::ostream &os, const ResolvedLocation &location);

UTILITY_GENERATE_ENUM_IO(LocationSource,
                         ((lastKnown)("lastKnown"))
                         ((liveFix)("liveFix"))
                         ((cachedManual)("cachedManual"))
                         ((persistedDefault)("persistedDefault"))
                         )

UTILITY_GENERATE_ENUM_IO(SensorError::Type,
                         ((permissionDenied)("permissionDenied"))
                         ((serviceDisabled)("serviceDisabled"))
                         ((timeout)("timeout"))
                         ((hardware)("hardware"))
                         )

} // namespace wildfire

#endif // wildfire_location_hpp_included_
