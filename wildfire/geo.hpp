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
 * @file geo.hpp
 *
 * Geographic coordinate value type, validation, region gate and the privacy
 * redaction formatter.
 *
 * NB: every coordinate written to any log must go through redact() (or the
 * output operator below, which calls it). Do not print raw latitude and
 * longitude anywhere.
 */

#ifndef wildfire_geo_hpp_included_
#define wildfire_geo_hpp_included_

#include <string>
#include <iosfwd>

#include "./result.hpp"

namespace wildfire {

/** WGS84 latitude/longitude in decimal degrees.
 */
struct GeoCoordinate {
    double latitude;
    double longitude;

    GeoCoordinate(double latitude, double longitude)
        : latitude(latitude), longitude(longitude)
    {}
};

/** Both components finite, latitude in [-90, 90], longitude in [-180, 180].
 */
bool valid(const GeoCoordinate &coordinate);

/** Returns the coordinate itself or a validation error describing the first
 *  violated constraint.
 */
Result<GeoCoordinate> validate(const GeoCoordinate &coordinate);

/** Axis aligned latitude/longitude box, bounds inclusive.
 */
struct Region {
    double minLatitude;
    double maxLatitude;
    double minLongitude;
    double maxLongitude;

    Region(double minLatitude, double maxLatitude
           , double minLongitude, double maxLongitude)
        : minLatitude(minLatitude), maxLatitude(maxLatitude)
        , minLongitude(minLongitude), maxLongitude(maxLongitude)
    {}

    /** False for invalid coordinates.
     */
    bool contains(const GeoCoordinate &coordinate) const;
};

/** Scotland including St Kilda, Orkney and Shetland: 54.6..60.9 N,
 *  -9.0..1.0 E.
 */
Region scotland();

/** Privacy redaction: both components rounded to 2 decimal places,
 *  e.g. "55.95,-3.19". Invalid coordinates yield "INVALID_COORDS".
 */
std::string redact(const GeoCoordinate &coordinate);

/** Writes redacted form.
 */
std::ostream& operator<<(std::ostream &os, const GeoCoordinate &coordinate);

std::ostream& operator<<(std::ostream &os, const Region &region);

} // namespace wildfire

#endif // wildfire_geo_hpp_included_
