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
#include <cmath>
#include <ostream>

#include <boost/format.hpp>

#include "./geo.hpp"

namespace wildfire {

namespace {

double round2(double value)
{
    auto rounded(std::round(value * 100.0) / 100.0);
    // get rid of negative zero
    if (rounded == 0.0) { return 0.0; }
    return rounded;
}

} // namespace

bool valid(const GeoCoordinate &c)
{
    return (std::isfinite(c.latitude) && std::isfinite(c.longitude)
            && (c.latitude >= -90.0) && (c.latitude <= 90.0)
            && (c.longitude >= -180.0) && (c.longitude <= 180.0));
}

Result<GeoCoordinate> validate(const GeoCoordinate &c)
{
    if (!std::isfinite(c.latitude) || !std::isfinite(c.longitude)) {
        return ServiceError(ErrorCategory::validation
                            , "Coordinates must be finite numbers.");
    }

    if ((c.latitude < -90.0) || (c.latitude > 90.0)) {
        return ServiceError(ErrorCategory::validation
                            , "Latitude must be between -90 and 90 degrees.");
    }

    if ((c.longitude < -180.0) || (c.longitude > 180.0)) {
        return ServiceError
            (ErrorCategory::validation
             , "Longitude must be between -180 and 180 degrees.");
    }

    return c;
}

bool Region::contains(const GeoCoordinate &c) const
{
    if (!valid(c)) { return false; }

    return ((c.latitude >= minLatitude) && (c.latitude <= maxLatitude)
            && (c.longitude >= minLongitude) && (c.longitude <= maxLongitude));
}

Region scotland()
{
    return Region(54.6, 60.9, -9.0, 1.0);
}

std::string redact(const GeoCoordinate &c)
{
    if (!valid(c)) { return "INVALID_COORDS"; }

    return str(boost::format("%.2f,%.2f")
               % round2(c.latitude) % round2(c.longitude));
}

std::ostream& operator<<(std::ostream &os, const GeoCoordinate &c)
{
    return os << redact(c);
}

std::ostream& operator<<(std::ostream &os, const Region &r)
{
    return os << "[" << r.minLatitude << ".." << r.maxLatitude
              << ", " << r.minLongitude << ".." << r.maxLongitude << "]";
}

} // namespace wildfire
