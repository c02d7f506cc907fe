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
 * @file sources.hpp
 *
 * Concrete risk index sources.
 */

#ifndef wildfire_sources_hpp_included_
#define wildfire_sources_hpp_included_

#include <string>

#include "./detail/http.hpp"
#include "./source.hpp"

namespace wildfire {

/** WMS GetFeatureInfo source (EFFIS fire weather index layer).
 *
 *  Queries the centre pixel of a 256x256 EPSG:3857 image covering
 *  +-1000 m around the point and reads the first feature of the returned
 *  GeoJSON FeatureCollection.
 */
class WmsIndexSource : public IndexSource {
public:
    WmsIndexSource(const detail::HttpClient::pointer &http
                   , const std::string &baseUrl
                   , const std::string &layer = "ecmwf.fwi");

    virtual std::string name() const { return "wms"; }

    virtual Result<RawIndexReading, TransportError>
    query(const GeoCoordinate &coordinate
          , const std::chrono::milliseconds &timeout);

    /** GetFeatureInfo request URL for given coordinate.
     */
    std::string url(const GeoCoordinate &coordinate) const;

private:
    detail::HttpClient::pointer http_;
    std::string baseUrl_;
    std::string layer_;
};

/** Point JSON source (regional service): GET <baseUrl>?lat=..&lon=..
 *  returning a JSON object with the index either at top level or under
 *  "properties".
 */
class PointIndexSource : public IndexSource {
public:
    PointIndexSource(const detail::HttpClient::pointer &http
                     , const std::string &baseUrl);

    virtual std::string name() const { return "point"; }

    virtual Result<RawIndexReading, TransportError>
    query(const GeoCoordinate &coordinate
          , const std::chrono::milliseconds &timeout);

    std::string url(const GeoCoordinate &coordinate) const;

private:
    detail::HttpClient::pointer http_;
    std::string baseUrl_;
};

namespace detail {

/** Web Mercator (EPSG:3857) easting/northing of a WGS84 coordinate.
 */
void webMercator(const GeoCoordinate &coordinate, double &x, double &y);

/** Reads index from GeoJSON FeatureCollection returned by GetFeatureInfo.
 */
Result<RawIndexReading, TransportError>
parseFeatureInfo(const HttpResponse &response);

/** Reads index from point service response.
 */
Result<RawIndexReading, TransportError>
parsePointReading(const HttpResponse &response);

} // namespace detail

} // namespace wildfire

#endif // wildfire_sources_hpp_included_
