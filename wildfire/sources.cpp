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
#include <sstream>

#include <boost/format.hpp>
#include <boost/math/constants/constants.hpp>

#include "dbglog/dbglog.hpp"

#include "./detail/json.hpp"
#include "./sources.hpp"

namespace wildfire {

namespace detail {

namespace {

const double WebMercatorHalfExtent(20037508.34);

/** Half size of the queried box in metres.
 */
const double BoxBuffer(1000.0);

const char *IndexKeys[] = { "fwi", "FWI", "value", "VALUE" };

boost::optional<TransportError> checkResponse(const HttpResponse &response)
{
    if (response.status >= 400) {
        return TransportError::http
            (int(response.status)
             , str(boost::format("HTTP status %d") % response.status));
    }

    if (!response.contentType.empty()
        && (response.contentType.find("json") == std::string::npos))
    {
        return TransportError::parse
            ("Unsupported response format: " + response.contentType
             , int(response.status));
    }

    return boost::none;
}

boost::optional<double> indexValue(const Json::Value &properties)
{
    if (!properties.isObject()) { return boost::none; }

    for (const auto *key : IndexKeys) {
        const auto &value(properties[key]);
        if (value.isNumeric()) { return value.asDouble(); }
    }
    return boost::none;
}

void readExtras(const Json::Value &properties, RawIndexReading &reading)
{
    const auto &level(properties["level"]);
    if (level.isString()) {
        std::istringstream is(level.asString());
        RiskLevel parsed;
        if (is >> parsed) { reading.level = parsed; }
    }

    for (const auto *key : { "observedAt", "datetime", "timestamp" }) {
        const auto &value(properties[key]);
        if (!value.isString()) { continue; }
        if (const auto ts = parseUtc(value.asString())) {
            reading.observedAt = ts;
            break;
        }
    }
}

Result<Json::Value, TransportError> parseBody(const HttpResponse &response)
{
    Json::Value root;
    std::string errors;
    if (!parseJson(response.body, root, &errors)) {
        return TransportError::parse("Failed to parse JSON response: "
                                     + errors, int(response.status));
    }
    return root;
}

Result<RawIndexReading, TransportError>
fromProperties(const Json::Value &properties, const HttpResponse &response)
{
    const auto index(indexValue(properties));
    if (!index) {
        return TransportError::parse("No index value found in response."
                                     , int(response.status));
    }

    if (!std::isfinite(*index) || (*index < 0.0)) {
        return TransportError::parse
            (str(boost::format("Invalid index value %g.") % *index)
             , int(response.status));
    }

    RawIndexReading reading(*index);
    readExtras(properties, reading);
    return reading;
}

} // namespace

void webMercator(const GeoCoordinate &coordinate, double &x, double &y)
{
    const auto pi(boost::math::constants::pi<double>());

    x = coordinate.longitude * WebMercatorHalfExtent / 180.0;
    y = (std::log(std::tan((90.0 + coordinate.latitude) * pi / 360.0))
         / (pi / 180.0)) * WebMercatorHalfExtent / 180.0;
}

Result<RawIndexReading, TransportError>
parseFeatureInfo(const HttpResponse &response)
{
    if (auto error = checkResponse(response)) { return *error; }

    const auto body(parseBody(response));
    if (!body) { return body.error(); }
    const auto &root(body.value());

    if (!root.isObject() || (root["type"] != "FeatureCollection")) {
        return TransportError::parse
            ("Invalid response format: expected FeatureCollection."
             , int(response.status));
    }

    const auto &features(root["features"]);
    if (!features.isArray() || features.empty()) {
        return TransportError::parse
            ("No index data available for the specified coordinates."
             , int(response.status));
    }

    return fromProperties(features[0]["properties"], response);
}

Result<RawIndexReading, TransportError>
parsePointReading(const HttpResponse &response)
{
    if (auto error = checkResponse(response)) { return *error; }

    const auto body(parseBody(response));
    if (!body) { return body.error(); }
    const auto &root(body.value());

    if (!root.isObject()) {
        return TransportError::parse("Invalid response format: expected "
                                     "JSON object.", int(response.status));
    }

    if (root["properties"].isObject()) {
        return fromProperties(root["properties"], response);
    }
    return fromProperties(root, response);
}

} // namespace detail

namespace {

Result<RawIndexReading, TransportError>
perform(const detail::HttpClient &http, const std::string &url
        , const std::chrono::milliseconds &timeout
        , Result<RawIndexReading, TransportError>
        (*parse)(const detail::HttpResponse&))
{
    detail::HttpResponse response;
    try {
        response = http.get(url, timeout);
    } catch (const detail::HttpError &e) {
        if (e.timedOut()) { return TransportError::timeout(e.what()); }
        return TransportError::network(e.what());
    }

    return parse(response);
}

} // namespace

WmsIndexSource::WmsIndexSource(const detail::HttpClient::pointer &http
                               , const std::string &baseUrl
                               , const std::string &layer)
    : http_(http), baseUrl_(baseUrl), layer_(layer)
{
    if (!http_) {
        LOGTHROW(err2, std::invalid_argument)
            << "WMS source needs an HTTP client.";
    }
}

std::string WmsIndexSource::url(const GeoCoordinate &coordinate) const
{
    double x, y;
    detail::webMercator(coordinate, x, y);

    return str(boost::format
               ("%s?SERVICE=WMS&VERSION=1.3.0&REQUEST=GetFeatureInfo"
                "&LAYERS=%s&QUERY_LAYERS=%s&STYLES=&CRS=EPSG:3857"
                "&BBOX=%.2f,%.2f,%.2f,%.2f&WIDTH=256&HEIGHT=256&I=128&J=128"
                "&INFO_FORMAT=application/json&FEATURE_COUNT=1")
               % baseUrl_ % layer_ % layer_
               % (x - detail::BoxBuffer) % (y - detail::BoxBuffer)
               % (x + detail::BoxBuffer) % (y + detail::BoxBuffer));
}

Result<RawIndexReading, TransportError>
WmsIndexSource::query(const GeoCoordinate &coordinate
                      , const std::chrono::milliseconds &timeout)
{
    LOG(info1) << "Querying WMS index at " << coordinate << ".";
    return perform(*http_, url(coordinate), timeout
                   , &detail::parseFeatureInfo);
}

PointIndexSource::PointIndexSource(const detail::HttpClient::pointer &http
                                   , const std::string &baseUrl)
    : http_(http), baseUrl_(baseUrl)
{
    if (!http_) {
        LOGTHROW(err2, std::invalid_argument)
            << "Point source needs an HTTP client.";
    }
}

std::string PointIndexSource::url(const GeoCoordinate &coordinate) const
{
    return str(boost::format("%s?lat=%.4f&lon=%.4f")
               % baseUrl_ % coordinate.latitude % coordinate.longitude);
}

Result<RawIndexReading, TransportError>
PointIndexSource::query(const GeoCoordinate &coordinate
                        , const std::chrono::milliseconds &timeout)
{
    LOG(info1) << "Querying point index at " << coordinate << ".";
    return perform(*http_, url(coordinate), timeout
                   , &detail::parsePointReading);
}

} // namespace wildfire
