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
 * @file detail/http.hpp
 *
 * Minimal blocking HTTP GET over libcurl.
 */

#ifndef wildfire_detail_http_hpp_included_
#define wildfire_detail_http_hpp_included_

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include <boost/optional.hpp>

namespace wildfire { namespace detail {

struct HttpResponse {
    long int status;
    std::string contentType;
    std::string body;

    HttpResponse() : status() {}
};

/** Transfer failure (no HTTP status available).
 */
class HttpError : public std::runtime_error {
public:
    HttpError(const std::string &message, bool timedOut)
        : std::runtime_error(message), timedOut_(timedOut)
    {}

    bool timedOut() const { return timedOut_; }

private:
    bool timedOut_;
};

class HttpClient {
public:
    typedef std::shared_ptr<HttpClient> pointer;

    HttpClient(const boost::optional<std::string> &proxy = boost::none
               , const std::string &userAgent = "wildfire-risk/1.0");

    /** Fetches url. Any HTTP status is returned, transfer failure throws
     *  HttpError. Safe to call from multiple threads, each call uses its own
     *  curl handle.
     */
    HttpResponse get(const std::string &url
                     , const std::chrono::milliseconds &timeout) const;

private:
    boost::optional<std::string> proxy_;
    std::string userAgent_;
};

/** URL stripped of query string and fragment. Query strings carry the
 *  queried position, only this form may be logged.
 */
std::string withoutQuery(const std::string &url);

} } // namespace wildfire::detail

#endif // wildfire_detail_http_hpp_included_
