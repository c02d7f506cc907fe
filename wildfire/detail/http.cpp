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
#include <iterator>
#include <mutex>

#include <curl/curl.h>

#include "dbglog/dbglog.hpp"

#include "./http.hpp"

extern "C" {

size_t wildfire_detail_http_write(char *ptr, size_t size, size_t nmemb
                                  , void *userdata)
{
    auto &buffer(*static_cast<std::string*>(userdata));
    auto bytes(size * nmemb);
    buffer.append(ptr, bytes);
    return bytes;
}

} // extern "C"

namespace wildfire { namespace detail {

namespace {

std::once_flag curlInitFlag;

void globalInit()
{
    std::call_once(curlInitFlag, []()
    {
        auto res(::curl_global_init(CURL_GLOBAL_DEFAULT));
        if (res != CURLE_OK) {
            LOGTHROW(err2, std::runtime_error)
                << "Failed to initialize libcurl: <"
                << ::curl_easy_strerror(res) << ">.";
        }
    });
}

std::shared_ptr< ::CURL> createCurl()
{
    auto c(::curl_easy_init());
    if (!c) {
        LOG(err2) << "Failed to create CURL handle.";
        throw HttpError("Failed to create CURL handle.", false);
    }

    return std::shared_ptr< ::CURL>
        (c, [](CURL *c) { if (c) { ::curl_easy_cleanup(c); } });
}

#define CHECK_CURL_STATUS(what)                                         \
    do {                                                                \
        auto res(what);                                                 \
        if (res != CURLE_OK) {                                          \
            LOG(warn1) << "Failed to fetch <" << target << ">: <"       \
                       << res << ", " << ::curl_easy_strerror(res)      \
                       << ">.";                                         \
            throw HttpError(::curl_easy_strerror(res)                   \
                            , res == CURLE_OPERATION_TIMEDOUT);         \
        }                                                               \
    } while (0)

#define SETOPT(name, value) \
    CHECK_CURL_STATUS(::curl_easy_setopt(curl, name, value))

} // namespace

std::string withoutQuery(const std::string &url)
{
    return url.substr(0, url.find_first_of("?#"));
}

HttpClient::HttpClient(const boost::optional<std::string> &proxy
                       , const std::string &userAgent)
    : proxy_(proxy), userAgent_(userAgent)
{
    globalInit();
}

HttpResponse HttpClient::get(const std::string &url
                             , const std::chrono::milliseconds &timeout)
    const
{
    const auto target(withoutQuery(url));
    LOG(info1) << "Fetching <" << target << "> (GET, timeout "
               << timeout.count() << " ms).";

    auto handle(createCurl());
    auto *curl(handle.get());

    HttpResponse response;

    // switch off SIGALARM
    SETOPT(CURLOPT_NOSIGNAL, 1L);
    SETOPT(CURLOPT_HTTPGET, 1L);
    SETOPT(CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);
    SETOPT(CURLOPT_URL, url.c_str());
    SETOPT(CURLOPT_FOLLOWLOCATION, 1L);
    SETOPT(CURLOPT_MAXREDIRS, 5L);
    SETOPT(CURLOPT_TIMEOUT_MS, long(timeout.count()));
    SETOPT(CURLOPT_CONNECTTIMEOUT_MS, long(timeout.count()));
    SETOPT(CURLOPT_USERAGENT, userAgent_.c_str());

    if (proxy_) {
        SETOPT(CURLOPT_PROXY, proxy_->c_str());
    }

    SETOPT(CURLOPT_WRITEFUNCTION, &wildfire_detail_http_write);
    SETOPT(CURLOPT_WRITEDATA, &response.body);

    CHECK_CURL_STATUS(::curl_easy_perform(curl));

    CHECK_CURL_STATUS(::curl_easy_getinfo
                      (curl, CURLINFO_RESPONSE_CODE, &response.status));

    char *contentType(nullptr);
    CHECK_CURL_STATUS(::curl_easy_getinfo
                      (curl, CURLINFO_CONTENT_TYPE, &contentType));
    if (contentType) { response.contentType = contentType; }

    LOG(info1) << "Fetched <" << target << ">: HTTP " << response.status
               << ", " << response.body.size() << " bytes.";
    return response;
}

#undef CHECK_CURL_STATUS
#undef SETOPT

} } // namespace wildfire::detail
