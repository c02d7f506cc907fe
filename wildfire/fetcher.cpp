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
#include <cmath>
#include <random>
#include <stdexcept>

#include <boost/lexical_cast.hpp>

#include "./fetcher.hpp"

namespace wildfire {

namespace detail {

bool retryable(const TransportError &error)
{
    switch (error.type) {
    case TransportError::Type::status:
        return (error.status && (*error.status >= 500));

    case TransportError::Type::network:
    case TransportError::Type::timeout:
        return true;

    case TransportError::Type::parse:
        return false;
    }
    return false;
}

ServiceError terminalError(const TransportError &error)
{
    switch (error.type) {
    case TransportError::Type::status:
        return ServiceError(categoryForStatus(error.status ? *error.status : 0)
                            , error.message, error.status);

    case TransportError::Type::network:
    case TransportError::Type::timeout:
        return ServiceError(ErrorCategory::network, error.message
                            , error.status);

    case TransportError::Type::parse:
        return ServiceError(ErrorCategory::parse, error.message
                            , error.status);
    }
    return ServiceError(ErrorCategory::general, error.message, error.status);
}

ServiceError exhaustedError(const TransportError &error, int attempts)
{
    const auto message(error.message + " (gave up after "
                       + boost::lexical_cast<std::string>(attempts)
                       + " attempts)");

    switch (error.type) {
    case TransportError::Type::status:
        return ServiceError(ErrorCategory::serviceUnavailable, message
                            , error.status);

    case TransportError::Type::network:
    case TransportError::Type::timeout:
        return ServiceError(ErrorCategory::network, message, error.status);

    case TransportError::Type::parse:
        // parse errors are terminal and never get here
        return ServiceError(ErrorCategory::parse, message, error.status);
    }
    return ServiceError(ErrorCategory::general, message, error.status);
}

} // namespace detail

Fetcher::Fetcher(const Clock::pointer &clock, const RetryPolicy &policy)
    : clock_(clock), policy_(policy)
{
    if (!clock_) {
        LOGTHROW(err2, std::invalid_argument) << "Fetcher needs a clock.";
    }

    if (policy_.baseDelay.count() < 0) {
        LOGTHROW(err2, std::invalid_argument)
            << "Backoff base delay cannot be negative.";
    }

    if ((policy_.jitter < 0.0) || (policy_.jitter > 1.0)) {
        LOGTHROW(err2, std::invalid_argument)
            << "Backoff jitter must be between 0 and 1.";
    }
}

std::chrono::milliseconds Fetcher::backoff(int retry) const
{
    const double delay(policy_.baseDelay.count() * std::pow(2.0, retry));

    if (policy_.jitter <= 0.0) {
        return std::chrono::milliseconds(std::int64_t(delay));
    }

    thread_local std::mt19937 engine{std::random_device{}()};
    std::uniform_real_distribution<double> spread(-1.0, 1.0);

    const auto jittered(delay + delay * policy_.jitter * spread(engine));
    return std::chrono::milliseconds
        (std::int64_t(std::min(std::max(jittered, 100.0), 30000.0)));
}

} // namespace wildfire
