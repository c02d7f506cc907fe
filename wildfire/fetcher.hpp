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
 * @file fetcher.hpp
 *
 * Resilient fetcher: bounded retry with exponential backoff around a single
 * outbound operation.
 *
 * The operation is any callable taking the per-attempt timeout and returning
 * Result<T, TransportError>. Fetcher classifies each failure:
 *
 *    * HTTP 4xx and parse errors are terminal, returned right away
 *    * HTTP 5xx, connectivity faults and timeouts are retried
 *      (1 + maxRetries attempts in total), waiting baseDelay * 2^n
 *      before retry n
 *    * an exception escaping the operation counts as connectivity fault
 *
 * Fetcher never falls back to anything itself, it only reports the error.
 */

#ifndef wildfire_fetcher_hpp_included_
#define wildfire_fetcher_hpp_included_

#include <chrono>
#include <type_traits>

#include <boost/optional.hpp>

#include "dbglog/dbglog.hpp"

#include "./clock.hpp"
#include "./result.hpp"

namespace wildfire {

struct RetryPolicy {
    /** Number of additional attempts after the first one.
     */
    int maxRetries;

    /** Delay before the first retry, doubled for each following one.
     */
    std::chrono::milliseconds baseDelay;

    /** Timeout handed to each attempt.
     */
    std::chrono::milliseconds timeout;

    /** Relative jitter applied to each backoff delay, 0.25 means +-25 %.
     *  0 disables jitter (and the clamping that comes with it).
     */
    double jitter;

    RetryPolicy()
        : maxRetries(3), baseDelay(1000), timeout(3000), jitter(0.0)
    {}
};

/** Upper bound of RetryPolicy::maxRetries.
 */
const int MaxRetries(10);

namespace detail {

/** True if failure is worth another attempt.
 */
bool retryable(const TransportError &error);

/** Maps failure that ends fetching to service error.
 */
ServiceError terminalError(const TransportError &error);

/** Maps last failure after all attempts were used to service error.
 */
ServiceError exhaustedError(const TransportError &error, int attempts);

} // namespace detail

class Fetcher {
public:
    Fetcher(const Clock::pointer &clock
            , const RetryPolicy &policy = RetryPolicy());

    /** Runs operation with retry policy given at construction.
     */
    template <typename Operation>
    Result<typename std::result_of
           <Operation(std::chrono::milliseconds)>::type::value_type>
    fetch(Operation operation) const {
        return fetch(operation, policy_.maxRetries, policy_.timeout);
    }

    /** Runs operation with explicit retry budget and per-attempt timeout.
     *
     *  Negative maxRetries (or more than MaxRetries) and non-positive
     *  timeout are validation errors, the operation is not run at all.
     */
    template <typename Operation>
    Result<typename std::result_of
           <Operation(std::chrono::milliseconds)>::type::value_type>
    fetch(Operation operation, int maxRetries
          , const std::chrono::milliseconds &timeout) const;

    /** Delay before retry number `retry` (0-based).
     */
    std::chrono::milliseconds backoff(int retry) const;

    const RetryPolicy& policy() const { return policy_; }

private:
    Clock::pointer clock_;
    RetryPolicy policy_;
};

// inlines

template <typename Operation>
Result<typename std::result_of
       <Operation(std::chrono::milliseconds)>::type::value_type>
Fetcher::fetch(Operation operation, int maxRetries
               , const std::chrono::milliseconds &timeout) const
{
    if ((maxRetries < 0) || (maxRetries > MaxRetries)) {
        return ServiceError(ErrorCategory::validation
                            , "maxRetries must be between 0 and 10.");
    }

    if (timeout.count() <= 0) {
        return ServiceError(ErrorCategory::validation
                            , "Timeout must be a positive duration.");
    }

    boost::optional<TransportError> last;

    for (int attempt(0); attempt <= maxRetries; ++attempt) {
        if (attempt) {
            const auto delay(backoff(attempt - 1));
            LOG(info1) << "Retrying in " << delay.count() << " ms (attempt "
                       << (attempt + 1) << "/" << (maxRetries + 1) << ").";
            clock_->sleep(delay);
        }

        try {
            const auto outcome(operation(timeout));
            if (outcome) { return outcome.value(); }
            last = outcome.error();
        } catch (const std::exception &e) {
            last = TransportError::network(e.what());
        } catch (...) {
            last = TransportError::network("Unknown failure.");
        }

        if (!detail::retryable(*last)) {
            LOG(warn1) << "Attempt failed with terminal error " << *last
                       << ".";
            return detail::terminalError(*last);
        }

        LOG(warn1) << "Attempt " << (attempt + 1) << "/" << (maxRetries + 1)
                   << " failed: " << *last << ".";
    }

    return detail::exhaustedError(*last, maxRetries + 1);
}

} // namespace wildfire

#endif // wildfire_fetcher_hpp_included_
