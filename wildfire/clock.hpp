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
 * @file clock.hpp
 *
 * Time source abstraction.
 *
 * Everything that ages data (cache TTL, manual location age) or waits
 * (retry backoff) asks a Clock instead of the system so that tests can move
 * time deterministically. All timestamps are UTC.
 */

#ifndef wildfire_clock_hpp_included_
#define wildfire_clock_hpp_included_

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include <boost/optional.hpp>

namespace wildfire {

/** UTC instant. std::chrono::system_clock counts from the Unix epoch.
 */
typedef std::chrono::system_clock::time_point Timestamp;

class Clock {
public:
    typedef std::shared_ptr<Clock> pointer;

    virtual ~Clock() {}

    virtual Timestamp now() const = 0;

    /** Blocks current thread for given duration.
     */
    virtual void sleep(const std::chrono::milliseconds &duration) const = 0;
};

class SystemClock : public Clock {
public:
    virtual Timestamp now() const;
    virtual void sleep(const std::chrono::milliseconds &duration) const;

    /** Shared process-wide instance.
     */
    static Clock::pointer instance();
};

std::int64_t toMillis(const Timestamp &timestamp);
Timestamp fromMillis(std::int64_t millis);

/** Formats timestamp as ISO 8601 with "Z" suffix.
 */
std::string formatUtc(const Timestamp &timestamp);

/** Parses ISO 8601 (extended format, optional fractional seconds, optional
 *  "Z" suffix). Returns boost::none when the string cannot be parsed.
 */
boost::optional<Timestamp> parseUtc(const std::string &value);

} // namespace wildfire

#endif // wildfire_clock_hpp_included_
