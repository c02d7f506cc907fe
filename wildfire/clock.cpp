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
#include <thread>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

#include "./clock.hpp"

namespace pt = boost::posix_time;
namespace ba = boost::algorithm;

namespace wildfire {

namespace {

const pt::ptime Epoch(boost::gregorian::date(1970, 1, 1));

} // namespace

Timestamp SystemClock::now() const
{
    return std::chrono::system_clock::now();
}

void SystemClock::sleep(const std::chrono::milliseconds &duration) const
{
    std::this_thread::sleep_for(duration);
}

Clock::pointer SystemClock::instance()
{
    static Clock::pointer clock(std::make_shared<SystemClock>());
    return clock;
}

std::int64_t toMillis(const Timestamp &timestamp)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>
        (timestamp.time_since_epoch()).count();
}

Timestamp fromMillis(std::int64_t millis)
{
    return Timestamp(std::chrono::milliseconds(millis));
}

std::string formatUtc(const Timestamp &timestamp)
{
    const auto value(Epoch + pt::milliseconds(toMillis(timestamp)));
    return pt::to_iso_extended_string(value) + "Z";
}

boost::optional<Timestamp> parseUtc(const std::string &value)
{
    auto raw(value);
    if (ba::ends_with(raw, "Z")) { raw.resize(raw.size() - 1); }
    if (raw.empty()) { return boost::none; }

    try {
        const auto parsed(pt::from_iso_extended_string(raw));
        if (parsed.is_special()) { return boost::none; }
        return fromMillis((parsed - Epoch).total_milliseconds());
    } catch (const std::exception&) {
        return boost::none;
    }
}

} // namespace wildfire
