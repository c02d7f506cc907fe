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
 * @file support/manualclock.hpp
 *
 * Clock driven by the test: sleep() only moves time forward and records the
 * requested delay.
 */

#ifndef wildfire_tests_support_manualclock_hpp_included_
#define wildfire_tests_support_manualclock_hpp_included_

#include <mutex>
#include <vector>

#include "wildfire/clock.hpp"

namespace wildfire { namespace test {

class ManualClock : public Clock {
public:
    typedef std::shared_ptr<ManualClock> pointer;

    /** 2023-11-14T22:13:20Z
     */
    static const std::int64_t DefaultStart = 1700000000000;

    explicit ManualClock(const Timestamp &start = fromMillis(DefaultStart))
        : now_(start)
    {}

    virtual Timestamp now() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    virtual void sleep(const std::chrono::milliseconds &duration) const {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += duration;
        sleeps_.push_back(duration);
    }

    void advance(const std::chrono::milliseconds &duration) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += duration;
    }

    std::vector<std::chrono::milliseconds> sleeps() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sleeps_;
    }

private:
    mutable std::mutex mutex_;
    mutable Timestamp now_;
    mutable std::vector<std::chrono::milliseconds> sleeps_;
};

} } // namespace wildfire::test

#endif // wildfire_tests_support_manualclock_hpp_included_
