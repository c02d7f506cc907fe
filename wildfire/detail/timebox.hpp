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
 * @file detail/timebox.hpp
 *
 * Runs a stage under a hard wall-clock budget.
 */

#ifndef wildfire_detail_timebox_hpp_included_
#define wildfire_detail_timebox_hpp_included_

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <thread>

#include <boost/optional.hpp>

namespace wildfire { namespace detail {

/** Runs function in a separate thread and waits at most `budget` for its
 *  result.
 *
 *  Returns boost::none when the budget elapses first (or is not positive,
 *  in which case the function is not run at all). The abandoned thread is
 *  detached and finishes on its own, everything it touches must therefore
 *  be owned by the function object (captured by value or shared pointer).
 *
 *  An exception thrown by the function is rethrown to the caller.
 */
template <typename T>
boost::optional<T> runWithin(const std::chrono::milliseconds &budget
                             , const std::function<T()> &function)
{
    if (budget.count() <= 0) { return boost::none; }

    auto task(std::make_shared<std::packaged_task<T()>>(function));
    auto future(task->get_future());

    std::thread([task]() { (*task)(); }).detach();

    if (future.wait_for(budget) != std::future_status::ready) {
        return boost::none;
    }

    return future.get();
}

} } // namespace wildfire::detail

#endif // wildfire_detail_timebox_hpp_included_
