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
 * @file telemetry.hpp
 *
 * Observation hooks of the risk orchestrator.
 */

#ifndef wildfire_telemetry_hpp_included_
#define wildfire_telemetry_hpp_included_

#include <chrono>
#include <memory>

#include "utility/enum-io.hpp"

namespace wildfire {

/** Fallback chain stage, in order of preference.
 */
enum class Stage {
    primary, secondary, cache, synthetic
};

class Telemetry {
public:
    typedef std::shared_ptr<Telemetry> pointer;

    virtual ~Telemetry() {}

    virtual void attemptStart(Stage stage) = 0;

    virtual void attemptEnd(Stage stage
                            , const std::chrono::milliseconds &elapsed
                            , bool success) = 0;

    /** Number of stages that failed (or were skipped) before the answering
     *  one.
     */
    virtual void fallbackDepth(int depth) = 0;

    virtual void complete(Stage stage
                          , const std::chrono::milliseconds &total) = 0;
};

/** Writes events to the log.
 */
class LogTelemetry : public Telemetry {
public:
    virtual void attemptStart(Stage stage);
    virtual void attemptEnd(Stage stage
                            , const std::chrono::milliseconds &elapsed
                            , bool success);
    virtual void fallbackDepth(int depth);
    virtual void complete(Stage stage
                          , const std::chrono::milliseconds &total);
};

UTILITY_GENERATE_ENUM_IO(Stage,
                         ((primary)("primary"))
                         ((secondary)("secondary"))
                         ((cache)("cache"))
                         ((synthetic)("synthetic"))
                         )

} // namespace wildfire

#endif // wildfire_telemetry_hpp_included_
