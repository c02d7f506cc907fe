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
#include "dbglog/dbglog.hpp"

#include "./telemetry.hpp"

namespace wildfire {

void LogTelemetry::attemptStart(Stage stage)
{
    LOG(info1) << "Stage <" << stage << "> started.";
}

void LogTelemetry::attemptEnd(Stage stage
                              , const std::chrono::milliseconds &elapsed
                              , bool success)
{
    if (success) {
        LOG(info1) << "Stage <" << stage << "> succeeded in "
                   << elapsed.count() << " ms.";
    } else {
        LOG(warn1) << "Stage <" << stage << "> failed after "
                   << elapsed.count() << " ms.";
    }
}

void LogTelemetry::fallbackDepth(int depth)
{
    LOG(info1) << "Fallback depth " << depth << ".";
}

void LogTelemetry::complete(Stage stage
                            , const std::chrono::milliseconds &total)
{
    LOG(info2) << "Risk resolved by <" << stage << "> in " << total.count()
               << " ms.";
}

} // namespace wildfire
