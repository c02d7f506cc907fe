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
 * @file synthetic.hpp
 *
 * Last-resort risk observation generator. Never fails.
 */

#ifndef wildfire_synthetic_hpp_included_
#define wildfire_synthetic_hpp_included_

#include <memory>

#include "utility/enum-io.hpp"

#include "./clock.hpp"
#include "./geo.hpp"
#include "./risk.hpp"

namespace wildfire {

class SyntheticGenerator {
public:
    typedef std::shared_ptr<SyntheticGenerator> pointer;

    enum class Strategy {
        /** Always the configured level.
         */
        fixed

        /** Level picked by CRC-32 of the location's geohash, stable for a
         *  given map cell.
         */
        , geohash
    };

    SyntheticGenerator(const Clock::pointer &clock
                       , Strategy strategy = Strategy::fixed
                       , RiskLevel level = RiskLevel::moderate);

    /** Produces synthetic observation stamped with current time. Falls back
     *  to the fixed level when the coordinate cannot be hashed.
     */
    RiskObservation generate(const GeoCoordinate &coordinate) const;

    Strategy strategy() const { return strategy_; }

private:
    Clock::pointer clock_;
    Strategy strategy_;
    RiskLevel level_;
};

UTILITY_GENERATE_ENUM_IO(SyntheticGenerator::Strategy,
                         ((fixed)("fixed"))
                         ((geohash)("geohash"))
                         )

} // namespace wildfire

#endif // wildfire_synthetic_hpp_included_
