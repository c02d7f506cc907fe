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
#include <boost/crc.hpp>

#include "./geohash.hpp"
#include "./synthetic.hpp"

namespace wildfire {

namespace {

const RiskLevel Tiers[] = {
    RiskLevel::veryLow, RiskLevel::low, RiskLevel::moderate
    , RiskLevel::high, RiskLevel::veryHigh, RiskLevel::extreme
};

} // namespace

SyntheticGenerator::SyntheticGenerator(const Clock::pointer &clock
                                       , Strategy strategy, RiskLevel level)
    : clock_(clock ? clock : SystemClock::instance())
    , strategy_(strategy), level_(level)
{}

RiskObservation
SyntheticGenerator::generate(const GeoCoordinate &coordinate) const
{
    const auto now(clock_->now());

    if ((strategy_ != Strategy::geohash) || !valid(coordinate)) {
        return RiskObservation::synthetic(level_, now);
    }

    const auto hash(geohash(coordinate, CacheKeyPrecision));
    boost::crc_32_type crc;
    crc.process_bytes(hash.data(), hash.size());

    const auto count(sizeof(Tiers) / sizeof(Tiers[0]));
    return RiskObservation::synthetic(Tiers[crc.checksum() % count], now);
}

} // namespace wildfire
