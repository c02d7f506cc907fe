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
 * @file risk.hpp
 *
 * Wildfire risk observation model.
 */

#ifndef wildfire_risk_hpp_included_
#define wildfire_risk_hpp_included_

#include <iosfwd>

#include <boost/optional.hpp>

#include <json/json.h>

#include "utility/enum-io.hpp"

#include "./clock.hpp"
#include "./result.hpp"

namespace wildfire {

/** Six ordered severity tiers.
 */
enum class RiskLevel {
    veryLow, low, moderate, high, veryHigh, extreme
};

/** Where an observation originally came from. Cache hits keep the source of
 *  the cached observation, `cache` marks records that predate source
 *  attribution.
 */
enum class DataSource {
    primary, secondary, cache, synthetic
};

enum class Freshness {
    live, cached, synthetic
};

/** Maps Fire Weather Index to risk level:
 *
 *    FWI < 5 -> veryLow, < 12 -> low, < 21 -> moderate, < 38 -> high,
 *    < 50 -> veryHigh, otherwise extreme
 *
 * Negative or non-finite index is a validation error.
 */
Result<RiskLevel> levelFromIndex(double index);

class RiskObservation {
public:
    /** Throws std::invalid_argument for negative or non-finite index.
     *  Observation time is kept with millisecond precision, the precision
     *  of persisted records.
     */
    RiskObservation(RiskLevel level, const boost::optional<double> &index
                    , DataSource source, Freshness freshness
                    , const Timestamp &observedAt);

    /** Observation fetched from a live source.
     */
    static RiskObservation live(RiskLevel level
                                , const boost::optional<double> &index
                                , DataSource source
                                , const Timestamp &observedAt);

    /** Synthetic observation, never carries an index value.
     */
    static RiskObservation synthetic(RiskLevel level
                                     , const Timestamp &observedAt);

    /** Copy with overridden freshness. The only permitted modification.
     */
    RiskObservation withFreshness(Freshness freshness) const;

    RiskLevel level() const { return level_; }
    const boost::optional<double>& index() const { return index_; }
    DataSource source() const { return source_; }
    Freshness freshness() const { return freshness_; }
    const Timestamp& observedAt() const { return observedAt_; }

    bool operator==(const RiskObservation &o) const;
    bool operator!=(const RiskObservation &o) const { return !(*this == o); }

private:
    RiskLevel level_;
    boost::optional<double> index_;
    DataSource source_;
    Freshness freshness_;
    Timestamp observedAt_;
};

/** Serializes observation without freshness (freshness is a property of the
 *  read path, not of the stored data).
 */
Json::Value asJson(const RiskObservation &observation);

/** Parses observation written by asJson(). Resulting freshness is `live`,
 *  the caller overrides it. Throws std::runtime_error on malformed input.
 */
RiskObservation observationFromJson(const Json::Value &value);

std::ostream& operator<<(std::ostream &os, const RiskObservation &o);

UTILITY_GENERATE_ENUM_IO(RiskLevel,
                         ((veryLow)("veryLow"))
                         ((low)("low"))
                         ((moderate)("moderate"))
                         ((high)("high"))
                         ((veryHigh)("veryHigh"))
                         ((extreme)("extreme"))
                         )

UTILITY_GENERATE_ENUM_IO(DataSource,
                         ((primary)("primary"))
                         ((secondary)("secondary"))
                         ((cache)("cache"))
                         ((synthetic)("synthetic"))
                         )

UTILITY_GENERATE_ENUM_IO(Freshness,
                         ((live)("live"))
                         ((cached)("cached"))
                         ((synthetic)("synthetic"))
                         )

} // namespace wildfire

#endif // wildfire_risk_hpp_included_
