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
#include <cmath>
#include <ostream>
#include <stdexcept>

#include <boost/lexical_cast.hpp>

#include "dbglog/dbglog.hpp"

#include "utility/raise.hpp"

#include "./risk.hpp"

namespace wildfire {

namespace {

void checkIndex(const boost::optional<double> &index)
{
    if (!index) { return; }
    if (!std::isfinite(*index) || (*index < 0.0)) {
        LOGTHROW(err1, std::invalid_argument)
            << "Risk index must be a finite non-negative number, got "
            << *index << ".";
    }
}

template <typename Enum>
Enum enumMember(const Json::Value &value, const char *name)
{
    const auto &member(value[name]);
    if (!member.isString()) {
        utility::raise<std::runtime_error>
            ("Missing or invalid member <%s>.", name);
    }

    try {
        return boost::lexical_cast<Enum>(member.asString());
    } catch (const boost::bad_lexical_cast&) {
        utility::raise<std::runtime_error>
            ("Invalid value <%s> of member <%s>."
             , member.asString(), name);
    }
    throw; // never reached
}

} // namespace

Result<RiskLevel> levelFromIndex(double index)
{
    if (!std::isfinite(index) || (index < 0.0)) {
        return ServiceError(ErrorCategory::validation
                            , "Fire weather index cannot be negative.");
    }

    if (index < 5.0) { return RiskLevel::veryLow; }
    if (index < 12.0) { return RiskLevel::low; }
    if (index < 21.0) { return RiskLevel::moderate; }
    if (index < 38.0) { return RiskLevel::high; }
    if (index < 50.0) { return RiskLevel::veryHigh; }
    return RiskLevel::extreme;
}

RiskObservation::RiskObservation(RiskLevel level
                                 , const boost::optional<double> &index
                                 , DataSource source, Freshness freshness
                                 , const Timestamp &observedAt)
    : level_(level), index_(index), source_(source), freshness_(freshness)
    , observedAt_(fromMillis(toMillis(observedAt)))
{
    checkIndex(index_);
}

RiskObservation RiskObservation::live(RiskLevel level
                                      , const boost::optional<double> &index
                                      , DataSource source
                                      , const Timestamp &observedAt)
{
    return RiskObservation(level, index, source, Freshness::live, observedAt);
}

RiskObservation RiskObservation::synthetic(RiskLevel level
                                           , const Timestamp &observedAt)
{
    return RiskObservation(level, boost::none, DataSource::synthetic
                           , Freshness::synthetic, observedAt);
}

RiskObservation RiskObservation::withFreshness(Freshness freshness) const
{
    auto copy(*this);
    copy.freshness_ = freshness;
    return copy;
}

bool RiskObservation::operator==(const RiskObservation &o) const
{
    return ((level_ == o.level_) && (index_ == o.index_)
            && (source_ == o.source_) && (freshness_ == o.freshness_)
            && (observedAt_ == o.observedAt_));
}

Json::Value asJson(const RiskObservation &o)
{
    Json::Value value(Json::objectValue);
    value["level"] = boost::lexical_cast<std::string>(o.level());
    if (o.index()) {
        value["index"] = *o.index();
    }
    value["source"] = boost::lexical_cast<std::string>(o.source());
    value["observedAt"] = Json::Int64(toMillis(o.observedAt()));
    return value;
}

RiskObservation observationFromJson(const Json::Value &value)
{
    if (!value.isObject()) {
        utility::raise<std::runtime_error>("Observation is not an object.");
    }

    const auto level(enumMember<RiskLevel>(value, "level"));

    boost::optional<double> index;
    if (value.isMember("index")) {
        const auto &raw(value["index"]);
        if (!raw.isNumeric()) {
            utility::raise<std::runtime_error>("Invalid member <index>.");
        }
        index = raw.asDouble();
    }

    // records written before source attribution existed
    auto source(DataSource::cache);
    if (value.isMember("source")) {
        source = enumMember<DataSource>(value, "source");
    }

    const auto &observedAt(value["observedAt"]);
    if (!observedAt.isIntegral()) {
        utility::raise<std::runtime_error>("Invalid member <observedAt>.");
    }

    try {
        return RiskObservation(level, index, source, Freshness::live
                               , fromMillis(observedAt.asInt64()));
    } catch (const std::invalid_argument &e) {
        utility::raise<std::runtime_error>("Invalid observation: %s."
                                           , e.what());
    }
    throw; // never reached
}

std::ostream& operator<<(std::ostream &os, const RiskObservation &o)
{
    os << "RiskObservation{level: " << o.level() << ", index: ";
    if (o.index()) { os << *o.index(); } else { os << "none"; }
    return os << ", source: " << o.source()
              << ", freshness: " << o.freshness()
              << ", observedAt: " << formatUtc(o.observedAt()) << "}";
}

} // namespace wildfire
