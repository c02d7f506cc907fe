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
 * @file source.hpp
 *
 * Interface of a network-backed risk index source.
 */

#ifndef wildfire_source_hpp_included_
#define wildfire_source_hpp_included_

#include <chrono>
#include <memory>
#include <string>

#include <boost/optional.hpp>

#include "./clock.hpp"
#include "./error.hpp"
#include "./geo.hpp"
#include "./result.hpp"
#include "./risk.hpp"

namespace wildfire {

/** One reading returned by a source.
 */
struct RawIndexReading {
    /** Fire Weather Index value.
     */
    double index;

    /** Level reported by the source itself, derived from index when absent.
     */
    boost::optional<RiskLevel> level;

    /** Observation time reported by the source, time of retrieval when
     *  absent.
     */
    boost::optional<Timestamp> observedAt;

    explicit RawIndexReading(double index = 0.0) : index(index) {}
};

class IndexSource {
public:
    typedef std::shared_ptr<IndexSource> pointer;

    virtual ~IndexSource() {}

    /** Source name used in logs.
     */
    virtual std::string name() const = 0;

    /** Single attempt to obtain a reading at given (validated) coordinate,
     *  bounded by timeout. Retrying is the caller's business.
     */
    virtual Result<RawIndexReading, TransportError>
    query(const GeoCoordinate &coordinate
          , const std::chrono::milliseconds &timeout) = 0;
};

} // namespace wildfire

#endif // wildfire_source_hpp_included_
