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
 * @file geocache.hpp
 *
 * Geospatially keyed cache of the most recent risk observation per map cell.
 *
 * Keys are geohashes (precision 5). Each record carries the time it was
 * stored and a format version. A record is served while its age is at most
 * the TTL (6 hours by default, boundary inclusive). The number of entries is
 * bounded by capacity, the entry with the oldest access time is evicted when
 * a new key arrives at full capacity.
 *
 * Records with an unknown format version or a payload that cannot be parsed
 * are misses, never errors. They are deleted when encountered.
 *
 * Concurrency: the access index is a plain map of key -> last access time
 * updated in short critical sections; store I/O happens outside of them.
 * Concurrent readers and writers may therefore interleave their timestamp
 * updates and eviction can pick an entry that is not strictly the least
 * recently used one. That is accepted: LRU here is an approximation, a test
 * expecting exact LRU order under concurrent access is wrong. Only clear()
 * excludes every other operation.
 */

#ifndef wildfire_geocache_hpp_included_
#define wildfire_geocache_hpp_included_

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <boost/optional.hpp>
#include <boost/thread/shared_mutex.hpp>

#include "./cachestore.hpp"
#include "./clock.hpp"
#include "./geo.hpp"
#include "./result.hpp"
#include "./risk.hpp"

namespace wildfire {

/** Introspection snapshot.
 */
struct CacheMetadata {
    std::size_t totalEntries;

    /** Key -> last access time.
     */
    std::map<std::string, Timestamp> accessLog;

    /** Key that would be evicted next, none for empty cache.
     */
    boost::optional<std::string> lruCandidate;

    CacheMetadata() : totalEntries() {}
};

class Geocache {
public:
    typedef std::shared_ptr<Geocache> pointer;

    struct Options {
        std::size_t capacity;
        std::chrono::milliseconds ttl;

        Options() : capacity(100), ttl(std::chrono::hours(6)) {}
    };

    /** Version written into every record. Anything else read back is a miss.
     */
    static const std::string FormatVersion;

    /** Rebuilds the access index from records already present in the store,
     *  dropping expired and unreadable ones.
     */
    Geocache(const CacheStore::pointer &store, const Clock::pointer &clock
             , const Options &options = Options());

    /** Cached observation for key with freshness forced to `cached` and the
     *  original source preserved. Absent, expired, unsupported or corrupt
     *  record is a miss.
     */
    boost::optional<RiskObservation> get(const std::string &key);

    /** get() keyed by the coordinate's geohash. Invalid coordinate is a miss.
     */
    boost::optional<RiskObservation> getFor(const GeoCoordinate &coordinate);

    /** Stores observation under coordinate's geohash.
     */
    Result<Unit> set(const GeoCoordinate &coordinate
                     , const RiskObservation &observation);

    /** Stores observation under explicit key.
     */
    Result<Unit> set(const std::string &key
                     , const RiskObservation &observation);

    /** Drops entry, missing key is fine.
     */
    void remove(const std::string &key);

    /** Drops everything. Exclusive with all other operations.
     */
    void clear();

    /** Removes expired and unreadable records. Returns number of removed
     *  records.
     */
    std::size_t cleanup();

    CacheMetadata metadata() const;

    const Options& options() const { return options_; }

private:
    enum class Status { valid, missing, unavailable, expired, corrupt
                        , unsupported };

    struct Lookup {
        Status status;
        boost::optional<RiskObservation> observation;
        Timestamp storedAt;

        Lookup(Status status) : status(status) {}
    };

    Lookup load(const std::string &key, const Timestamp &now) const;

    void discard(const std::string &key);

    void touch(const std::string &key, const Timestamp &when);

    CacheStore::pointer store_;
    Clock::pointer clock_;
    Options options_;

    /** Shared by regular operations, exclusive for clear().
     */
    mutable boost::shared_mutex guard_;

    /** Protects index_.
     */
    mutable std::mutex indexMutex_;
    std::map<std::string, Timestamp> index_;
};

} // namespace wildfire

#endif // wildfire_geocache_hpp_included_
