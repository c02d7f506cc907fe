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
#include <stdexcept>
#include <vector>

#include <boost/thread/locks.hpp>

#include "dbglog/dbglog.hpp"

#include "./detail/json.hpp"
#include "./geohash.hpp"
#include "./geocache.hpp"

namespace wildfire {

namespace {

typedef boost::shared_lock<boost::shared_mutex> SharedLock;
typedef boost::unique_lock<boost::shared_mutex> ExclusiveLock;
typedef std::lock_guard<std::mutex> IndexLock;

boost::optional<std::string>
oldest(const std::map<std::string, Timestamp> &index)
{
    if (index.empty()) { return boost::none; }

    auto best(index.begin());
    for (auto iindex(index.begin()), eindex(index.end());
         iindex != eindex; ++iindex)
    {
        if (iindex->second < best->second) { best = iindex; }
    }
    return best->first;
}

Json::Value buildRecord(const std::string &key, const Timestamp &storedAt
                        , const RiskObservation &observation)
{
    Json::Value record(Json::objectValue);
    record["version"] = Geocache::FormatVersion;
    record["storedAt"] = Json::Int64(toMillis(storedAt));
    record["geohash"] = key;
    record["data"] = asJson(observation);
    return record;
}

} // namespace

const std::string Geocache::FormatVersion("1.0");

Geocache::Geocache(const CacheStore::pointer &store
                   , const Clock::pointer &clock, const Options &options)
    : store_(store), clock_(clock), options_(options)
{
    if (!store_ || !clock_) {
        LOGTHROW(err2, std::invalid_argument)
            << "Geocache needs both store and clock.";
    }

    if (!options_.capacity) {
        LOGTHROW(err2, std::invalid_argument)
            << "Geocache capacity must be positive.";
    }

    if (options_.ttl.count() < 0) {
        LOGTHROW(err2, std::invalid_argument)
            << "Geocache TTL cannot be negative.";
    }

    // rebuild index from persisted records
    std::vector<std::string> keys;
    try {
        keys = store_->keys();
    } catch (const std::exception &e) {
        LOG(warn2) << "Cannot list persisted cache records: " << e.what()
                   << "; starting with empty cache.";
        return;
    }

    const auto now(clock_->now());
    std::size_t dropped(0);
    for (const auto &key : keys) {
        const auto lookup(load(key, now));
        switch (lookup.status) {
        case Status::valid:
            index_[key] = lookup.storedAt;
            break;

        case Status::expired:
        case Status::corrupt:
        case Status::unsupported:
            discard(key);
            ++dropped;
            break;

        case Status::missing:
        case Status::unavailable:
            break;
        }
    }

    LOG(info2) << "Geocache opened with " << index_.size()
               << " entries (" << dropped << " stale records dropped).";
}

Geocache::Lookup Geocache::load(const std::string &key
                                , const Timestamp &now) const
{
    boost::optional<std::string> raw;
    try {
        raw = store_->get(key);
    } catch (const std::exception &e) {
        LOG(warn2) << "Cannot read cache record <" << key << ">: "
                   << e.what() << ".";
        return Lookup(Status::unavailable);
    }

    if (!raw) { return Lookup(Status::missing); }

    Json::Value record;
    std::string errors;
    if (!detail::parseJson(*raw, record, &errors) || !record.isObject()) {
        LOG(warn1) << "Corrupted cache record <" << key << ">: "
                   << errors << ".";
        return Lookup(Status::corrupt);
    }

    // records without version predate versioning and use the first format
    std::string version(FormatVersion);
    if (record.isMember("version")) {
        const auto &rawVersion(record["version"]);
        if (!rawVersion.isString()) {
            LOG(warn1) << "Cache record <" << key
                       << "> has invalid version field.";
            return Lookup(Status::unsupported);
        }
        version = rawVersion.asString();
    }

    if (version != FormatVersion) {
        LOG(info1) << "Cache record <" << key << "> has unsupported version <"
                   << version << ">.";
        return Lookup(Status::unsupported);
    }

    const auto &storedAt(record["storedAt"]);
    if (!storedAt.isIntegral()) {
        LOG(warn1) << "Cache record <" << key << "> has no valid timestamp.";
        return Lookup(Status::corrupt);
    }

    Lookup lookup(Status::valid);
    try {
        lookup.observation = observationFromJson(record["data"]);
    } catch (const std::exception &e) {
        LOG(warn1) << "Corrupted cache record <" << key << ">: "
                   << e.what() << ".";
        return Lookup(Status::corrupt);
    }
    lookup.storedAt = fromMillis(storedAt.asInt64());

    // inclusive boundary: exactly TTL old is still valid
    const auto age(toMillis(now) - storedAt.asInt64());
    if (age > options_.ttl.count()) {
        LOG(debug) << "Cache record <" << key << "> expired (age "
                   << age << " ms).";
        return Lookup(Status::expired);
    }

    return lookup;
}

void Geocache::discard(const std::string &key)
{
    {
        IndexLock lock(indexMutex_);
        index_.erase(key);
    }

    try {
        store_->remove(key);
    } catch (const std::exception &e) {
        LOG(warn2) << "Cannot remove cache record <" << key << ">: "
                   << e.what() << ".";
    }
}

void Geocache::touch(const std::string &key, const Timestamp &when)
{
    IndexLock lock(indexMutex_);
    index_[key] = when;
}

boost::optional<RiskObservation> Geocache::get(const std::string &key)
{
    SharedLock guard(guard_);

    const auto now(clock_->now());
    const auto lookup(load(key, now));

    switch (lookup.status) {
    case Status::valid:
        touch(key, now);
        LOG(info1) << "Cache hit <" << key << ">.";
        return lookup.observation->withFreshness(Freshness::cached);

    case Status::expired:
    case Status::corrupt:
    case Status::unsupported:
        discard(key);
        break;

    case Status::missing:
    case Status::unavailable:
        break;
    }

    LOG(info1) << "Cache miss <" << key << ">.";
    return boost::none;
}

boost::optional<RiskObservation>
Geocache::getFor(const GeoCoordinate &coordinate)
{
    if (!valid(coordinate)) { return boost::none; }
    return get(geohash(coordinate, CacheKeyPrecision));
}

Result<Unit> Geocache::set(const GeoCoordinate &coordinate
                           , const RiskObservation &observation)
{
    const auto validated(validate(coordinate));
    if (!validated) { return validated.error(); }

    return set(geohash(coordinate, CacheKeyPrecision), observation);
}

Result<Unit> Geocache::set(const std::string &key
                           , const RiskObservation &observation)
{
    SharedLock guard(guard_);

    const auto now(clock_->now());

    // make room for a new key
    std::vector<std::string> victims;
    {
        IndexLock lock(indexMutex_);
        if (!index_.count(key)) {
            while (index_.size() >= options_.capacity) {
                const auto victim(oldest(index_));
                if (!victim) { break; }
                index_.erase(*victim);
                victims.push_back(*victim);
            }
        }
    }

    for (const auto &victim : victims) {
        LOG(info1) << "Evicting least recently used entry <" << victim
                   << ">.";
        try {
            store_->remove(victim);
        } catch (const std::exception &e) {
            LOG(warn2) << "Cannot remove evicted record <" << victim
                       << ">: " << e.what() << ".";
        }
    }

    try {
        store_->set(key, detail::writeJson
                    (buildRecord(key, now, observation)));
    } catch (const std::exception &e) {
        LOG(warn2) << "Cannot store cache record <" << key << ">: "
                   << e.what() << ".";
        return ServiceError(ErrorCategory::general
                            , std::string("Failed to write cache entry: ")
                            + e.what());
    }

    touch(key, now);
    LOG(info1) << "Cached <" << key << ">.";
    return Unit();
}

void Geocache::remove(const std::string &key)
{
    SharedLock guard(guard_);
    discard(key);
}

void Geocache::clear()
{
    ExclusiveLock guard(guard_);

    {
        IndexLock lock(indexMutex_);
        index_.clear();
    }

    try {
        for (const auto &key : store_->keys()) {
            store_->remove(key);
        }
    } catch (const std::exception &e) {
        LOG(err2) << "Cannot clear persisted cache records: " << e.what()
                  << ".";
    }

    LOG(info2) << "Geocache cleared.";
}

std::size_t Geocache::cleanup()
{
    SharedLock guard(guard_);

    std::vector<std::string> keys;
    try {
        keys = store_->keys();
    } catch (const std::exception &e) {
        LOG(warn2) << "Cannot list persisted cache records: " << e.what()
                   << ".";
        return 0;
    }

    const auto now(clock_->now());
    std::size_t removed(0);
    for (const auto &key : keys) {
        switch (load(key, now).status) {
        case Status::expired:
        case Status::corrupt:
        case Status::unsupported:
            discard(key);
            ++removed;
            break;

        case Status::valid:
        case Status::missing:
        case Status::unavailable:
            break;
        }
    }

    LOG(info2) << "Geocache cleanup removed " << removed << " records.";
    return removed;
}

CacheMetadata Geocache::metadata() const
{
    CacheMetadata metadata;

    IndexLock lock(indexMutex_);
    metadata.totalEntries = index_.size();
    metadata.accessLog = index_;
    metadata.lruCandidate = oldest(index_);
    return metadata;
}

} // namespace wildfire
