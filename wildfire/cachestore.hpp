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
 * @file cachestore.hpp
 *
 * Durable string key/value stores backing the geocache.
 *
 * Stores only move strings around, they know nothing about records, TTL or
 * eviction. Failures to write are reported by exception, reading a missing
 * key yields boost::none and removing a missing key is a no-op.
 */

#ifndef wildfire_cachestore_hpp_included_
#define wildfire_cachestore_hpp_included_

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <boost/filesystem/path.hpp>

namespace wildfire {

namespace fs = boost::filesystem;

class CacheStore {
public:
    typedef std::shared_ptr<CacheStore> pointer;

    virtual ~CacheStore() {}

    virtual boost::optional<std::string> get(const std::string &key) = 0;

    /** Stores value under key, replaces existing one.
     */
    virtual void set(const std::string &key, const std::string &value) = 0;

    virtual void remove(const std::string &key) = 0;

    /** All keys currently stored.
     */
    virtual std::vector<std::string> keys() = 0;
};

/** Process-local store.
 */
class MemoryCacheStore : public CacheStore {
public:
    virtual boost::optional<std::string> get(const std::string &key);
    virtual void set(const std::string &key, const std::string &value);
    virtual void remove(const std::string &key);
    virtual std::vector<std::string> keys();

private:
    std::mutex mutex_;
    std::map<std::string, std::string> values_;
};

/** One file per key under root directory, spread into subdirectories by
 *  CRC-32 of the key. Keys are limited to [A-Za-z0-9_-] (geohashes fit).
 *
 *  Writes go to a temporary file that is renamed over the target so a reader
 *  never sees a half-written record.
 */
class FileCacheStore : public CacheStore {
public:
    FileCacheStore(const fs::path &root);

    virtual boost::optional<std::string> get(const std::string &key);
    virtual void set(const std::string &key, const std::string &value);
    virtual void remove(const std::string &key);
    virtual std::vector<std::string> keys();

    const fs::path& root() const { return root_; }

private:
    fs::path path(const std::string &key) const;

    const fs::path root_;
};

} // namespace wildfire

#endif // wildfire_cachestore_hpp_included_
