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
 * @file preferences.hpp
 *
 * Small typed key/value store for persisted user preferences.
 */

#ifndef wildfire_preferences_hpp_included_
#define wildfire_preferences_hpp_included_

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include <boost/optional.hpp>
#include <boost/filesystem/path.hpp>

#include <json/json.h>

namespace wildfire {

/** Getters return none for missing keys and for values of another type.
 *  Setters throw on storage failure.
 */
class PreferenceStore {
public:
    typedef std::shared_ptr<PreferenceStore> pointer;

    virtual ~PreferenceStore() {}

    virtual boost::optional<std::string>
    getString(const std::string &key) const = 0;
    virtual boost::optional<double> getDouble(const std::string &key) const = 0;
    virtual boost::optional<std::int64_t>
    getInt(const std::string &key) const = 0;

    virtual void setString(const std::string &key
                           , const std::string &value) = 0;
    virtual void setDouble(const std::string &key, double value) = 0;
    virtual void setInt(const std::string &key, std::int64_t value) = 0;

    /** Missing key is fine.
     */
    virtual void remove(const std::string &key) = 0;
};

class MemoryPreferenceStore : public PreferenceStore {
public:
    MemoryPreferenceStore();

    virtual boost::optional<std::string>
    getString(const std::string &key) const;
    virtual boost::optional<double> getDouble(const std::string &key) const;
    virtual boost::optional<std::int64_t>
    getInt(const std::string &key) const;

    virtual void setString(const std::string &key, const std::string &value);
    virtual void setDouble(const std::string &key, double value);
    virtual void setInt(const std::string &key, std::int64_t value);

    virtual void remove(const std::string &key);

protected:
    /** Called with lock held after every modification.
     */
    virtual void persist(const Json::Value&) {}

    void assign(const std::string &key, const Json::Value &value);

    mutable std::mutex mutex_;
    Json::Value values_;
};

/** Preferences kept in a single JSON object file, rewritten (via temporary
 *  file and rename) after every modification.
 */
class FilePreferenceStore : public MemoryPreferenceStore {
public:
    /** Loads existing file. Missing file means no preferences, unreadable
     *  file is logged and ignored.
     */
    FilePreferenceStore(const boost::filesystem::path &path);

    const boost::filesystem::path& path() const { return path_; }

protected:
    virtual void persist(const Json::Value &values);

private:
    boost::filesystem::path path_;
};

} // namespace wildfire

#endif // wildfire_preferences_hpp_included_
