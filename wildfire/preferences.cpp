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
#include <iterator>

#include <boost/filesystem.hpp>

#include "dbglog/dbglog.hpp"
#include "utility/streams.hpp"
#include "utility/path.hpp"

#include "./detail/json.hpp"
#include "./preferences.hpp"

namespace fs = boost::filesystem;

namespace wildfire {

typedef std::lock_guard<std::mutex> Lock;

MemoryPreferenceStore::MemoryPreferenceStore()
    : values_(Json::objectValue)
{}

boost::optional<std::string>
MemoryPreferenceStore::getString(const std::string &key) const
{
    Lock lock(mutex_);
    const auto &value(values_[key]);
    if (!value.isString()) { return boost::none; }
    return value.asString();
}

boost::optional<double>
MemoryPreferenceStore::getDouble(const std::string &key) const
{
    Lock lock(mutex_);
    const auto &value(values_[key]);
    if (!value.isNumeric()) { return boost::none; }
    return value.asDouble();
}

boost::optional<std::int64_t>
MemoryPreferenceStore::getInt(const std::string &key) const
{
    Lock lock(mutex_);
    const auto &value(values_[key]);
    if (!value.isInt64()) { return boost::none; }
    return std::int64_t(value.asInt64());
}

void MemoryPreferenceStore::assign(const std::string &key
                                   , const Json::Value &value)
{
    Lock lock(mutex_);
    auto previous(values_);
    values_[key] = value;
    try {
        persist(values_);
    } catch (...) {
        values_ = previous;
        throw;
    }
}

void MemoryPreferenceStore::setString(const std::string &key
                                      , const std::string &value)
{
    assign(key, value);
}

void MemoryPreferenceStore::setDouble(const std::string &key, double value)
{
    assign(key, value);
}

void MemoryPreferenceStore::setInt(const std::string &key
                                   , std::int64_t value)
{
    assign(key, Json::Int64(value));
}

void MemoryPreferenceStore::remove(const std::string &key)
{
    Lock lock(mutex_);
    if (!values_.isMember(key)) { return; }

    auto previous(values_);
    values_.removeMember(key);
    try {
        persist(values_);
    } catch (...) {
        values_ = previous;
        throw;
    }
}

FilePreferenceStore::FilePreferenceStore(const fs::path &path)
    : path_(path)
{
    if (!exists(path_)) {
        LOG(info1) << "No preferences file " << path_ << " yet.";
        return;
    }

    try {
        utility::ifstreambuf f(path_.string());
        std::string content((std::istreambuf_iterator<char>(f))
                            , std::istreambuf_iterator<char>());
        f.close();

        Json::Value values;
        std::string errors;
        if (!detail::parseJson(content, values, &errors)
            || !values.isObject())
        {
            LOG(warn2) << "Ignoring malformed preferences file " << path_
                       << ": " << errors << ".";
            return;
        }

        values_ = values;
    } catch (const std::exception &e) {
        LOG(warn2) << "Cannot read preferences file " << path_ << ": "
                   << e.what() << ".";
    }
}

void FilePreferenceStore::persist(const Json::Value &values)
{
    const auto tmpFile(utility::addExtension(path_, ".tmp"));

    if (path_.has_parent_path()) {
        create_directories(path_.parent_path());
    }

    {
        const auto content(detail::writeJson(values));
        utility::ofstreambuf f(tmpFile.string());
        f.write(content.data(), content.size());
        f.close();
    }

    rename(tmpFile, path_);
}

} // namespace wildfire
