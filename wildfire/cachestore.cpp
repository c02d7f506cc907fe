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
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <thread>

#include <boost/crc.hpp>
#include <boost/format.hpp>
#include <boost/filesystem.hpp>

#include "dbglog/dbglog.hpp"
#include "utility/streams.hpp"
#include "utility/path.hpp"

#include "./cachestore.hpp"

namespace wildfire {

namespace {

std::uint32_t calculateHash(const std::string &data)
{
    boost::crc_32_type crc;
    crc.process_bytes(data.data(), data.size());
    return crc.checksum();
}

bool validKey(const std::string &key)
{
    if (key.empty()) { return false; }

    for (auto c : key) {
        if (((c >= 'a') && (c <= 'z')) || ((c >= 'A') && (c <= 'Z'))
            || ((c >= '0') && (c <= '9'))
            || (c == '_') || (c == '-'))
        {
            continue;
        }
        return false;
    }
    return true;
}

const char *TmpExtension(".tmp");

} // namespace

boost::optional<std::string> MemoryCacheStore::get(const std::string &key)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto fvalues(values_.find(key));
    if (fvalues == values_.end()) { return boost::none; }
    return fvalues->second;
}

void MemoryCacheStore::set(const std::string &key, const std::string &value)
{
    std::lock_guard<std::mutex> lock(mutex_);
    values_[key] = value;
}

void MemoryCacheStore::remove(const std::string &key)
{
    std::lock_guard<std::mutex> lock(mutex_);
    values_.erase(key);
}

std::vector<std::string> MemoryCacheStore::keys()
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    keys.reserve(values_.size());
    for (const auto &item : values_) { keys.push_back(item.first); }
    return keys;
}

FileCacheStore::FileCacheStore(const fs::path &root)
    : root_(root)
{
    create_directories(root_);
}

fs::path FileCacheStore::path(const std::string &key) const
{
    if (!validKey(key)) {
        LOGTHROW(err1, std::invalid_argument)
            << "Invalid cache key <" << key << ">.";
    }

    const auto hash(calculateHash(key));
    return root_
        / str(boost::format("%02x/%02x")
              % ((hash >> 24) & 0xff)
              % ((hash >> 16) & 0xff)
              )
        / key;
}

boost::optional<std::string> FileCacheStore::get(const std::string &key)
{
    const auto file(path(key));
    if (!exists(file)) { return boost::none; }

    LOG(debug) << "Loading cache record <" << key << "> from file "
               << file << ".";

    utility::ifstreambuf f(file.string());
    std::string content((std::istreambuf_iterator<char>(f))
                        , std::istreambuf_iterator<char>());
    f.close();
    return content;
}

void FileCacheStore::set(const std::string &key, const std::string &value)
{
    const auto file(path(key));
    // per-thread temporary file, concurrent writers of one key must not
    // share it
    const auto tmpFile(utility::addExtension
                       (file, str(boost::format(".%s%s")
                                  % std::this_thread::get_id()
                                  % TmpExtension)));

    LOG(debug) << "Storing cache record <" << key << "> into file "
               << file << ".";

    create_directories(tmpFile.parent_path());

    {
        utility::ofstreambuf f(tmpFile.string());
        f.write(value.data(), value.size());
        f.close();
    }

    rename(tmpFile, file);
}

void FileCacheStore::remove(const std::string &key)
{
    boost::system::error_code ec;
    fs::remove(path(key), ec);
    if (ec) {
        LOG(warn1) << "Cannot remove cache record <" << key << ">: "
                   << ec.message() << ".";
    }
}

std::vector<std::string> FileCacheStore::keys()
{
    std::vector<std::string> keys;

    for (fs::recursive_directory_iterator ifiles(root_), efiles;
         ifiles != efiles; ++ifiles)
    {
        const auto &file(ifiles->path());
        if (!is_regular_file(file)) { continue; }
        // leftovers of interrupted writes
        if (file.extension() == TmpExtension) { continue; }

        const auto key(file.filename().string());
        if (validKey(key)) { keys.push_back(key); }
    }

    return keys;
}

} // namespace wildfire
