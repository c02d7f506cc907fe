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
 * @file result.hpp
 *
 * Value-or-error return type used at every boundary of the library.
 */

#ifndef wildfire_result_hpp_included_
#define wildfire_result_hpp_included_

#include <stdexcept>
#include <utility>

#include <boost/variant.hpp>

#include "./error.hpp"

namespace wildfire {

/** Empty value for operations that only report success or failure.
 */
struct Unit {};

template <typename T, typename E = ServiceError>
class Result {
public:
    typedef T value_type;
    typedef E error_type;

    Result(const T &value) : content_(value) {}
    Result(T &&value) : content_(std::move(value)) {}
    Result(const E &error) : content_(error) {}
    Result(E &&error) : content_(std::move(error)) {}

    bool ok() const { return content_.which() == 0; }
    explicit operator bool() const { return ok(); }

    /** Returns held value, throws std::logic_error when holding an error.
     */
    const T& value() const {
        if (const auto *value = boost::get<T>(&content_)) { return *value; }
        throw std::logic_error("Result holds an error, not a value.");
    }

    /** Returns held error, throws std::logic_error when holding a value.
     */
    const E& error() const {
        if (const auto *error = boost::get<E>(&content_)) { return *error; }
        throw std::logic_error("Result holds a value, not an error.");
    }

    const T* operator->() const { return &value(); }
    const T& operator*() const { return value(); }

private:
    boost::variant<T, E> content_;
};

} // namespace wildfire

#endif // wildfire_result_hpp_included_
