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
 * @file error.hpp
 *
 * Error taxonomy shared by every boundary operation.
 *
 * Boundary operations return errors (see result.hpp), they never throw them.
 * ServiceError is what callers see, TransportError is what a single outbound
 * attempt reports to the resilient fetcher before it is classified.
 */

#ifndef wildfire_error_hpp_included_
#define wildfire_error_hpp_included_

#include <string>
#include <iosfwd>

#include <boost/optional.hpp>

#include "utility/enum-io.hpp"

namespace wildfire {

enum class ErrorCategory {
    validation, notFound, serviceUnavailable, network, parse, general
};

/** Refinement of an error category, used where the category alone does not
 *  let the caller decide what to do next.
 */
enum class ErrorKind {
    none, permissionDenied, locationUnavailable
};

struct ServiceError {
    ErrorCategory category;
    std::string message;
    boost::optional<int> statusCode;
    ErrorKind kind;

    ServiceError(ErrorCategory category, const std::string &message
                 , const boost::optional<int> &statusCode = boost::none
                 , ErrorKind kind = ErrorKind::none)
        : category(category), message(message), statusCode(statusCode)
        , kind(kind)
    {}
};

/** Fixed status-to-category mapping: 404 -> notFound,
 *  503 -> serviceUnavailable, anything else -> general.
 */
ErrorCategory categoryForStatus(int status);

/** Failure of one outbound attempt.
 */
struct TransportError {
    enum class Type {
        /** Transport succeeded, server answered with non-2xx status.
         */
        status,
        /** Connectivity fault (DNS, refused connection, reset...).
         */
        network,
        /** Attempt did not finish in time.
         */
        timeout,
        /** Transport succeeded but content is unusable.
         */
        parse
    };

    Type type;
    boost::optional<int> status;
    std::string message;

    TransportError(Type type, const std::string &message
                   , const boost::optional<int> &status = boost::none)
        : type(type), status(status), message(message)
    {}

    static TransportError http(int status, const std::string &message) {
        return TransportError(Type::status, message, status);
    }

    static TransportError network(const std::string &message) {
        return TransportError(Type::network, message);
    }

    static TransportError timeout(const std::string &message) {
        return TransportError(Type::timeout, message);
    }

    static TransportError parse(const std::string &message
                                , const boost::optional<int> &status
                                = boost::none)
    {
        return TransportError(Type::parse, message, status);
    }
};

std::ostream& operator<<(std::ostream &os, const ServiceError &error);
std::ostream& operator<<(std::ostream &os, const TransportError &error);

UTILITY_GENERATE_ENUM_IO(ErrorCategory,
                         ((validation)("validation"))
                         ((notFound)("notFound"))
                         ((serviceUnavailable)("serviceUnavailable"))
                         ((network)("network"))
                         ((parse)("parse"))
                         ((general)("general"))
                         )

UTILITY_GENERATE_ENUM_IO(ErrorKind,
                         ((none)("none"))
                         ((permissionDenied)("permissionDenied"))
                         ((locationUnavailable)("locationUnavailable"))
                         )

UTILITY_GENERATE_ENUM_IO(TransportError::Type,
                         ((status)("status"))
                         ((network)("network"))
                         ((timeout)("timeout"))
                         ((parse)("parse"))
                         )

} // namespace wildfire

#endif // wildfire_error_hpp_included_
