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
#include <ostream>

#include "./error.hpp"

namespace wildfire {

ErrorCategory categoryForStatus(int status)
{
    switch (status) {
    case 404: return ErrorCategory::notFound;
    case 503: return ErrorCategory::serviceUnavailable;
    default: break;
    }
    return ErrorCategory::general;
}

std::ostream& operator<<(std::ostream &os, const ServiceError &error)
{
    os << "<" << error.category;
    if (error.statusCode) { os << ", HTTP " << *error.statusCode; }
    if (error.kind != ErrorKind::none) { os << ", " << error.kind; }
    return os << ">: " << error.message;
}

std::ostream& operator<<(std::ostream &os, const TransportError &error)
{
    os << "<" << error.type;
    if (error.status) { os << ", HTTP " << *error.status; }
    return os << ">: " << error.message;
}

} // namespace wildfire
