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

#include "dbglog/dbglog.hpp"

#include "./geohash.hpp"

namespace wildfire {

namespace {

const char *Base32("0123456789bcdefghjkmnpqrstuvwxyz");

} // namespace

std::string geohash(const GeoCoordinate &coordinate, int precision)
{
    if ((precision < 1) || (precision > 12)) {
        LOGTHROW(err1, std::invalid_argument)
            << "Geohash precision must be between 1 and 12, got "
            << precision << ".";
    }

    double latMin(-90.0), latMax(90.0);
    double lonMin(-180.0), lonMax(180.0);

    std::string hash;
    hash.reserve(precision);

    unsigned int bits(0);
    int bitCount(0);
    // bits alternate, longitude first
    bool lonBit(true);

    while (int(hash.size()) < precision) {
        if (lonBit) {
            const auto mid((lonMin + lonMax) / 2.0);
            if (coordinate.longitude >= mid) {
                bits = (bits << 1) | 1;
                lonMin = mid;
            } else {
                bits <<= 1;
                lonMax = mid;
            }
        } else {
            const auto mid((latMin + latMax) / 2.0);
            if (coordinate.latitude >= mid) {
                bits = (bits << 1) | 1;
                latMin = mid;
            } else {
                bits <<= 1;
                latMax = mid;
            }
        }

        lonBit = !lonBit;

        if (++bitCount == 5) {
            hash.push_back(Base32[bits]);
            bits = 0;
            bitCount = 0;
        }
    }

    return hash;
}

bool validGeohash(const std::string &hash)
{
    if (hash.empty()) { return false; }
    return (hash.find_first_not_of(Base32) == std::string::npos);
}

} // namespace wildfire
