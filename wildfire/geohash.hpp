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
 * @file geohash.hpp
 *
 * Geohash encoder.
 *
 * Used only to derive cache keys: the same coordinate always yields the same
 * key and nearby coordinates share a cell. No proximity search is built on
 * top of it.
 */

#ifndef wildfire_geohash_hpp_included_
#define wildfire_geohash_hpp_included_

#include <string>

#include "./geo.hpp"

namespace wildfire {

/** Precision used for cache keys (cell of roughly 4.9 x 4.9 km).
 */
const int CacheKeyPrecision(5);

/** Encodes coordinate as geohash of given precision (1 to 12 characters).
 *
 *  Coordinate must be valid, the caller is responsible for rejecting invalid
 *  input. Throws std::invalid_argument for precision out of range.
 */
std::string geohash(const GeoCoordinate &coordinate
                    , int precision = CacheKeyPrecision);

/** Checks that the string is a non-empty sequence of geohash base32
 *  characters.
 */
bool validGeohash(const std::string &hash);

} // namespace wildfire

#endif // wildfire_geohash_hpp_included_
