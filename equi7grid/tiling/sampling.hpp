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
 * \file tiling/sampling.hpp
 *
 * Sampling to tile class mapping and sampling token notation.
 */

#ifndef equi7grid_tiling_sampling_hpp_included_
#define equi7grid_tiling_sampling_hpp_included_

#include <new>
#include <string>

#include <boost/optional.hpp>

#include "basetypes.hpp"

namespace equi7grid { namespace tiling {

/** Returns tile class for given sampling:
 *
 *   T6 for 64 <= s <= 6000 and s dividing 600000
 *   T3 for 20 <= s <= 60   and s dividing 300000
 *   T1 for  1 <= s <= 16   and s dividing 100000
 *
 * Throws UnsupportedSampling otherwise.
 */
TileClass tileClass(Sampling sampling);

/** Non-throwing version of tileClass.
 */
boost::optional<TileClass> tileClass(Sampling sampling, std::nothrow_t);

/** Tile extent in metres (600000, 300000 or 100000).
 */
Coordinate tileExtent(TileClass tileClass);

/** Tile size digit as written in tile names (6, 3 or 1).
 */
inline int tileSizeDigit(TileClass tileClass) {
    return int(tileExtent(tileClass) / TileNameUnit);
}

/** Sampling used when the family of a tile is requested by tile class only.
 */
Sampling representativeSampling(TileClass tileClass);

/** Samplings a grid can be constructed with, in descending order.
 */
const SamplingList& supportedSamplings();

/** Is sampling one of supportedSamplings()?
 */
bool supported(Sampling sampling);

/** Returns samplings from supportedSamplings() that do not satisfy the tile
 *  class rule. Should be empty.
 */
SamplingList inconsistentSamplings();

/** Formats sampling token used inside long tile names.
 *
 *  Samplings below 1000 are written as 3-digit zero-padded number. Samplings
 *  >= 1000 are written in kilometres as D'K'D (first digit of kilometres and
 *  first decimal digit) or as plain number of metres, based on notation.
 *
 *  Kilometre notation is lossy for samplings not divisible by 100.
 */
std::string encodeSampling(Sampling sampling
                           , SamplingNotation notation
                           = SamplingNotation::kilometres);

/** Parses sampling token. Throws MalformedTileName (structure) on failure.
 */
Sampling decodeSampling(const std::string &token
                        , SamplingNotation notation
                        = SamplingNotation::kilometres);

} } // namespace equi7grid::tiling

#endif // equi7grid_tiling_sampling_hpp_included_
