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
 * \file error.hpp
 *
 * Grid error types.
 */

#ifndef equi7grid_error_hpp_included_
#define equi7grid_error_hpp_included_

#include <stdexcept>
#include <string>

#include "utility/enum-io.hpp"

namespace equi7grid {

struct Error : std::runtime_error {
    Error(const std::string &message) : std::runtime_error(message) {}
};

/** Static grid data cannot be loaded (missing, unreadable or corrupt).
 */
struct DataUnavailable : Error {
    DataUnavailable(const std::string &message) : Error(message) {}
};

struct NoSuchSubgrid : Error {
    NoSuchSubgrid(const std::string &message) : Error(message) {}
};

struct UnsupportedSampling : Error {
    UnsupportedSampling(const std::string &message) : Error(message) {}
};

/** Tile name failed to parse or failed one of the cross-checks against the
 *  tiling system it was decoded in. Failed check is available in `check`.
 */
struct MalformedTileName : Error {
    enum class Check {
        structure, subgrid, sampling, tileSize, alignment, range
    };

    MalformedTileName(const std::string &message
                      , Check check = Check::structure)
        : Error(message), check(check)
    {}

    Check check;
};

struct SubgridMismatch : MalformedTileName {
    SubgridMismatch(const std::string &message)
        : MalformedTileName(message, Check::subgrid) {}
};

struct SamplingMismatch : MalformedTileName {
    SamplingMismatch(const std::string &message)
        : MalformedTileName(message, Check::sampling) {}
};

struct TileSizeMismatch : MalformedTileName {
    TileSizeMismatch(const std::string &message)
        : MalformedTileName(message, Check::tileSize) {}
};

/** Lower-left corner is not a multiple of the tile extent.
 */
struct UnalignedCorner : MalformedTileName {
    UnalignedCorner(const std::string &message)
        : MalformedTileName(message, Check::alignment) {}
};

/** Lower-left corner cannot be expressed in 3-digit 100km units.
 */
struct CornerOutOfRange : MalformedTileName {
    CornerOutOfRange(const std::string &message)
        : MalformedTileName(message, Check::range) {}
};

/** Geodetic point is inside no subgrid or inside more than one.
 */
struct AmbiguousOrUnresolvedPoint : Error {
    AmbiguousOrUnresolvedPoint(const std::string &message) : Error(message) {}
};

UTILITY_GENERATE_ENUM_IO(MalformedTileName::Check,
    ((structure))
    ((subgrid))
    ((sampling))
    ((tileSize))
    ((alignment))
    ((range))
)

} // namespace equi7grid

#endif // equi7grid_error_hpp_included_
