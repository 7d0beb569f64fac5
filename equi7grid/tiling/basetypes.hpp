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
#ifndef equi7grid_tiling_basetypes_hpp_included_
#define equi7grid_tiling_basetypes_hpp_included_

#include <array>
#include <string>
#include <vector>

#include "utility/enum-io.hpp"

#include "../registry.hpp"

namespace equi7grid { namespace tiling {

using registry::TileClass;
using registry::TileNameSet;

/** Grid sampling, i.e. pixel size in metres.
 */
typedef int Sampling;

typedef std::vector<Sampling> SamplingList;

/** Planar coordinate of a tile corner, metres.
 */
typedef long Coordinate;

/** Tile corner coordinates are written in tile names in these units (100km).
 */
constexpr Coordinate TileNameUnit(100000);

/** Textual form of a tile name.
 *
 *  long:  EU500M_E012N018T6
 *  short: E012N018T6 (subgrid and sampling must be known from context)
 */
enum class TileNameForm { shortForm, longForm };

/** Notation of sampling token inside tile name. Kilometre notation uses
 *  D'K'D form for samplings >= 1000 (e.g. 1500 -> 1K5), metre notation always
 *  writes plain number of metres.
 */
enum class SamplingNotation { kilometres, metres };

/** Pixel row numbering: from tile's north edge down or from south edge up.
 */
enum class RowOrigin { topDown, bottomUp };

/** Lower-left corner of a tile.
 */
struct Corner {
    Coordinate x;
    Coordinate y;

    Corner(Coordinate x = 0, Coordinate y = 0) : x(x), y(y) {}

    bool operator<(const Corner &c) const {
        if (x < c.x) { return true; }
        else if (c.x < x) { return false; }
        return y < c.y;
    }

    bool operator==(const Corner &c) const {
        return (x == c.x) && (y == c.y);
    }

    bool operator!=(const Corner &c) const { return !operator==(c); }
};

/** Pixel column and row inside a tile.
 */
struct PixelIndex {
    long column;
    long row;

    PixelIndex(long column = 0, long row = 0) : column(column), row(row) {}

    bool operator==(const PixelIndex &p) const {
        return (column == p.column) && (row == p.row);
    }

    bool operator!=(const PixelIndex &p) const { return !operator==(p); }
};

/** GDAL-style affine transformation:
 *      x = gt[0] + column * gt[1] + row * gt[2]
 *      y = gt[3] + column * gt[4] + row * gt[5]
 */
typedef std::array<double, 6> GeoTransform;

/** Everything needed to produce and validate tile names of one subgrid at one
 *  sampling.
 */
struct TileNaming {
    std::string subgrid;
    Sampling sampling;
    TileClass tileClass;
    SamplingNotation notation;

    TileNaming() : sampling(), tileClass(), notation() {}

    TileNaming(const std::string &subgrid, Sampling sampling
               , TileClass tileClass
               , SamplingNotation notation = SamplingNotation::kilometres)
        : subgrid(subgrid), sampling(sampling), tileClass(tileClass)
        , notation(notation)
    {}
};

UTILITY_GENERATE_ENUM_IO(TileNameForm,
    ((shortForm)("short"))
    ((longForm)("long"))
)

UTILITY_GENERATE_ENUM_IO(SamplingNotation,
    ((kilometres)("km"))
    ((metres)("m"))
)

UTILITY_GENERATE_ENUM_IO(RowOrigin,
    ((topDown)("top-down"))
    ((bottomUp)("bottom-up"))
)

} } // namespace equi7grid::tiling

#endif // equi7grid_tiling_basetypes_hpp_included_
