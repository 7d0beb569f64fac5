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
 * \file tiling/tile.hpp
 *
 * Single tile of a subgrid tiling system.
 */

#ifndef equi7grid_tiling_tile_hpp_included_
#define equi7grid_tiling_tile_hpp_included_

#include <string>
#include <vector>

#include "math/geometry_core.hpp"

#include "basetypes.hpp"

namespace equi7grid { namespace tiling {

class Tile {
public:
    typedef std::vector<Tile> list;

    Tile(const TileNaming &naming, const Corner &lowerLeft
         , bool coversLand = false);

    /** Long tile name.
     */
    const std::string& name() const { return name_; }

    /** Short tile name (corner and class part only).
     */
    std::string shortName() const;

    const std::string& subgrid() const { return naming_.subgrid; }
    Sampling sampling() const { return naming_.sampling; }
    TileClass tileClass() const { return naming_.tileClass; }
    const TileNaming& naming() const { return naming_; }

    const Corner& lowerLeft() const { return lowerLeft_; }

    /** Tile extent in metres.
     */
    Coordinate tileSize() const { return tileSize_; }

    bool coversLand() const { return coversLand_; }

    /** Tile extents in subgrid projection.
     */
    math::Extents2 extents() const;

    /** Tile size in pixels.
     */
    math::Size2 size() const;

    /** Is point (in subgrid projection) inside this tile? Lower and left
     *  edges are inclusive.
     */
    bool contains(const math::Point2 &xy) const;

    GeoTransform geoTransform(RowOrigin origin = RowOrigin::topDown) const;

    /** Pixel index of given point (in subgrid projection).
     */
    PixelIndex pixel(const math::Point2 &xy
                     , RowOrigin origin = RowOrigin::topDown) const;

    bool operator==(const Tile &o) const { return name_ == o.name_; }

private:
    TileNaming naming_;
    Corner lowerLeft_;
    Coordinate tileSize_;
    std::string name_;
    bool coversLand_;
};

/** Inverts affine transformation and rounds the result down.
 */
PixelIndex pixelIndex(const GeoTransform &gt, const math::Point2 &xy);

} } // namespace equi7grid::tiling

#endif // equi7grid_tiling_tile_hpp_included_
