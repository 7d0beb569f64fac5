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
 * \file tiling/tilingsystem.hpp
 *
 * Tiling of one subgrid at one sampling.
 */

#ifndef equi7grid_tiling_tilingsystem_hpp_included_
#define equi7grid_tiling_tilingsystem_hpp_included_

#include <new>
#include <string>
#include <vector>

#include "math/geometry_core.hpp"

#include "../registry.hpp"

#include "basetypes.hpp"
#include "tilename.hpp"
#include "tile.hpp"

namespace equi7grid { namespace tiling {

/** Result of batch point to tile assignment. Distinct tiles are listed in
 *  order of their first occurrence, index maps each input point to its tile.
 */
struct TileAssignment {
    Tile::list tiles;
    std::vector<std::size_t> index;

    const Tile& operator[](std::size_t i) const { return tiles[index[i]]; }
    std::size_t size() const { return index.size(); }
};

typedef std::vector<std::string> TileNameList;

class TilingSystem {
public:
    TilingSystem(const registry::SubgridZone &zone, Sampling sampling
                 , SamplingNotation notation = SamplingNotation::kilometres);

    const TileNaming& naming() const { return naming_; }
    const std::string& subgrid() const { return naming_.subgrid; }
    Sampling sampling() const { return naming_.sampling; }
    TileClass tileClass() const { return naming_.tileClass; }
    Coordinate tileSize() const { return tileSize_; }

    /** Lower-left corner of tile containing given point.
     */
    Corner lowerLeft(const math::Point2 &xy) const;

    /** Can tile containing given point be named, i.e. does its corner fit
     *  into the 3-digit tile name fields?
     */
    bool nameable(const math::Point2 &xy) const;

    /** Lower-left corner of named tile.
     */
    Corner lowerLeft(const std::string &name) const;

    /** Tile by its name (long or short form).
     */
    Tile tile(const std::string &name) const;

    /** Tile containing given point.
     */
    Tile tile(const math::Point2 &xy) const;

    /** Assigns each point a tile. All points must be nameable.
     */
    TileAssignment tiles(const math::Points2 &xy) const;

    /** Name of tile containing given point.
     */
    std::string tileName(const math::Point2 &xy
                         , TileNameForm form = TileNameForm::longForm) const;

    std::string encode(const Corner &lowerLeft
                       , TileNameForm form = TileNameForm::longForm) const;

    TileName decode(const std::string &name) const;

    std::string toShort(const std::string &name) const;

    void check(const std::string &name) const;
    bool check(const std::string &name, std::nothrow_t) const;

    /** Does named tile cover land? Unknown tiles do not.
     */
    bool coversLand(const std::string &name) const;

    /** Short names of all tiles of this tile class covering land.
     */
    const TileNameSet& tilesCoveringLand() const;

    /** Tiles at target sampling related to the named one. Coarser or equal
     *  target yields the single containing tile, finer target yields all
     *  contained tiles, iterated first by x then by y. Names are in long
     *  form.
     */
    TileNameList familyTiles(const std::string &name
                             , Sampling targetSampling) const;

    /** Same as above, target is given by tile class only. Names are in short
     *  form.
     */
    TileNameList familyTiles(const std::string &name
                             , TileClass targetClass) const;

private:
    Corner floor(const math::Point2 &xy) const;

    const registry::SubgridZone *zone_;
    TileNaming naming_;
    Coordinate tileSize_;
};

/** Family tiles of a decoded tile in target naming.
 */
TileNameList familyTiles(const TileName &source, const TileNaming &target
                         , TileNameForm form = TileNameForm::longForm);

} } // namespace equi7grid::tiling

#endif // equi7grid_tiling_tilingsystem_hpp_included_
