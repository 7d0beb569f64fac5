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
 * \file tiling/grid.hpp
 *
 * Equi7 grid at given sampling: all 7 subgrids, point resolution and
 * geographic point to tile pixel mapping.
 */

#ifndef equi7grid_tiling_grid_hpp_included_
#define equi7grid_tiling_grid_hpp_included_

#include <map>
#include <new>
#include <string>
#include <vector>
#include <utility>

#include <boost/noncopyable.hpp>
#include <boost/optional.hpp>
#include <boost/geometry/index/rtree.hpp>

#include "math/geometry_core.hpp"

#include "../registry.hpp"

#include "basetypes.hpp"
#include "subgrid.hpp"

namespace equi7grid { namespace tiling {

/** Point in subgrid projection.
 */
struct Location {
    std::string subgrid;
    math::Point2 xy;

    Location() = default;
    Location(const std::string &subgrid, const math::Point2 &xy)
        : subgrid(subgrid), xy(xy) {}
};

/** Point located in tile pixel.
 */
struct PixelLocation {
    std::string subgrid;
    math::Point2 xy;

    /** Long name of tile containing the point.
     */
    std::string tileName;
    PixelIndex pixel;

    typedef boost::optional<PixelLocation> optional;
    typedef std::vector<optional> optlist;
};

typedef std::vector<boost::optional<std::string> > SubgridIdList;

class Grid : boost::noncopyable {
public:
    typedef std::map<std::string, Subgrid> Subgrids;

    /** Creates grid at given sampling.
     *
     *  Throws UnsupportedSampling if sampling is not one of
     *  supportedSamplings() and DataUnavailable if registry is empty.
     */
    explicit Grid(Sampling sampling
                  , SamplingNotation notation = SamplingNotation::kilometres
                  , const registry::Registry &registry = registry::system);

    Sampling sampling() const { return sampling_; }
    SamplingNotation notation() const { return notation_; }
    TileClass tileClass() const { return tileClass_; }
    Coordinate tileSize() const;

    const Subgrids& subgrids() const { return subgrids_; }

    const Subgrid& subgrid(const std::string &id) const;
    const Subgrid* subgrid(const std::string &id, std::nothrow_t) const;

    /** Resolves subgrid for each point. Points outside all zones or inside
     *  more than one zone yield none. Order of input is preserved.
     */
    SubgridIdList resolve(const math::Points2 &lonlat) const;

    /** Resolves subgrid for single point. Throws AmbiguousOrUnresolvedPoint.
     */
    const Subgrid& resolve(const math::Point2 &lonlat) const;

    /** Resolves subgrid for single point. Returns null on failure.
     */
    const Subgrid* resolve(const math::Point2 &lonlat, std::nothrow_t) const;

    /** Projects geographic point into the subgrid it falls in.
     */
    Location lonlatToXy(const math::Point2 &lonlat) const;

    /** Projects geographic point into given (preferred) subgrid, no zone
     *  membership check.
     */
    Location lonlatToXy(const math::Point2 &lonlat
                        , const std::string &subgridId) const;

    math::Point2 xyToLonLat(const std::string &subgridId
                            , const math::Point2 &xy) const;

    /** Finds tile and pixel of geographic point. Throws
     *  AmbiguousOrUnresolvedPoint if point cannot be assigned a subgrid.
     */
    PixelLocation lonlatToPixel(const math::Point2 &lonlat
                                , RowOrigin origin = RowOrigin::topDown)
        const;

    /** Finds tile and pixel of geographic point in given (preferred)
     *  subgrid, no zone membership check.
     */
    PixelLocation lonlatToPixel(const math::Point2 &lonlat
                                , const std::string &subgridId
                                , RowOrigin origin = RowOrigin::topDown)
        const;

    /** Batch version of lonlatToPixel. Points that cannot be located yield
     *  none.
     */
    PixelLocation::optlist
    lonlatToPixel(const math::Points2 &lonlat
                  , RowOrigin origin = RowOrigin::topDown) const;

    /** Creates tile from its long name.
     */
    Tile tile(const std::string &name) const;

    /** Family tiles of tile given by long name. See
     *  TilingSystem::familyTiles.
     */
    TileNameList familyTiles(const std::string &name
                             , Sampling targetSampling) const;

    TileNameList familyTiles(const std::string &name
                             , TileClass targetClass) const;

private:
    void candidates(const math::Point2 &lonlat
                    , std::vector<const Subgrid*> &matches) const;

    const TilingSystem& tilingSystem(const std::string &name) const;

    typedef std::pair<registry::GeoBox, const Subgrid*> ZoneIndexValue;
    typedef boost::geometry::index::rtree
        <ZoneIndexValue, boost::geometry::index::quadratic<8> > ZoneIndex;

    Sampling sampling_;
    SamplingNotation notation_;
    TileClass tileClass_;
    Subgrids subgrids_;

    /** Zone envelopes.
     */
    ZoneIndex index_;
};

} } // namespace equi7grid::tiling

#endif // equi7grid_tiling_grid_hpp_included_
