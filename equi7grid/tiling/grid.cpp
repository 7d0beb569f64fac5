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
#include <cmath>
#include <limits>
#include <tuple>
#include <iterator>

#include "dbglog/dbglog.hpp"
#include "utility/openmp.hpp"

#include "../error.hpp"

#include "grid.hpp"
#include "sampling.hpp"

namespace bgi = boost::geometry::index;

namespace equi7grid { namespace tiling {

Grid::Grid(Sampling sampling, SamplingNotation notation
           , const registry::Registry &registry)
    : sampling_(sampling), notation_(notation)
    , tileClass_(tiling::tileClass(sampling))
{
    if (!supported(sampling)) {
        LOGTHROW(err1, UnsupportedSampling)
            << "Sampling <" << sampling << "> is not supported by the grid.";
    }

    if (registry.empty()) {
        LOGTHROW(err1, DataUnavailable)
            << "Grid data not loaded, cannot create grid.";
    }

    std::vector<ZoneIndexValue> envelopes;
    for (const auto &item : registry.subgrids) {
        const auto &zone(item.second);
        auto res(subgrids_.emplace(std::piecewise_construct
                                   , std::forward_as_tuple(zone.id)
                                   , std::forward_as_tuple
                                   (zone, sampling, notation)));
        envelopes.emplace_back(zone.envelope, &res.first->second);
    }

    // bulk load
    index_ = ZoneIndex(envelopes.begin(), envelopes.end());

    LOG(info1) << "Created grid with sampling <" << sampling_
               << "> (" << tileClass_ << ", " << subgrids_.size()
               << " subgrids).";
}

Coordinate Grid::tileSize() const
{
    return tileExtent(tileClass_);
}

const Subgrid* Grid::subgrid(const std::string &id, std::nothrow_t) const
{
    auto fsubgrids(subgrids_.find(id));
    if (fsubgrids == subgrids_.end()) { return nullptr; }
    return &fsubgrids->second;
}

const Subgrid& Grid::subgrid(const std::string &id) const
{
    if (const auto *sg = subgrid(id, std::nothrow)) { return *sg; }

    LOGTHROW(err1, NoSuchSubgrid)
        << "<" << id << "> is not known subgrid.";
    throw;
}

void Grid::candidates(const math::Point2 &lonlat
                      , std::vector<const Subgrid*> &matches) const
{
    const registry::GeoPoint point(lonlat(0), lonlat(1));

    std::vector<ZoneIndexValue> hits;
    index_.query(bgi::intersects(point), std::back_inserter(hits));

    for (const auto &hit : hits) {
        if (hit.second->contains(lonlat)) { matches.push_back(hit.second); }
    }
}

const Subgrid* Grid::resolve(const math::Point2 &lonlat, std::nothrow_t)
    const
{
    std::vector<const Subgrid*> matches;
    candidates(lonlat, matches);
    if (matches.size() != 1) { return nullptr; }
    return matches.front();
}

const Subgrid& Grid::resolve(const math::Point2 &lonlat) const
{
    std::vector<const Subgrid*> matches;
    candidates(lonlat, matches);
    if (matches.size() == 1) { return *matches.front(); }

    if (matches.empty()) {
        LOGTHROW(err1, AmbiguousOrUnresolvedPoint)
            << "Point (" << lonlat(0) << ", " << lonlat(1)
            << ") lies in no subgrid.";
    }

    LOGTHROW(err1, AmbiguousOrUnresolvedPoint)
        << "Point (" << lonlat(0) << ", " << lonlat(1)
        << ") lies in " << matches.size() << " subgrids.";
    throw;
}

SubgridIdList Grid::resolve(const math::Points2 &lonlat) const
{
    SubgridIdList ids(lonlat.size());

    const auto size(static_cast<int>(lonlat.size()));
    UTILITY_OMP(parallel for)
    for (int i = 0; i < size; ++i) {
        if (const auto *sg = resolve(lonlat[i], std::nothrow)) {
            ids[i] = sg->id();
        }
    }

    LOG(info1) << "Resolved subgrids of " << lonlat.size() << " points.";
    return ids;
}

Location Grid::lonlatToXy(const math::Point2 &lonlat) const
{
    const auto &sg(resolve(lonlat));
    return Location(sg.id(), sg.toXy(lonlat));
}

Location Grid::lonlatToXy(const math::Point2 &lonlat
                          , const std::string &subgridId) const
{
    const auto &sg(subgrid(subgridId));
    return Location(sg.id(), sg.toXy(lonlat));
}

math::Point2 Grid::xyToLonLat(const std::string &subgridId
                              , const math::Point2 &xy) const
{
    return subgrid(subgridId).toLonLat(xy);
}

namespace {

PixelLocation pixelLocation(const Subgrid &sg, const math::Point2 &lonlat
                            , RowOrigin origin)
{
    PixelLocation loc;
    loc.subgrid = sg.id();
    loc.xy = sg.toXy(lonlat);

    const auto tile(sg.tilingSystem().tile(loc.xy));
    loc.tileName = tile.name();
    loc.pixel = tile.pixel(loc.xy, origin);
    return loc;
}

} // namespace

PixelLocation Grid::lonlatToPixel(const math::Point2 &lonlat
                                  , RowOrigin origin) const
{
    return pixelLocation(resolve(lonlat), lonlat, origin);
}

PixelLocation Grid::lonlatToPixel(const math::Point2 &lonlat
                                  , const std::string &subgridId
                                  , RowOrigin origin) const
{
    return pixelLocation(subgrid(subgridId), lonlat, origin);
}

PixelLocation::optlist Grid::lonlatToPixel(const math::Points2 &lonlat
                                           , RowOrigin origin) const
{
    PixelLocation::optlist out(lonlat.size());

    // group points by subgrid
    std::map<std::string, std::vector<std::size_t> > groups;
    {
        const auto ids(resolve(lonlat));
        for (std::size_t i(0), e(ids.size()); i != e; ++i) {
            if (ids[i]) { groups[*ids[i]].push_back(i); }
        }
    }

    for (const auto &group : groups) {
        const auto &sg(subgrid(group.first));
        const auto &indices(group.second);

        math::Points2 xy(indices.size());
        const auto size(static_cast<int>(indices.size()));

        // one convertor copy per thread, cloned outside parallel region
        std::vector<Subgrid::Projector> projectors;
        for (int t(0), e(omp_get_max_threads()); t < e; ++t) {
            projectors.push_back(sg.projector());
        }

        UTILITY_OMP(parallel)
        {
            auto &projector(projectors[omp_get_thread_num()]);

            UTILITY_OMP(for)
            for (int k = 0; k < size; ++k) {
                const auto &ll(lonlat[indices[k]]);
                try {
                    xy[k] = projector.toXy(ll);
                } catch (const std::exception &e) {
                    LOG(warn1)
                        << "Unable to project point (" << ll(0) << ", "
                        << ll(1) << ") to subgrid <" << sg.id()
                        << ">: <" << e.what() << ">.";
                    xy[k] = math::Point2
                        (std::numeric_limits<double>::quiet_NaN()
                         , std::numeric_limits<double>::quiet_NaN());
                }
            }
        }

        const auto &ts(sg.tilingSystem());

        math::Points2 valid;
        std::vector<std::size_t> validIndices;
        for (int k = 0; k < size; ++k) {
            if (!ts.nameable(xy[k])) { continue; }
            valid.push_back(xy[k]);
            validIndices.push_back(indices[k]);
        }

        const auto assignment(ts.tiles(valid));
        for (std::size_t k(0), e(valid.size()); k != e; ++k) {
            const auto &tile(assignment[k]);

            PixelLocation loc;
            loc.subgrid = sg.id();
            loc.xy = valid[k];
            loc.tileName = tile.name();
            loc.pixel = tile.pixel(valid[k], origin);
            out[validIndices[k]] = loc;
        }

        LOG(info1) << "Located " << valid.size() << " of " << size
                   << " points in subgrid <" << sg.id() << ">.";
    }

    return out;
}

const TilingSystem& Grid::tilingSystem(const std::string &name) const
{
    if (tileNameForm(name) != TileNameForm::longForm) {
        LOGTHROW(err1, MalformedTileName)
            << "Tile name <" << name << "> is not in long form.";
    }

    const auto *sg(subgrid(name.substr(0, 2), std::nothrow));
    if (!sg) {
        LOGTHROW(err1, SubgridMismatch)
            << "Tile name <" << name << "> does not belong to any subgrid.";
    }

    return sg->tilingSystem();
}

Tile Grid::tile(const std::string &name) const
{
    return tilingSystem(name).tile(name);
}

TileNameList Grid::familyTiles(const std::string &name
                               , Sampling targetSampling) const
{
    return tilingSystem(name).familyTiles(name, targetSampling);
}

TileNameList Grid::familyTiles(const std::string &name
                               , TileClass targetClass) const
{
    return tilingSystem(name).familyTiles(name, targetClass);
}

} } // namespace equi7grid::tiling
