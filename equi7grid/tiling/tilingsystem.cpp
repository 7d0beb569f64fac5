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
#include <map>

#include "dbglog/dbglog.hpp"

#include "../error.hpp"

#include "tilingsystem.hpp"
#include "sampling.hpp"

namespace equi7grid { namespace tiling {

namespace {

inline Coordinate floorTo(double value, Coordinate step)
{
    return Coordinate(std::floor(value / step)) * step;
}

} // namespace

TilingSystem::TilingSystem(const registry::SubgridZone &zone
                           , Sampling sampling, SamplingNotation notation)
    : zone_(&zone)
    , naming_(zone.id, sampling, tiling::tileClass(sampling), notation)
    , tileSize_(tileExtent(naming_.tileClass))
{}

Corner TilingSystem::floor(const math::Point2 &xy) const
{
    return Corner(floorTo(xy(0), tileSize_), floorTo(xy(1), tileSize_));
}

Corner TilingSystem::lowerLeft(const math::Point2 &xy) const
{
    return floor(xy);
}

bool TilingSystem::nameable(const math::Point2 &xy) const
{
    if (!std::isfinite(xy(0)) || !std::isfinite(xy(1))) { return false; }
    const auto ll(floor(xy));
    return ((ll.x >= 0) && (ll.y >= 0)
            && ((ll.x / TileNameUnit) <= 999)
            && ((ll.y / TileNameUnit) <= 999));
}

Corner TilingSystem::lowerLeft(const std::string &name) const
{
    return decode(name).lowerLeft;
}

Tile TilingSystem::tile(const std::string &name) const
{
    const auto tn(decode(name));
    const auto shortName(encode(tn.lowerLeft, TileNameForm::shortForm));
    return Tile(naming_, tn.lowerLeft
                , zone_->landTiles(naming_.tileClass).count(shortName));
}

Tile TilingSystem::tile(const math::Point2 &xy) const
{
    const auto ll(floor(xy));
    const auto shortName(encode(ll, TileNameForm::shortForm));
    return Tile(naming_, ll
                , zone_->landTiles(naming_.tileClass).count(shortName));
}

TileAssignment TilingSystem::tiles(const math::Points2 &xy) const
{
    TileAssignment assignment;
    assignment.index.reserve(xy.size());

    std::map<Corner, std::size_t> seen;
    for (const auto &p : xy) {
        const auto ll(floor(p));
        auto fseen(seen.find(ll));
        if (fseen == seen.end()) {
            fseen = seen.insert(std::make_pair
                                (ll, assignment.tiles.size())).first;
            const auto shortName(encode(ll, TileNameForm::shortForm));
            assignment.tiles.emplace_back
                (naming_, ll
                 , zone_->landTiles(naming_.tileClass).count(shortName));
        }
        assignment.index.push_back(fseen->second);
    }

    LOG(debug) << "Assigned " << xy.size() << " points to "
               << assignment.tiles.size() << " tiles of subgrid <"
               << naming_.subgrid << ">.";

    return assignment;
}

std::string TilingSystem::tileName(const math::Point2 &xy
                                   , TileNameForm form) const
{
    return encode(floor(xy), form);
}

std::string TilingSystem::encode(const Corner &lowerLeft
                                 , TileNameForm form) const
{
    return encodeTileName(naming_, lowerLeft, form);
}

TileName TilingSystem::decode(const std::string &name) const
{
    return decodeTileName(naming_, name);
}

std::string TilingSystem::toShort(const std::string &name) const
{
    return shortTileName(naming_, name);
}

void TilingSystem::check(const std::string &name) const
{
    checkTileName(naming_, name);
}

bool TilingSystem::check(const std::string &name, std::nothrow_t) const
{
    return checkTileName(naming_, name, std::nothrow);
}

bool TilingSystem::coversLand(const std::string &name) const
{
    return zone_->landTiles(naming_.tileClass).count(toShort(name));
}

const TileNameSet& TilingSystem::tilesCoveringLand() const
{
    return zone_->landTiles(naming_.tileClass);
}

TileNameList TilingSystem::familyTiles(const std::string &name
                                       , Sampling targetSampling) const
{
    if (!supported(targetSampling)) {
        LOGTHROW(err1, UnsupportedSampling)
            << "Target sampling <" << targetSampling
            << "> is not supported by the grid.";
    }

    const TileNaming target(naming_.subgrid, targetSampling
                            , tiling::tileClass(targetSampling)
                            , naming_.notation);
    return tiling::familyTiles(decode(name), target);
}

TileNameList TilingSystem::familyTiles(const std::string &name
                                       , TileClass targetClass) const
{
    const TileNaming target(naming_.subgrid
                            , representativeSampling(targetClass)
                            , targetClass, naming_.notation);
    return tiling::familyTiles(decode(name), target
                               , TileNameForm::shortForm);
}

TileNameList familyTiles(const TileName &source, const TileNaming &target
                         , TileNameForm form)
{
    const auto sourceSize(source.tileSize());
    const auto targetSize(tileExtent(target.tileClass));

    TileNameList names;

    if (targetSize >= sourceSize) {
        // single parent (or the tile itself in another sampling)
        names.push_back
            (encodeTileName(target
                            , Corner((source.lowerLeft.x / targetSize)
                                     * targetSize
                                     , (source.lowerLeft.y / targetSize)
                                     * targetSize)
                            , form));
        return names;
    }

    const auto n(sourceSize / targetSize);
    names.reserve(n * n);
    for (Coordinate i(0); i < n; ++i) {
        for (Coordinate j(0); j < n; ++j) {
            names.push_back
                (encodeTileName(target
                                , Corner(source.lowerLeft.x + i * targetSize
                                         , source.lowerLeft.y + j * targetSize)
                                , form));
        }
    }

    return names;
}

} } // namespace equi7grid::tiling
