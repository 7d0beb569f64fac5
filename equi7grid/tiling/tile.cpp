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

#include "tile.hpp"
#include "tilename.hpp"
#include "sampling.hpp"

namespace equi7grid { namespace tiling {

Tile::Tile(const TileNaming &naming, const Corner &lowerLeft, bool coversLand)
    : naming_(naming), lowerLeft_(lowerLeft)
    , tileSize_(tileExtent(naming.tileClass))
    , name_(encodeTileName(naming, lowerLeft, TileNameForm::longForm))
    , coversLand_(coversLand)
{}

std::string Tile::shortName() const
{
    return encodeTileName(naming_, lowerLeft_, TileNameForm::shortForm);
}

math::Extents2 Tile::extents() const
{
    return math::Extents2(lowerLeft_.x, lowerLeft_.y
                          , lowerLeft_.x + tileSize_
                          , lowerLeft_.y + tileSize_);
}

math::Size2 Tile::size() const
{
    const auto pixels(int(tileSize_ / naming_.sampling));
    return math::Size2(pixels, pixels);
}

bool Tile::contains(const math::Point2 &xy) const
{
    return ((xy(0) >= lowerLeft_.x) && (xy(0) < (lowerLeft_.x + tileSize_))
            && (xy(1) >= lowerLeft_.y)
            && (xy(1) < (lowerLeft_.y + tileSize_)));
}

GeoTransform Tile::geoTransform(RowOrigin origin) const
{
    const double s(naming_.sampling);
    if (origin == RowOrigin::bottomUp) {
        return {{ double(lowerLeft_.x), s, 0.0
                  , double(lowerLeft_.y), 0.0, s }};
    }
    return {{ double(lowerLeft_.x), s, 0.0
              , double(lowerLeft_.y + tileSize_), 0.0, -s }};
}

PixelIndex Tile::pixel(const math::Point2 &xy, RowOrigin origin) const
{
    return pixelIndex(geoTransform(origin), xy);
}

PixelIndex pixelIndex(const GeoTransform &gt, const math::Point2 &xy)
{
    const auto det(gt[2] * gt[4] - gt[1] * gt[5]);

    const auto column(-(gt[2] * gt[3] - gt[0] * gt[5]
                        + gt[5] * xy(0) - gt[2] * xy(1)) / det);
    const auto row(-(-gt[1] * gt[3] + gt[0] * gt[4]
                     - gt[4] * xy(0) + gt[1] * xy(1)) / det);

    return PixelIndex(long(std::floor(column)), long(std::floor(row)));
}

} } // namespace equi7grid::tiling
