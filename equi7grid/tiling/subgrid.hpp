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
 * \file tiling/subgrid.hpp
 *
 * Projected subgrid: zone, projection and tiling system.
 */

#ifndef equi7grid_tiling_subgrid_hpp_included_
#define equi7grid_tiling_subgrid_hpp_included_

#include <mutex>
#include <string>

#include <boost/noncopyable.hpp>

#include "math/geometry_core.hpp"
#include "geo/csconvertor.hpp"

#include "../registry.hpp"

#include "tilingsystem.hpp"

namespace equi7grid { namespace tiling {

class Subgrid : boost::noncopyable {
public:
    Subgrid(const registry::SubgridZone &zone, Sampling sampling
            , SamplingNotation notation = SamplingNotation::kilometres);

    /** Subgrid tag, e.g. EU.
     */
    const std::string& id() const { return zone_->id; }

    /** Full subgrid name, e.g. EQUI7_EU500M.
     */
    std::string name() const;

    const registry::SubgridZone& zone() const { return *zone_; }

    const TilingSystem& tilingSystem() const { return tilingSystem_; }

    /** Is geographic point strictly inside zone extent? Points on zone
     *  boundary are not.
     */
    bool contains(const math::Point2 &lonlat) const;

    /** Projects geographic (lon, lat) point to subgrid projection.
     *  Serialized, use projector() for bulk work.
     */
    math::Point2 toXy(const math::Point2 &lonlat) const;

    /** Inverse of toXy.
     */
    math::Point2 toLonLat(const math::Point2 &xy) const;

    /** Thread-private projection for bulk work.
     */
    struct Projector {
        geo::CsConvertor toXy;
        geo::CsConvertor toLonLat;
    };

    /** Creates independent copy of projection convertors.
     */
    Projector projector() const;

private:
    const registry::SubgridZone *zone_;
    TilingSystem tilingSystem_;
    geo::CsConvertor toXy_;
    geo::CsConvertor toLonLat_;
    mutable std::mutex mutex_;
};

} } // namespace equi7grid::tiling

#endif // equi7grid_tiling_subgrid_hpp_included_
