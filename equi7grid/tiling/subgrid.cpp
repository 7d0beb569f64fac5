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
#include <boost/geometry/algorithms/within.hpp>

#include "dbglog/dbglog.hpp"

#include "geo/srsdef.hpp"

#include "../error.hpp"

#include "subgrid.hpp"
#include "sampling.hpp"

namespace bg = boost::geometry;

namespace equi7grid { namespace tiling {

namespace {

const geo::SrsDefinition Wgs84("+proj=longlat +datum=WGS84 +no_defs"
                               , geo::SrsDefinition::Type::proj4);

} // namespace

Subgrid::Subgrid(const registry::SubgridZone &zone, Sampling sampling
                 , SamplingNotation notation)
    : zone_(&zone), tilingSystem_(zone, sampling, notation)
{
    try {
        toXy_ = geo::CsConvertor(Wgs84, zone.srsDef);
        toLonLat_ = geo::CsConvertor(zone.srsDef, Wgs84);
    } catch (const std::exception &e) {
        LOGTHROW(err1, DataUnavailable)
            << "Unable to set up projection of subgrid <" << zone.id
            << ">: <" << e.what() << ">.";
    }
}

std::string Subgrid::name() const
{
    return "EQUI7_" + zone_->id
        + encodeSampling(tilingSystem_.sampling()
                         , tilingSystem_.naming().notation)
        + "M";
}

bool Subgrid::contains(const math::Point2 &lonlat) const
{
    return bg::within(registry::GeoPoint(lonlat(0), lonlat(1))
                      , zone_->extent);
}

math::Point2 Subgrid::toXy(const math::Point2 &lonlat) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return toXy_(lonlat);
}

math::Point2 Subgrid::toLonLat(const math::Point2 &xy) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return toLonLat_(xy);
}

Subgrid::Projector Subgrid::projector() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return { toXy_.clone(), toLonLat_.clone() };
}

} } // namespace equi7grid::tiling
