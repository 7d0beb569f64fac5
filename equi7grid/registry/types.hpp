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
 * \file registry/types.hpp
 */

#ifndef equi7grid_registry_types_hpp_included_
#define equi7grid_registry_types_hpp_included_

#include <map>
#include <set>
#include <string>
#include <vector>

#include <boost/geometry/geometries/point_xy.hpp>
#include <boost/geometry/geometries/polygon.hpp>
#include <boost/geometry/geometries/multi_polygon.hpp>
#include <boost/geometry/geometries/box.hpp>

#include "utility/enum-io.hpp"

namespace equi7grid { namespace registry {

/** Tile class. Declaration order follows tile extent, i.e. class with larger
 *  extent compares greater.
 */
enum class TileClass { t1, t3, t6 };

typedef std::set<std::string> TileNameSet;

/** Short names of tiles known to intersect land, per tile class.
 */
typedef std::map<TileClass, TileNameSet> CoverLand;

/** Zone extent geometry, in geographic (lon, lat) coordinates.
 */
typedef boost::geometry::model::d2::point_xy<double> GeoPoint;
typedef boost::geometry::model::polygon<GeoPoint> GeoPolygon;
typedef boost::geometry::model::multi_polygon<GeoPolygon> ZoneExtent;
typedef boost::geometry::model::box<GeoPoint> GeoBox;

typedef std::vector<std::string> StringIdList;

UTILITY_GENERATE_ENUM_IO(TileClass,
    ((t1)("T1"))
    ((t3)("T3"))
    ((t6)("T6"))
)

} } // namespace equi7grid::registry

#endif // equi7grid_registry_types_hpp_included_
