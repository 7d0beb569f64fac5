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
 * \file registry/subgrid.hpp
 */

#ifndef equi7grid_registry_subgrid_hpp_included_
#define equi7grid_registry_subgrid_hpp_included_

#include <string>

#include "geo/srsdef.hpp"

#include "../error.hpp"

#include "types.hpp"
#include "dict.hpp"

namespace equi7grid { namespace registry {

/** Continental subgrid zone as defined by the static grid data.
 */
struct SubgridZone {
    /** Two-letter subgrid tag, e.g. EU.
     */
    std::string id;

    /** Zone extent in geographic coordinates, as found in the data file.
     */
    std::string extentWkt;

    /** Parsed and corrected zone extent.
     */
    ZoneExtent extent;

    /** Bounding box of zone extent.
     */
    GeoBox envelope;

    /** Projection of the subgrid (azimuthal equidistant), WKT.
     */
    geo::SrsDefinition srsDef;

    /** Tiles covering land.
     */
    CoverLand coverLand;

    static constexpr char typeName[] = "subgrid";
    typedef StringDictionary<SubgridZone, NoSuchSubgrid> dict;

    /** Returns set of short names of land tiles of given class. Missing class
     *  yields an empty set.
     */
    const TileNameSet& landTiles(TileClass tileClass) const;
};

/** Tags of all subgrids the grid is composed of.
 */
const StringIdList& subgridIds();

} } // namespace equi7grid::registry

#endif // equi7grid_registry_subgrid_hpp_included_
