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
 * \file registry/subgrid.cpp
 */

#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/geometry/algorithms/correct.hpp>
#include <boost/geometry/algorithms/envelope.hpp>
#include <boost/geometry/algorithms/is_empty.hpp>
#include <boost/geometry/io/wkt/read.hpp>

#include "dbglog/dbglog.hpp"

#include "jsoncpp/json.hpp"
#include "jsoncpp/as.hpp"

#include "subgrid.hpp"
#include "json.hpp"

namespace ba = boost::algorithm;
namespace bg = boost::geometry;

namespace equi7grid { namespace registry {

constexpr char SubgridZone::typeName[];

namespace {

const StringIdList SubgridIds = { "AF", "AN", "AS", "EU", "NA", "OC", "SA" };

const TileNameSet EmptyTileNameSet;

void parseExtent(SubgridZone &subgrid, const std::string &wkt)
{
    const auto trimmed(ba::trim_copy(wkt));

    try {
        if (ba::istarts_with(trimmed, "MULTIPOLYGON")) {
            bg::read_wkt(trimmed, subgrid.extent);
        } else if (ba::istarts_with(trimmed, "POLYGON")) {
            GeoPolygon polygon;
            bg::read_wkt(trimmed, polygon);
            subgrid.extent.clear();
            subgrid.extent.push_back(polygon);
        } else {
            LOGTHROW(err1, Json::Error)
                << "Zone extent of subgrid <" << subgrid.id
                << "> is neither POLYGON nor MULTIPOLYGON.";
        }
    } catch (const bg::read_wkt_exception &e) {
        LOGTHROW(err1, Json::Error)
            << "Unable to parse zone extent of subgrid <" << subgrid.id
            << ">: <" << e.what() << ">.";
    }

    // fix ring orientation and closure
    bg::correct(subgrid.extent);

    if (bg::is_empty(subgrid.extent)) {
        LOGTHROW(err1, Json::Error)
            << "Zone extent of subgrid <" << subgrid.id << "> is empty.";
    }

    subgrid.extentWkt = wkt;
    bg::envelope(subgrid.extent, subgrid.envelope);
}

} // namespace

const TileNameSet& SubgridZone::landTiles(TileClass tileClass) const
{
    auto fcoverLand(coverLand.find(tileClass));
    if (fcoverLand == coverLand.end()) { return EmptyTileNameSet; }
    return fcoverLand->second;
}

const StringIdList& subgridIds()
{
    return SubgridIds;
}

void fromJson(CoverLand &coverLand, const Json::Value &value)
{
    for (const auto &code : Json::check(value, Json::objectValue)
             .getMemberNames())
    {
        TileClass tileClass{};
        try {
            tileClass = boost::lexical_cast<TileClass>(code);
        } catch (const boost::bad_lexical_cast&) {
            LOGTHROW(err1, Json::Error)
                << "Invalid tile class <" << code << "> in coverLand.";
        }

        auto &tiles(coverLand[tileClass]);
        for (const auto &name
                 : Json::check(value[code], Json::arrayValue))
        {
            tiles.insert(Json::as<std::string>(name, "coverLand"));
        }
    }
}

void fromJson(SubgridZone &subgrid, const Json::Value &value)
{
    std::string s;
    parseExtent(subgrid, Json::get(s, value, "zoneExtent"));

    subgrid.srsDef = { Json::get(s, value, "projection")
                       , geo::SrsDefinition::Type::wkt };

    if (value.isMember("coverLand")) {
        fromJson(subgrid.coverLand, value["coverLand"]);
    }
}

void fromJson(Registry &registry, const Json::Value &value
              , const boost::filesystem::path &path)
{
    try {
        Json::check(value, Json::objectValue);
        Json::get(registry.version, value, "version");

        const auto &subgrids(value["subgrids"]);
        for (const auto &id : Json::check(subgrids, Json::objectValue)
                 .getMemberNames())
        {
            SubgridZone subgrid;
            subgrid.id = id;
            fromJson(subgrid, Json::check(subgrids[id], Json::objectValue));
            registry.subgrids.add(subgrid);
        }
    } catch (const Json::Error &e) {
        LOGTHROW(err1, DataUnavailable)
            << "Invalid grid data file " << path << " format ("
            << e.what() << ").";
    }

    // all subgrids must be defined and nothing else
    for (const auto &id : SubgridIds) {
        if (!registry.subgrids.has(id)) {
            LOGTHROW(err1, DataUnavailable)
                << "Grid data file " << path << " is missing subgrid <"
                << id << ">.";
        }
    }

    if (registry.subgrids.size() != SubgridIds.size()) {
        LOGTHROW(err1, DataUnavailable)
            << "Grid data file " << path << " defines unknown subgrids.";
    }
}

} } // namespace equi7grid::registry
