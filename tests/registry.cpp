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
#include <sstream>

#include <catch2/catch.hpp>

#include "equi7grid/error.hpp"
#include "equi7grid/registry.hpp"

namespace er = equi7grid::registry;
using equi7grid::registry::TileClass;

namespace {

const char *Box("MULTIPOLYGON (((0 0, 10 0, 10 10, 0 10, 0 0)))");
// JSON-escaped projection WKT; not interpreted while loading
const char *Projection("PROJCS[\\\"Azimuthal_Equidistant\\\"]");

/** Builds grid data document with all subgrids but skipped one and with
 *  optional extra subgrid entry.
 */
std::string document(const std::string &skip = ""
                     , const std::string &extra = ""
                     , const std::string &euExtent = Box
                     , const std::string &euCoverLand = "{}")
{
    std::ostringstream os;
    os << "{ \"version\": \"1\", \"subgrids\": {";
    bool first(true);
    for (const auto &id : er::subgridIds()) {
        if (id == skip) { continue; }
        if (!first) { os << ", "; }
        first = false;
        os << '"' << id << "\": { \"zoneExtent\": \""
           << ((id == "EU") ? euExtent : Box)
           << "\", \"projection\": \"" << Projection << '"';
        if (id == "EU") { os << ", \"coverLand\": " << euCoverLand; }
        os << " }";
    }
    if (!extra.empty()) {
        os << ", \"" << extra << "\": { \"zoneExtent\": \"" << Box
           << "\", \"projection\": \"" << Projection << "\" }";
    }
    os << "} }";
    return os.str();
}

er::Registry load(const std::string &json)
{
    std::istringstream is(json);
    return er::load(is, "test");
}

} // namespace

TEST_CASE("Grid data file is loaded", "[registry]") {
    const auto reg(er::load(boost::filesystem::path(EQUI7GRID_TEST_DATA)
                            / er::DataFileName));

    REQUIRE(reg.version == "test-1");
    REQUIRE(reg.subgrids.size() == 7);
    for (const auto &id : er::subgridIds()) {
        REQUIRE(reg.subgrids.has(id));
    }

    const auto &eu(reg.subgrid("EU"));
    REQUIRE(eu.id == "EU");
    REQUIRE(eu.landTiles(TileClass::t6).size() == 3);
    REQUIRE(eu.landTiles(TileClass::t6).count("E054N018T6") == 1);
    REQUIRE(eu.landTiles(TileClass::t1).size() == 1);
    REQUIRE(reg.subgrid("AS").landTiles(TileClass::t6).empty());

    REQUIRE(eu.envelope.min_corner().x() == Approx(-10));
    REQUIRE(eu.envelope.max_corner().y() == Approx(72));

    // AF extent is given as plain polygon
    const auto &af(reg.subgrid("AF"));
    REQUIRE(af.extent.size() == 1);
    REQUIRE(af.envelope.min_corner().y() == Approx(-35));

    REQUIRE_THROWS_AS(reg.subgrid("XX"), equi7grid::NoSuchSubgrid);
}

TEST_CASE("Minimal grid data document is loaded", "[registry]") {
    const auto reg(load(document("", "", Box
                                 , "{ \"T3\": [\"E003N003T3\"] }")));
    REQUIRE(reg.version == "1");
    REQUIRE(reg.subgrids.size() == 7);
    REQUIRE(reg.subgrid("EU").landTiles(TileClass::t3).size() == 1);
}

TEST_CASE("Missing grid data file", "[registry]") {
    REQUIRE_THROWS_AS(er::load(boost::filesystem::path(EQUI7GRID_TEST_DATA)
                               / "does-not-exist.json")
                      , equi7grid::DataUnavailable);
}

TEST_CASE("Corrupt grid data is rejected", "[registry]") {
    REQUIRE_THROWS_AS(load("{ \"version\": "), equi7grid::DataUnavailable);
    REQUIRE_THROWS_AS(load("[]"), equi7grid::DataUnavailable);
    REQUIRE_THROWS_AS(load(document("OC")), equi7grid::DataUnavailable);
    REQUIRE_THROWS_AS(load(document("", "XX")), equi7grid::DataUnavailable);
    REQUIRE_THROWS_AS(load(document("", "", "POINT (1 1)"))
                      , equi7grid::DataUnavailable);
    REQUIRE_THROWS_AS(load(document("", "", "MULTIPOLYGON (((0 0, 1"))
                      , equi7grid::DataUnavailable);
    REQUIRE_THROWS_AS(load(document("", "", Box, "{ \"T2\": [] }"))
                      , equi7grid::DataUnavailable);
    REQUIRE_THROWS_AS(load(document("", "", Box, "[]"))
                      , equi7grid::DataUnavailable);
}
