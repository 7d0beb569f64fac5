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
#include <catch2/catch.hpp>

#include "equi7grid/error.hpp"
#include "equi7grid/registry.hpp"
#include "equi7grid/tiling/grid.hpp"
#include "equi7grid/tiling/io.hpp"

namespace er = equi7grid::registry;
namespace et = equi7grid::tiling;
using equi7grid::registry::TileClass;

namespace {

const er::Registry& testRegistry()
{
    static const auto registry
        (er::load(boost::filesystem::path(EQUI7GRID_TEST_DATA)
                  / er::DataFileName));
    return registry;
}

const et::Grid& grid500()
{
    static const et::Grid grid(500, et::SamplingNotation::kilometres
                               , testRegistry());
    return grid;
}

// projection centre of EU subgrid
const math::Point2 EuCentre(24.0, 53.0);
const math::Point2 EuCentreXy(5837287.81977, 2121415.69617);

} // namespace

TEST_CASE("Grid construction", "[grid]") {
    const auto &grid(grid500());
    REQUIRE(grid.sampling() == 500);
    REQUIRE(grid.tileClass() == TileClass::t6);
    REQUIRE(grid.tileSize() == 600000);
    REQUIRE(grid.subgrids().size() == 7);

    REQUIRE(grid.subgrid("EU").name() == "EQUI7_EU500M");
    REQUIRE(grid.subgrid("AN").tilingSystem().sampling() == 500);
    REQUIRE_THROWS_AS(grid.subgrid("XX"), equi7grid::NoSuchSubgrid);
    REQUIRE(grid.subgrid("XX", std::nothrow) == nullptr);

    const et::Grid km(1000, et::SamplingNotation::kilometres, testRegistry());
    REQUIRE(km.subgrid("AF").name() == "EQUI7_AF1K0M");
    const et::Grid m(1000, et::SamplingNotation::metres, testRegistry());
    REQUIRE(m.subgrid("AF").name() == "EQUI7_AF1000M");
}

TEST_CASE("Grid construction failures", "[grid]") {
    REQUIRE_THROWS_AS(et::Grid(7, et::SamplingNotation::kilometres
                               , testRegistry())
                      , equi7grid::UnsupportedSampling);
    REQUIRE_THROWS_AS(et::Grid(120, et::SamplingNotation::kilometres
                               , testRegistry())
                      , equi7grid::UnsupportedSampling);

    const er::Registry empty;
    REQUIRE_THROWS_AS(et::Grid(500, et::SamplingNotation::kilometres, empty)
                      , equi7grid::DataUnavailable);
}

TEST_CASE("Subgrid resolution", "[grid]") {
    const auto &grid(grid500());

    const math::Points2 points = {
        EuCentre
        , math::Point2(20, 0)
        , math::Point2(100, 40)
        , math::Point2(-100, 40)
        , math::Point2(-60, -20)
        , math::Point2(130, -20)
        , math::Point2(0, -80)
        // open ocean
        , math::Point2(-40, 20)
        // EU and AF overlap
        , math::Point2(10, 36)
        // EU and AS boundary
        , math::Point2(40, 50)
    };

    const auto ids(grid.resolve(points));
    REQUIRE(ids.size() == points.size());
    REQUIRE(*ids[0] == "EU");
    REQUIRE(*ids[1] == "AF");
    REQUIRE(*ids[2] == "AS");
    REQUIRE(*ids[3] == "NA");
    REQUIRE(*ids[4] == "SA");
    REQUIRE(*ids[5] == "OC");
    REQUIRE(*ids[6] == "AN");
    REQUIRE_FALSE(bool(ids[7]));
    REQUIRE_FALSE(bool(ids[8]));
    REQUIRE_FALSE(bool(ids[9]));

    REQUIRE(grid.resolve(EuCentre).id() == "EU");
    REQUIRE(grid.resolve(math::Point2(10, 36), std::nothrow) == nullptr);
    REQUIRE_THROWS_AS(grid.resolve(math::Point2(-40, 20))
                      , equi7grid::AmbiguousOrUnresolvedPoint);
    REQUIRE_THROWS_AS(grid.resolve(math::Point2(10, 36))
                      , equi7grid::AmbiguousOrUnresolvedPoint);
}

TEST_CASE("Geographic to projected coordinates", "[grid]") {
    const auto &grid(grid500());

    const auto loc(grid.lonlatToXy(EuCentre));
    REQUIRE(loc.subgrid == "EU");
    REQUIRE(loc.xy(0) == Approx(EuCentreXy(0)).margin(1e-3));
    REQUIRE(loc.xy(1) == Approx(EuCentreXy(1)).margin(1e-3));

    const auto ll(grid.xyToLonLat("EU", loc.xy));
    REQUIRE(ll(0) == Approx(EuCentre(0)).margin(1e-7));
    REQUIRE(ll(1) == Approx(EuCentre(1)).margin(1e-7));

    const auto af(grid.lonlatToXy(math::Point2(21.5, 8.5)));
    REQUIRE(af.subgrid == "AF");
    REQUIRE(af.xy(0) == Approx(5621452.01998).margin(1e-3));
    REQUIRE(af.xy(1) == Approx(5990638.42298).margin(1e-3));

    // ambiguous point projected into preferred subgrid
    const auto preferred(grid.lonlatToXy(math::Point2(10, 36), "AF"));
    REQUIRE(preferred.subgrid == "AF");
    REQUIRE_THROWS_AS(grid.lonlatToXy(math::Point2(10, 36))
                      , equi7grid::AmbiguousOrUnresolvedPoint);

    // round trip away from projection centre
    const math::Point2 madrid(-3.7, 40.4);
    const auto xy(grid.lonlatToXy(madrid));
    const auto back(grid.xyToLonLat(xy.subgrid, xy.xy));
    REQUIRE(back(0) == Approx(madrid(0)).margin(1e-7));
    REQUIRE(back(1) == Approx(madrid(1)).margin(1e-7));
}

TEST_CASE("Geographic point to tile pixel", "[grid]") {
    const auto &grid(grid500());

    const auto loc(grid.lonlatToPixel(EuCentre));
    REQUIRE(loc.subgrid == "EU");
    REQUIRE(loc.tileName == "EU500M_E054N018T6");
    REQUIRE(loc.pixel == et::PixelIndex(874, 557));

    const auto bottomUp(grid.lonlatToPixel(EuCentre
                                           , et::RowOrigin::bottomUp));
    REQUIRE(bottomUp.tileName == "EU500M_E054N018T6");
    REQUIRE(bottomUp.pixel == et::PixelIndex(874, 642));

    REQUIRE_THROWS_AS(grid.lonlatToPixel(math::Point2(-40, 20))
                      , equi7grid::AmbiguousOrUnresolvedPoint);
}

TEST_CASE("Geographic point to tile pixel in given subgrid", "[grid]") {
    const auto &grid(grid500());

    const auto loc(grid.lonlatToPixel(EuCentre, "EU"));
    REQUIRE(loc.subgrid == "EU");
    REQUIRE(loc.tileName == "EU500M_E054N018T6");
    REQUIRE(loc.pixel == et::PixelIndex(874, 557));
    REQUIRE(grid.lonlatToPixel(EuCentre, "EU", et::RowOrigin::bottomUp).pixel
            == et::PixelIndex(874, 642));

    // point outside any zone is still projected into requested subgrid
    const math::Point2 ocean(-20, 50);
    REQUIRE(grid.resolve(ocean, std::nothrow) == nullptr);
    const auto forced(grid.lonlatToPixel(ocean, "EU"));
    REQUIRE(forced.subgrid == "EU");
    REQUIRE(forced.tileName
            == grid.subgrid("EU").tilingSystem()
               .tileName(grid.lonlatToXy(ocean, "EU").xy));

    REQUIRE_THROWS_AS(grid.lonlatToPixel(EuCentre, "XX")
                      , equi7grid::NoSuchSubgrid);
}

TEST_CASE("Batch point to tile pixel", "[grid]") {
    const auto &grid(grid500());

    const math::Points2 points = {
        EuCentre
        , math::Point2(-40, 20)
        , math::Point2(21.5, 8.5)
        , math::Point2(10, 36)
        , math::Point2(24.001, 53.001)
    };

    const auto locs(grid.lonlatToPixel(points));
    REQUIRE(locs.size() == points.size());

    REQUIRE(bool(locs[0]));
    REQUIRE(locs[0]->tileName == "EU500M_E054N018T6");
    REQUIRE(locs[0]->pixel == et::PixelIndex(874, 557));

    REQUIRE_FALSE(bool(locs[1]));

    REQUIRE(bool(locs[2]));
    REQUIRE(locs[2]->subgrid == "AF");
    REQUIRE(locs[2]->tileName == "AF500M_E054N054T6");

    REQUIRE_FALSE(bool(locs[3]));

    REQUIRE(bool(locs[4]));
    REQUIRE(locs[4]->tileName == "EU500M_E054N018T6");

    // batch agrees with scalar version
    for (std::size_t i(0); i < points.size(); ++i) {
        if (!locs[i]) { continue; }
        const auto scalar(grid.lonlatToPixel(points[i]));
        REQUIRE(scalar.tileName == locs[i]->tileName);
        REQUIRE(scalar.pixel == locs[i]->pixel);
    }
}

TEST_CASE("Batch point to tile pixel with many points", "[grid]") {
    const auto &grid(grid500());

    // enough points to spread over all worker threads
    math::Points2 points;
    for (int i(0); i < 20; ++i) {
        for (int j(0); j < 20; ++j) {
            points.emplace_back(EuCentre(0) - 2.0 + 0.2 * i
                                , EuCentre(1) - 2.0 + 0.2 * j);
        }
    }

    const auto locs(grid.lonlatToPixel(points, et::RowOrigin::bottomUp));
    REQUIRE(locs.size() == points.size());

    for (std::size_t i(0); i < points.size(); ++i) {
        REQUIRE(bool(locs[i]));
        const auto scalar(grid.lonlatToPixel(points[i]
                                             , et::RowOrigin::bottomUp));
        REQUIRE(locs[i]->subgrid == "EU");
        REQUIRE(scalar.tileName == locs[i]->tileName);
        REQUIRE(scalar.pixel == locs[i]->pixel);
    }
}

TEST_CASE("Tiles by name", "[grid]") {
    const auto &grid(grid500());

    const auto tile(grid.tile("EU500M_E054N018T6"));
    REQUIRE(tile.coversLand());
    REQUIRE(tile.lowerLeft() == et::Corner(5400000, 1800000));

    REQUIRE(grid.tile("AF500M_E054N054T6").coversLand());
    REQUIRE_FALSE(grid.tile("AF500M_E000N000T6").coversLand());

    REQUIRE_THROWS_AS(grid.tile("E054N018T6"), equi7grid::MalformedTileName);
    REQUIRE_THROWS_AS(grid.tile("XX500M_E054N018T6")
                      , equi7grid::SubgridMismatch);
    REQUIRE_THROWS_AS(grid.tile("EU250M_E054N018T6")
                      , equi7grid::SamplingMismatch);

    REQUIRE(grid.familyTiles("EU500M_E054N018T6", 10).size() == 36);
    REQUIRE(grid.familyTiles("EU500M_E054N018T6", TileClass::t3).size() == 4);
}
