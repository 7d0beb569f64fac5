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
#include "equi7grid/tiling/sampling.hpp"

namespace et = equi7grid::tiling;
using equi7grid::registry::TileClass;

TEST_CASE("Sampling determines tile class", "[sampling]") {
    REQUIRE(et::tileClass(6000) == TileClass::t6);
    REQUIRE(et::tileClass(500) == TileClass::t6);
    REQUIRE(et::tileClass(64) == TileClass::t6);
    REQUIRE(et::tileClass(60) == TileClass::t3);
    REQUIRE(et::tileClass(25) == TileClass::t3);
    REQUIRE(et::tileClass(20) == TileClass::t3);
    REQUIRE(et::tileClass(16) == TileClass::t1);
    REQUIRE(et::tileClass(10) == TileClass::t1);
    REQUIRE(et::tileClass(1) == TileClass::t1);
}

TEST_CASE("Unsupported samplings are rejected", "[sampling]") {
    REQUIRE_THROWS_AS(et::tileClass(0), equi7grid::UnsupportedSampling);
    REQUIRE_THROWS_AS(et::tileClass(-500), equi7grid::UnsupportedSampling);
    // gaps between class ranges
    REQUIRE_THROWS_AS(et::tileClass(17), equi7grid::UnsupportedSampling);
    REQUIRE_THROWS_AS(et::tileClass(62), equi7grid::UnsupportedSampling);
    // out of range
    REQUIRE_THROWS_AS(et::tileClass(7000), equi7grid::UnsupportedSampling);
    // in range but not dividing tile extent
    REQUIRE_THROWS_AS(et::tileClass(7), equi7grid::UnsupportedSampling);
    REQUIRE_THROWS_AS(et::tileClass(700), equi7grid::UnsupportedSampling);

    REQUIRE_FALSE(bool(et::tileClass(7, std::nothrow)));
    REQUIRE(bool(et::tileClass(500, std::nothrow)));
}

TEST_CASE("Supported samplings follow tile class rule", "[sampling]") {
    REQUIRE(et::inconsistentSamplings().empty());
    REQUIRE(et::supportedSamplings().size() == 34);

    for (auto sampling : et::supportedSamplings()) {
        REQUIRE(et::supported(sampling));
        REQUIRE_NOTHROW(et::tileClass(sampling));
    }

    // satisfies the rule but is not offered
    REQUIRE(et::tileClass(120) == TileClass::t6);
    REQUIRE_FALSE(et::supported(120));
}

TEST_CASE("Tile extents", "[sampling]") {
    REQUIRE(et::tileExtent(TileClass::t6) == 600000);
    REQUIRE(et::tileExtent(TileClass::t3) == 300000);
    REQUIRE(et::tileExtent(TileClass::t1) == 100000);

    REQUIRE(et::tileSizeDigit(TileClass::t6) == 6);
    REQUIRE(et::tileSizeDigit(TileClass::t1) == 1);

    REQUIRE(et::representativeSampling(TileClass::t6) == 500);
    REQUIRE(et::representativeSampling(TileClass::t3) == 20);
    REQUIRE(et::representativeSampling(TileClass::t1) == 10);
}

TEST_CASE("Sampling token encoding", "[sampling]") {
    REQUIRE(et::encodeSampling(500) == "500");
    REQUIRE(et::encodeSampling(75) == "075");
    REQUIRE(et::encodeSampling(1) == "001");
    REQUIRE(et::encodeSampling(1000) == "1K0");
    REQUIRE(et::encodeSampling(3000) == "3K0");
    REQUIRE(et::encodeSampling(1500) == "1K5");

    REQUIRE(et::encodeSampling(500, et::SamplingNotation::metres) == "500");
    REQUIRE(et::encodeSampling(1000, et::SamplingNotation::metres)
            == "1000");
    REQUIRE(et::encodeSampling(6000, et::SamplingNotation::metres)
            == "6000");

    REQUIRE_THROWS_AS(et::encodeSampling(0), equi7grid::UnsupportedSampling);
    REQUIRE_THROWS_AS(et::encodeSampling(12000)
                      , equi7grid::UnsupportedSampling);
}

TEST_CASE("Kilometre notation is lossy", "[sampling]") {
    REQUIRE(et::encodeSampling(1234) == "1K2");
    REQUIRE(et::decodeSampling("1K2") == 1200);
}

TEST_CASE("Sampling token decoding", "[sampling]") {
    REQUIRE(et::decodeSampling("500") == 500);
    REQUIRE(et::decodeSampling("010") == 10);
    REQUIRE(et::decodeSampling("6K0") == 6000);
    REQUIRE(et::decodeSampling("1000", et::SamplingNotation::metres)
            == 1000);
    REQUIRE(et::decodeSampling("075", et::SamplingNotation::metres) == 75);

    REQUIRE_THROWS_AS(et::decodeSampling(""), equi7grid::MalformedTileName);
    REQUIRE_THROWS_AS(et::decodeSampling("50"), equi7grid::MalformedTileName);
    REQUIRE_THROWS_AS(et::decodeSampling("5X0"), equi7grid::MalformedTileName);
    REQUIRE_THROWS_AS(et::decodeSampling("KK0"), equi7grid::MalformedTileName);
    REQUIRE_THROWS_AS(et::decodeSampling("1K0", et::SamplingNotation::metres)
                      , equi7grid::MalformedTileName);
}

TEST_CASE("Metre notation round-trips every supported sampling"
          , "[sampling]")
{
    for (auto sampling : et::supportedSamplings()) {
        const auto token(et::encodeSampling(sampling
                                            , et::SamplingNotation::metres));
        REQUIRE(et::decodeSampling(token, et::SamplingNotation::metres)
                == sampling);
        // supported samplings >= 1000 are whole kilometres
        REQUIRE(et::decodeSampling(et::encodeSampling(sampling)) == sampling);
    }
}
