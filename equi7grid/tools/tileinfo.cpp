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
#include <cstdlib>
#include <iostream>
#include <iomanip>

#include <boost/optional.hpp>

#include "utility/gccversion.hpp"
#include "utility/buildsys.hpp"
#include "service/cmdline.hpp"

#include "../registry/po.hpp"
#include "../tiling/po.hpp"
#include "../tiling/grid.hpp"
#include "../tiling/sampling.hpp"
#include "../tiling/io.hpp"

namespace po = boost::program_options;
namespace er = equi7grid::registry;
namespace et = equi7grid::tiling;

namespace {

void print(std::ostream &os, const et::GeoTransform &gt)
{
    os << '[';
    for (std::size_t i(0); i < gt.size(); ++i) {
        if (i) { os << ", "; }
        os << gt[i];
    }
    os << ']';
}

} // namespace

class TileInfo : public service::Cmdline
{
public:
    TileInfo()
        : Cmdline("equi7grid-tileinfo", BUILD_TARGET_VERSION
                  , service::DISABLE_EXCESSIVE_LOGGING)
    {}

private:
    virtual void configuration(po::options_description &cmdline
                               , po::options_description &config
                               , po::positional_options_description &pd)
        UTILITY_OVERRIDE;

    virtual void configure(const po::variables_map &vars)
        UTILITY_OVERRIDE;

    virtual bool help(std::ostream &out, const std::string &what) const
        UTILITY_OVERRIDE;

    virtual int run() UTILITY_OVERRIDE;

    et::GridConfig gridConfig_;
    std::string tileName_;
    boost::optional<et::Sampling> familySampling_;
    boost::optional<et::TileClass> familyClass_;
};

void TileInfo::configuration(po::options_description &cmdline
                             , po::options_description &config
                             , po::positional_options_description &pd)
{
    er::dataConfiguration(cmdline, er::defaultPath());
    et::gridConfiguration(cmdline, gridConfig_);

    cmdline.add_options()
        ("tileName", po::value(&tileName_)->required()
         , "Long name of tile to query, e.g. EU500M_E012N018T6.")
        ("family.sampling", po::value<et::Sampling>()
         , "List family tiles at given sampling.")
        ("family.class", po::value<et::TileClass>()
         , "List family tiles of given tile class (T1, T3 or T6).")
    ;

    pd.add("tileName", 1);

    (void) config;
}

void TileInfo::configure(const po::variables_map &vars)
{
    er::dataConfigure(vars);
    et::gridConfigure(vars, gridConfig_);

    if (vars.count("family.sampling")) {
        familySampling_ = vars["family.sampling"].as<et::Sampling>();
    }
    if (vars.count("family.class")) {
        familyClass_ = vars["family.class"].as<et::TileClass>();
    }

    if (familySampling_ && familyClass_) {
        throw po::validation_error
            (po::validation_error::multiple_values_not_allowed
             , "family.class");
    }
}

bool TileInfo::help(std::ostream &out, const std::string &what) const
{
    if (what.empty()) {
        out << R"RAW(equi7grid-tileinfo: tileName

Prints tile geometry (extents, pixel size, geotransform) and land coverage
of given tile. Tile sampling must match --sampling.
)RAW";
    }
    return false;
}

int TileInfo::run()
{
    et::Grid grid(gridConfig_.sampling, gridConfig_.notation);

    const auto tile(grid.tile(tileName_));
    const auto extents(tile.extents());
    const auto size(tile.size());

    std::cout << "Tile: " << tile.name() << std::endl;
    std::cout << "Short name: " << tile.shortName() << std::endl;
    std::cout << "Subgrid: " << grid.subgrid(tile.subgrid()).name()
              << std::endl;
    std::cout << "Tile class: " << tile.tileClass() << std::endl;
    std::cout << "Sampling: " << tile.sampling() << " m" << std::endl;
    std::cout << std::fixed << std::setprecision(0)
              << "Extents: " << extents.ll(0) << ',' << extents.ll(1)
              << ':' << extents.ur(0) << ',' << extents.ur(1) << std::endl;
    std::cout << "Size: " << size.width << 'x' << size.height
              << " px" << std::endl;
    std::cout << std::setprecision(1) << "Geotransform (top-down): ";
    print(std::cout, tile.geoTransform(et::RowOrigin::topDown));
    std::cout << std::endl << "Geotransform (bottom-up): ";
    print(std::cout, tile.geoTransform(et::RowOrigin::bottomUp));
    std::cout << std::endl;
    std::cout << "Covers land: " << std::boolalpha << tile.coversLand()
              << std::endl;

    et::TileNameList family;
    if (familySampling_) {
        family = grid.familyTiles(tileName_, *familySampling_);
    } else if (familyClass_) {
        family = grid.familyTiles(tileName_, *familyClass_);
    } else {
        return EXIT_SUCCESS;
    }

    std::cout << "Family (" << family.size() << "):" << std::endl;
    for (const auto &name : family) {
        std::cout << "    " << name << std::endl;
    }

    return EXIT_SUCCESS;
}

int main(int argc, char *argv[])
{
    return TileInfo()(argc, argv);
}
