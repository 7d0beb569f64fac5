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
#include "../tiling/io.hpp"

namespace po = boost::program_options;
namespace er = equi7grid::registry;
namespace et = equi7grid::tiling;

class Locate : public service::Cmdline
{
public:
    Locate()
        : Cmdline("equi7grid-locate", BUILD_TARGET_VERSION
                  , service::DISABLE_EXCESSIVE_LOGGING)
        , origin_(et::RowOrigin::topDown)
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
    double lon_;
    double lat_;
    et::RowOrigin origin_;
    boost::optional<std::string> subgrid_;
};

void Locate::configuration(po::options_description &cmdline
                           , po::options_description &config
                           , po::positional_options_description &pd)
{
    er::dataConfiguration(cmdline, er::defaultPath());
    et::gridConfiguration(cmdline, gridConfig_);

    cmdline.add_options()
        ("lon", po::value(&lon_)->required()
         , "Longitude (WGS84, degrees).")
        ("lat", po::value(&lat_)->required()
         , "Latitude (WGS84, degrees).")
        ("origin", po::value(&origin_)->required()
         ->default_value(origin_)
         , "Pixel row origin: top-down or bottom-up.")
        ("subgrid", po::value<std::string>()
         , "Use given subgrid instead of resolving it from zone extents.")
    ;

    pd.add("lon", 1)
        .add("lat", 1);

    (void) config;
}

void Locate::configure(const po::variables_map &vars)
{
    er::dataConfigure(vars);
    et::gridConfigure(vars, gridConfig_);

    if (vars.count("subgrid")) {
        subgrid_ = vars["subgrid"].as<std::string>();
    }
}

bool Locate::help(std::ostream &out, const std::string &what) const
{
    if (what.empty()) {
        out << R"RAW(equi7grid-locate: lon lat

Finds subgrid, projected coordinates, tile and pixel of given geographic
point.
)RAW";
    }
    return false;
}

int Locate::run()
{
    et::Grid grid(gridConfig_.sampling, gridConfig_.notation);
    const math::Point2 lonlat(lon_, lat_);

    et::PixelLocation loc;
    if (subgrid_) {
        loc = grid.lonlatToPixel(lonlat, *subgrid_, origin_);
    } else {
        const auto *sg(grid.resolve(lonlat, std::nothrow));
        if (!sg) {
            std::cout << "Point " << lon_ << ", " << lat_
                      << " cannot be assigned a unique subgrid." << std::endl;
            return EXIT_FAILURE;
        }
        loc = grid.lonlatToPixel(lonlat, origin_);
    }

    std::cout << "Subgrid: " << grid.subgrid(loc.subgrid).name() << std::endl;
    std::cout << std::fixed << std::setprecision(3)
              << "Projected: " << loc.xy(0) << ", " << loc.xy(1)
              << std::endl;
    std::cout << "Tile: " << loc.tileName << std::endl;
    std::cout << "Pixel (" << origin_ << "): " << loc.pixel << std::endl;

    return EXIT_SUCCESS;
}

int main(int argc, char *argv[])
{
    return Locate()(argc, argv);
}
