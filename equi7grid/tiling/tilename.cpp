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
#include <boost/format.hpp>

#include "dbglog/dbglog.hpp"

#include "../error.hpp"

#include "tilename.hpp"
#include "sampling.hpp"

namespace equi7grid { namespace tiling {

namespace {

const std::string::size_type ShortNameSize(10);

inline bool isDigit(char c) { return (c >= '0') && (c <= '9'); }

template <unsigned int width, typename T>
inline const char* parseDigits(const char *p, T &value)
{
    value = 0;
    for (unsigned int i(0); i < width; ++i, ++p) {
        if (!isDigit(*p)) { return nullptr; }
        value *= 10;
        value += (*p - '0');
    }
    return p;
}

struct Block {
    Coordinate east;
    Coordinate north;
    int sizeDigit;
};

/** Parses E<ddd>N<ddd>T<d>.
 */
bool parseBlock(const std::string &str, Block &block)
{
    if (str.size() != ShortNameSize) { return false; }

    const char *p(str.c_str());

    if (*p++ != 'E') { return false; }
    if (!(p = parseDigits<3>(p, block.east))) { return false; }
    if (*p++ != 'N') { return false; }
    if (!(p = parseDigits<3>(p, block.north))) { return false; }
    if (*p++ != 'T') { return false; }
    if (!(p = parseDigits<1>(p, block.sizeDigit))) { return false; }

    return !*p;
}

} // namespace

Coordinate TileName::tileSize() const
{
    return tileExtent(tileClass);
}

boost::optional<TileNameForm> tileNameForm(const std::string &name
                                           , std::nothrow_t)
{
    if (name.find('_') != std::string::npos) {
        return TileNameForm::longForm;
    }

    if ((name.size() == ShortNameSize) && (name[0] == 'E')) {
        return TileNameForm::shortForm;
    }

    return boost::none;
}

TileNameForm tileNameForm(const std::string &name)
{
    if (const auto form = tileNameForm(name, std::nothrow)) { return *form; }

    LOGTHROW(err1, MalformedTileName)
        << "Tile name <" << name << "> is neither in long nor in short form.";
    throw;
}

std::string encodeTileName(const TileNaming &naming, const Corner &lowerLeft
                           , TileNameForm form)
{
    const auto extent(tileExtent(naming.tileClass));

    if ((lowerLeft.x < 0) || (lowerLeft.y < 0)
        || ((lowerLeft.x / TileNameUnit) > 999)
        || ((lowerLeft.y / TileNameUnit) > 999))
    {
        LOGTHROW(err1, CornerOutOfRange)
            << "Corner (" << lowerLeft.x << ", " << lowerLeft.y
            << ") cannot be expressed in a tile name.";
    }

    if ((lowerLeft.x % extent) || (lowerLeft.y % extent)) {
        LOGTHROW(err1, UnalignedCorner)
            << "Corner (" << lowerLeft.x << ", " << lowerLeft.y
            << ") is not aligned to " << naming.tileClass
            << " tile extent " << extent << ".";
    }

    const auto shortName
        (str(boost::format("E%03dN%03d%s")
             % (lowerLeft.x / TileNameUnit) % (lowerLeft.y / TileNameUnit)
             % naming.tileClass));

    if (form == TileNameForm::shortForm) { return shortName; }

    return str(boost::format("%sM_%s")
               % (naming.subgrid
                  + encodeSampling(naming.sampling, naming.notation))
               % shortName);
}

TileName decodeTileName(const TileNaming &naming, const std::string &name)
{
    TileName tn;
    tn.form = tileNameForm(name);
    tn.subgrid = naming.subgrid;
    tn.sampling = naming.sampling;
    tn.tileClass = naming.tileClass;

    std::string block(name);

    if (tn.form == TileNameForm::longForm) {
        const auto split(name.find('_'));
        // at least 2 letter subgrid, 1 character token and M
        if ((split < 4) || (name[split - 1] != 'M')
            || (name.find('_', split + 1) != std::string::npos))
        {
            LOGTHROW(err1, MalformedTileName)
                << "Tile name <" << name << "> has invalid prefix.";
        }

        const auto subgrid(name.substr(0, 2));
        if (subgrid != naming.subgrid) {
            LOGTHROW(err1, SubgridMismatch)
                << "Tile name <" << name << "> belongs to subgrid <"
                << subgrid << ">, expected <" << naming.subgrid << ">.";
        }

        const auto token(name.substr(2, split - 3));
        // structural check of the token
        decodeSampling(token, naming.notation);
        const auto expected(encodeSampling(naming.sampling, naming.notation));
        if (token != expected) {
            LOGTHROW(err1, SamplingMismatch)
                << "Tile name <" << name << "> has sampling <" << token
                << ">, expected <" << expected << ">.";
        }

        block = name.substr(split + 1);
    }

    Block b;
    if (!parseBlock(block, b)) {
        LOGTHROW(err1, MalformedTileName)
            << "Tile name <" << name << "> has invalid corner/size block.";
    }

    const auto sizeDigit(tileSizeDigit(naming.tileClass));
    if (b.sizeDigit != sizeDigit) {
        LOGTHROW(err1, TileSizeMismatch)
            << "Tile name <" << name << "> has tile size <" << b.sizeDigit
            << ">, expected <" << sizeDigit << ">.";
    }

    if ((b.east % sizeDigit) || (b.north % sizeDigit)) {
        LOGTHROW(err1, UnalignedCorner)
            << "Tile name <" << name << "> has corner not aligned to "
            << naming.tileClass << " tile extent.";
    }

    tn.lowerLeft = Corner(b.east * TileNameUnit, b.north * TileNameUnit);
    return tn;
}

std::string shortTileName(const TileNaming &naming, const std::string &name)
{
    return encodeTileName(naming, decodeTileName(naming, name).lowerLeft
                          , TileNameForm::shortForm);
}

void checkTileName(const TileNaming &naming, const std::string &name)
{
    decodeTileName(naming, name);
}

bool checkTileName(const TileNaming &naming, const std::string &name
                   , std::nothrow_t)
{
    try {
        decodeTileName(naming, name);
    } catch (const MalformedTileName&) {
        return false;
    }
    return true;
}

} } // namespace equi7grid::tiling
