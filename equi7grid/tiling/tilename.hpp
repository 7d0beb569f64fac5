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
 * \file tiling/tilename.hpp
 *
 * Tile name codec.
 *
 * Long form:  <subgrid><sampling>M_E<east>N<north>T<size>, e.g.
 *             EU500M_E012N018T6
 * Short form: E<east>N<north>T<size>, e.g. E012N018T6
 *
 * East and north are lower-left corner coordinates in 100km units, size is
 * tile extent in 100km units.
 */

#ifndef equi7grid_tiling_tilename_hpp_included_
#define equi7grid_tiling_tilename_hpp_included_

#include <new>
#include <string>

#include <boost/optional.hpp>

#include "basetypes.hpp"

namespace equi7grid { namespace tiling {

/** Decoded tile name.
 */
struct TileName {
    std::string subgrid;
    Sampling sampling;
    TileClass tileClass;
    Corner lowerLeft;

    /** Form the name was decoded from.
     */
    TileNameForm form;

    TileName()
        : sampling(), tileClass(), form(TileNameForm::longForm) {}

    Coordinate tileSize() const;

    bool operator==(const TileName &o) const;
};

/** Detects form of given name from its structure: a name containing '_' is a
 *  long one, otherwise a 10 character name starting with 'E' is a short one.
 *
 *  Throws MalformedTileName if neither applies.
 */
TileNameForm tileNameForm(const std::string &name);

boost::optional<TileNameForm> tileNameForm(const std::string &name
                                           , std::nothrow_t);

/** Encodes tile name.
 *
 *  Throws UnalignedCorner if corner is not a multiple of the tile extent and
 *  CornerOutOfRange if the corner does not fit into 3 digits.
 */
std::string encodeTileName(const TileNaming &naming, const Corner &lowerLeft
                           , TileNameForm form = TileNameForm::longForm);

/** Decodes tile name and cross-checks it against the naming:
 *      * subgrid and sampling (long form only)
 *      * tile size digit
 *      * corner alignment to tile extent
 *      * tile class
 *
 *  Short form takes subgrid and sampling from the naming.
 *
 *  Throws MalformedTileName (or one of its subtypes) on failure.
 */
TileName decodeTileName(const TileNaming &naming, const std::string &name);

/** Converts any valid name to its short form.
 */
std::string shortTileName(const TileNaming &naming, const std::string &name);

/** Checks tile name. Throws on failure.
 */
void checkTileName(const TileNaming &naming, const std::string &name);

/** Checks tile name. Returns false on failure.
 */
bool checkTileName(const TileNaming &naming, const std::string &name
                   , std::nothrow_t);

// inlines

inline bool TileName::operator==(const TileName &o) const
{
    return ((subgrid == o.subgrid) && (sampling == o.sampling)
            && (tileClass == o.tileClass) && (lowerLeft == o.lowerLeft));
}

} } // namespace equi7grid::tiling

#endif // equi7grid_tiling_tilename_hpp_included_
