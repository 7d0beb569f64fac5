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
 * \file registry.hpp
 *
 * Static grid data: subgrid zones, their projections and land coverage.
 */

#ifndef equi7grid_registry_hpp_included_
#define equi7grid_registry_hpp_included_

#include <iosfwd>

#include <boost/filesystem/path.hpp>

#include "registry/subgrid.hpp"

namespace equi7grid { namespace registry {

/** Grid data registry. Immutable once loaded.
 */
struct Registry {
    /** Version of the grid data.
     */
    std::string version;

    SubgridZone::dict subgrids;

    Registry() = default;

    const SubgridZone& subgrid(const std::string &id) const {
        return subgrids(id);
    }

    bool empty() const { return subgrids.empty(); }
};

/** System-wide registry. Populated by init().
 */
extern Registry system;

/** Loads system registry from given directory. Must be called once, before
 *  any grid is constructed from the system registry.
 */
void init(const boost::filesystem::path &dataRoot);

boost::filesystem::path dataRoot();

/** Returns default path to grid data directory.
 *  NB: implemented in file generated from config.cpp.in template
 */
boost::filesystem::path defaultPath();

/** Name of grid data file inside data directory.
 */
extern const char *DataFileName;

Registry load(const boost::filesystem::path &path);

Registry load(std::istream &in
              , const boost::filesystem::path &path = "unknown");

} } // namespace equi7grid::registry

#endif // equi7grid_registry_hpp_included_
