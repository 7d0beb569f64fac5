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
#include <fstream>

#include "dbglog/dbglog.hpp"

#include "jsoncpp/json.hpp"
#include "jsoncpp/io.hpp"

#include "../registry.hpp"
#include "json.hpp"

namespace equi7grid { namespace registry {

namespace detail {
    boost::filesystem::path root;
} // namespace detail

Registry system;

const char *DataFileName("equi7grid.json");

void init(const boost::filesystem::path &dataRoot)
{
    detail::root = dataRoot;
    system = load(dataRoot / DataFileName);

    LOG(info2) << "Loaded grid data version <" << system.version
               << "> from " << dataRoot << ".";
}

boost::filesystem::path dataRoot()
{
    return detail::root;
}

Registry load(std::istream &in, const boost::filesystem::path &path)
{
    // load json
    auto content(Json::read<DataUnavailable>(in, path, "grid data"));

    Registry registry;
    fromJson(registry, content, path);
    return registry;
}

Registry load(const boost::filesystem::path &path)
{
    LOG(info1) << "Loading grid data file from " << path  << ".";
    std::ifstream f;
    f.exceptions(std::ios::badbit | std::ios::failbit);
    try {
        f.open(path.string(), std::ios_base::in);
    } catch (const std::exception &e) {
        LOGTHROW(err1, DataUnavailable)
            << "Unable to load grid data file " << path
            << ": <" << e.what() << ">.";
    }
    auto registry(load(f, path));
    f.close();
    return registry;
}

} } // namespace equi7grid::registry
