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
#ifndef equi7grid_tiling_po_hpp_included_
#define equi7grid_tiling_po_hpp_included_

#include <boost/program_options.hpp>

#include "basetypes.hpp"

namespace equi7grid { namespace tiling {

struct GridConfig {
    Sampling sampling;
    SamplingNotation notation;

    GridConfig()
        : sampling(500), notation(SamplingNotation::kilometres) {}
};

inline void gridConfiguration
(boost::program_options::options_description &od, GridConfig &config)
{
    od.add_options()
        ("sampling", boost::program_options::value(&config.sampling)
         ->required()->default_value(config.sampling)
         , "Grid sampling (pixel size) in metres.")
        ("namesInMetres", boost::program_options::bool_switch()
         , "Write sampling >= 1000 in tile names in metres instead of "
         "kilometres (i.e. EU1000M_... instead of EU1K0M_...).")
        ;
}

inline void gridConfigure(const boost::program_options::variables_map &vars
                          , GridConfig &config)
{
    config.notation = (vars["namesInMetres"].as<bool>()
                       ? SamplingNotation::metres
                       : SamplingNotation::kilometres);
}

} } // namespace equi7grid::tiling

#endif // equi7grid_tiling_po_hpp_included_
