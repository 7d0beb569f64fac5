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
#include <algorithm>

#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>

#include "dbglog/dbglog.hpp"
#include "utility/raise.hpp"

#include "../error.hpp"

#include "sampling.hpp"

namespace equi7grid { namespace tiling {

namespace {

const SamplingList Supported = {
    6000, 3000, 1000, 800, 750, 600, 500, 400, 300, 250, 200, 150, 125, 100
    , 96, 80, 75, 64
    , 60, 50, 48, 40, 32, 30, 25, 24, 20
    , 16, 10, 8, 5, 4, 2, 1
};

struct ClassRule {
    TileClass tileClass;
    Sampling min;
    Sampling max;
    Coordinate extent;
};

const ClassRule ClassRules[] = {
    { TileClass::t6, 64, 6000, 600000 }
    , { TileClass::t3, 20, 60, 300000 }
    , { TileClass::t1, 1, 16, 100000 }
};

inline bool isDigit(char c) { return (c >= '0') && (c <= '9'); }

inline int digit(char c) { return c - '0'; }

} // namespace

boost::optional<TileClass> tileClass(Sampling sampling, std::nothrow_t)
{
    for (const auto &rule : ClassRules) {
        if ((sampling >= rule.min) && (sampling <= rule.max)
            && !(rule.extent % sampling))
        {
            return rule.tileClass;
        }
    }
    return boost::none;
}

TileClass tileClass(Sampling sampling)
{
    if (const auto tc = tileClass(sampling, std::nothrow)) { return *tc; }

    LOGTHROW(err1, UnsupportedSampling)
        << "Sampling <" << sampling << "> does not map to any tile class.";
    throw;
}

Coordinate tileExtent(TileClass tileClass)
{
    for (const auto &rule : ClassRules) {
        if (rule.tileClass == tileClass) { return rule.extent; }
    }

    utility::raise<Error>
        ("Unexpected TileClass value <%s>. Go fix your program."
         , tileClass);
    throw;
}

Sampling representativeSampling(TileClass tileClass)
{
    switch (tileClass) {
    case TileClass::t6: return 500;
    case TileClass::t3: return 20;
    case TileClass::t1: return 10;
    }

    utility::raise<Error>
        ("Unexpected TileClass value <%s>. Go fix your program."
         , tileClass);
    throw;
}

const SamplingList& supportedSamplings()
{
    return Supported;
}

bool supported(Sampling sampling)
{
    return (std::find(Supported.begin(), Supported.end(), sampling)
            != Supported.end());
}

SamplingList inconsistentSamplings()
{
    SamplingList out;
    for (auto sampling : Supported) {
        if (!tileClass(sampling, std::nothrow)) { out.push_back(sampling); }
    }
    return out;
}

std::string encodeSampling(Sampling sampling, SamplingNotation notation)
{
    if (sampling <= 0) {
        LOGTHROW(err1, UnsupportedSampling)
            << "Cannot encode non-positive sampling <" << sampling << ">.";
    }

    if (sampling < 1000) {
        return str(boost::format("%03d") % sampling);
    }

    if (notation == SamplingNotation::metres) {
        return boost::lexical_cast<std::string>(sampling);
    }

    if (sampling >= 10000) {
        LOGTHROW(err1, UnsupportedSampling)
            << "Sampling <" << sampling << "> cannot be written in "
            "kilometre notation.";
    }

    if (sampling % 100) {
        LOG(warn2)
            << "Sampling <" << sampling << "> written in kilometre notation "
            "loses precision.";
    }

    return str(boost::format("%dK%d")
               % (sampling / 1000) % ((sampling % 1000) / 100));
}

Sampling decodeSampling(const std::string &token, SamplingNotation notation)
{
    auto malformed([&]() {
            LOGTHROW(err1, MalformedTileName)
                << "Invalid sampling token <" << token << ">.";
        });

    if (token.empty()) { malformed(); }

    if ((notation == SamplingNotation::kilometres)
        && (token.size() == 3) && (token[1] == 'K'))
    {
        if (!isDigit(token[0]) || !isDigit(token[2])) { malformed(); }
        return digit(token[0]) * 1000 + digit(token[2]) * 100;
    }

    if ((notation == SamplingNotation::kilometres) && (token.size() != 3)) {
        malformed();
    }

    // plain number of metres; at most 9 digits keeps it in int range
    if (token.size() > 9) { malformed(); }

    Sampling sampling(0);
    for (char c : token) {
        if (!isDigit(c)) { malformed(); }
        sampling = sampling * 10 + digit(c);
    }
    return sampling;
}

} } // namespace equi7grid::tiling
