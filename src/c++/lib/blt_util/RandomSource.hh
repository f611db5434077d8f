//
// ReadSim - Empirical Short Read Simulator
// Copyright (c) 2009-2018 Illumina, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
//

/// \file
/// \brief single ordered stream of random values shared by all simulation steps
///

#pragma once

#include "blt_util/thirdparty_push.h"

#include "boost/random/mersenne_twister.hpp"

#include "blt_util/thirdparty_pop.h"

#include <cstdint>


/// \brief Wraps the random generator used for every sampling decision
///
/// Reproducibility under a fixed seed depends on the order in which values are
/// drawn, so a single instance must be passed explicitly to each consumer in turn.
///
class RandomSource
{
public:
    typedef boost::random::mt19937 gen_t;

    /// seed from the system entropy source, output is not reproducible
    RandomSource();

    explicit
    RandomSource(const uint32_t seed);

    RandomSource(const RandomSource&) = delete;
    RandomSource& operator=(const RandomSource&) = delete;

    uint32_t
    seed() const
    {
        return _seed;
    }

    /// uniform real value in [0,1)
    double
    uniform();

    /// uniform integer in [beginVal,endVal)
    unsigned
    uniformInt(
        const unsigned beginVal,
        const unsigned endVal);

    /// normally distributed real value
    double
    normal(
        const double mean,
        const double sd);

private:
    uint32_t _seed;
    gen_t _gen;
};
