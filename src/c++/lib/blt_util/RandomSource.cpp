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
///

#include "blt_util/RandomSource.hh"

#include "common/Exceptions.hh"

#include "blt_util/thirdparty_push.h"

#include "boost/random/normal_distribution.hpp"
#include "boost/random/random_device.hpp"
#include "boost/random/uniform_int_distribution.hpp"
#include "boost/random/uniform_real_distribution.hpp"

#include "blt_util/thirdparty_pop.h"

#include <sstream>



static
uint32_t
getEntropySeed()
{
    boost::random::random_device rd;
    return static_cast<uint32_t>(rd());
}



RandomSource::
RandomSource()
    : _seed(getEntropySeed()),
      _gen(_seed)
{}



RandomSource::
RandomSource(const uint32_t seed)
    : _seed(seed),
      _gen(_seed)
{}



double
RandomSource::
uniform()
{
    boost::random::uniform_real_distribution<double> dist(0.,1.);
    return dist(_gen);
}



unsigned
RandomSource::
uniformInt(
    const unsigned beginVal,
    const unsigned endVal)
{
    if (beginVal >= endVal)
    {
        using namespace readsim::common;
        std::ostringstream oss;
        oss << "Empty range requested for uniform integer draw: [" << beginVal << "," << endVal << ")";
        BOOST_THROW_EXCEPTION(PreConditionException(oss.str()));
    }
    boost::random::uniform_int_distribution<unsigned> dist(beginVal,endVal-1);
    return dist(_gen);
}



double
RandomSource::
normal(
    const double mean,
    const double sd)
{
    boost::random::normal_distribution<double> dist(mean,sd);
    return dist(_gen);
}
