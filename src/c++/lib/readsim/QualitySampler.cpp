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

#include "readsim/QualitySampler.hh"

#include "blt_util/RandomSource.hh"

#include <algorithm>



static
bool
isThresholdLess(
    const QualityCdfEntry& entry,
    const unsigned value)
{
    return (entry.threshold < value);
}



/// \brief pull the quality for \p rv from a scaled discrete cdf
///
static
uint8_t
lookupQualityCdf(
    const QualityCdf& cdf,
    const unsigned rv)
{
    QualityCdf::const_iterator iter(std::lower_bound(cdf.begin(), cdf.end(), rv, isThresholdLess));

    // the final threshold is always maxDistNumber, so this only guards against truncated tables:
    if (iter == cdf.end()) --iter;
    return iter->qscore;
}



void
QualitySampler::
sample(
    const unsigned readLength,
    const READ_MATE::index_t mate,
    RandomSource& rng,
    std::vector<uint8_t>& qualities) const
{
    _profile.verifyLength(readLength, mate);

    qualities.resize(readLength);
    for (unsigned readPos(0); readPos<readLength; ++readPos)
    {
        const unsigned rv(rng.uniformInt(1, QualityProfile::maxDistNumber+1));
        qualities[readPos] = lookupQualityCdf(_profile.getQualityCdf(mate, readPos), rv);
    }
}
