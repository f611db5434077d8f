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

#include "readsim/ErrorInjector.hh"

#include "blt_util/qscore.hh"
#include "blt_util/RandomSource.hh"
#include "blt_util/seq_util.hh"
#include "common/Exceptions.hh"

#include <sstream>



uint8_t
getMutatedBaseId(
    RandomSource& rng,
    const uint8_t baseId)
{
    uint8_t id(static_cast<uint8_t>(rng.uniformInt(0,N_BASE-1)));
    if (id>=baseId) id += 1;
    return id;
}



char
getRandomBase(RandomSource& rng)
{
    return id_to_base(static_cast<uint8_t>(rng.uniformInt(0,N_BASE)));
}



unsigned
injectSubstitutionErrors(
    RandomSource& rng,
    std::vector<uint8_t>& qualities,
    std::string& sequence)
{
    if (qualities.size() != sequence.size())
    {
        using namespace readsim::common;
        std::ostringstream oss;
        oss << "Basecall quality count " << qualities.size() << " does not match read length " << sequence.size();
        BOOST_THROW_EXCEPTION(PreConditionException(oss.str()));
    }

    static const uint8_t unknownBaseQscore(1);

    unsigned substitutionCount(0);
    const unsigned readLength(sequence.size());
    for (unsigned readPos(0); readPos<readLength; ++readPos)
    {
        const uint8_t baseId(base_to_id(sequence[readPos]));
        if (baseId == BASE_ID::ANY)
        {
            qualities[readPos] = unknownBaseQscore;
            continue;
        }

        if (rng.uniform() < qphred_to_error_prob(qualities[readPos]))
        {
            sequence[readPos] = id_to_base(getMutatedBaseId(rng,baseId));
            substitutionCount++;
        }
    }
    return substitutionCount;
}
