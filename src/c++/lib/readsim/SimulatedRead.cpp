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

#include "readsim/SimulatedRead.hh"

#include <iostream>
#include <sstream>



std::string
SimulatedRead::
readId(
    const std::string& referenceId,
    const unsigned readIndex)
{
    std::ostringstream oss;
    oss << referenceId << '-' << readIndex;
    return oss.str();
}



std::string
SimulatedRead::
description() const
{
    std::ostringstream oss;
    oss << startPos << (isPlusStrand ? 'F' : 'R');
    return oss.str();
}



std::ostream&
operator<<(std::ostream& os, const SimulatedRead& read)
{
    os << "SimulatedRead: " << read.description()
       << " length: " << read.length()
       << " indels: " << read.indels.size() << "\n";
    os << "\treference: " << read.reference << "\n";
    os << "\tsequence:  " << read.sequence << "\n";
    return os;
}
