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

#include "FastqWriter.hh"

#include "blt_util/qscore.hh"

#include <iostream>



void
FastqWriter::
write(
    const std::string& readId,
    const SimulatedRead& read)
{
    _os << '@' << readId << '\n'
        << read.sequence << '\n'
        << "+\n";
    for (const uint8_t qscore : read.qualities)
    {
        _os << qphred_to_fastq_char(qscore);
    }
    _os << '\n';
}
