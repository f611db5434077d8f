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
/// \brief fastq output of simulated reads
///

#pragma once

#include "readsim/SimulatedRead.hh"

#include <iosfwd>
#include <string>


/// \brief Writes simulated reads as 4-line fastq records with phred+33 qualities
///
struct FastqWriter
{
    explicit
    FastqWriter(std::ostream& os)
        : _os(os)
    {}

    void
    write(
        const std::string& readId,
        const SimulatedRead& read);

private:
    std::ostream& _os;
};
