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
/// \brief a single simulated read and its generation details
///

#pragma once

#include "readsim/IndelGenerator.hh"

#include <cstdint>

#include <iosfwd>
#include <string>
#include <vector>


struct SimulatedRead
{
    /// read identifier following the convention "<referenceId>-<readIndex>"
    static
    std::string
    readId(
        const std::string& referenceId,
        const unsigned readIndex);

    /// start position and strand of the read, ie. "1203F" or "88R"
    std::string
    description() const;

    bool
    isTruncated() const
    {
        return (length() < requestedLength);
    }

    unsigned
    length() const
    {
        return sequence.size();
    }

    void
    clear()
    {
        reference.clear();
        sequence.clear();
        qualities.clear();
        indels.clear();
        isPlusStrand = true;
        startPos = 0;
        requestedLength = 0;
    }

    /// reference bases consumed by the read, on the read strand
    std::string reference;

    /// simulated basecalls
    std::string sequence;

    /// basecall qualities, one per entry of sequence
    std::vector<uint8_t> qualities;

    /// indels applied when reconstructing sequence from reference
    IndelMap indels;

    bool isPlusStrand = true;

    /// offset of the read start in the source sequence of its strand
    unsigned startPos = 0;

    /// configured read length, length() is shorter when the source sequence was too short
    unsigned requestedLength = 0;
};

std::ostream&
operator<<(std::ostream& os, const SimulatedRead& read);


/// both ends of a simulated fragment
struct SimulatedReadPair
{
    /// read from the fragment plus strand, first mate
    SimulatedRead fwd;

    /// read from the fragment minus strand, second mate
    SimulatedRead rev;
};
