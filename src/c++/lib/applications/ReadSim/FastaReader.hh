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
/// \brief sequential reader of fasta records
///

#pragma once

#include <iosfwd>
#include <string>


struct FastaRecord
{
    void
    clear()
    {
        id.clear();
        sequence.clear();
    }

    /// first word of the header line
    std::string id;
    std::string sequence;
};


/// \brief Reads the records of a fasta stream one at a time
///
/// Sequence lines may be wrapped at any width and may carry a trailing '\r'.
/// Blank lines are ignored.
///
class FastaReader
{
public:
    /// \param streamLabel name of the stream used in error messages
    FastaReader(
        std::istream& is,
        const std::string& streamLabel);

    /// \brief Read the next record
    ///
    /// \return false if there are no records left in the stream
    ///
    /// \throws GeneralException for sequence found before the first header or an empty header
    /// \throws IoException if the stream can't be read
    bool
    nextRecord(FastaRecord& record);

private:
    bool
    getLine(std::string& line);

    void
    parseHeader(const std::string& line);

    std::istream& _is;
    std::string _streamLabel;
    unsigned _lineNumber = 0;

    bool _isHeaderPending = false;
    std::string _pendingId;
};
