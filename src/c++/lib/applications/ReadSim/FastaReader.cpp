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

#include "FastaReader.hh"

#include "common/Exceptions.hh"

#include <cerrno>

#include <iostream>
#include <sstream>



FastaReader::
FastaReader(
    std::istream& is,
    const std::string& streamLabel)
    : _is(is),
      _streamLabel(streamLabel)
{}



bool
FastaReader::
getLine(std::string& line)
{
    if (! std::getline(_is, line))
    {
        if (_is.bad())
        {
            using namespace readsim::common;
            std::ostringstream oss;
            oss << "Unexpected failure while attempting to read line " << (_lineNumber+1)
                << " of fasta file/stream: '" << _streamLabel << "'";
            BOOST_THROW_EXCEPTION(IoException(EIO, oss.str()));
        }
        return false;
    }

    _lineNumber++;

    // windows fasta files may still have '\r'
    if ((! line.empty()) && (line[line.size()-1] == '\r')) line.resize(line.size()-1);
    return true;
}



void
FastaReader::
parseHeader(const std::string& line)
{
    const std::string::size_type idStart(line.find_first_not_of(" \t", 1));
    if (idStart == std::string::npos)
    {
        using namespace readsim::common;
        std::ostringstream oss;
        oss << "Unexpected header format on line " << _lineNumber << " of fasta file/stream '" << _streamLabel
            << "': '" << line << "'";
        BOOST_THROW_EXCEPTION(GeneralException(oss.str()));
    }

    const std::string::size_type idEnd(line.find_first_of(" \t", idStart));
    _pendingId = line.substr(idStart, idEnd-idStart);
    _isHeaderPending = true;
}



bool
FastaReader::
nextRecord(FastaRecord& record)
{
    record.clear();

    std::string line;
    if (! _isHeaderPending)
    {
        while (getLine(line))
        {
            if (line.empty()) continue;
            if (line[0] != '>')
            {
                using namespace readsim::common;
                std::ostringstream oss;
                oss << "Missing fasta header before line " << _lineNumber << " of fasta file/stream '"
                    << _streamLabel << "'";
                BOOST_THROW_EXCEPTION(GeneralException(oss.str()));
            }
            parseHeader(line);
            break;
        }
        if (! _isHeaderPending) return false;
    }

    record.id = _pendingId;
    _isHeaderPending = false;

    while (getLine(line))
    {
        if (line.empty()) continue;
        if (line[0] == '>')
        {
            parseHeader(line);
            break;
        }
        record.sequence += line;
    }
    return true;
}
