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
/// \brief empirical per-position basecall quality distributions for a paired-end platform
///

#pragma once

#include <cstdint>

#include <iosfwd>
#include <string>
#include <vector>


namespace READ_MATE
{
enum index_t
{
    FIRST,
    SECOND,
    SIZE
};

inline
const char*
label(const index_t id)
{
    switch (id)
    {
    case FIRST:
        return "first";
    case SECOND:
        return "second";
    default:
        return "unknown";
    }
}
}


/// one entry of a positional quality CDF, \p threshold is scaled to a total
/// mass of QualityProfile::maxDistNumber
struct QualityCdfEntry
{
    unsigned threshold;
    uint8_t qscore;
};

typedef std::vector<QualityCdfEntry> QualityCdf;


/// \brief Cumulative quality distributions for each read position of both mates
///
/// Profiles are line-oriented text, one mate per file. Each (symbol,position)
/// is described by a line of ascending quality values followed by a line of
/// cumulative observation counts, both tab-separated and prefixed by the
/// symbol and position. Only the combined distribution (symbol '.') is
/// retained; per-base distributions (A,C,G,T,N) are checked for consistency
/// and otherwise ignored.
///
class QualityProfile
{
public:
    /// \brief Load the profile from the files of the first and second mate
    ///
    /// \throws IoException if either file can't be opened
    /// \throws ProfileFormatException for any malformed content
    QualityProfile(
        const std::string& firstMateFilename,
        const std::string& secondMateFilename);

    QualityProfile(
        std::istream& firstMateStream,
        std::istream& secondMateStream);

    /// number of read positions covered for \p mate
    unsigned
    maxLength(const READ_MATE::index_t mate) const
    {
        return _qualityCdfs[mate].size();
    }

    /// \throws ReadLengthException if \p readLength exceeds the positions covered for \p mate
    void
    verifyLength(
        const unsigned readLength,
        const READ_MATE::index_t mate) const;

    const QualityCdf&
    getQualityCdf(
        const READ_MATE::index_t mate,
        const unsigned readPos) const
    {
        return _qualityCdfs[mate][readPos];
    }

    /// total mass which profile counts are rescaled to
    static const unsigned maxDistNumber = 1000000;

private:
    void
    loadMate(
        std::istream& is,
        const std::string& sourceLabel,
        const READ_MATE::index_t mate);

    std::vector<QualityCdf> _qualityCdfs[READ_MATE::SIZE];
};
