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

#include "readsim/QualityProfile.hh"

#include "blt_util/parse_util.hh"
#include "blt_util/qscore.hh"
#include "common/Exceptions.hh"

#include "blt_util/thirdparty_push.h"

#include "boost/algorithm/string.hpp"

#include "blt_util/thirdparty_pop.h"

#include <cerrno>

#include <fstream>
#include <iostream>
#include <sstream>


namespace PROFILE_SYMBOL
{
enum index_t
{
    COMBINED,
    A,
    C,
    G,
    T,
    N,
    SIZE
};

inline
char
getSymbol(const index_t index)
{
    static const char symbols[] = ".ACGTN";
    return symbols[index];
}

static
bool
getIndex(
    const std::string& symbol,
    index_t& index)
{
    if (symbol.size() != 1) return false;
    switch (symbol[0])
    {
    case '.':
        index = COMBINED;
        return true;
    case 'A':
        index = A;
        return true;
    case 'C':
        index = C;
        return true;
    case 'G':
        index = G;
        return true;
    case 'T':
        index = T;
        return true;
    case 'N':
        index = N;
        return true;
    default:
        return false;
    }
}
}



namespace
{

/// one parsed line of a profile: symbol, read position and a value array
struct ProfileLine
{
    PROFILE_SYMBOL::index_t symbol = PROFILE_SYMBOL::COMBINED;
    unsigned readPos = 0;
    std::vector<unsigned> data;
};

}



static
void
throwFormatError(
    const std::string& sourceLabel,
    const unsigned lineNo,
    const std::string& line,
    const std::string& reason)
{
    using namespace readsim::common;
    std::ostringstream oss;
    oss << "Invalid format in quality profile '" << sourceLabel << "' at line " << lineNo
        << ": " << reason << " [" << line << "]";
    BOOST_THROW_EXCEPTION(ProfileFormatException(oss.str()));
}



static
void
parseProfileLine(
    const std::string& line,
    const std::string& sourceLabel,
    const unsigned lineNo,
    ProfileLine& pline)
{
    std::vector<std::string> fields;
    boost::split(fields, line, boost::is_any_of("\t"));

    if (fields.size() < 2)
    {
        throwFormatError(sourceLabel, lineNo, line, "expected symbol and read position fields");
    }

    if (! PROFILE_SYMBOL::getIndex(fields[0], pline.symbol))
    {
        throwFormatError(sourceLabel, lineNo, line, "unexpected base symbol '" + fields[0] + "' linked to distribution");
    }

    using namespace readsim::blt_util;
    try
    {
        pline.readPos = parse_unsigned_str(fields[1]);
        pline.data.clear();
        for (unsigned fieldIndex(2); fieldIndex<fields.size(); ++fieldIndex)
        {
            pline.data.push_back(parse_unsigned_str(fields[fieldIndex]));
        }
    }
    catch (const readsim::common::GeneralException& e)
    {
        throwFormatError(sourceLabel, lineNo, line, e.what());
    }
}



/// rescale cumulative counts to a total mass of maxDistNumber and pair them with their qscores
static
void
makeQualityCdf(
    const std::vector<unsigned>& qscores,
    const std::vector<unsigned>& counts,
    QualityCdf& cdf)
{
    const uint64_t totalCount(counts.back());
    const uint64_t maxDistNumber(QualityProfile::maxDistNumber);

    cdf.clear();
    const unsigned qualCount(qscores.size());
    for (unsigned qualIndex(0); qualIndex<qualCount; ++qualIndex)
    {
        QualityCdfEntry entry;
        entry.threshold = static_cast<unsigned>(((counts[qualIndex] * maxDistNumber) + totalCount - 1) / totalCount);
        entry.qscore = static_cast<uint8_t>(qscores[qualIndex]);
        cdf.push_back(entry);
    }
}



const unsigned QualityProfile::maxDistNumber;



QualityProfile::
QualityProfile(
    const std::string& firstMateFilename,
    const std::string& secondMateFilename)
{
    const std::string* filenames[READ_MATE::SIZE] = { &firstMateFilename, &secondMateFilename };
    for (unsigned mateIndex(0); mateIndex<READ_MATE::SIZE; ++mateIndex)
    {
        const std::string& filename(*filenames[mateIndex]);
        std::ifstream ifs(filename.c_str());
        if (! ifs)
        {
            using namespace readsim::common;
            std::ostringstream oss;
            oss << "Can't open quality profile file '" << filename << "'";
            BOOST_THROW_EXCEPTION(IoException(errno, oss.str()));
        }
        loadMate(ifs, filename, static_cast<READ_MATE::index_t>(mateIndex));
    }
}



QualityProfile::
QualityProfile(
    std::istream& firstMateStream,
    std::istream& secondMateStream)
{
    loadMate(firstMateStream, "first mate stream", READ_MATE::FIRST);
    loadMate(secondMateStream, "second mate stream", READ_MATE::SECOND);
}



void
QualityProfile::
loadMate(
    std::istream& is,
    const std::string& sourceLabel,
    const READ_MATE::index_t mate)
{
    std::vector<QualityCdf>& mateCdfs(_qualityCdfs[mate]);
    mateCdfs.clear();

    // positions are counted independently for each symbol:
    std::vector<unsigned> symbolPosCount(PROFILE_SYMBOL::SIZE,0);

    ProfileLine qscoreLine;
    ProfileLine countLine;
    std::string line;
    unsigned lineNo(0);
    while (std::getline(is,line))
    {
        ++lineNo;
        boost::trim(line);

        // a blank line terminates the profile:
        if (line.empty()) break;
        if (line[0] == '#') continue;

        parseProfileLine(line, sourceLabel, lineNo, qscoreLine);

        const unsigned expectedPos(symbolPosCount[qscoreLine.symbol]);
        if (qscoreLine.readPos != expectedPos)
        {
            std::ostringstream oss;
            oss << "expected read position " << expectedPos << " but found " << qscoreLine.readPos;
            throwFormatError(sourceLabel, lineNo, line, oss.str());
        }

        // the quality value line must be followed immediately by its count line:
        const std::string qscoreText(line);
        if (! std::getline(is,line))
        {
            throwFormatError(sourceLabel, lineNo, qscoreText, "missing observation count line");
        }
        ++lineNo;
        boost::trim(line);
        parseProfileLine(line, sourceLabel, lineNo, countLine);

        if ((countLine.symbol != qscoreLine.symbol) || (countLine.readPos != qscoreLine.readPos))
        {
            throwFormatError(sourceLabel, lineNo, line, "count line symbol or read position does not match the preceding quality line");
        }
        if (countLine.data.size() != qscoreLine.data.size())
        {
            throwFormatError(sourceLabel, lineNo, line, "count line length does not match the preceding quality line");
        }

        if (qscoreLine.data.empty()) continue;

        for (const unsigned qscore : qscoreLine.data)
        {
            if (! is_valid_qscore(qscore))
            {
                std::ostringstream oss;
                oss << "quality value " << qscore << " is outside of the supported range [0," << MAX_QSCORE << ")";
                throwFormatError(sourceLabel, lineNo-1, qscoreText, oss.str());
            }
        }
        for (unsigned countIndex(1); countIndex<countLine.data.size(); ++countIndex)
        {
            if (countLine.data[countIndex] < countLine.data[countIndex-1])
            {
                throwFormatError(sourceLabel, lineNo, line, "observation counts are not cumulative");
            }
        }
        if (countLine.data.back() == 0)
        {
            throwFormatError(sourceLabel, lineNo, line, "total observation count is zero");
        }

        symbolPosCount[qscoreLine.symbol]++;

        if (qscoreLine.symbol != PROFILE_SYMBOL::COMBINED) continue;

        mateCdfs.emplace_back();
        makeQualityCdf(qscoreLine.data, countLine.data, mateCdfs.back());
    }

    if (is.bad())
    {
        using namespace readsim::common;
        std::ostringstream oss;
        oss << "Unexpected read failure in quality profile '" << sourceLabel << "' after line " << lineNo;
        BOOST_THROW_EXCEPTION(IoException(EIO, oss.str()));
    }

    // check coverage of the full read range:
    if (mateCdfs.empty())
    {
        using namespace readsim::common;
        std::ostringstream oss;
        oss << "Invalid " << READ_MATE::label(mate) << " mate quality profile '" << sourceLabel
            << "': no combined quality distribution found";
        BOOST_THROW_EXCEPTION(ProfileFormatException(oss.str()));
    }

    static const PROFILE_SYMBOL::index_t primarySymbols[] =
    { PROFILE_SYMBOL::A, PROFILE_SYMBOL::C, PROFILE_SYMBOL::G, PROFILE_SYMBOL::T };

    bool isSeparateQualities(false);
    for (const PROFILE_SYMBOL::index_t symbol : primarySymbols)
    {
        if (symbolPosCount[symbol] > 0) isSeparateQualities = true;
    }

    if (! isSeparateQualities) return;

    for (const PROFILE_SYMBOL::index_t symbol : primarySymbols)
    {
        if (symbolPosCount[symbol] == mateCdfs.size()) continue;

        using namespace readsim::common;
        std::ostringstream oss;
        oss << "Invalid " << READ_MATE::label(mate) << " mate quality profile '" << sourceLabel
            << "': not all symbols represented over full range, base symbol index " << static_cast<int>(symbol)
            << " covers " << symbolPosCount[symbol] << " of " << mateCdfs.size() << " positions";
        BOOST_THROW_EXCEPTION(ProfileFormatException(oss.str()));
    }
}



void
QualityProfile::
verifyLength(
    const unsigned readLength,
    const READ_MATE::index_t mate) const
{
    if (readLength <= maxLength(mate)) return;

    using namespace readsim::common;
    std::ostringstream oss;
    oss << "Requested read length " << readLength << " exceeds the " << maxLength(mate)
        << " positions supported by the " << READ_MATE::label(mate) << " mate quality profile";
    BOOST_THROW_EXCEPTION(ReadLengthException(oss.str()));
}
