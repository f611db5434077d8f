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

#include "boost/test/unit_test.hpp"

#include "readsim/QualityProfile.hh"
#include "readsim/test/testProfileUtil.hh"

#include "common/Exceptions.hh"
#include "test_config.h"

#include <sstream>
#include <string>


using namespace readsim::common;


static
void
loadProfileText(
    const std::string& firstMateText,
    const std::string& secondMateText)
{
    std::istringstream firstMateStream(firstMateText);
    std::istringstream secondMateStream(secondMateText);
    QualityProfile profile(firstMateStream, secondMateStream);
}



BOOST_AUTO_TEST_SUITE( test_QualityProfile )


BOOST_AUTO_TEST_CASE( test_ProfileFiles )
{
    const std::string dataPath(TEST_DATA_PATH);
    const QualityProfile profile(dataPath + "/testProfileR1.txt", dataPath + "/testProfileR2.txt");

    BOOST_REQUIRE_EQUAL(profile.maxLength(READ_MATE::FIRST), 3u);
    BOOST_REQUIRE_EQUAL(profile.maxLength(READ_MATE::SECOND), 2u);

    const QualityCdf& cdf(profile.getQualityCdf(READ_MATE::FIRST, 0));
    BOOST_REQUIRE_EQUAL(cdf.size(), 3u);
    BOOST_REQUIRE_EQUAL(cdf[0].threshold, 100000u);
    BOOST_REQUIRE_EQUAL(cdf[1].threshold, 500000u);
    BOOST_REQUIRE_EQUAL(cdf[2].threshold, QualityProfile::maxDistNumber);
    BOOST_REQUIRE_EQUAL(static_cast<int>(cdf[0].qscore), 20);
    BOOST_REQUIRE_EQUAL(static_cast<int>(cdf[2].qscore), 40);

    const QualityCdf& cdf2(profile.getQualityCdf(READ_MATE::FIRST, 2));
    BOOST_REQUIRE_EQUAL(cdf2.size(), 2u);
    BOOST_REQUIRE_EQUAL(cdf2[0].threshold, 50000u);
    BOOST_REQUIRE_EQUAL(static_cast<int>(cdf2[0].qscore), 10);
}


BOOST_AUTO_TEST_CASE( test_ThresholdRounding )
{
    const QualityProfile profile(TEST_DATA_PATH "/testProfileR1.txt", TEST_DATA_PATH "/testProfileR2.txt");

    // 3/7 of the total mass is rounded up:
    const QualityCdf& cdf(profile.getQualityCdf(READ_MATE::SECOND, 1));
    BOOST_REQUIRE_EQUAL(cdf.size(), 2u);
    BOOST_REQUIRE_EQUAL(cdf[0].threshold, 428572u);
    BOOST_REQUIRE_EQUAL(cdf[1].threshold, QualityProfile::maxDistNumber);
}


BOOST_AUTO_TEST_CASE( test_MissingFile )
{
    BOOST_REQUIRE_THROW(QualityProfile(TEST_DATA_PATH "/missingProfileR1.txt", TEST_DATA_PATH "/testProfileR2.txt"),
                        IoException);
}


BOOST_AUTO_TEST_CASE( test_VerifyLength )
{
    std::istringstream firstMateStream(getConstantProfileText(10, 30));
    std::istringstream secondMateStream(getConstantProfileText(8, 30));
    const QualityProfile profile(firstMateStream, secondMateStream);

    BOOST_REQUIRE_EQUAL(profile.maxLength(READ_MATE::FIRST), 10u);
    BOOST_REQUIRE_EQUAL(profile.maxLength(READ_MATE::SECOND), 8u);

    BOOST_REQUIRE_NO_THROW(profile.verifyLength(10, READ_MATE::FIRST));
    BOOST_REQUIRE_NO_THROW(profile.verifyLength(8, READ_MATE::SECOND));
    BOOST_REQUIRE_THROW(profile.verifyLength(11, READ_MATE::FIRST), ReadLengthException);
    BOOST_REQUIRE_THROW(profile.verifyLength(9, READ_MATE::SECOND), ReadLengthException);
}


BOOST_AUTO_TEST_CASE( test_NonSequentialPosition )
{
    const std::string text(".\t0\t30\n.\t0\t10\n.\t2\t30\n.\t2\t10\n");
    BOOST_REQUIRE_THROW(loadProfileText(text, text), ProfileFormatException);
}


BOOST_AUTO_TEST_CASE( test_PositionRestart )
{
    const std::string combined(getConstantProfileText(2, 30));

    // each symbol section starts over at position 0:
    const std::string withUnknown(combined + "N\t0\t2\nN\t0\t10\nN\t1\t2\nN\t1\t10\n");
    BOOST_REQUIRE_NO_THROW(loadProfileText(withUnknown, withUnknown));

    // a repeated section for the same symbol does not:
    BOOST_REQUIRE_THROW(loadProfileText(combined + ".\t0\t30\n.\t0\t10\n", combined), ProfileFormatException);
}


BOOST_AUTO_TEST_CASE( test_MismatchedLinePair )
{
    const std::string good(getConstantProfileText(2, 30));

    // count line length differs from the quality line:
    BOOST_REQUIRE_THROW(loadProfileText(".\t0\t30\t40\n.\t0\t10\n", good), ProfileFormatException);

    // count line position differs from the quality line:
    BOOST_REQUIRE_THROW(loadProfileText(".\t0\t30\n.\t1\t10\n", good), ProfileFormatException);

    // count line is missing:
    BOOST_REQUIRE_THROW(loadProfileText(good, ".\t0\t30\n"), ProfileFormatException);
}


BOOST_AUTO_TEST_CASE( test_UnknownSymbol )
{
    const std::string good(getConstantProfileText(2, 30));
    BOOST_REQUIRE_THROW(loadProfileText(good + "X\t0\t30\nX\t0\t10\n", good), ProfileFormatException);
}


BOOST_AUTO_TEST_CASE( test_InvalidValues )
{
    const std::string good(getConstantProfileText(2, 30));

    BOOST_REQUIRE_THROW(loadProfileText(".\t0\t80\n.\t0\t10\n", good), ProfileFormatException);
    BOOST_REQUIRE_THROW(loadProfileText(".\t0\t30\t40\n.\t0\t10\t5\n", good), ProfileFormatException);
    BOOST_REQUIRE_THROW(loadProfileText(".\t0\t30\n.\t0\t0\n", good), ProfileFormatException);
    BOOST_REQUIRE_THROW(loadProfileText(".\t0\tthirty\n.\t0\t10\n", good), ProfileFormatException);
    BOOST_REQUIRE_THROW(loadProfileText(".\tfirst\t30\n.\tfirst\t10\n", good), ProfileFormatException);
}


BOOST_AUTO_TEST_CASE( test_EmptyProfile )
{
    const std::string good(getConstantProfileText(2, 30));
    BOOST_REQUIRE_THROW(loadProfileText("# only comments\n", good), ProfileFormatException);
    BOOST_REQUIRE_THROW(loadProfileText(good, ""), ProfileFormatException);
}


BOOST_AUTO_TEST_CASE( test_IncompleteBaseCoverage )
{
    std::string text(getConstantProfileText(2, 30));
    const char bases[] = "ACG";
    for (unsigned baseIndex(0); baseIndex<3; ++baseIndex)
    {
        for (unsigned readPos(0); readPos<2; ++readPos)
        {
            std::ostringstream oss;
            oss << bases[baseIndex] << "\t" << readPos << "\t30\n"
                << bases[baseIndex] << "\t" << readPos << "\t10\n";
            text += oss.str();
        }
    }

    // T is covered for only one of the two positions:
    BOOST_REQUIRE_THROW(loadProfileText(text + "T\t0\t30\nT\t0\t10\n", text + "T\t0\t30\nT\t0\t10\nT\t1\t30\nT\t1\t10\n"),
                        ProfileFormatException);
    BOOST_REQUIRE_NO_THROW(loadProfileText(text + "T\t0\t30\nT\t0\t10\nT\t1\t30\nT\t1\t10\n", text + "T\t0\t30\nT\t0\t10\nT\t1\t30\nT\t1\t10\n"));
}


BOOST_AUTO_TEST_CASE( test_CommentsAndTermination )
{
    const std::string text("# header\n.\t0\t30\n.\t0\t10\n# between\n.\t1\t35\n.\t1\t10\n\n.\t5\tgarbage\n");
    std::istringstream firstMateStream(text);
    std::istringstream secondMateStream(text);
    const QualityProfile profile(firstMateStream, secondMateStream);

    BOOST_REQUIRE_EQUAL(profile.maxLength(READ_MATE::FIRST), 2u);
    BOOST_REQUIRE_EQUAL(static_cast<int>(profile.getQualityCdf(READ_MATE::SECOND, 1)[0].qscore), 35);
}


BOOST_AUTO_TEST_SUITE_END()
