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

#include "applications/ReadSim/ReadSimRun.hh"

#include "blt_util/RandomSource.hh"


BOOST_AUTO_TEST_SUITE( test_ReadSimRun )


BOOST_AUTO_TEST_CASE( test_ReadPairCount )
{
    ReadSimOptions opt;
    opt.readOpt.readLength = 100;
    opt.xfold = 2.5;
    BOOST_REQUIRE_EQUAL(getReadPairCount(opt, 1050), 25u);
    BOOST_REQUIRE_EQUAL(getReadPairCount(opt, 99), 0u);

    opt.xfold = 0.15;
    BOOST_REQUIRE_EQUAL(getReadPairCount(opt, 1000), 2u);

    opt.xfold = 0.;
    opt.readPairCount = 17;
    BOOST_REQUIRE_EQUAL(getReadPairCount(opt, 1050), 17u);
}


BOOST_AUTO_TEST_CASE( test_InsertLength )
{
    ReadSimOptions opt;
    opt.insertMean = 210.;
    opt.insertSD = 50.;
    opt.minInsertLength = 200;

    RandomSource rng(42);
    for (unsigned drawIndex(0); drawIndex<1000; ++drawIndex)
    {
        BOOST_REQUIRE(drawInsertLength(opt, rng) > 200u);
    }

    opt.insertSD = 0.;
    BOOST_REQUIRE_EQUAL(drawInsertLength(opt, rng), 210u);
}


BOOST_AUTO_TEST_SUITE_END()
