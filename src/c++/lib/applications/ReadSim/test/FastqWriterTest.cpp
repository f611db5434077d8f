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

#include "applications/ReadSim/FastqWriter.hh"

#include <sstream>


BOOST_AUTO_TEST_SUITE( test_FastqWriter )


BOOST_AUTO_TEST_CASE( test_WriteRecord )
{
    SimulatedRead read;
    read.sequence = "ACGTN";
    read.qualities = { 40, 30, 20, 2, 1 };

    std::ostringstream oss;
    FastqWriter writer(oss);
    writer.write(SimulatedRead::readId("chr1", 3), read);
    writer.write("chr1-4", read);

    BOOST_REQUIRE_EQUAL(oss.str(), "@chr1-3\nACGTN\n+\nI?5#\"\n@chr1-4\nACGTN\n+\nI?5#\"\n");
}


BOOST_AUTO_TEST_SUITE_END()
