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

#include "blt_util/seq_util.hh"

#include <string>


BOOST_AUTO_TEST_SUITE( test_seq_util )


BOOST_AUTO_TEST_CASE( test_base_id )
{
    BOOST_REQUIRE_EQUAL(static_cast<int>(base_to_id('G')),static_cast<int>(BASE_ID::G));
    BOOST_REQUIRE_EQUAL(static_cast<int>(base_to_id('N')),static_cast<int>(BASE_ID::ANY));
    BOOST_REQUIRE_EQUAL(static_cast<int>(base_to_id('g')),static_cast<int>(BASE_ID::ANY));
    BOOST_REQUIRE_EQUAL(id_to_base(BASE_ID::T),'T');
    BOOST_REQUIRE_EQUAL(id_to_base(BASE_ID::ANY),'N');
}


BOOST_AUTO_TEST_CASE( test_comp_base )
{
    BOOST_REQUIRE_EQUAL(comp_base('A'),'T');
    BOOST_REQUIRE_EQUAL(comp_base('c'),'G');
    BOOST_REQUIRE_EQUAL(comp_base('G'),'C');
    BOOST_REQUIRE_EQUAL(comp_base('t'),'A');
    BOOST_REQUIRE_EQUAL(comp_base('U'),'A');
    BOOST_REQUIRE_EQUAL(comp_base('u'),'A');
    BOOST_REQUIRE_EQUAL(comp_base('N'),'N');
    BOOST_REQUIRE_EQUAL(comp_base('R'),'N');
    BOOST_REQUIRE_EQUAL(comp_base('-'),'N');
}


BOOST_AUTO_TEST_CASE( test_normalize )
{
    std::string seq("acgtUuNnRYkm");
    normalizeBaseStr(seq);
    BOOST_REQUIRE_EQUAL(seq,"ACGTTTNNNNNN");
}


BOOST_AUTO_TEST_CASE( test_revcomp )
{
    BOOST_REQUIRE_EQUAL(reverseCompCopyStr("AACGTN"),"NACGTT");
    BOOST_REQUIRE_EQUAL(reverseCompCopyStr("acgu"),"ACGT");
    BOOST_REQUIRE_EQUAL(reverseCompCopyStr(""),"");
}


BOOST_AUTO_TEST_CASE( test_revcomp_twice )
{
    const std::string primary("ACGTNNACGTTTGCA");
    BOOST_REQUIRE_EQUAL(reverseCompCopyStr(reverseCompCopyStr(primary)),primary);

    const std::string mixed("acGTuURYswKMbdhvN");
    std::string normalized(mixed);
    normalizeBaseStr(normalized);
    BOOST_REQUIRE_EQUAL(reverseCompCopyStr(reverseCompCopyStr(mixed)),normalized);
}


BOOST_AUTO_TEST_SUITE_END()
