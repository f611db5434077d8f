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

#include "readsim/IndelGenerator.hh"

#include "blt_util/RandomSource.hh"
#include "blt_util/seq_util.hh"
#include "common/Exceptions.hh"


/// check the internal consistency of an indel plan for a read of length \p readLength
static
void
checkIndelPlan(
    const IndelPlan& plan,
    const unsigned readLength)
{
    unsigned insertionCount(0);
    unsigned deletionCount(0);
    for (const IndelMap::value_type& indel : plan.indels)
    {
        BOOST_REQUIRE(indel.first < readLength);
        if (indel.second == INDEL_DELETION_MARKER)
        {
            BOOST_REQUIRE(indel.first > 0);
            deletionCount++;
        }
        else
        {
            BOOST_REQUIRE(is_primary_base(indel.second));
            insertionCount++;
        }
    }

    // positions are map keys, so distinct positions means no event was lost:
    BOOST_REQUIRE_EQUAL(plan.indels.size(), plan.insertionCount + plan.deletionCount);
    BOOST_REQUIRE_EQUAL(insertionCount, plan.insertionCount);
    BOOST_REQUIRE_EQUAL(deletionCount, plan.deletionCount);
    BOOST_REQUIRE_EQUAL(plan.netDelta(), static_cast<int>(insertionCount) - static_cast<int>(deletionCount));
}



BOOST_AUTO_TEST_SUITE( test_IndelGenerator )


BOOST_AUTO_TEST_CASE( test_RateCurve )
{
    const IndelRateCurve curve(100, 0.01, 2);
    BOOST_REQUIRE_EQUAL(curve.size(), 2u);
    BOOST_REQUIRE_CLOSE(curve.rate(0), 0.2642380210770444, 1e-6);
    BOOST_REQUIRE_CLOSE(curve.rate(1), 0.07937320225218117, 1e-6);

    const IndelRateCurve zeroCurve(100, 0., 3);
    BOOST_REQUIRE_EQUAL(zeroCurve.size(), 3u);
    for (unsigned eventIndex(0); eventIndex<zeroCurve.size(); ++eventIndex)
    {
        BOOST_REQUIRE_EQUAL(zeroCurve.rate(eventIndex), 0.);
    }
}


BOOST_AUTO_TEST_CASE( test_RateCurveMonotonic )
{
    const IndelRateCurve curve(150, 0.02, 10);
    BOOST_REQUIRE_EQUAL(curve.size(), 10u);
    for (unsigned eventIndex(1); eventIndex<curve.size(); ++eventIndex)
    {
        BOOST_REQUIRE(curve.rate(eventIndex) <= curve.rate(eventIndex-1));
    }
}


BOOST_AUTO_TEST_CASE( test_RateCurveClamp )
{
    const IndelRateCurve curve(3, 0.5, 10);
    BOOST_REQUIRE_EQUAL(curve.size(), 3u);

    const IndelRateCurve emptyCurve(0, 0.5, 2);
    BOOST_REQUIRE_EQUAL(emptyCurve.size(), 0u);
}


BOOST_AUTO_TEST_CASE( test_RateCurveInvalidProb )
{
    using namespace readsim::common;
    BOOST_REQUIRE_THROW(IndelRateCurve(100, -0.1, 2), InvalidParameterException);
    BOOST_REQUIRE_THROW(IndelRateCurve(100, 1.5, 2), InvalidParameterException);
}


BOOST_AUTO_TEST_CASE( test_NoIndels )
{
    static const unsigned readLength(100);
    const IndelRateCurve zeroCurve(readLength, 0., 2);
    const IndelGenerator generator(zeroCurve, zeroCurve);
    RandomSource rng(42);

    IndelPlan plan;
    for (unsigned trialIndex(0); trialIndex<100; ++trialIndex)
    {
        generator.sampleIndels(readLength, rng, plan);
        BOOST_REQUIRE(plan.indels.empty());
        BOOST_REQUIRE_EQUAL(plan.netDelta(), 0);

        generator.sampleNonShrinkingIndels(readLength, rng, plan);
        BOOST_REQUIRE(plan.indels.empty());
    }
}


BOOST_AUTO_TEST_CASE( test_DistinctPositions )
{
    static const unsigned readLength(50);
    const IndelRateCurve insertionCurve(readLength, 0.05, 5);
    const IndelRateCurve deletionCurve(readLength, 0.06, 5);
    const IndelGenerator generator(insertionCurve, deletionCurve);
    RandomSource rng(101);

    IndelPlan plan;
    bool isInsertionSeen(false);
    bool isDeletionSeen(false);
    for (unsigned trialIndex(0); trialIndex<500; ++trialIndex)
    {
        generator.sampleIndels(readLength, rng, plan);
        checkIndelPlan(plan, readLength);
        BOOST_REQUIRE(plan.insertionCount + plan.deletionCount <= readLength);
        if (plan.insertionCount > 0) isInsertionSeen = true;
        if (plan.deletionCount > 0) isDeletionSeen = true;
    }
    BOOST_REQUIRE(isInsertionSeen);
    BOOST_REQUIRE(isDeletionSeen);
}


BOOST_AUTO_TEST_CASE( test_NonShrinking )
{
    static const unsigned readLength(50);
    const IndelRateCurve insertionCurve(readLength, 0.05, 5);
    const IndelRateCurve deletionCurve(readLength, 0.2, 5);
    const IndelGenerator generator(insertionCurve, deletionCurve);
    RandomSource rng(202);

    IndelPlan plan;
    bool isDeletionSeen(false);
    for (unsigned trialIndex(0); trialIndex<500; ++trialIndex)
    {
        generator.sampleNonShrinkingIndels(readLength, rng, plan);
        checkIndelPlan(plan, readLength);
        BOOST_REQUIRE(plan.insertionCount >= plan.deletionCount);
        BOOST_REQUIRE(plan.netDelta() >= 0);
        if (plan.deletionCount > 0) isDeletionSeen = true;
    }
    BOOST_REQUIRE(isDeletionSeen);
}


BOOST_AUTO_TEST_CASE( test_ShortReadIndels )
{
    // rates are computed for long reads but applied to very short ones:
    const IndelRateCurve insertionCurve(100, 0.02, 2);
    const IndelRateCurve deletionCurve(100, 0.02, 2);
    const IndelGenerator generator(insertionCurve, deletionCurve);
    RandomSource rng(303);

    IndelPlan plan;
    for (unsigned readLength(3); readLength<10; ++readLength)
    {
        for (unsigned trialIndex(0); trialIndex<200; ++trialIndex)
        {
            generator.sampleIndels(readLength, rng, plan);
            checkIndelPlan(plan, readLength);
            BOOST_REQUIRE(plan.insertionCount + plan.deletionCount <= readLength);
        }
    }
}


BOOST_AUTO_TEST_CASE( test_SamplingBudget )
{
    using namespace readsim::common;

    // every read is certain to have more than two events:
    const IndelRateCurve certainCurve(100, 1., 2);
    BOOST_REQUIRE_EQUAL(certainCurve.rate(1), 1.);

    const IndelRateCurve zeroCurve(100, 0., 2);
    RandomSource rng(404);
    IndelPlan plan;

    // two deletions can't be placed in a read with a single eligible position:
    const IndelGenerator deletionGenerator(zeroCurve, certainCurve);
    BOOST_REQUIRE_THROW(deletionGenerator.sampleIndels(2, rng, plan), IndelSamplingException);
    BOOST_REQUIRE_THROW(deletionGenerator.sampleIndels(1, rng, plan), IndelSamplingException);

    // two insertions can't be placed in a single base read:
    const IndelGenerator insertionGenerator(certainCurve, zeroCurve);
    BOOST_REQUIRE_THROW(insertionGenerator.sampleNonShrinkingIndels(1, rng, plan), IndelSamplingException);

    BOOST_REQUIRE_NO_THROW(insertionGenerator.sampleNonShrinkingIndels(2, rng, plan));
    BOOST_REQUIRE_EQUAL(plan.insertionCount, 2u);
    BOOST_REQUIRE_EQUAL(plan.deletionCount, 0u);
}


BOOST_AUTO_TEST_SUITE_END()
