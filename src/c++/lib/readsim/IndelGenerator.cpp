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

#include "readsim/IndelGenerator.hh"

#include "readsim/ErrorInjector.hh"

#include "blt_util/RandomSource.hh"
#include "common/Exceptions.hh"

#include "blt_util/thirdparty_push.h"

#include "boost/math/distributions/binomial.hpp"

#include "blt_util/thirdparty_pop.h"

#include <algorithm>
#include <sstream>



IndelRateCurve::
IndelRateCurve(
    const unsigned readLength,
    const double eventProb,
    const unsigned maxEventCount)
{
    if ((eventProb < 0.) || (eventProb > 1.))
    {
        using namespace readsim::common;
        std::ostringstream oss;
        oss << "Indel event probability must be in [0,1], found: " << eventProb;
        BOOST_THROW_EXCEPTION(InvalidParameterException(oss.str()));
    }

    const unsigned curveSize(std::min(maxEventCount, readLength));
    if (curveSize == 0) return;

    const boost::math::binomial_distribution<double> dist(readLength, eventProb);
    for (unsigned eventIndex(0); eventIndex<curveSize; ++eventIndex)
    {
        const double eventCount(eventIndex+1);
        _rates.push_back(boost::math::cdf(boost::math::complement(dist, eventCount)));
    }
}



/// maximum number of position draws allowed to place the events of one indel type
static
unsigned
getPositionDrawBudget(const unsigned readLength)
{
    static const unsigned drawsPerBase(10);
    static const unsigned minDraws(100);
    return std::max(minDraws, drawsPerBase*readLength);
}



static
void
throwSamplingError(
    const char* indelLabel,
    const unsigned eventCount,
    const unsigned readLength)
{
    using namespace readsim::common;
    std::ostringstream oss;
    oss << "Failed to place " << eventCount << " " << indelLabel << "(s) in a read of length " << readLength
        << " within " << getPositionDrawBudget(readLength) << " position draws";
    BOOST_THROW_EXCEPTION(IndelSamplingException(oss.str()));
}



/// deletions are placed at distinct unused positions in [1,readLength)
static
void
placeDeletions(
    const unsigned eventCount,
    const unsigned readLength,
    RandomSource& rng,
    IndelMap& indels)
{
    if (readLength < 2) throwSamplingError("deletion", eventCount, readLength);

    const unsigned drawBudget(getPositionDrawBudget(readLength));
    unsigned drawCount(0);
    unsigned placedCount(0);
    while (placedCount < eventCount)
    {
        if (drawCount >= drawBudget) throwSamplingError("deletion", eventCount, readLength);
        drawCount++;

        const unsigned readPos(rng.uniformInt(1, readLength));
        if (indels.count(readPos)) continue;
        indels[readPos] = INDEL_DELETION_MARKER;
        placedCount++;
    }
}



/// insertions are placed at distinct unused positions in [0,readLength)
static
void
placeInsertions(
    const unsigned eventCount,
    const unsigned readLength,
    RandomSource& rng,
    IndelMap& indels)
{
    if (readLength < 1) throwSamplingError("insertion", eventCount, readLength);

    const unsigned drawBudget(getPositionDrawBudget(readLength));
    unsigned drawCount(0);
    unsigned placedCount(0);
    while (placedCount < eventCount)
    {
        if (drawCount >= drawBudget) throwSamplingError("insertion", eventCount, readLength);
        drawCount++;

        const unsigned readPos(rng.uniformInt(0, readLength));
        if (indels.count(readPos)) continue;
        indels[readPos] = getRandomBase(rng);
        placedCount++;
    }
}



/// true if \p eventCount more events still leave enough unchanged positions in the read
static
bool
isEnoughUnchangedPositions(
    const unsigned readLength,
    const IndelPlan& plan,
    const unsigned eventCount)
{
    return (readLength >= (plan.deletionCount + plan.insertionCount + eventCount));
}



void
IndelGenerator::
sampleIndels(
    const unsigned readLength,
    RandomSource& rng,
    IndelPlan& plan) const
{
    plan.clear();

    for (unsigned eventIndex(_deletionCurve.size()); eventIndex-- > 0;)
    {
        if (rng.uniform() <= _deletionCurve.rate(eventIndex))
        {
            plan.deletionCount = eventIndex+1;
            placeDeletions(plan.deletionCount, readLength, rng, plan.indels);
            break;
        }
    }

    for (unsigned eventIndex(_insertionCurve.size()); eventIndex-- > 0;)
    {
        if (! isEnoughUnchangedPositions(readLength, plan, eventIndex+1)) continue;

        if (rng.uniform() <= _insertionCurve.rate(eventIndex))
        {
            plan.insertionCount = eventIndex+1;
            placeInsertions(plan.insertionCount, readLength, rng, plan.indels);
            break;
        }
    }
}



void
IndelGenerator::
sampleNonShrinkingIndels(
    const unsigned readLength,
    RandomSource& rng,
    IndelPlan& plan) const
{
    plan.clear();

    for (unsigned eventIndex(_insertionCurve.size()); eventIndex-- > 0;)
    {
        if (rng.uniform() <= _insertionCurve.rate(eventIndex))
        {
            plan.insertionCount = eventIndex+1;
            placeInsertions(plan.insertionCount, readLength, rng, plan.indels);
            break;
        }
    }

    for (unsigned eventIndex(_deletionCurve.size()); eventIndex-- > 0;)
    {
        if (plan.deletionCount == plan.insertionCount) break;

        // deletions may not outnumber insertions:
        if ((eventIndex+1) > plan.insertionCount) continue;
        if (! isEnoughUnchangedPositions(readLength, plan, eventIndex+1)) continue;

        if (rng.uniform() <= _deletionCurve.rate(eventIndex))
        {
            plan.deletionCount = eventIndex+1;
            placeDeletions(plan.deletionCount, readLength, rng, plan.indels);
            break;
        }
    }
}
