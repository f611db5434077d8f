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
/// \brief per-read insertion and deletion sampling
///

#pragma once

#include <map>
#include <vector>


class RandomSource;


/// read position to indel: '-' for a deleted reference base, otherwise the inserted base
typedef std::map<unsigned,char> IndelMap;

/// marks a deleted position in an IndelMap
static const char INDEL_DELETION_MARKER = '-';


/// \brief Probability of observing more than each event count in a read
///
/// rate(i) is the binomial survival probability 1 - BinomCDF(i+1; readLength, eventProb)
/// so the curve is non-increasing with i.
///
class IndelRateCurve
{
public:
    /// \param maxEventCount is clamped to \p readLength
    ///
    /// \throws InvalidParameterException if \p eventProb is not in [0,1]
    IndelRateCurve(
        const unsigned readLength,
        const double eventProb,
        const unsigned maxEventCount);

    /// number of event counts covered by the curve
    unsigned
    size() const
    {
        return _rates.size();
    }

    /// probability of more than \p eventIndex events
    double
    rate(const unsigned eventIndex) const
    {
        return _rates[eventIndex];
    }

private:
    std::vector<double> _rates;
};


/// result of indel sampling for a single read
struct IndelPlan
{
    void
    clear()
    {
        indels.clear();
        insertionCount = 0;
        deletionCount = 0;
    }

    /// net change in read length: insertionCount - deletionCount
    int
    netDelta() const
    {
        return static_cast<int>(insertionCount) - static_cast<int>(deletionCount);
    }

    IndelMap indels;
    unsigned insertionCount = 0;
    unsigned deletionCount = 0;
};


/// \brief Chooses the number and positions of indels for each read
///
/// Event counts are selected from the largest to the smallest candidate using
/// the insertion and deletion rate curves. Positions are then drawn by rejection
/// sampling, with the number of draws bounded in proportion to the read length.
///
class IndelGenerator
{
public:
    IndelGenerator(
        const IndelRateCurve& insertionCurve,
        const IndelRateCurve& deletionCurve)
        : _insertionCurve(insertionCurve),
          _deletionCurve(deletionCurve)
    {}

    /// \brief Deletions are sampled first, then insertions limited to the
    /// positions left untouched by the deletions
    ///
    /// Deletions are never placed at position 0.
    ///
    /// \throws IndelSamplingException if positions can't be found within the draw budget
    void
    sampleIndels(
        const unsigned readLength,
        RandomSource& rng,
        IndelPlan& plan) const;

    /// \brief Insertions are sampled first, then at most as many deletions,
    /// so that the read never consumes more reference than \p readLength
    ///
    /// \throws IndelSamplingException if positions can't be found within the draw budget
    void
    sampleNonShrinkingIndels(
        const unsigned readLength,
        RandomSource& rng,
        IndelPlan& plan) const;

private:
    IndelRateCurve _insertionCurve;
    IndelRateCurve _deletionCurve;
};
