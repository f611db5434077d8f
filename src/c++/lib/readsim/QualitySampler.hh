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

#pragma once

#include "readsim/QualityProfile.hh"

#include <cstdint>

#include <vector>


class RandomSource;


/// \brief Draws basecall qualities from the positional distributions of a QualityProfile
///
struct QualitySampler
{
    explicit
    QualitySampler(const QualityProfile& profile)
        : _profile(profile)
    {}

    /// \brief Draw one quality for each position of a read of length \p readLength
    ///
    /// One uniform integer in [1,QualityProfile::maxDistNumber] is drawn per
    /// position, in position order, and mapped through the position's CDF.
    ///
    /// \throws ReadLengthException if \p readLength exceeds the profile length for \p mate
    void
    sample(
        const unsigned readLength,
        const READ_MATE::index_t mate,
        RandomSource& rng,
        std::vector<uint8_t>& qualities) const;

    const QualityProfile&
    profile() const
    {
        return _profile;
    }

private:
    const QualityProfile& _profile;
};
