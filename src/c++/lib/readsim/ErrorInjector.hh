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
/// \brief quality driven basecall substitution errors
///

#pragma once

#include <cstdint>

#include <string>
#include <vector>


class RandomSource;


/// \brief uniform draw of a primary base id other than \p baseId
///
uint8_t
getMutatedBaseId(
    RandomSource& rng,
    const uint8_t baseId);

/// \brief uniform draw of any primary base
///
char
getRandomBase(RandomSource& rng);

/// \brief Introduce substitution errors into \p sequence according to the error
/// probability implied by each basecall quality
///
/// Non-ACGT positions have their quality set to 1 and are never mutated. For all
/// other positions one uniform value is drawn, and the base is replaced with one
/// of the three other bases when the value falls below the phred error
/// probability of the position quality.
///
/// \return number of substituted bases
unsigned
injectSubstitutionErrors(
    RandomSource& rng,
    std::vector<uint8_t>& qualities,
    std::string& sequence);
