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

#include "ReadSimOptions.hh"

class RandomSource;


/// number of read pairs to simulate from a reference sequence of length \p refLength
unsigned
getReadPairCount(
    const ReadSimOptions& opt,
    const unsigned refLength);

/// draw fragment lengths from the configured normal distribution until one exceeds the minimum
unsigned
drawInsertLength(
    const ReadSimOptions& opt,
    RandomSource& rng);

/// simulate read pairs for every sequence of the reference fasta
void
runReadSim(const ReadSimOptions& opt);
