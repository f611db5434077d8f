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

#include "common/Program.hh"
#include "readsim/ReadSimulationOptions.hh"

#include <cstdint>

#include <string>


struct ReadSimOptions
{
    bool
    isSeed() const
    {
        return (seed >= 0);
    }

    bool
    isXfold() const
    {
        return (xfold > 0.);
    }

    ReadSimulationOptions readOpt;

    /// negative values indicate a nondeterministic seed
    int64_t seed = -1;

    std::string firstMateProfileFilename;
    std::string secondMateProfileFilename;
    std::string profileName;
    std::string profileDir;

    double xfold = 0.;
    unsigned readPairCount = 0;

    double insertMean = 500.;
    double insertSD = 50.;
    unsigned minInsertLength = 200;

    std::string referenceFilename;
    std::string outputPrefix;
};


void
parseReadSimOptions(
    const readsim::Program& prog,
    int argc,
    char** argv,
    ReadSimOptions& opt);
