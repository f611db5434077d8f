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


/// read model parameters shared by every read generated by a ReadSynthesizer
///
struct ReadSimulationOptions
{
    unsigned readLength = 100;

    /// per-base insertion probability
    double insertionRate = 0.00009;

    /// per-base deletion probability
    double deletionRate = 0.00011;

    /// maximum number of insertion (and separately deletion) events per read
    unsigned maxIndelCount = 2;
};
