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
/// \brief built-in Illumina empirical quality profile names
///

#pragma once

#include <iosfwd>
#include <string>


/// \brief Resolve the profile files of both mates for the built-in profile \p profileName
///
/// \param[in] profileDir directory holding the profile files
/// \param[out] firstMateFile profile file of the first mate
/// \param[out] secondMateFile profile file of the second mate
///
/// \throws InvalidParameterException if \p profileName is not a built-in profile
void
getProfileFiles(
    const std::string& profileDir,
    const std::string& profileName,
    std::string& firstMateFile,
    std::string& secondMateFile);

/// true if \p profileName is a built-in profile
bool
isKnownProfile(const std::string& profileName);

/// write all built-in profile names to \p os, one per line
void
listProfileNames(std::ostream& os);
