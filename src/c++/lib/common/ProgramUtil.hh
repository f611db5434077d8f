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
/// \brief command-line handling shared by all programs
///

#pragma once

#include "common/Program.hh"

#include "blt_util/thirdparty_push.h"

#include "boost/program_options.hpp"

#include "blt_util/thirdparty_pop.h"

#include <iosfwd>
#include <string>


/// \brief Write the program usage to \p os and exit
///
/// Exits with EXIT_FAILURE when an error message \p msg is provided, EXIT_SUCCESS otherwise.
void
usage(
    std::ostream& os,
    const readsim::Program& prog,
    const boost::program_options::options_description& visible,
    const char* friendlyName,
    const char* extendedUsage,
    const char* msg);


/// \brief Check that a required input path exists and convert it to an absolute path
///
/// \param[in,out] filePath the path to check
/// \param[in] fileLabel description of the file used in error messages
/// \param[out] errorMsg error description if the check fails
///
/// \return true if the check failed
bool
checkAndStandardizeRequiredInputFilePath(
    std::string& filePath,
    const char* fileLabel,
    std::string& errorMsg,
    const bool isDirectory = false);
