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

#include "common/ProgramUtil.hh"

#include "blt_util/thirdparty_push.h"

#include "boost/filesystem.hpp"

#include "blt_util/thirdparty_pop.h"

#include <cstdlib>

#include <iostream>
#include <sstream>



void
usage(
    std::ostream& os,
    const readsim::Program& prog,
    const boost::program_options::options_description& visible,
    const char* friendlyName,
    const char* extendedUsage,
    const char* msg)
{
    os << "\n" << prog.name() << ": " << friendlyName << "\n\n";
    os << "version: " << prog.version() << "\n\n";
    os << "usage: " << prog.name() << " [options]" << extendedUsage << "\n\n";
    os << visible << "\n\n";

    if (nullptr != msg)
    {
        os << "\n" << msg << "\n\n";
        exit(EXIT_FAILURE);
    }
    exit(EXIT_SUCCESS);
}



bool
checkAndStandardizeRequiredInputFilePath(
    std::string& filePath,
    const char* fileLabel,
    std::string& errorMsg,
    const bool isDirectory)
{
    const char* pathLabel(isDirectory ? "directory" : "file");

    errorMsg.clear();
    if (filePath.empty())
    {
        std::ostringstream oss;
        oss << "Must specify " << fileLabel << " " << pathLabel;
        errorMsg = oss.str();
        return true;
    }

    if (! boost::filesystem::exists(filePath))
    {
        std::ostringstream oss;
        oss << "Can't find " << fileLabel << " " << pathLabel << ": '" << filePath << "'";
        errorMsg = oss.str();
        return true;
    }

    if (isDirectory != boost::filesystem::is_directory(filePath))
    {
        std::ostringstream oss;
        oss << "Expected " << fileLabel << " to be a " << pathLabel << ": '" << filePath << "'";
        errorMsg = oss.str();
        return true;
    }

    filePath = boost::filesystem::absolute(filePath).string();
    return false;
}
