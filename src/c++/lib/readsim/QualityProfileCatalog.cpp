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

#include "readsim/QualityProfileCatalog.hh"

#include "common/Exceptions.hh"

#include "blt_util/thirdparty_push.h"

#include "boost/filesystem.hpp"

#include "blt_util/thirdparty_pop.h"

#include <iostream>
#include <sstream>



namespace
{

struct ProfileFilePair
{
    const char* name;
    const char* firstMate;
    const char* secondMate;
};

const ProfileFilePair profileFiles[] =
{
    { "Emp100", "Emp100R1.txt", "Emp100R2.txt" },
    { "Emp36", "Emp36R1.txt", "Emp36R2.txt" },
    { "Emp44", "Emp44R1.txt", "Emp44R2.txt" },
    { "Emp50", "Emp50R1.txt", "Emp50R2.txt" },
    { "Emp75", "Emp75R1.txt", "Emp75R2.txt" },
    { "EmpMiSeq250", "EmpMiSeq250R1.txt", "EmpMiSeq250R2.txt" },
    { "EmpR36", "EmpR36R1.txt", "EmpR36R2.txt" },
    { "EmpR44", "EmpR44R1.txt", "EmpR44R2.txt" },
    { "EmpR50", "EmpR50R1.txt", "EmpR50R2.txt" },
    { "EmpR75", "EmpR75R1.txt", "EmpR75R2.txt" },
    { "HiSeq2500L125", "HiSeq2500L125R1.txt", "HiSeq2500L125R2.txt" },
    { "HiSeq2500L150", "HiSeq2500L150R1.txt", "HiSeq2500L150R2.txt" },
    { "HiSeq2500L150filt", "HiSeq2500L150R1filter.txt", "HiSeq2500L150R2filter.txt" },
    { "HiSeq2kL100", "HiSeq2kL100R1.txt", "HiSeq2kL100R2.txt" },
    { "HiSeqXPCRfreeL150", "HiSeqXPCRfreeL150R1.txt", "HiSeqXPCRfreeL150R2.txt" },
    { "HiSeqXtruSeqL150", "HiSeqXtruSeqL150R1.txt", "HiSeqXtruSeqL150R2.txt" },
    { "MiSeqv3L250", "MiSeqv3L250R1.txt", "MiSeqv3L250R2.txt" },
    { "NextSeq500v2L75", "NextSeq500v2L75R1.txt", "NextSeq500v2L75R2.txt" }
};

const unsigned profileCount(sizeof(profileFiles)/sizeof(profileFiles[0]));



const ProfileFilePair*
findProfile(const std::string& profileName)
{
    for (unsigned profileIndex(0); profileIndex<profileCount; ++profileIndex)
    {
        if (profileName == profileFiles[profileIndex].name) return (profileFiles+profileIndex);
    }
    return nullptr;
}

}



bool
isKnownProfile(const std::string& profileName)
{
    return (findProfile(profileName) != nullptr);
}



void
listProfileNames(std::ostream& os)
{
    for (unsigned profileIndex(0); profileIndex<profileCount; ++profileIndex)
    {
        os << profileFiles[profileIndex].name << "\n";
    }
}



void
getProfileFiles(
    const std::string& profileDir,
    const std::string& profileName,
    std::string& firstMateFile,
    std::string& secondMateFile)
{
    const ProfileFilePair* profile(findProfile(profileName));
    if (profile == nullptr)
    {
        using namespace readsim::common;
        std::ostringstream oss;
        oss << "Unknown quality profile name: '" << profileName << "'. Valid profile names are:\n";
        listProfileNames(oss);
        BOOST_THROW_EXCEPTION(InvalidParameterException(oss.str()));
    }

    const boost::filesystem::path dirPath(profileDir);
    firstMateFile = (dirPath / profile->firstMate).string();
    secondMateFile = (dirPath / profile->secondMate).string();
}
