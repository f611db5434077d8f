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
/// \brief output file or stdout stream
///

#pragma once

#include "blt_util/thirdparty_push.h"

#include "boost/utility.hpp"

#include "blt_util/thirdparty_pop.h"

#include <fstream>
#include <iosfwd>
#include <string>


/// \brief Output stream to a named file, or to stdout for the filename "-"
///
/// The file is opened on construction so that write permission problems
/// are reported before any work is done.
///
/// \throws IoException if the file can't be opened
struct OutStream : private boost::noncopyable
{
    explicit
    OutStream(const std::string& fileName);

    std::ostream&
    getStream()
    {
        return *_osPtr;
    }

    const std::string&
    fileName() const
    {
        return _fileName;
    }

private:
    std::string _fileName;
    std::ofstream _ofs;
    std::ostream* _osPtr;
};
