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

#include "blt_util/parse_util.hh"

#include "common/Exceptions.hh"

#include <cerrno>
#include <climits>
#include <cstdlib>

#include <limits>
#include <sstream>



static
void
parse_exception(
    const char* type_label,
    const char* parse_str)
{
    using namespace readsim::common;
    std::ostringstream oss;
    oss << "Can't parse " << type_label << " from string: '" << parse_str << "'";
    BOOST_THROW_EXCEPTION(GeneralException(oss.str()));
}



namespace readsim
{
namespace blt_util
{

unsigned
parse_unsigned(const char*& s)
{
    static const int base(10);

    // strtoul silently wraps negative input:
    const char* p(s);
    while ((*p == ' ') || (*p == '\t')) ++p;
    if (*p == '-')
    {
        parse_exception("unsigned",s);
    }

    errno = 0;

    char* endptr;
    const unsigned long val(strtoul(s, &endptr, base));
    if ((errno == ERANGE && (val == ULONG_MAX || val == 0))
        || (errno != 0 && val == 0) || (endptr == s))
    {
        parse_exception("unsigned long",s);
    }

    if (val > std::numeric_limits<unsigned>::max())
    {
        parse_exception("unsigned",s);
    }

    s = endptr;

    return static_cast<unsigned>(val);
}



unsigned
parse_unsigned_str(const std::string& s)
{
    const char* s2(s.c_str());
    const unsigned val(parse_unsigned(s2));
    if ((s2-s.c_str())!=static_cast<int>(s.length()))
    {
        parse_exception("unsigned",s.c_str());
    }
    return val;
}

}
}
