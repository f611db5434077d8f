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

#include "blt_util/seq_util.hh"

#include <algorithm>


char
comp_base(const char a)
{
    switch (a)
    {
    case 'A':
    case 'a':
        return 'T';
    case 'C':
    case 'c':
        return 'G';
    case 'G':
    case 'g':
        return 'C';
    case 'T':
    case 't':
    case 'U':
    case 'u':
        return 'A';
    default:
        return 'N';
    }
}



static
char
norm_base(const char a)
{
    switch (a)
    {
    case 'A':
    case 'a':
        return 'A';
    case 'C':
    case 'c':
        return 'C';
    case 'G':
    case 'g':
        return 'G';
    case 'T':
    case 't':
    case 'U':
    case 'u':
        return 'T';
    default:
        return 'N';
    }
}



void
normalizeBaseStr(std::string& seq)
{
    std::transform(seq.begin(),seq.end(),seq.begin(),norm_base);
}



std::string
reverseCompCopyStr(const std::string& seq)
{
    std::string rev(seq.size(),'N');
    std::transform(seq.rbegin(),seq.rend(),rev.begin(),comp_base);
    return rev;
}
