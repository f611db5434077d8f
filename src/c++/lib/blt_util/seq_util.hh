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

#include <cstdint>

#include <string>


namespace BASE_ID
{
enum index_t
{
    A,
    C,
    G,
    T,
    ANY,
    SIZE
};
}

enum { N_BASE=4 };


inline
uint8_t
base_to_id(const char a)
{
    switch (a)
    {
    case 'A':
        return BASE_ID::A;
    case 'C':
        return BASE_ID::C;
    case 'G':
        return BASE_ID::G;
    case 'T':
        return BASE_ID::T;
    default:
        return BASE_ID::ANY;
    }
}

inline
char
id_to_base(const uint8_t i)
{
    static const char base[] = "ACGTN";
    return base[(i<BASE_ID::ANY) ? i : BASE_ID::ANY];
}

/// true for the primary (unambiguous) upper-case bases ACGT
inline
bool
is_primary_base(const char a)
{
    return (base_to_id(a) != BASE_ID::ANY);
}


/// complement of a single base, case-insensitive
///
/// U complements to A, all other non-ACGT symbols map to N
///
char
comp_base(const char a);

/// upper-case the sequence in place, U becomes T and any other non-ACGT
/// symbol becomes N
void
normalizeBaseStr(std::string& seq);

/// reverse complement of \p seq, see comp_base() for symbol handling
std::string
reverseCompCopyStr(const std::string& seq);
