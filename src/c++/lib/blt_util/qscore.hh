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

#include <cmath>

#include <algorithm>


/// qscores are cached for all values below this bound:
enum { MAX_QSCORE = 80 };


/// precomputed phred error probabilities for qscores [0,MAX_QSCORE)
///
struct qphred_cache
{
    static
    double
    get_error_prob(const int qscore)
    {
        return get_cache()._error_prob[std::min(std::max(qscore,0),MAX_QSCORE-1)];
    }

private:
    qphred_cache()
    {
        for (int i(0); i<MAX_QSCORE; ++i)
        {
            _error_prob[i] = std::pow(10.,-static_cast<double>(i)/10.);
        }
    }

    static
    const qphred_cache&
    get_cache()
    {
        static const qphred_cache qc;
        return qc;
    }

    double _error_prob[MAX_QSCORE];
};



inline
bool
is_valid_qscore(const int qscore)
{
    return ((qscore >= 0) && (qscore < MAX_QSCORE));
}

/// qscores outside of [0,MAX_QSCORE) are clamped to the cached range
inline
double
qphred_to_error_prob(const int qscore)
{
    return qphred_cache::get_error_prob(qscore);
}

/// sanger/phred+33 fastq encoding of a qscore
inline
char
qphred_to_fastq_char(const int qscore)
{
    return static_cast<char>(qscore+33);
}
