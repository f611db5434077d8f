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
/// \brief generates reads with empirical qualities, substitution errors and indels
///

#pragma once

#include "readsim/IndelGenerator.hh"
#include "readsim/QualitySampler.hh"
#include "readsim/ReadSimulationOptions.hh"
#include "readsim/SimulatedRead.hh"

#include <string>


class RandomSource;


/// \brief Simulates reads from a reference sequence or from excised fragments
///
/// Each read is produced by selecting indels, slicing the reference bases
/// the read consumes, reconstructing the read sequence, sampling basecall
/// qualities and finally injecting substitution errors. All random values are
/// drawn from the RandomSource supplied at construction, in that order.
///
/// Reads from the minus strand are sliced from the start of the reverse
/// complement of the source sequence, exactly as plus strand reads are sliced
/// from the source sequence itself.
///
class ReadSynthesizer
{
public:
    /// synthesizer supporting the fragment and error-free modes only
    ///
    /// \throws ReadLengthException if the read length exceeds either mate of \p profile
    /// \throws InvalidParameterException for a zero read length or invalid indel rates
    ReadSynthesizer(
        const QualityProfile& profile,
        const ReadSimulationOptions& opt,
        RandomSource& rng);

    /// synthesizer additionally supporting positional reads from \p reference
    ReadSynthesizer(
        const QualityProfile& profile,
        const ReadSimulationOptions& opt,
        RandomSource& rng,
        const std::string& reference);

    const ReadSimulationOptions&
    options() const
    {
        return _opt;
    }

    bool
    hasReference() const
    {
        return (! _reference.empty());
    }

    unsigned
    referenceLength() const
    {
        return _reference.size();
    }

    /// \brief Simulate a read starting at \p pos of the reference strand selected by \p isPlusStrand
    ///
    /// Qualities are sampled from the first mate profile. The read is truncated
    /// when fewer than readLength reference bases remain after \p pos.
    ///
    /// \throws InvalidParameterException if there is no reference or \p pos is outside of it
    void
    nextReadAt(
        const unsigned pos,
        const bool isPlusStrand,
        SimulatedRead& read);

    /// \brief Simulate a read at a uniformly drawn reference position and strand
    ///
    /// \throws InvalidParameterException if there is no reference or it isn't longer than the read length
    void
    nextRead(SimulatedRead& read);

    /// \brief Simulate one read from the start of \p fragment or of its reverse complement
    ///
    /// Plus strand reads use first mate qualities and minus strand reads use second
    /// mate qualities. The read length is reduced to the fragment length for short fragments.
    void
    nextFragmentRead(
        const std::string& fragment,
        const bool isPlusStrand,
        SimulatedRead& read);

    /// simulate the reads from both ends of \p fragment
    void
    nextFragmentPair(
        const std::string& fragment,
        SimulatedReadPair& readPair);

    /// \brief Error-free read: a direct prefix of \p fragment (or of its reverse complement)
    /// with constant quality \p qscore, no indels and no random draws
    void
    nextSimpleRead(
        const std::string& fragment,
        const bool isPlusStrand,
        SimulatedRead& read,
        const uint8_t qscore = 40) const;

    void
    nextSimplePair(
        const std::string& fragment,
        SimulatedReadPair& readPair,
        const uint8_t qscore = 40) const;

private:
    void
    validateOptions() const;

    /// sample an indel plan for \p readLength which consumes at most \p availableLength source bases
    void
    selectIndels(
        const unsigned readLength,
        const unsigned availableLength,
        IndelPlan& plan);

    /// simulate a read of at most the configured read length from \p strandSeq starting at \p startPos
    void
    synthesizeRead(
        const std::string& strandSeq,
        const unsigned startPos,
        const bool isPlusStrand,
        const READ_MATE::index_t mate,
        SimulatedRead& read);

    void
    makeSimpleRead(
        const std::string& strandSeq,
        const bool isPlusStrand,
        const uint8_t qscore,
        SimulatedRead& read) const;

    const ReadSimulationOptions _opt;
    RandomSource& _rng;
    QualitySampler _qualitySampler;
    IndelGenerator _indelGenerator;
    IndelPlan _indelPlan;

    std::string _reference;
    std::string _referenceRevComp;
};


/// \brief Apply \p indels to \p reference to produce the simulated read sequence
///
/// \p reference and the indel read positions are walked together: positions without
/// an indel copy the next reference base, deletions skip the next reference base and
/// insertions emit the inserted base without consuming reference. Insertions
/// at consecutive positions after the reference is exhausted are appended.
void
reconstructReadSequence(
    const std::string& reference,
    const IndelMap& indels,
    std::string& sequence);
