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

#include "readsim/ReadSynthesizer.hh"

#include "readsim/ErrorInjector.hh"

#include "blt_util/RandomSource.hh"
#include "blt_util/seq_util.hh"
#include "common/Exceptions.hh"

#include <algorithm>
#include <sstream>



void
reconstructReadSequence(
    const std::string& reference,
    const IndelMap& indels,
    std::string& sequence)
{
    sequence.clear();

    const unsigned refSize(reference.size());
    unsigned refPos(0);
    unsigned readPos(0);
    while (refPos < refSize)
    {
        const IndelMap::const_iterator iter(indels.find(readPos));
        if (iter == indels.end())
        {
            sequence.push_back(reference[refPos]);
            refPos++;
        }
        else if (iter->second == INDEL_DELETION_MARKER)
        {
            refPos++;
        }
        else
        {
            sequence.push_back(iter->second);
        }
        readPos++;
    }

    // trailing insertions:
    while (true)
    {
        const IndelMap::const_iterator iter(indels.find(readPos));
        if ((iter == indels.end()) || (iter->second == INDEL_DELETION_MARKER)) break;
        sequence.push_back(iter->second);
        readPos++;
    }
}



ReadSynthesizer::
ReadSynthesizer(
    const QualityProfile& profile,
    const ReadSimulationOptions& opt,
    RandomSource& rng)
    : _opt(opt),
      _rng(rng),
      _qualitySampler(profile),
      _indelGenerator(
          IndelRateCurve(opt.readLength, opt.insertionRate, opt.maxIndelCount),
          IndelRateCurve(opt.readLength, opt.deletionRate, opt.maxIndelCount))
{
    validateOptions();
}



ReadSynthesizer::
ReadSynthesizer(
    const QualityProfile& profile,
    const ReadSimulationOptions& opt,
    RandomSource& rng,
    const std::string& reference)
    : ReadSynthesizer(profile, opt, rng)
{
    _reference = reference;
    normalizeBaseStr(_reference);
    _referenceRevComp = reverseCompCopyStr(_reference);
}



void
ReadSynthesizer::
validateOptions() const
{
    if (_opt.readLength == 0)
    {
        using namespace readsim::common;
        BOOST_THROW_EXCEPTION(InvalidParameterException("Read length must be greater than zero"));
    }

    const QualityProfile& profile(_qualitySampler.profile());
    profile.verifyLength(_opt.readLength, READ_MATE::FIRST);
    profile.verifyLength(_opt.readLength, READ_MATE::SECOND);
}



void
ReadSynthesizer::
selectIndels(
    const unsigned readLength,
    const unsigned availableLength,
    IndelPlan& plan)
{
    bool isFit(false);
    try
    {
        _indelGenerator.sampleIndels(readLength, _rng, plan);
        const int consumedLength(static_cast<int>(readLength) - plan.netDelta());
        isFit = (consumedLength <= static_cast<int>(availableLength));
    }
    catch (const readsim::common::IndelSamplingException&)
    {
        // retried once below with the non-shrinking method
    }

    if (isFit) return;

    _indelGenerator.sampleNonShrinkingIndels(readLength, _rng, plan);
}



void
ReadSynthesizer::
synthesizeRead(
    const std::string& strandSeq,
    const unsigned startPos,
    const bool isPlusStrand,
    const READ_MATE::index_t mate,
    SimulatedRead& read)
{
    read.clear();
    read.isPlusStrand = isPlusStrand;
    read.startPos = startPos;
    read.requestedLength = _opt.readLength;

    const unsigned availableLength(strandSeq.size() - startPos);
    const unsigned readLength(std::min(_opt.readLength, availableLength));
    if (readLength == 0) return;

    selectIndels(readLength, availableLength, _indelPlan);

    const unsigned consumedLength(readLength - _indelPlan.netDelta());
    read.reference = strandSeq.substr(startPos, consumedLength);
    read.indels = _indelPlan.indels;
    reconstructReadSequence(read.reference, read.indels, read.sequence);

    _qualitySampler.sample(read.length(), mate, _rng, read.qualities);
    injectSubstitutionErrors(_rng, read.qualities, read.sequence);
}



void
ReadSynthesizer::
nextReadAt(
    const unsigned pos,
    const bool isPlusStrand,
    SimulatedRead& read)
{
    using namespace readsim::common;

    if (! hasReference())
    {
        BOOST_THROW_EXCEPTION(InvalidParameterException("Positional read simulation requires a reference sequence"));
    }

    if (pos >= referenceLength())
    {
        std::ostringstream oss;
        oss << "Read start position " << pos << " is outside of the reference sequence, length: " << referenceLength();
        BOOST_THROW_EXCEPTION(InvalidParameterException(oss.str()));
    }

    const std::string& strandSeq(isPlusStrand ? _reference : _referenceRevComp);
    synthesizeRead(strandSeq, pos, isPlusStrand, READ_MATE::FIRST, read);
}



void
ReadSynthesizer::
nextRead(SimulatedRead& read)
{
    using namespace readsim::common;

    if (! hasReference())
    {
        BOOST_THROW_EXCEPTION(InvalidParameterException("Positional read simulation requires a reference sequence"));
    }

    if (referenceLength() <= _opt.readLength)
    {
        std::ostringstream oss;
        oss << "Reference sequence length " << referenceLength() << " must exceed the read length " << _opt.readLength;
        BOOST_THROW_EXCEPTION(InvalidParameterException(oss.str()));
    }

    const unsigned pos(_rng.uniformInt(0, referenceLength() - _opt.readLength));
    const bool isPlusStrand(_rng.uniform() < 0.5);
    nextReadAt(pos, isPlusStrand, read);
}



void
ReadSynthesizer::
nextFragmentRead(
    const std::string& fragment,
    const bool isPlusStrand,
    SimulatedRead& read)
{
    std::string strandSeq;
    if (isPlusStrand)
    {
        strandSeq = fragment;
        normalizeBaseStr(strandSeq);
    }
    else
    {
        strandSeq = reverseCompCopyStr(fragment);
    }

    const READ_MATE::index_t mate(isPlusStrand ? READ_MATE::FIRST : READ_MATE::SECOND);
    synthesizeRead(strandSeq, 0, isPlusStrand, mate, read);
}



void
ReadSynthesizer::
nextFragmentPair(
    const std::string& fragment,
    SimulatedReadPair& readPair)
{
    nextFragmentRead(fragment, true, readPair.fwd);
    nextFragmentRead(fragment, false, readPair.rev);
}



void
ReadSynthesizer::
makeSimpleRead(
    const std::string& strandSeq,
    const bool isPlusStrand,
    const uint8_t qscore,
    SimulatedRead& read) const
{
    read.clear();
    read.isPlusStrand = isPlusStrand;
    read.requestedLength = _opt.readLength;

    const unsigned readLength(std::min(_opt.readLength, static_cast<unsigned>(strandSeq.size())));
    read.reference = strandSeq.substr(0, readLength);
    read.sequence = read.reference;
    read.qualities.assign(readLength, qscore);
}



void
ReadSynthesizer::
nextSimpleRead(
    const std::string& fragment,
    const bool isPlusStrand,
    SimulatedRead& read,
    const uint8_t qscore) const
{
    if (isPlusStrand)
    {
        std::string strandSeq(fragment);
        normalizeBaseStr(strandSeq);
        makeSimpleRead(strandSeq, isPlusStrand, qscore, read);
    }
    else
    {
        makeSimpleRead(reverseCompCopyStr(fragment), isPlusStrand, qscore, read);
    }
}



void
ReadSynthesizer::
nextSimplePair(
    const std::string& fragment,
    SimulatedReadPair& readPair,
    const uint8_t qscore) const
{
    nextSimpleRead(fragment, true, readPair.fwd, qscore);
    nextSimpleRead(fragment, false, readPair.rev, qscore);
}
