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

#include "ReadSimRun.hh"
#include "FastaReader.hh"
#include "FastqWriter.hh"

#include "blt_util/log.hh"
#include "blt_util/RandomSource.hh"
#include "common/Exceptions.hh"
#include "common/OutStream.hh"
#include "readsim/QualityProfile.hh"
#include "readsim/ReadSynthesizer.hh"

#include <cerrno>
#include <cmath>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>



unsigned
getReadPairCount(
    const ReadSimOptions& opt,
    const unsigned refLength)
{
    if (! opt.isXfold()) return opt.readPairCount;

    const unsigned readLength(opt.readOpt.readLength);
    return static_cast<unsigned>(std::ceil((refLength / readLength) * opt.xfold));
}



unsigned
drawInsertLength(
    const ReadSimOptions& opt,
    RandomSource& rng)
{
    while (true)
    {
        const double insertLength(std::ceil(rng.normal(opt.insertMean, opt.insertSD)));
        if (insertLength > opt.minInsertLength) return static_cast<unsigned>(insertLength);
    }
}



static
void
simulateReference(
    const ReadSimOptions& opt,
    const FastaRecord& record,
    ReadSynthesizer& synthesizer,
    RandomSource& rng,
    FastqWriter& firstMateWriter,
    FastqWriter& secondMateWriter)
{
    const unsigned refLength(record.sequence.size());
    const unsigned readPairCount(getReadPairCount(opt, refLength));

    log_os << "INFO: Generating " << readPairCount << " read pairs for " << record.id << "\n";

    const unsigned progressStep(std::max(1u, readPairCount/10));
    SimulatedReadPair readPair;
    for (unsigned readIndex(0); readIndex<readPairCount; ++readIndex)
    {
        const unsigned insertLength(drawInsertLength(opt, rng));
        if (insertLength >= refLength)
        {
            log_os << "WARNING: Reference sequence '" << record.id << "' of length " << refLength
                   << " is too short for fragment length " << insertLength << ", skipping remaining reads\n";
            break;
        }

        const unsigned pos(rng.uniformInt(0, refLength-insertLength));
        synthesizer.nextFragmentPair(record.sequence.substr(pos, insertLength), readPair);

        const std::string readId(SimulatedRead::readId(record.id, readIndex));
        firstMateWriter.write(readId, readPair.fwd);
        secondMateWriter.write(readId, readPair.rev);

        if (((readIndex+1) % progressStep) == 0)
        {
            log_os << "INFO: Wrote " << (readIndex+1) << " read pairs\n";
        }
    }
}



void
runReadSim(const ReadSimOptions& opt)
{
    OutStream firstMateOuts(opt.outputPrefix + ".r1.fq");
    OutStream secondMateOuts(opt.outputPrefix + ".r2.fq");
    FastqWriter firstMateWriter(firstMateOuts.getStream());
    FastqWriter secondMateWriter(secondMateOuts.getStream());

    const QualityProfile profile(opt.firstMateProfileFilename, opt.secondMateProfileFilename);

    std::unique_ptr<RandomSource> rngPtr;
    if (opt.isSeed())
    {
        rngPtr.reset(new RandomSource(static_cast<uint32_t>(opt.seed)));
    }
    else
    {
        rngPtr.reset(new RandomSource());
        log_os << "INFO: Using random seed " << rngPtr->seed() << "\n";
    }

    ReadSynthesizer synthesizer(profile, opt.readOpt, *rngPtr);

    std::ifstream refStream(opt.referenceFilename.c_str());
    if (! refStream)
    {
        using namespace readsim::common;
        std::ostringstream oss;
        oss << "Can't open reference fasta file: '" << opt.referenceFilename << "'";
        BOOST_THROW_EXCEPTION(IoException(errno, oss.str()));
    }

    FastaReader fastaReader(refStream, opt.referenceFilename);
    FastaRecord record;
    while (fastaReader.nextRecord(record))
    {
        simulateReference(opt, record, synthesizer, *rngPtr, firstMateWriter, secondMateWriter);
    }
}
