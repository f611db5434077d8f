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

#include "ReadSimOptions.hh"

#include "blt_util/log.hh"
#include "common/ProgramUtil.hh"
#include "readsim/QualityProfileCatalog.hh"

#include "blt_util/thirdparty_push.h"

#include "boost/program_options.hpp"

#include "blt_util/thirdparty_pop.h"

#include <initializer_list>
#include <iostream>
#include <limits>
#include <sstream>



static
void
usage(
    std::ostream& os,
    const readsim::Program& prog,
    const boost::program_options::options_description& visible,
    const char* msg = nullptr)
{
    usage(os, prog, visible, "Simulate paired-end Illumina reads with empirical quality profiles", "", msg);
}



void
parseReadSimOptions(
    const readsim::Program& prog,
    int argc,
    char** argv,
    ReadSimOptions& opt)
{
    namespace po = boost::program_options;
    po::options_description req("configuration");
    req.add_options()
    ("ref", po::value(&opt.referenceFilename),
     "reference fasta file to sample reads from (required)")
    ("output-prefix", po::value(&opt.outputPrefix),
     "prefix of the output read files, reads are written to PREFIX.r1.fq and PREFIX.r2.fq (required)")
    ("read-length", po::value(&opt.readOpt.readLength),
     "read length (required)")
    ("xfold", po::value(&opt.xfold),
     "depth of coverage, mutually exclusive with num-reads")
    ("num-reads", po::value(&opt.readPairCount),
     "number of read pairs per reference sequence, mutually exclusive with xfold")
    ("seed", po::value(&opt.seed),
     "random seed, a nondeterministic seed is used if not specified")
    ;

    po::options_description profile("quality profile");
    profile.add_options()
    ("profile1", po::value(&opt.firstMateProfileFilename),
     "empirical quality profile of the first read")
    ("profile2", po::value(&opt.secondMateProfileFilename),
     "empirical quality profile of the second read")
    ("profile-name", po::value(&opt.profileName),
     "name of a built-in Illumina profile, used instead of profile1/profile2")
    ("profile-dir", po::value(&opt.profileDir),
     "directory containing the built-in Illumina profile files")
    ;

    po::options_description model("read model");
    model.add_options()
    ("ins-rate", po::value(&opt.readOpt.insertionRate)->default_value(opt.readOpt.insertionRate),
     "per-base insertion rate")
    ("del-rate", po::value(&opt.readOpt.deletionRate)->default_value(opt.readOpt.deletionRate),
     "per-base deletion rate")
    ("max-indels", po::value(&opt.readOpt.maxIndelCount)->default_value(opt.readOpt.maxIndelCount),
     "maximum number of insertions, and separately of deletions, in a read")
    ("insert-mean", po::value(&opt.insertMean)->default_value(opt.insertMean),
     "mean fragment length")
    ("insert-sd", po::value(&opt.insertSD)->default_value(opt.insertSD),
     "fragment length standard deviation")
    ("min-insert", po::value(&opt.minInsertLength)->default_value(opt.minInsertLength),
     "fragment lengths are drawn until they exceed this value")
    ;

    po::options_description help("help");
    help.add_options()
    ("help,h","print this message");

    po::options_description visible("options");
    visible.add(req).add(profile).add(model).add(help);

    bool po_parse_fail(false);
    po::variables_map vm;
    try
    {
        po::store(po::parse_command_line(argc, argv, visible,
                                         po::command_line_style::unix_style ^ po::command_line_style::allow_short), vm);
        po::notify(vm);
    }
    catch (const boost::program_options::error& e)
    {
        log_os << "\nERROR: Exception thrown by option parser: " << e.what() << "\n";
        po_parse_fail=true;
    }

    if ((argc<=1) || (vm.count("help")) || po_parse_fail)
    {
        usage(log_os,prog,visible);
    }

    std::string errorMsg;
    if (checkAndStandardizeRequiredInputFilePath(opt.referenceFilename, "reference fasta", errorMsg))
    {
        usage(log_os,prog,visible,errorMsg.c_str());
    }

    if (opt.outputPrefix.empty())
    {
        usage(log_os,prog,visible,"Must specify an output prefix");
    }

    if (opt.readOpt.readLength == 0)
    {
        usage(log_os,prog,visible,"Must specify a positive read length");
    }

    const bool isXfoldArg(vm.count("xfold"));
    const bool isReadCountArg(vm.count("num-reads"));
    if (isXfoldArg && isReadCountArg)
    {
        usage(log_os,prog,visible,"xfold and num-reads are mutually exclusive options");
    }
    if (! (isXfoldArg || isReadCountArg))
    {
        usage(log_os,prog,visible,"Must specify one of xfold or num-reads");
    }
    if (isXfoldArg && (! opt.isXfold()))
    {
        usage(log_os,prog,visible,"xfold must be greater than zero");
    }

    if (vm.count("seed") && ((opt.seed < 0) || (opt.seed > std::numeric_limits<uint32_t>::max())))
    {
        std::ostringstream oss;
        oss << "seed must be in the range [0," << std::numeric_limits<uint32_t>::max() << "]";
        usage(log_os,prog,visible,oss.str().c_str());
    }

    for (const double rate : { opt.readOpt.insertionRate, opt.readOpt.deletionRate })
    {
        if ((rate < 0.) || (rate > 1.))
        {
            usage(log_os,prog,visible,"Indel rates must be in the range [0,1]");
        }
    }

    if (opt.insertSD < 0.)
    {
        usage(log_os,prog,visible,"Fragment length standard deviation must not be negative");
    }
    if (opt.insertMean <= opt.minInsertLength)
    {
        usage(log_os,prog,visible,"Mean fragment length must exceed the minimum fragment length");
    }

    if (! opt.profileName.empty())
    {
        if (vm.count("profile1") || vm.count("profile2"))
        {
            usage(log_os,prog,visible,"profile-name can't be combined with profile1/profile2");
        }
        if (! isKnownProfile(opt.profileName))
        {
            std::ostringstream oss;
            oss << "Unknown profile name: '" << opt.profileName << "'. Valid profile names are:\n";
            listProfileNames(oss);
            usage(log_os,prog,visible,oss.str().c_str());
        }
        if (checkAndStandardizeRequiredInputFilePath(opt.profileDir, "profile", errorMsg, true))
        {
            usage(log_os,prog,visible,errorMsg.c_str());
        }
        getProfileFiles(opt.profileDir, opt.profileName,
                        opt.firstMateProfileFilename, opt.secondMateProfileFilename);
    }

    if (checkAndStandardizeRequiredInputFilePath(opt.firstMateProfileFilename, "first read quality profile", errorMsg))
    {
        usage(log_os,prog,visible,errorMsg.c_str());
    }
    if (checkAndStandardizeRequiredInputFilePath(opt.secondMateProfileFilename, "second read quality profile", errorMsg))
    {
        usage(log_os,prog,visible,errorMsg.c_str());
    }
}
