/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ferry_runner_PathMapper_hpp
#define ferry_runner_PathMapper_hpp

#include <iostream>
#include <string>
#include <vector>

#include <boost/format.hpp>
#include <boost/filesystem.hpp>

#include "libferry/CLIArguments.hpp"
#include "libferry/LogLevel.hpp"
#include "runner/InvocationRequest.hpp"
#include "runner/MountEntry.hpp"
#include "runner/PathTranslationTable.hpp"


namespace ferry {
namespace runner {

struct OutputLocation {
    std::string outputTemplate;
    bool optional;
    boost::filesystem::path containerPath;
};

struct MountSet {
    std::vector<MountEntry> mounts;
    PathTranslationTable translationTable;
    libferry::CLIArguments containerArguments; // the request's arguments, rewritten to container paths
    std::vector<OutputLocation> outputs;
    boost::filesystem::path outputRoot;        // canonical host path of the output root
    boost::filesystem::path outputRootContainerPath;
};

/**
 * Computes the bind mounts of one invocation.
 *
 * Inputs are canonicalized and their containing directories are mounted at
 * /mnt/in<N>. The output root is mounted read-write at /mnt/out0, the
 * directories of outputs in subfolders of the output root at /mnt/out<N>.
 * Every canonical host directory is mounted once: an output directory that
 * already holds an input reuses that input's mount point, made read-write.
 * Missing inputs and invalid output templates raise PathResolutionError before
 * any output directory is created.
 */
class PathMapper {
public:
    static const boost::filesystem::path outputRootContainerPath;

public:
    PathMapper(const boost::filesystem::path& outputDir);
    MountSet computeMounts(const InvocationRequest& request) const;

private:
    void printLog(const boost::format& message, libferry::LogLevel,
                  std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr) const;

private:
    boost::filesystem::path outputDir;
    const std::string sysname = "PathMapper";
};

}
}

#endif
