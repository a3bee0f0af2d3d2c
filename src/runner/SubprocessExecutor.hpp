/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ferry_runner_SubprocessExecutor_hpp
#define ferry_runner_SubprocessExecutor_hpp

#include <chrono>
#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/format.hpp>

#include "libferry/LogLevel.hpp"
#include "libferry/utility/process.hpp"
#include "runner/ProcessExecutor.hpp"


namespace ferry {
namespace runner {

/**
 * Executes the engine as a child process of the caller.
 *
 * The child gets only the launcher's variables listed in 'forwardedVariables'.
 * The engine binary is searched in the launcher's PATH
 * unless argv[0] contains a slash.
 */
class SubprocessExecutor : public ProcessExecutor {
public:
    struct Options {
        std::unordered_map<std::string, std::string> launcherEnvironment;
        std::vector<std::string> forwardedVariables;
        std::chrono::seconds timeout{0};
        libferry::process::LineHandler stdoutLineHandler;
        libferry::process::LineHandler stderrLineHandler;
    };

public:
    SubprocessExecutor();
    SubprocessExecutor(const Options& options);
    ExecutionResult run(const libferry::CLIArguments& argv) override;

    std::vector<std::string> makeEnvironment() const;
    boost::filesystem::path findEngine(const std::string& executable) const;

private:
    void printLog(const boost::format& message, libferry::LogLevel,
                  std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr) const;

private:
    Options options;
    const std::string sysname = "SubprocessExecutor";
};

}
}

#endif
