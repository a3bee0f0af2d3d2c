/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libferry_utility_process_hpp
#define libferry_utility_process_hpp

#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <boost/filesystem.hpp>

#include "libferry/CLIArguments.hpp"

/**
 * Utility functions for system operations
 */

namespace libferry {
namespace process {

using LineHandler = std::function<void(const std::string&)>;

struct CaptureOptions {
    // "NAME=VALUE" entries; when not set the child inherits the environment of the caller
    boost::optional<std::vector<std::string>> environment;
    // zero means no timeout
    std::chrono::milliseconds timeout{0};
    // grace period between SIGTERM and SIGKILL once the timeout expired
    std::chrono::milliseconds killGracePeriod{std::chrono::seconds{5}};
    LineHandler stdoutLineHandler;
    LineHandler stderrLineHandler;
};

struct CapturedOutput {
    int exitStatus = 0;
    bool terminatedBySignal = false;
    int signal = 0;
    bool timedOut = false;
    std::string standardOutput;
    std::string standardError;
};

CapturedOutput forkExecCapture(const libferry::CLIArguments& args, const CaptureOptions& options = CaptureOptions{});
boost::optional<boost::filesystem::path> findExecutable(const std::string& name, const std::string& searchPath);
std::string getHostname();

}}

#endif
