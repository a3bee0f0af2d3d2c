/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ferry_runner_Errors_hpp
#define ferry_runner_Errors_hpp

#include <chrono>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>

#include "libferry/Error.hpp"
#include "libferry/CLIArguments.hpp"

/**
 * Errors raised by the runner. All of them are libferry::Error instances, hence
 * they carry an error trace and can be rethrown with FERRY_RETHROW_ERROR.
 * They are constructed with FERRY_ERROR_TRACE_ENTRY as first argument, e.g.
 *
 *     throw PathResolutionError{FERRY_ERROR_TRACE_ENTRY(message.str()), path};
 */

namespace ferry {
namespace runner {

// A declared input is missing or an output template is invalid
class PathResolutionError : public libferry::Error {
public:
    PathResolutionError(const libferry::Error::ErrorTraceEntry&, const boost::filesystem::path&);
    const boost::filesystem::path& getPath() const { return path; }

private:
    boost::filesystem::path path;
};

// The container engine binary is absent or not executable
class ExecutableNotFoundError : public libferry::Error {
public:
    ExecutableNotFoundError(const libferry::Error::ErrorTraceEntry&, const std::string& executable);
    const std::string& getExecutable() const { return executable; }

private:
    std::string executable;
};

// The container ran and exited with a nonzero code
class ContainerExecutionError : public libferry::Error {
public:
    ContainerExecutionError(const libferry::Error::ErrorTraceEntry&,
                            int exitCode,
                            const libferry::CLIArguments& argv,
                            const libferry::CLIArguments& containerArgv,
                            const std::string& standardOutput,
                            const std::string& standardError);
    int getExitCode() const { return exitCode; }
    const libferry::CLIArguments& getArgv() const { return argv; }
    const libferry::CLIArguments& getContainerArgv() const { return containerArgv; }
    const std::string& getStandardOutput() const { return standardOutput; }
    const std::string& getStandardError() const { return standardError; }

private:
    int exitCode;
    libferry::CLIArguments argv;
    libferry::CLIArguments containerArgv;
    std::string standardOutput;
    std::string standardError;
};

// The container was terminated because it exceeded the configured timeout
class ExecutionCancelledError : public libferry::Error {
public:
    ExecutionCancelledError(const libferry::Error::ErrorTraceEntry&,
                            const libferry::CLIArguments& argv,
                            std::chrono::seconds timeout);
    const libferry::CLIArguments& getArgv() const { return argv; }
    std::chrono::seconds getTimeout() const { return timeout; }

private:
    libferry::CLIArguments argv;
    std::chrono::seconds timeout;
};

// Declared outputs are missing after a successful execution
class MissingOutputError : public libferry::Error {
public:
    MissingOutputError(const libferry::Error::ErrorTraceEntry&, const std::vector<boost::filesystem::path>& paths);
    const std::vector<boost::filesystem::path>& getPaths() const { return paths; }

private:
    std::vector<boost::filesystem::path> paths;
};

}
}

#endif
