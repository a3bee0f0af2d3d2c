/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "runner/Errors.hpp"


namespace ferry {
namespace runner {

PathResolutionError::PathResolutionError(const libferry::Error::ErrorTraceEntry& entry,
                                         const boost::filesystem::path& path)
    : libferry::Error{libferry::LogLevel::ERROR, entry}
    , path{path}
{}

ExecutableNotFoundError::ExecutableNotFoundError(const libferry::Error::ErrorTraceEntry& entry,
                                                 const std::string& executable)
    : libferry::Error{libferry::LogLevel::ERROR, entry}
    , executable{executable}
{}

ContainerExecutionError::ContainerExecutionError(const libferry::Error::ErrorTraceEntry& entry,
                                                 int exitCode,
                                                 const libferry::CLIArguments& argv,
                                                 const libferry::CLIArguments& containerArgv,
                                                 const std::string& standardOutput,
                                                 const std::string& standardError)
    : libferry::Error{libferry::LogLevel::ERROR, entry}
    , exitCode{exitCode}
    , argv{argv}
    , containerArgv{containerArgv}
    , standardOutput{standardOutput}
    , standardError{standardError}
{}

ExecutionCancelledError::ExecutionCancelledError(const libferry::Error::ErrorTraceEntry& entry,
                                                 const libferry::CLIArguments& argv,
                                                 std::chrono::seconds timeout)
    : libferry::Error{libferry::LogLevel::ERROR, entry}
    , argv{argv}
    , timeout{timeout}
{}

MissingOutputError::MissingOutputError(const libferry::Error::ErrorTraceEntry& entry,
                                       const std::vector<boost::filesystem::path>& paths)
    : libferry::Error{libferry::LogLevel::ERROR, entry}
    , paths{paths}
{}

}
}
