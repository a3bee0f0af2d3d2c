/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "runner/SubprocessExecutor.hpp"

#include <map>

#include "libferry/Error.hpp"
#include "libferry/Logger.hpp"
#include "libferry/utility/environment.hpp"
#include "runner/Config.hpp"
#include "runner/Errors.hpp"

extern char** environ;


namespace ferry {
namespace runner {

static SubprocessExecutor::Options makeDefaultOptions() {
    auto options = SubprocessExecutor::Options{};
    options.launcherEnvironment = libferry::environment::parseVariables(environ);
    options.forwardedVariables = Config{}.engineEnvironment;
    return options;
}

SubprocessExecutor::SubprocessExecutor()
    : SubprocessExecutor(makeDefaultOptions())
{}

SubprocessExecutor::SubprocessExecutor(const Options& options)
    : options{options}
{}

ExecutionResult SubprocessExecutor::run(const libferry::CLIArguments& argv) {
    if(argv.empty()) {
        FERRY_THROW_ERROR("Cannot run the container engine: empty command line");
    }

    auto engine = findEngine(*argv.begin());
    auto resolvedArgv = libferry::CLIArguments{engine.string()} + libferry::CLIArguments(argv.begin() + 1, argv.end());

    auto captureOptions = libferry::process::CaptureOptions{};
    captureOptions.environment = makeEnvironment();
    captureOptions.timeout = options.timeout;
    captureOptions.stdoutLineHandler = options.stdoutLineHandler;
    captureOptions.stderrLineHandler = options.stderrLineHandler;

    auto start = std::chrono::steady_clock::now();
    auto output = libferry::process::forkExecCapture(resolvedArgv, captureOptions);
    auto end = std::chrono::steady_clock::now();

    auto result = ExecutionResult{};
    result.exitCode = output.exitStatus;
    result.standardOutput = std::move(output.standardOutput);
    result.standardError = std::move(output.standardError);
    result.argv = argv;
    result.cancelled = output.timedOut;
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

    printLog(boost::format("%s exited with code %d after %d ms%s")
             % engine % result.exitCode % result.elapsed.count() % (result.cancelled ? " (timed out)" : ""),
             libferry::LogLevel::DEBUG);
    return result;
}

std::vector<std::string> SubprocessExecutor::makeEnvironment() const {
    // sorted and without duplicates
    auto variables = std::map<std::string, std::string>{};
    for(const auto& name : options.forwardedVariables) {
        auto it = options.launcherEnvironment.find(name);
        if(it != options.launcherEnvironment.cend()) {
            variables[name] = it->second;
        }
    }

    auto environment = std::vector<std::string>{};
    for(const auto& variable : variables) {
        environment.push_back(variable.first + "=" + variable.second);
    }
    return environment;
}

boost::filesystem::path SubprocessExecutor::findEngine(const std::string& executable) const {
    auto path = options.launcherEnvironment.find("PATH");
    auto searchPath = path != options.launcherEnvironment.cend() ? path->second : std::string{};

    auto engine = libferry::process::findExecutable(executable, searchPath);
    if(!engine) {
        auto message = boost::format("Container engine executable '%s' not found or not executable"
                                     " (searched PATH=%s)") % executable % searchPath;
        throw ExecutableNotFoundError{FERRY_ERROR_TRACE_ENTRY(message.str()), executable};
    }

    printLog(boost::format("Using container engine %s") % *engine, libferry::LogLevel::DEBUG);
    return *engine;
}

void SubprocessExecutor::printLog(const boost::format& message, libferry::LogLevel level,
                                  std::ostream& outStream, std::ostream& errStream) const {
    libferry::Logger::getInstance().log(message, sysname, level, outStream, errStream);
}

}
}
