/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "runner/Runner.hpp"

#include <chrono>
#include <vector>

#include "libferry/Error.hpp"
#include "libferry/Logger.hpp"
#include "libferry/utility/environment.hpp"
#include "libferry/utility/filesystem.hpp"
#include "libferry/utility/string.hpp"
#include "runner/CommandAssembler.hpp"
#include "runner/Errors.hpp"
#include "runner/ImageResolver.hpp"
#include "runner/SubprocessExecutor.hpp"

extern char** environ;


namespace ferry {
namespace runner {

SubprocessExecutor::Options Runner::makeExecutorOptions(const Config& config,
                                                       std::ostream& outStream, std::ostream& errStream) {
    auto options = SubprocessExecutor::Options{};
    options.launcherEnvironment = libferry::environment::parseVariables(environ);
    options.forwardedVariables = config.engineEnvironment;
    options.timeout = config.timeout;
    options.stdoutLineHandler = [&outStream, &errStream](const std::string& line) {
        libferry::Logger::getInstance().log(line, "Runner", libferry::LogLevel::INFO, outStream, errStream);
    };
    options.stderrLineHandler = [&outStream, &errStream](const std::string& line) {
        libferry::Logger::getInstance().log(line, "Runner", libferry::LogLevel::ERROR, outStream, errStream);
    };
    return options;
}

Runner::Runner(std::shared_ptr<const Config> config)
    : Runner(config, std::make_shared<SubprocessExecutor>(makeExecutorOptions(*config)))
{}

Runner::Runner(std::shared_ptr<const Config> config, std::shared_ptr<ProcessExecutor> executor)
    : config{std::move(config)}
    , executor{std::move(executor)}
    , runnerId{libferry::string::generateRandom(16)}
{
    if(this->config->dataDir.empty()) {
        dataDir = libferry::filesystem::makeUniquePathWithRandomSuffix(
            boost::filesystem::temp_directory_path() / "ferry");
    }
    else {
        dataDir = boost::filesystem::absolute(this->config->dataDir);
    }
    printLog(boost::format("Created runner %s with data directory %s") % runnerId % dataDir,
             libferry::LogLevel::DEBUG);
}

OutputMap Runner::execute(const InvocationRequest& request) {
    printLog(boost::format("Executing %s %s") % request.packageName % request.toolName, libferry::LogLevel::INFO);

    auto outputDirectory = makeOutputDirectory(request);
    auto mountSet = PathMapper{outputDirectory}.computeMounts(request);

    auto image = qualifyImage(resolveImage(request.image, config->imageOverrides), config->engine);
    auto workingDirectory = resolveWorkingDirectory(request, mountSet);

    auto argv = CommandAssembler{EngineSettings::fromConfig(*config)}.assemble(
        image, mountSet.mounts, makeContainerEnvironment(request), workingDirectory, mountSet.containerArguments);

    printLog(boost::format("Running container engine: %s") % argv.shellQuoted(), libferry::LogLevel::DEBUG);
    printLog(boost::format("Running command: %s") % mountSet.containerArguments.shellQuoted(), libferry::LogLevel::DEBUG);

    auto result = executor->run(argv);

    auto elapsed = result.elapsed.count() / double(1000);
    printLog(boost::format("Executed %s %s in %.3f [sec]") % request.packageName % request.toolName % elapsed,
             libferry::LogLevel::INFO);

    checkExecutionResult(result, mountSet);
    return collectOutputs(mountSet);
}

boost::filesystem::path Runner::makeOutputDirectory(const InvocationRequest& request) {
    if(!config->perExecutionDirectories) {
        return dataDir;
    }
    auto counter = executionCounter++;
    auto name = boost::format("%s_%d_%s") % runnerId % counter % request.toolName;
    return dataDir / name.str();
}

boost::filesystem::path Runner::resolveWorkingDirectory(const InvocationRequest& request, const MountSet& mountSet) const {
    if(!request.workingDirectory) {
        return mountSet.outputRootContainerPath;
    }

    const auto& hint = *request.workingDirectory;
    if(hint.is_absolute()) {
        auto translated = mountSet.translationTable.toContainer(hint);
        if(translated) {
            return *translated;
        }
        return hint;
    }
    return mountSet.outputRootContainerPath / hint;
}

EnvironmentSpec Runner::makeContainerEnvironment(const InvocationRequest& request) const {
    auto environment = config->environ;
    for(const auto& variable : request.environment) {
        environment[variable.first] = variable.second;
    }
    return environment;
}

void Runner::checkExecutionResult(const ExecutionResult& result, const MountSet& mountSet) const {
    if(result.cancelled) {
        auto message = boost::format("Command was cancelled after exceeding the timeout of %d seconds\n- Engine args: %s")
            % config->timeout.count() % result.argv.shellQuoted();
        throw ExecutionCancelledError{FERRY_ERROR_TRACE_ENTRY(message.str()), result.argv, config->timeout};
    }

    if(result.exitCode != 0) {
        auto message = boost::format("Command failed with return code %d\n- Command args: %s\n- Engine args: %s")
            % result.exitCode % mountSet.containerArguments.shellQuoted() % result.argv.shellQuoted();
        throw ContainerExecutionError{FERRY_ERROR_TRACE_ENTRY(message.str()),
                                      result.exitCode,
                                      result.argv,
                                      mountSet.containerArguments,
                                      result.standardOutput,
                                      result.standardError};
    }
}

OutputMap Runner::collectOutputs(const MountSet& mountSet) const {
    auto outputs = OutputMap{};
    auto missing = std::vector<boost::filesystem::path>{};

    for(const auto& output : mountSet.outputs) {
        auto hostPath = mountSet.translationTable.toHost(output.containerPath);
        if(!hostPath) {
            auto message = boost::format("Failed to map output %s back to the host: no mount contains %s")
                % output.outputTemplate % output.containerPath;
            FERRY_THROW_ERROR(message.str());
        }

        if(!output.optional && !boost::filesystem::exists(*hostPath)) {
            missing.push_back(*hostPath);
        }
        outputs[output.outputTemplate] = *hostPath;
    }

    if(missing.empty()) {
        return outputs;
    }

    if(config->requireOutputs) {
        auto message = boost::format("Container exited successfully, but %d declared outputs are missing, e.g. %s")
            % missing.size() % missing.front();
        throw MissingOutputError{FERRY_ERROR_TRACE_ENTRY(message.str()), missing};
    }
    for(const auto& path : missing) {
        printLog(boost::format("Declared output %s does not exist after a successful execution") % path,
                 libferry::LogLevel::WARN);
    }
    return outputs;
}

void Runner::printLog(const boost::format& message, libferry::LogLevel level,
                      std::ostream& outStream, std::ostream& errStream) const {
    libferry::Logger::getInstance().log(message, sysname, level, outStream, errStream);
}

}
}
