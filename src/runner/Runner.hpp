/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ferry_runner_Runner_hpp
#define ferry_runner_Runner_hpp

#include <atomic>
#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <string>

#include <boost/format.hpp>
#include <boost/filesystem.hpp>

#include "libferry/LogLevel.hpp"
#include "runner/Config.hpp"
#include "runner/InvocationRequest.hpp"
#include "runner/PathMapper.hpp"
#include "runner/ProcessExecutor.hpp"
#include "runner/SubprocessExecutor.hpp"


namespace ferry {
namespace runner {

using OutputMap = std::map<std::string, boost::filesystem::path>;

/**
 * Executes invocation requests in containers.
 *
 * Each call of execute() computes its own mounts, assembles the engine command,
 * runs exactly one engine process and maps the declared outputs back to host
 * paths. Concurrent calls on the same Runner are allowed: they only share the
 * configuration snapshot and the execution counter.
 */
class Runner {
public:
    // Options of the default executor. Each line the container writes is logged
    // as it arrives: stdout at INFO, stderr at ERROR.
    static SubprocessExecutor::Options makeExecutorOptions(const Config& config,
                                                           std::ostream& outStream=std::cout,
                                                           std::ostream& errStream=std::cerr);

public:
    Runner(std::shared_ptr<const Config> config);
    Runner(std::shared_ptr<const Config> config, std::shared_ptr<ProcessExecutor> executor);

    OutputMap execute(const InvocationRequest& request);

    const boost::filesystem::path& getDataDir() const { return dataDir; }
    const std::string& getRunnerId() const { return runnerId; }

private:
    boost::filesystem::path makeOutputDirectory(const InvocationRequest& request);
    boost::filesystem::path resolveWorkingDirectory(const InvocationRequest& request, const MountSet& mountSet) const;
    EnvironmentSpec makeContainerEnvironment(const InvocationRequest& request) const;
    void checkExecutionResult(const ExecutionResult& result, const MountSet& mountSet) const;
    OutputMap collectOutputs(const MountSet& mountSet) const;
    void printLog(const boost::format& message, libferry::LogLevel,
                  std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr) const;

private:
    std::shared_ptr<const Config> config;
    std::shared_ptr<ProcessExecutor> executor;
    boost::filesystem::path dataDir;
    std::string runnerId;
    std::atomic<std::uint64_t> executionCounter{0};
    const std::string sysname = "Runner";
};

}
}

#endif
