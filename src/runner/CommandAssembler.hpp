/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ferry_runner_CommandAssembler_hpp
#define ferry_runner_CommandAssembler_hpp

#include <string>
#include <vector>

#include <boost/filesystem.hpp>

#include "libferry/CLIArguments.hpp"
#include "runner/Config.hpp"
#include "runner/MountEntry.hpp"


namespace ferry {
namespace runner {

struct EngineSettings {
    static EngineSettings fromConfig(const Config&);

    Engine engine = Engine::Podman;
    std::string executable = "podman";
    std::vector<std::string> extraArgs;
    bool keepUserIdentity = true;
};

/**
 * Builds the command line of the container engine. Mounts are emitted sorted by
 * container path and environment variables sorted by name, so equal inputs
 * always produce the same command line.
 */
class CommandAssembler {
public:
    CommandAssembler(const EngineSettings& settings);
    libferry::CLIArguments assemble(const std::string& image,
                                    const std::vector<MountEntry>& mounts,
                                    const EnvironmentSpec& environment,
                                    const boost::filesystem::path& workingDirectory,
                                    const libferry::CLIArguments& containerArgv) const;

private:
    libferry::CLIArguments generateBaseArgs() const;
    libferry::CLIArguments generateMountArgs(const std::vector<MountEntry>& mounts) const;
    libferry::CLIArguments generateEnvironmentArgs(const EnvironmentSpec& environment) const;
    libferry::CLIArguments generateUserArgs() const;
    libferry::CLIArguments generateWorkingDirectoryArgs(const boost::filesystem::path& workingDirectory) const;

private:
    EngineSettings settings;
};

}
}

#endif
