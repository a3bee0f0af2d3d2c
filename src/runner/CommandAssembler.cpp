/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "runner/CommandAssembler.hpp"

#include <algorithm>

#include <boost/format.hpp>

#include "libferry/Error.hpp"


namespace ferry {
namespace runner {

EngineSettings EngineSettings::fromConfig(const Config& config) {
    auto settings = EngineSettings{};
    settings.engine = config.engine;
    settings.executable = config.getEngineExecutable();
    settings.extraArgs = config.engineExtraArgs;
    settings.keepUserIdentity = config.keepUserIdentity;
    return settings;
}

CommandAssembler::CommandAssembler(const EngineSettings& settings)
    : settings{settings}
{}

libferry::CLIArguments CommandAssembler::assemble(const std::string& image,
                                                  const std::vector<MountEntry>& mounts,
                                                  const EnvironmentSpec& environment,
                                                  const boost::filesystem::path& workingDirectory,
                                                  const libferry::CLIArguments& containerArgv) const {
    if(containerArgv.empty()) {
        FERRY_THROW_ERROR("Cannot assemble container command: the tool's command line is empty");
    }

    auto args = generateBaseArgs();
    args += generateMountArgs(mounts);
    args += generateEnvironmentArgs(environment);
    args += generateUserArgs();
    args += generateWorkingDirectoryArgs(workingDirectory);
    args.push_back(image);
    args += containerArgv;
    return args;
}

libferry::CLIArguments CommandAssembler::generateBaseArgs() const {
    auto args = libferry::CLIArguments{settings.executable};
    switch(settings.engine) {
        case Engine::Podman:
            args += libferry::CLIArguments{"run", "--rm"};
            break;
        case Engine::Apptainer:
            // no automatic binds of $HOME, the current directory, /tmp or the
            // admin's bind paths, and none of the engine's own environment
            args += libferry::CLIArguments{"exec", "--containall", "--no-mount", "hostfs"};
            break;
    }
    for(const auto& arg : settings.extraArgs) {
        args.push_back(arg);
    }
    return args;
}

libferry::CLIArguments CommandAssembler::generateMountArgs(const std::vector<MountEntry>& mounts) const {
    auto sortedMounts = mounts;
    std::sort(sortedMounts.begin(), sortedMounts.end(), [](const MountEntry& lhs, const MountEntry& rhs) {
        return lhs.containerPath.string() < rhs.containerPath.string();
    });

    auto adjacent = std::adjacent_find(sortedMounts.cbegin(), sortedMounts.cend(), [](const MountEntry& lhs, const MountEntry& rhs) {
        return lhs.containerPath == rhs.containerPath;
    });
    if(adjacent != sortedMounts.cend()) {
        auto message = boost::format("Cannot assemble container command: more than one mount"
                                     " with destination %s") % adjacent->containerPath;
        FERRY_THROW_ERROR(message.str());
    }

    auto flag = settings.engine == Engine::Podman ? "-v" : "-B";
    auto args = libferry::CLIArguments{};
    for(const auto& mount : sortedMounts) {
        auto value = boost::format("%s:%s:%s") % mount.hostPath.string() % mount.containerPath.string() % toString(mount.accessMode);
        args += libferry::CLIArguments{flag, value.str()};
    }
    return args;
}

libferry::CLIArguments CommandAssembler::generateEnvironmentArgs(const EnvironmentSpec& environment) const {
    auto flag = settings.engine == Engine::Podman ? "-e" : "--env";
    auto args = libferry::CLIArguments{};
    for(const auto& variable : environment) {
        // apptainer splits the value of --env at commas
        if(settings.engine == Engine::Apptainer && variable.second.find(',') != std::string::npos) {
            auto message = boost::format("Cannot pass environment variable %s=%s to apptainer:"
                                         " the value contains a ','") % variable.first % variable.second;
            FERRY_THROW_ERROR(message.str());
        }
        args += libferry::CLIArguments{flag, variable.first + "=" + variable.second};
    }
    return args;
}

libferry::CLIArguments CommandAssembler::generateUserArgs() const {
    switch(settings.engine) {
        case Engine::Podman:
            // map the invoking user to the same uid/gid inside the container, files
            // written into the read-write mounts are then owned by the invoking user
            return settings.keepUserIdentity ? libferry::CLIArguments{"--userns=keep-id"} : libferry::CLIArguments{};
        case Engine::Apptainer:
            // apptainer runs as the invoking user unless asked to fake root
            return settings.keepUserIdentity ? libferry::CLIArguments{} : libferry::CLIArguments{"--fakeroot"};
    }
    return libferry::CLIArguments{};
}

libferry::CLIArguments CommandAssembler::generateWorkingDirectoryArgs(const boost::filesystem::path& workingDirectory) const {
    auto flag = settings.engine == Engine::Podman ? "-w" : "--pwd";
    return libferry::CLIArguments{flag, workingDirectory.string()};
}

}
}
