/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <algorithm>

#include "libferry/Error.hpp"
#include "runner/CommandAssembler.hpp"
#include "test_utility/unittest_main_function.hpp"


using namespace ferry;

TEST_GROUP(CommandAssemblerTestGroup) {
    std::vector<runner::MountEntry> mounts = {
        runner::MountEntry{"/scratch", "/mnt/out0", runner::AccessMode::ReadWrite},
        runner::MountEntry{"/data", "/mnt/in0", runner::AccessMode::ReadOnly}
    };
    runner::EnvironmentSpec environment = {
        {"OMP_NUM_THREADS", "4"},
        {"LANG", "C"}
    };
    libferry::CLIArguments containerArgv = {"tool", "/mnt/in0/in.txt", "/mnt/out0/out.txt"};
};

static runner::EngineSettings makeSettings(runner::Engine engine) {
    auto settings = runner::EngineSettings{};
    settings.engine = engine;
    settings.executable = engine == runner::Engine::Podman ? "podman" : "apptainer";
    return settings;
}

TEST(CommandAssemblerTestGroup, podman) {
    auto assembler = runner::CommandAssembler{makeSettings(runner::Engine::Podman)};
    auto argv = assembler.assemble("ubuntu:22.04", mounts, environment, "/mnt/out0", containerArgv);

    auto expected = libferry::CLIArguments{
        "podman", "run", "--rm",
        "-v", "/data:/mnt/in0:ro",
        "-v", "/scratch:/mnt/out0:rw",
        "-e", "LANG=C",
        "-e", "OMP_NUM_THREADS=4",
        "--userns=keep-id",
        "-w", "/mnt/out0",
        "ubuntu:22.04",
        "tool", "/mnt/in0/in.txt", "/mnt/out0/out.txt"
    };
    CHECK_EQUAL(argv.string(), expected.string());
    CHECK(argv == expected);
}

TEST(CommandAssemblerTestGroup, podman_extraArgsAndNoUserMapping) {
    auto settings = makeSettings(runner::Engine::Podman);
    settings.executable = "/opt/podman/bin/podman";
    settings.extraArgs = {"--network=none", "--pull=never"};
    settings.keepUserIdentity = false;

    auto argv = runner::CommandAssembler{settings}.assemble("image", {}, {}, "/work", {"true"});

    auto expected = libferry::CLIArguments{
        "/opt/podman/bin/podman", "run", "--rm", "--network=none", "--pull=never",
        "-w", "/work", "image", "true"
    };
    CHECK(argv == expected);
}

TEST(CommandAssemblerTestGroup, apptainer) {
    auto assembler = runner::CommandAssembler{makeSettings(runner::Engine::Apptainer)};
    auto argv = assembler.assemble("docker://ubuntu:22.04", mounts, environment, "/mnt/out0", containerArgv);

    auto expected = libferry::CLIArguments{
        "apptainer", "exec", "--containall", "--no-mount", "hostfs",
        "-B", "/data:/mnt/in0:ro",
        "-B", "/scratch:/mnt/out0:rw",
        "--env", "LANG=C",
        "--env", "OMP_NUM_THREADS=4",
        "--pwd", "/mnt/out0",
        "docker://ubuntu:22.04",
        "tool", "/mnt/in0/in.txt", "/mnt/out0/out.txt"
    };
    CHECK_EQUAL(argv.string(), expected.string());
}

TEST(CommandAssemblerTestGroup, apptainer_fakeroot) {
    auto settings = makeSettings(runner::Engine::Apptainer);
    settings.keepUserIdentity = false;

    auto argv = runner::CommandAssembler{settings}.assemble("tool.sif", {}, {}, "/mnt/out0", {"true"});

    auto expected = libferry::CLIArguments{
        "apptainer", "exec", "--containall", "--no-mount", "hostfs",
        "--fakeroot", "--pwd", "/mnt/out0", "tool.sif", "true"
    };
    CHECK(argv == expected);
}

TEST(CommandAssemblerTestGroup, apptainer_extraArgsFollowIsolationArgs) {
    auto settings = makeSettings(runner::Engine::Apptainer);
    settings.extraArgs = {"--nv"};

    auto argv = runner::CommandAssembler{settings}.assemble("tool.sif", {}, {}, "/mnt/out0", {"true"});

    auto expected = libferry::CLIArguments{
        "apptainer", "exec", "--containall", "--no-mount", "hostfs", "--nv",
        "--pwd", "/mnt/out0", "tool.sif", "true"
    };
    CHECK(argv == expected);
}

TEST(CommandAssemblerTestGroup, apptainer_environmentValueWithComma) {
    auto assembler = runner::CommandAssembler{makeSettings(runner::Engine::Apptainer)};
    auto listEnvironment = runner::EnvironmentSpec{{"HOSTS", "a,b"}};

    try {
        assembler.assemble("tool.sif", {}, listEnvironment, "/mnt/out0", {"true"});
        FAIL("Expected libferry::Error");
    }
    catch(const libferry::Error& e) {
        auto message = e.getErrorTrace().front().errorMessage;
        CHECK(message.find("HOSTS=a,b") != std::string::npos);
    }

    // podman takes the value verbatim
    auto podman = runner::CommandAssembler{makeSettings(runner::Engine::Podman)};
    auto argv = podman.assemble("image", {}, listEnvironment, "/work", {"true"});
    auto args = argv.strings();
    CHECK(std::find(args.cbegin(), args.cend(), "HOSTS=a,b") != args.cend());
}

TEST(CommandAssemblerTestGroup, deterministic) {
    auto assembler = runner::CommandAssembler{makeSettings(runner::Engine::Podman)};
    auto reversedMounts = mounts;
    std::reverse(reversedMounts.begin(), reversedMounts.end());

    auto first = assembler.assemble("image", mounts, environment, "/mnt/out0", containerArgv);
    auto second = assembler.assemble("image", reversedMounts, environment, "/mnt/out0", containerArgv);
    CHECK(first == second);
}

TEST(CommandAssemblerTestGroup, duplicateDestination) {
    auto duplicateMounts = mounts;
    duplicateMounts.push_back(runner::MountEntry{"/elsewhere", "/mnt/in0", runner::AccessMode::ReadOnly});

    auto assembler = runner::CommandAssembler{makeSettings(runner::Engine::Podman)};
    CHECK_THROWS(libferry::Error, assembler.assemble("image", duplicateMounts, environment, "/mnt/out0", containerArgv));
}

TEST(CommandAssemblerTestGroup, emptyContainerCommand) {
    auto assembler = runner::CommandAssembler{makeSettings(runner::Engine::Podman)};
    CHECK_THROWS(libferry::Error, assembler.assemble("image", mounts, environment, "/mnt/out0", libferry::CLIArguments{}));
}

TEST(CommandAssemblerTestGroup, settingsFromConfig) {
    auto config = runner::Config{};
    config.engine = runner::Engine::Apptainer;
    config.engineExtraArgs = {"--cleanenv"};
    config.keepUserIdentity = false;

    auto settings = runner::EngineSettings::fromConfig(config);
    CHECK(settings.engine == runner::Engine::Apptainer);
    CHECK_EQUAL(settings.executable, std::string{"apptainer"});
    CHECK((settings.extraArgs == std::vector<std::string>{"--cleanenv"}));
    CHECK(!settings.keepUserIdentity);

    config.engineExecutablePath = "/usr/local/bin/apptainer";
    CHECK_EQUAL(runner::EngineSettings::fromConfig(config).executable, std::string{"/usr/local/bin/apptainer"});
}

FERRY_UNITTEST_MAIN_FUNCTION();
