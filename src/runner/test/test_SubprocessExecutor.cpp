/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <chrono>
#include <vector>

#include <boost/filesystem.hpp>

#include "runner/Errors.hpp"
#include "runner/SubprocessExecutor.hpp"
#include "test_utility/filesystem.hpp"
#include "test_utility/unittest_main_function.hpp"


using namespace ferry;

TEST_GROUP(SubprocessExecutorTestGroup) {
};

static runner::SubprocessExecutor::Options makeOptions() {
    auto options = runner::SubprocessExecutor::Options{};
    options.launcherEnvironment = {{"PATH", "/usr/bin:/bin"}, {"HOME", "/home/user"}, {"SECRET", "value"}};
    options.forwardedVariables = {"PATH", "HOME", "NOT_SET"};
    return options;
}

TEST(SubprocessExecutorTestGroup, captureOutputAndExitCode) {
    auto executor = runner::SubprocessExecutor{makeOptions()};
    auto argv = libferry::CLIArguments{"sh", "-c", "echo out; echo err >&2; exit 7"};

    auto result = executor.run(argv);

    CHECK_EQUAL(result.exitCode, 7);
    CHECK_EQUAL(result.standardOutput, std::string{"out\n"});
    CHECK_EQUAL(result.standardError, std::string{"err\n"});
    CHECK(result.argv == argv);
    CHECK(!result.cancelled);
}

TEST(SubprocessExecutorTestGroup, explicitEnvironment) {
    auto executor = runner::SubprocessExecutor{makeOptions()};

    CHECK((executor.makeEnvironment() == std::vector<std::string>{"HOME=/home/user", "PATH=/usr/bin:/bin"}));

    // only the forwarded variables reach the child
    auto result = executor.run({"/bin/sh", "-c", "printf \"$HOME:$SECRET\""});
    CHECK_EQUAL(result.exitCode, 0);
    CHECK_EQUAL(result.standardOutput, std::string{"/home/user:"});
}

TEST(SubprocessExecutorTestGroup, engineNotFound) {
    auto executor = runner::SubprocessExecutor{makeOptions()};

    try {
        executor.run({"ferry-test-no-such-engine", "run"});
        FAIL("Expected ExecutableNotFoundError");
    }
    catch(const runner::ExecutableNotFoundError& e) {
        CHECK_EQUAL(e.getExecutable(), std::string{"ferry-test-no-such-engine"});
    }

    CHECK_THROWS(runner::ExecutableNotFoundError, executor.run({"/non/existing/podman", "run"}));

    // no PATH in the launcher's environment
    auto options = makeOptions();
    options.launcherEnvironment.erase("PATH");
    CHECK_THROWS(runner::ExecutableNotFoundError, runner::SubprocessExecutor{options}.run({"sh", "-c", "true"}));
}

TEST(SubprocessExecutorTestGroup, engineFromPath) {
    auto testDirRAII = test_utility::filesystem::makeTemporaryDirectory("ferry-test-executor");
    auto binDir = testDirRAII.getPath() / "bin";
    test_utility::filesystem::createExecutable(binDir / "podman", "printf \"fake podman: $*\"");

    auto options = makeOptions();
    options.launcherEnvironment["PATH"] = binDir.string() + ":/usr/bin:/bin";
    auto executor = runner::SubprocessExecutor{options};

    CHECK(executor.findEngine("podman") == binDir / "podman");

    auto result = executor.run({"podman", "run", "--rm", "image"});
    CHECK_EQUAL(result.exitCode, 0);
    CHECK_EQUAL(result.standardOutput, std::string{"fake podman: run --rm image"});
    // the result reports the command line as requested
    CHECK(result.argv == (libferry::CLIArguments{"podman", "run", "--rm", "image"}));
}

TEST(SubprocessExecutorTestGroup, killedBySignal) {
    auto executor = runner::SubprocessExecutor{makeOptions()};
    auto result = executor.run({"sh", "-c", "kill -KILL $$"});
    CHECK_EQUAL(result.exitCode, 128 + 9);
    CHECK(!result.cancelled);
}

TEST(SubprocessExecutorTestGroup, timeout) {
    auto options = makeOptions();
    options.timeout = std::chrono::seconds{1};
    auto executor = runner::SubprocessExecutor{options};

    auto result = executor.run({"sh", "-c", "sleep 60"});

    CHECK(result.cancelled);
    CHECK(result.exitCode != 0);
    CHECK(result.elapsed < std::chrono::seconds{30});
}

TEST(SubprocessExecutorTestGroup, lineHandlers) {
    auto stdoutLines = std::vector<std::string>{};
    auto stderrLines = std::vector<std::string>{};
    auto options = makeOptions();
    options.stdoutLineHandler = [&stdoutLines](const std::string& line) { stdoutLines.push_back(line); };
    options.stderrLineHandler = [&stderrLines](const std::string& line) { stderrLines.push_back(line); };
    auto executor = runner::SubprocessExecutor{options};

    auto result = executor.run({"sh", "-c", "echo one; echo two; echo three >&2"});

    CHECK((stdoutLines == std::vector<std::string>{"one", "two"}));
    CHECK((stderrLines == std::vector<std::string>{"three"}));
    // the complete output is captured regardless of the handlers
    CHECK_EQUAL(result.standardOutput, std::string{"one\ntwo\n"});
}

FERRY_UNITTEST_MAIN_FUNCTION();
