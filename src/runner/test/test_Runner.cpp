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
#include <atomic>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <boost/filesystem.hpp>

#include "libferry/Logger.hpp"
#include "libferry/utility/filesystem.hpp"
#include "runner/Errors.hpp"
#include "runner/Runner.hpp"
#include "test_utility/config.hpp"
#include "test_utility/executors.hpp"
#include "test_utility/filesystem.hpp"
#include "test_utility/unittest_main_function.hpp"


using namespace ferry;

TEST_GROUP(RunnerTestGroup) {
    libferry::PathRAII testDirRAII = test_utility::filesystem::makeTemporaryDirectory("ferry-test-runner");
    boost::filesystem::path inputDir = testDirRAII.getPath() / "data";
    test_utility::config::ConfigRAII configRAII = test_utility::config::makeConfig();

    void setup() {
        test_utility::filesystem::createFile(inputDir / "in.txt", "input");
    }

    void teardown() {
        libferry::Logger::getInstance().setLevel(libferry::LogLevel::WARN);
    }
};

static runner::InvocationRequest makeRequest(const boost::filesystem::path& input) {
    auto request = runner::InvocationRequest{};
    request.toolName = "tool";
    request.packageName = "package";
    request.image = "ubuntu:22.04";
    request.arguments = {
        runner::ArgumentToken::literal("tool"),
        runner::ArgumentToken::input(input),
        runner::ArgumentToken::output("out.txt")
    };
    return request;
}

static bool contains(const std::vector<std::string>& args, const std::vector<std::string>& sequence) {
    return std::search(args.cbegin(), args.cend(), sequence.cbegin(), sequence.cend()) != args.cend();
}

TEST(RunnerTestGroup, executeMapsInputsAndOutputs) {
    auto executor = std::make_shared<test_utility::executors::SpyExecutor>(0,
        [this](const libferry::CLIArguments&) {
            auto scratch = boost::filesystem::canonical(configRAII.config->dataDir);
            test_utility::filesystem::createFile(scratch / "out.txt", "output");
        });
    auto runner = runner::Runner{configRAII.config, executor};

    auto outputs = runner.execute(makeRequest(inputDir / "in.txt"));

    CHECK_EQUAL(executor->invocations.size(), 1u);
    auto args = executor->invocations.front().strings();
    auto scratch = boost::filesystem::canonical(runner.getDataDir());

    CHECK_EQUAL(args.front(), std::string{"podman"});
    CHECK(contains(args, {"run", "--rm"}));
    CHECK(contains(args, {"-v", inputDir.string() + ":/mnt/in0:ro"}));
    CHECK(contains(args, {"-v", scratch.string() + ":/mnt/out0:rw"}));
    CHECK(contains(args, {"-w", "/mnt/out0"}));
    CHECK(contains(args, {"ubuntu:22.04", "tool", "/mnt/in0/in.txt", "/mnt/out0/out.txt"}));
    CHECK_EQUAL(args.back(), std::string{"/mnt/out0/out.txt"});

    CHECK_EQUAL(outputs.size(), 1u);
    CHECK(outputs.at("out.txt") == scratch / "out.txt");
    CHECK(boost::filesystem::exists(outputs.at("out.txt")));
}

TEST(RunnerTestGroup, missingInputRunsNothing) {
    auto executor = std::make_shared<test_utility::executors::SpyExecutor>();
    auto runner = runner::Runner{configRAII.config, executor};

    CHECK_THROWS(runner::PathResolutionError, runner.execute(makeRequest(inputDir / "missing.txt")));
    CHECK(executor->invocations.empty());
}

TEST(RunnerTestGroup, missingInputReportsPath) {
    auto executor = std::make_shared<test_utility::executors::SpyExecutor>();
    auto runner = runner::Runner{configRAII.config, executor};
    try {
        runner.execute(makeRequest(inputDir / "missing.txt"));
        FAIL("PathResolutionError expected");
    }
    catch(const runner::PathResolutionError& error) {
        CHECK(error.getPath() == inputDir / "missing.txt");
    }
}

TEST(RunnerTestGroup, failingCommand) {
    auto executor = std::make_shared<test_utility::executors::SpyExecutor>(3);
    executor->standardError = "tool: cannot open /mnt/in0/in.txt\n";
    auto runner = runner::Runner{configRAII.config, executor};

    try {
        runner.execute(makeRequest(inputDir / "in.txt"));
        FAIL("ContainerExecutionError expected");
    }
    catch(const runner::ContainerExecutionError& error) {
        CHECK_EQUAL(error.getExitCode(), 3);
        CHECK(error.getArgv() == executor->invocations.front());
        auto expectedContainerArgv = libferry::CLIArguments{"tool", "/mnt/in0/in.txt", "/mnt/out0/out.txt"};
        CHECK(error.getContainerArgv() == expectedContainerArgv);
        CHECK_EQUAL(error.getStandardError(), executor->standardError);
        auto message = error.getErrorTrace().front().errorMessage;
        CHECK(message.find("Command failed with return code 3") != std::string::npos);
        CHECK(message.find("- Command args: tool /mnt/in0/in.txt /mnt/out0/out.txt") != std::string::npos);
        CHECK(message.find("- Engine args: podman run --rm") != std::string::npos);
    }
}

TEST(RunnerTestGroup, cancelledCommand) {
    configRAII.config->timeout = std::chrono::seconds{10};
    auto executor = std::make_shared<test_utility::executors::SpyExecutor>(137);
    executor->cancelled = true;
    auto runner = runner::Runner{configRAII.config, executor};

    try {
        runner.execute(makeRequest(inputDir / "in.txt"));
        FAIL("ExecutionCancelledError expected");
    }
    catch(const runner::ExecutionCancelledError& error) {
        CHECK(error.getTimeout() == std::chrono::seconds{10});
        CHECK(error.getArgv() == executor->invocations.front());
    }
}

TEST(RunnerTestGroup, missingOutputIsReturnedByDefault) {
    auto executor = std::make_shared<test_utility::executors::SpyExecutor>();
    auto runner = runner::Runner{configRAII.config, executor};

    auto outputs = runner.execute(makeRequest(inputDir / "in.txt"));

    auto scratch = boost::filesystem::canonical(runner.getDataDir());
    CHECK(outputs.at("out.txt") == scratch / "out.txt");
    CHECK(!boost::filesystem::exists(outputs.at("out.txt")));
}

TEST(RunnerTestGroup, missingOutputWhenRequired) {
    configRAII.config->requireOutputs = true;
    auto executor = std::make_shared<test_utility::executors::SpyExecutor>();
    auto runner = runner::Runner{configRAII.config, executor};

    try {
        runner.execute(makeRequest(inputDir / "in.txt"));
        FAIL("MissingOutputError expected");
    }
    catch(const runner::MissingOutputError& error) {
        auto scratch = boost::filesystem::canonical(runner.getDataDir());
        CHECK_EQUAL(error.getPaths().size(), 1u);
        CHECK(error.getPaths().front() == scratch / "out.txt");
    }
}

TEST(RunnerTestGroup, optionalOutputIsNeverRequired) {
    configRAII.config->requireOutputs = true;
    auto executor = std::make_shared<test_utility::executors::SpyExecutor>();
    auto runner = runner::Runner{configRAII.config, executor};

    auto request = makeRequest(inputDir / "in.txt");
    request.arguments.back() = runner::ArgumentToken::output("out.txt", true);

    auto outputs = runner.execute(request);
    CHECK_EQUAL(outputs.size(), 1u);
}

TEST(RunnerTestGroup, perExecutionDirectories) {
    configRAII.config->perExecutionDirectories = true;
    auto executor = std::make_shared<test_utility::executors::SpyExecutor>();
    auto runner = runner::Runner{configRAII.config, executor};

    auto first = runner.execute(makeRequest(inputDir / "in.txt"));
    auto second = runner.execute(makeRequest(inputDir / "in.txt"));

    auto dataDir = boost::filesystem::canonical(runner.getDataDir());
    auto expectedFirst = dataDir / (runner.getRunnerId() + "_0_tool") / "out.txt";
    auto expectedSecond = dataDir / (runner.getRunnerId() + "_1_tool") / "out.txt";
    CHECK(first.at("out.txt") == expectedFirst);
    CHECK(second.at("out.txt") == expectedSecond);

    auto secondArgs = executor->invocations.back().strings();
    CHECK(contains(secondArgs, {"-v", expectedSecond.parent_path().string() + ":/mnt/out0:rw"}));
}

TEST(RunnerTestGroup, runnerIdIsUnique) {
    auto executor = std::make_shared<test_utility::executors::SpyExecutor>();
    auto runner0 = runner::Runner{configRAII.config, executor};
    auto runner1 = runner::Runner{configRAII.config, executor};
    CHECK_EQUAL(runner0.getRunnerId().size(), 16u);
    CHECK(runner0.getRunnerId() != runner1.getRunnerId());
}

TEST(RunnerTestGroup, defaultDataDirectory) {
    configRAII.config->dataDir.clear();
    auto executor = std::make_shared<test_utility::executors::SpyExecutor>();
    auto runner = runner::Runner{configRAII.config, executor};
    CHECK(runner.getDataDir().parent_path() == boost::filesystem::temp_directory_path());
    CHECK(runner.getDataDir().filename().string().find("ferry-") == 0);
}

TEST(RunnerTestGroup, imageOverrideForPodman) {
    configRAII.config->imageOverrides["ubuntu:22.04"] = "localhost/ubuntu:patched";
    auto executor = std::make_shared<test_utility::executors::SpyExecutor>();
    auto runner = runner::Runner{configRAII.config, executor};

    runner.execute(makeRequest(inputDir / "in.txt"));

    auto args = executor->invocations.front().strings();
    CHECK(contains(args, {"localhost/ubuntu:patched", "tool"}));
}

TEST(RunnerTestGroup, apptainerQualifiesImage) {
    configRAII.config->engine = runner::Engine::Apptainer;
    auto executor = std::make_shared<test_utility::executors::SpyExecutor>();
    auto runner = runner::Runner{configRAII.config, executor};

    runner.execute(makeRequest(inputDir / "in.txt"));

    auto args = executor->invocations.front().strings();
    CHECK_EQUAL(args.front(), std::string{"apptainer"});
    CHECK(contains(args, {"-B", inputDir.string() + ":/mnt/in0:ro"}));
    CHECK(contains(args, {"--pwd", "/mnt/out0"}));
    CHECK(contains(args, {"docker://ubuntu:22.04", "tool"}));
}

TEST(RunnerTestGroup, workingDirectory) {
    auto executor = std::make_shared<test_utility::executors::SpyExecutor>();
    auto runner = runner::Runner{configRAII.config, executor};

    // host directory covered by an input mount
    auto request = makeRequest(inputDir / "in.txt");
    request.workingDirectory = inputDir;
    runner.execute(request);
    CHECK(contains(executor->invocations.back().strings(), {"-w", "/mnt/in0"}));

    // absolute path outside the mounts is used inside the container as is
    request.workingDirectory = boost::filesystem::path{"/opt/tool"};
    runner.execute(request);
    CHECK(contains(executor->invocations.back().strings(), {"-w", "/opt/tool"}));

    // relative path is relative to the output root
    request.workingDirectory = boost::filesystem::path{"work"};
    runner.execute(request);
    CHECK(contains(executor->invocations.back().strings(), {"-w", "/mnt/out0/work"}));
}

TEST(RunnerTestGroup, environment) {
    configRAII.config->environ = {{"OMP_NUM_THREADS", "4"}, {"LANG", "C"}};
    auto executor = std::make_shared<test_utility::executors::SpyExecutor>();
    auto runner = runner::Runner{configRAII.config, executor};

    auto request = makeRequest(inputDir / "in.txt");
    request.environment = {{"OMP_NUM_THREADS", "1"}};
    runner.execute(request);

    auto args = executor->invocations.front().strings();
    CHECK(contains(args, {"-e", "LANG=C", "-e", "OMP_NUM_THREADS=1"}));
    CHECK(!contains(args, {"-e", "OMP_NUM_THREADS=4"}));
}

TEST(RunnerTestGroup, engineNotFound) {
    configRAII.config->engineExecutablePath = (testDirRAII.getPath() / "bin/podman").string();
    auto runner = runner::Runner{configRAII.config};

    try {
        runner.execute(makeRequest(inputDir / "in.txt"));
        FAIL("ExecutableNotFoundError expected");
    }
    catch(const runner::ExecutableNotFoundError& error) {
        CHECK_EQUAL(error.getExecutable(), (testDirRAII.getPath() / "bin/podman").string());
    }
}

TEST(RunnerTestGroup, realEngineProcess) {
    auto engine = testDirRAII.getPath() / "bin/podman";
    auto argsFile = testDirRAII.getPath() / "args.txt";
    test_utility::filesystem::createExecutable(engine,
        "echo \"$@\" > " + argsFile.string() + "\n"
        "echo 'engine failure' >&2\n"
        "exit 125\n");
    configRAII.config->engineExecutablePath = engine.string();
    auto runner = runner::Runner{configRAII.config};

    try {
        runner.execute(makeRequest(inputDir / "in.txt"));
        FAIL("ContainerExecutionError expected");
    }
    catch(const runner::ContainerExecutionError& error) {
        CHECK_EQUAL(error.getExitCode(), 125);
        CHECK_EQUAL(error.getStandardError(), std::string{"engine failure\n"});
    }

    auto recorded = libferry::filesystem::readFile(argsFile);
    CHECK(recorded.find("run --rm") == 0);
    CHECK(recorded.find("ubuntu:22.04 tool /mnt/in0/in.txt /mnt/out0/out.txt") != std::string::npos);
}

TEST(RunnerTestGroup, inputFromPreviousExecution) {
    auto executor = std::make_shared<test_utility::executors::SpyExecutor>();
    auto runner = runner::Runner{configRAII.config, executor};
    test_utility::filesystem::createFile(runner.getDataDir() / "prev.txt", "previous output");
    auto scratch = boost::filesystem::canonical(runner.getDataDir());

    auto request = makeRequest(scratch / "prev.txt");
    request.workingDirectory = scratch;
    auto outputs = runner.execute(request);

    // the data directory is mounted once, read-write
    auto args = executor->invocations.front().strings();
    CHECK(contains(args, {"-v", scratch.string() + ":/mnt/in0:rw"}));
    CHECK(std::count(args.cbegin(), args.cend(), "-v") == 1);
    CHECK(contains(args, {"-w", "/mnt/in0"}));
    CHECK(contains(args, {"ubuntu:22.04", "tool", "/mnt/in0/prev.txt", "/mnt/in0/out.txt"}));
    CHECK(outputs.at("out.txt") == scratch / "out.txt");
}

TEST(RunnerTestGroup, containerOutputIsLogged) {
    auto engine = testDirRAII.getPath() / "bin/podman";
    test_utility::filesystem::createExecutable(engine,
        "echo 'tool says hello'\n"
        "echo 'tool warning' >&2\n"
        "exit 0\n");
    configRAII.config->engineExecutablePath = engine.string();
    libferry::Logger::getInstance().setLevel(libferry::LogLevel::INFO);

    std::ostringstream outStream;
    std::ostringstream errStream;
    auto options = runner::Runner::makeExecutorOptions(*configRAII.config, outStream, errStream);
    auto runner = runner::Runner{configRAII.config, std::make_shared<runner::SubprocessExecutor>(options)};

    runner.execute(makeRequest(inputDir / "in.txt"));

    CHECK(outStream.str().find("[Runner] [INFO] tool says hello\n") != std::string::npos);
    CHECK(errStream.str().find("[Runner] [ERROR] tool warning\n") != std::string::npos);
    CHECK(outStream.str().find("tool warning") == std::string::npos);
}

static runner::InvocationRequest makeRequestWithSharedSubdirectory(const boost::filesystem::path& input) {
    auto request = makeRequest(input);
    request.arguments.push_back(runner::ArgumentToken::output("sub/a.txt"));
    request.arguments.push_back(runner::ArgumentToken::output("sub/b.txt"));
    return request;
}

static std::vector<runner::OutputMap> executeConcurrently(runner::Runner& runner,
                                                          const runner::InvocationRequest& request,
                                                          size_t numberOfThreads) {
    auto results = std::vector<runner::OutputMap>(numberOfThreads);
    std::atomic<size_t> failures{0};
    auto threads = std::vector<std::thread>{};
    for(size_t i=0; i<numberOfThreads; ++i) {
        threads.emplace_back([&runner, &request, &results, &failures, i]() {
            try {
                results[i] = runner.execute(request);
            }
            catch(const std::exception&) {
                ++failures;
            }
        });
    }
    for(auto& thread : threads) {
        thread.join();
    }
    CHECK_EQUAL(failures.load(), 0u);
    return results;
}

TEST(RunnerTestGroup, concurrentExecutionsInSharedDirectory) {
    auto executor = std::make_shared<test_utility::executors::SpyExecutor>();
    auto runner = runner::Runner{configRAII.config, executor};

    auto results = executeConcurrently(runner, makeRequestWithSharedSubdirectory(inputDir / "in.txt"), 8);

    CHECK_EQUAL(executor->invocations.size(), 8u);
    auto scratch = boost::filesystem::canonical(runner.getDataDir());
    CHECK(boost::filesystem::is_directory(scratch / "sub"));
    for(const auto& outputs : results) {
        CHECK(outputs.at("sub/a.txt") == scratch / "sub/a.txt");
        CHECK(outputs.at("sub/b.txt") == scratch / "sub/b.txt");
    }
    // mount numbering restarts with every invocation
    for(const auto& invocation : executor->invocations) {
        auto args = invocation.strings();
        CHECK(contains(args, {"ubuntu:22.04", "tool", "/mnt/in0/in.txt", "/mnt/out0/out.txt",
                              "/mnt/out1/a.txt", "/mnt/out1/b.txt"}));
    }
}

TEST(RunnerTestGroup, concurrentExecutionsInPerExecutionDirectories) {
    configRAII.config->perExecutionDirectories = true;
    auto executor = std::make_shared<test_utility::executors::SpyExecutor>();
    auto runner = runner::Runner{configRAII.config, executor};

    auto results = executeConcurrently(runner, makeRequestWithSharedSubdirectory(inputDir / "in.txt"), 8);

    CHECK_EQUAL(executor->invocations.size(), 8u);
    auto outputRoots = std::set<boost::filesystem::path>{};
    for(const auto& outputs : results) {
        auto root = outputs.at("out.txt").parent_path();
        outputRoots.insert(root);
        CHECK(outputs.at("sub/a.txt") == root / "sub/a.txt");
        CHECK(boost::filesystem::is_directory(root / "sub"));
    }
    CHECK_EQUAL(outputRoots.size(), 8u);
}

FERRY_UNITTEST_MAIN_FUNCTION();
