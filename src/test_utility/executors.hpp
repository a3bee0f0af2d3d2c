/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

/**
 * @brief Process executors to be used in the tests in place of a container engine.
 */

#ifndef ferry_test_utility_executors_hpp
#define ferry_test_utility_executors_hpp

#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "libferry/CLIArguments.hpp"
#include "runner/ProcessExecutor.hpp"


namespace test_utility {
namespace executors {

// Records the command lines it is asked to run and returns a canned result.
// The optional action simulates the tool, e.g. writing its output files.
// Safe to share between concurrent invocations.
class SpyExecutor : public ferry::runner::ProcessExecutor {
public:
    using Action = std::function<void(const libferry::CLIArguments&)>;

    SpyExecutor(int exitCode = 0, Action action = Action{})
        : exitCode{exitCode}
        , action{std::move(action)}
    {}

    ferry::runner::ExecutionResult run(const libferry::CLIArguments& argv) override {
        {
            std::lock_guard<std::mutex> lock{mutex};
            invocations.push_back(argv);
        }
        if(action) {
            action(argv);
        }
        auto result = ferry::runner::ExecutionResult{};
        result.exitCode = exitCode;
        result.standardOutput = standardOutput;
        result.standardError = standardError;
        result.argv = argv;
        result.cancelled = cancelled;
        return result;
    }

public:
    int exitCode;
    Action action;
    std::string standardOutput;
    std::string standardError;
    bool cancelled = false;
    std::vector<libferry::CLIArguments> invocations;

private:
    std::mutex mutex;
};

}
}

#endif
