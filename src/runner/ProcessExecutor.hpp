/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ferry_runner_ProcessExecutor_hpp
#define ferry_runner_ProcessExecutor_hpp

#include <chrono>
#include <string>

#include "libferry/CLIArguments.hpp"


namespace ferry {
namespace runner {

struct ExecutionResult {
    int exitCode = 0;
    std::string standardOutput;
    std::string standardError;
    libferry::CLIArguments argv;
    bool cancelled = false; // terminated because of a timeout
    std::chrono::milliseconds elapsed{0};
};

/**
 * Runs the container engine. Implementations block until the process terminated
 * and report a nonzero exit through the result, never as an error.
 */
class ProcessExecutor {
public:
    virtual ~ProcessExecutor() = default;
    virtual ExecutionResult run(const libferry::CLIArguments& argv) = 0;
};

}
}

#endif
