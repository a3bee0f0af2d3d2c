/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <clocale>
#include <exception>
#include <memory>

#include <boost/filesystem.hpp>
#include <boost/format.hpp>

#include "libferry/CLIArguments.hpp"
#include "libferry/Error.hpp"
#include "libferry/Logger.hpp"
#include "cli/CLI.hpp"
#include "runner/Errors.hpp"

using namespace ferry;

// Exit statuses are 8-bit: anything out of range is reported as a generic failure
static int toExitStatus(int exitCode) {
    return exitCode > 0 && exitCode < 256 ? exitCode : 1;
}

int main(int argc, char* argv[]) {
    std::setlocale(LC_CTYPE, "C.UTF-8"); // enable handling of non-ascii characters

    auto& logger = libferry::Logger::getInstance();

    try {
        auto ferryInstallationPrefixDir = boost::filesystem::canonical("/proc/self/exe").parent_path().parent_path();
        auto context = std::make_shared<cli::Context>();
        context->schemaDirectory = ferryInstallationPrefixDir / "etc";

        auto args = libferry::CLIArguments(argc, argv);
        auto command = cli::CLI{}.parseCommandLine(args, context);
        command->execute();
    }
    catch(const runner::ContainerExecutionError& e) {
        logger.logErrorTrace(e, "main");
        return toExitStatus(e.getExitCode());
    }
    catch(const libferry::Error& e) {
        logger.logErrorTrace(e, "main");
        return 1;
    }
    catch(const std::exception& e) {
        auto message = boost::format("Caught exception in main function. No error trace available."
                                     " Exception message: %s") % e.what();
        logger.log(message.str(), "main", libferry::LogLevel::ERROR);
        return 1;
    }

    return 0;
}
