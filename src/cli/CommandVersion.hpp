/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ferry_cli_CommandVersion_hpp
#define ferry_cli_CommandVersion_hpp

#include <iostream>
#include <memory>

#include "libferry/CLIArguments.hpp"
#include "libferry/Logger.hpp"
#include "cli/Command.hpp"
#include "cli/Utility.hpp"


namespace ferry {
namespace cli {

class CommandVersion : public Command {
public:
    CommandVersion() = default;

    CommandVersion(const libferry::CLIArguments& args, std::shared_ptr<const Context>) {
        parseCommandArguments(args);
    }

    void execute() override {
        libferry::Logger::getInstance().log(FERRY_VERSION, "CommandVersion", libferry::LogLevel::GENERAL);
    }

    std::string getBriefDescription() const override {
        return "Show the Ferry version information";
    }

    void printHelpMessage() const override {
        cli::utility::printHelpMessage(std::cout, "ferry version", getBriefDescription());
    }

private:
    void parseCommandArguments(const libferry::CLIArguments& args) {
        auto optionsDescription = boost::program_options::options_description();
        libferry::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);

        cli::utility::validateNumberOfPositionalArguments(positionalArgs, 0, 0, "version");

        if(nameAndOptionArgs.argc() > 1) {
            auto message = boost::format("Command 'version' doesn't support options"
                                         "\nSee 'ferry help version'");
            cli::utility::printLog(message, libferry::LogLevel::GENERAL, std::cerr);
            FERRY_THROW_ERROR(message.str(), libferry::LogLevel::INFO);
        }
    }
};

}
}

#endif
