/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ferry_cli_CommandHelp_hpp
#define ferry_cli_CommandHelp_hpp

#include <algorithm>
#include <iostream>
#include <memory>

#include "libferry/CLIArguments.hpp"
#include "libferry/Error.hpp"
#include "cli/CLI.hpp"
#include "cli/Command.hpp"
#include "cli/CommandObjectsFactory.hpp"
#include "cli/Utility.hpp"

namespace ferry {
namespace cli {

class CommandHelp : public Command {
public:
    CommandHelp() = default;

    CommandHelp(const libferry::CLIArguments& args, std::shared_ptr<const Context>) {
        if(args.argc() > 1) {
            auto message = boost::format("Command 'help' doesn't support options");
            cli::utility::printLog(message, libferry::LogLevel::GENERAL, std::cerr);
            FERRY_THROW_ERROR(message.str(), libferry::LogLevel::INFO);
        }
    }

    void execute() override {
        std::cout
        << "Usage: ferry COMMAND\n"
        << "\n"
        << cli::CLI{}.getOptionsDescription()
        << "\n"
        << "Commands:\n";

        auto factory = CommandObjectsFactory{};
        auto commandNames = factory.getCommandNames();
        std::sort(commandNames.begin(), commandNames.end());
        for(const auto& name : commandNames) {
            auto description = factory.makeCommandObject(name)->getBriefDescription();
            std::cout << "   " << name << ": " << description << "\n";
        }
    }

    std::string getBriefDescription() const override {
        return "Print help message about a command";
    }

    void printHelpMessage() const override {
        cli::utility::printHelpMessage(std::cout, "ferry help [COMMAND]", getBriefDescription());
    }
};

}
}

#endif
