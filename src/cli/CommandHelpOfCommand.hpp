/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ferry_cli_CommandHelpOfCommand_hpp
#define ferry_cli_CommandHelpOfCommand_hpp

#include <memory>

#include "libferry/Error.hpp"
#include "cli/Command.hpp"

namespace ferry {
namespace cli {

class CommandHelpOfCommand : public Command {
public:
    CommandHelpOfCommand(std::unique_ptr<cli::Command> command)
        : command(std::move(command))
    {}

    void execute() override {
        command->printHelpMessage();
    }

    std::string getBriefDescription() const override {
        FERRY_THROW_ERROR("Help of a command has no brief description of its own");
    }

    void printHelpMessage() const override {
        FERRY_THROW_ERROR("Help of a command has no help message of its own");
    }

    const cli::Command& getCommand() const { return *command; }

private:
    std::unique_ptr<cli::Command> command;
};

}
}

#endif
