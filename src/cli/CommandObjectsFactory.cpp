/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "cli/CommandObjectsFactory.hpp"

#include <boost/format.hpp>

#include "libferry/Error.hpp"
#include "libferry/Logger.hpp"
#include "cli/CommandHelp.hpp"
#include "cli/CommandHelpOfCommand.hpp"
#include "cli/CommandRun.hpp"
#include "cli/CommandVersion.hpp"


namespace ferry {
namespace cli {

CommandObjectsFactory::CommandObjectsFactory() {
    addCommand<cli::CommandHelp>("help");
    addCommand<cli::CommandRun>("run");
    addCommand<cli::CommandVersion>("version");
}

bool CommandObjectsFactory::isValidCommandName(const std::string& commandName) const {
    return map.find(commandName) != map.cend();
}

std::vector<std::string> CommandObjectsFactory::getCommandNames() const {
    auto names = std::vector<std::string>{};
    names.reserve(map.size());
    for(const auto& kv : map) {
        names.push_back(kv.first);
    }
    return names;
}

std::unique_ptr<cli::Command> CommandObjectsFactory::makeCommandObject(const std::string& commandName) const {
    checkCommandName(commandName);
    return map.at(commandName)();
}

std::unique_ptr<cli::Command> CommandObjectsFactory::makeCommandObject(
    const std::string& commandName,
    const libferry::CLIArguments& commandArgs,
    std::shared_ptr<const Context> context) const {
    checkCommandName(commandName);
    return mapWithArguments.at(commandName)(commandArgs, std::move(context));
}

std::unique_ptr<cli::Command> CommandObjectsFactory::makeCommandObjectHelpOfCommand(const std::string& commandName) const {
    auto commandObject = makeCommandObject(commandName);
    return std::unique_ptr<cli::Command>{new cli::CommandHelpOfCommand{std::move(commandObject)}};
}

void CommandObjectsFactory::checkCommandName(const std::string& commandName) const {
    if(!isValidCommandName(commandName)) {
        auto message = boost::format("'%s' is not a Ferry command\nSee 'ferry help'") % commandName;
        libferry::Logger::getInstance().log(message, "CommandObjectsFactory", libferry::LogLevel::GENERAL, std::cerr);
        FERRY_THROW_ERROR(message.str(), libferry::LogLevel::DEBUG);
    }
}

}
}
