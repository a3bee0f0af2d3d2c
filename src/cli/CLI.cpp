/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "cli/CLI.hpp"

#include <iostream>
#include <string>
#include <tuple>

#include <boost/format.hpp>

#include "libferry/Error.hpp"
#include "libferry/Logger.hpp"
#include "cli/CommandObjectsFactory.hpp"
#include "cli/Utility.hpp"


namespace ferry {
namespace cli {

CLI::CLI() {
    optionsDescription.add_options()
        ("help", "Print help")
        ("version", "Print version information and quit")
        ("debug", "Enable debug mode (print all log messages with DEBUG level or higher)")
        ("verbose", "Enable verbose mode (print all log messages with INFO level or higher)");
}

std::unique_ptr<cli::Command> CLI::parseCommandLine(const libferry::CLIArguments& args, std::shared_ptr<const Context> context) const {
    libferry::CLIArguments nameAndOptionArgs, positionalArgs;
    std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);
    boost::program_options::variables_map values;
    auto factory = cli::CommandObjectsFactory{};
    auto& logger = libferry::Logger::getInstance();

    try {
        boost::program_options::store(
            boost::program_options::command_line_parser(nameAndOptionArgs.argc(), nameAndOptionArgs.argv())
                .options(optionsDescription)
                .style(boost::program_options::command_line_style::unix_style)
                .run(), values);
        boost::program_options::notify(values);
    }
    catch (const std::exception& e) {
        auto message = boost::format("%s\nSee 'ferry help'") % e.what();
        logger.log(message, "CLI", libferry::LogLevel::GENERAL, std::cerr);
        FERRY_THROW_ERROR(message.str(), libferry::LogLevel::INFO);
    }

    if(values.count("debug")) {
        logger.setLevel(libferry::LogLevel::DEBUG);
    }
    else if(values.count("verbose")) {
        logger.setLevel(libferry::LogLevel::INFO);
    }
    else {
        logger.setLevel(libferry::LogLevel::WARN);
    }

    // --help and --version override other arguments and options
    if(values.count("help")) {
        return factory.makeCommandObject("help", libferry::CLIArguments{}, std::move(context));
    }
    if(values.count("version")) {
        return factory.makeCommandObject("version", libferry::CLIArguments{}, std::move(context));
    }

    if(positionalArgs.empty()) {
        return factory.makeCommandObject("help");
    }

    auto commandName = std::string{positionalArgs.argv()[0]};

    bool isCommandHelpFollowedByAnArgument = commandName == "help" && positionalArgs.argc() > 1;
    if(isCommandHelpFollowedByAnArgument) {
        return parseCommandHelpOfCommand(positionalArgs);
    }

    return factory.makeCommandObject(commandName, positionalArgs, std::move(context));
}

const boost::program_options::options_description& CLI::getOptionsDescription() const {
    return optionsDescription;
}

std::unique_ptr<cli::Command> CLI::parseCommandHelpOfCommand(const libferry::CLIArguments& args) const {
    auto optionsDescription = boost::program_options::options_description();
    libferry::CLIArguments nameAndOptionArgs, positionalArgs;
    std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);
    if(nameAndOptionArgs.argc() > 1) {
        auto message = boost::format("Command 'help' doesn't support options");
        cli::utility::printLog(message, libferry::LogLevel::GENERAL, std::cerr);
        FERRY_THROW_ERROR(message.str(), libferry::LogLevel::INFO);
    }
    if(positionalArgs.argc() > 1) {
        auto message = boost::format("Too many arguments for command 'help'"
                                     "\nSee 'ferry help help'");
        cli::utility::printLog(message, libferry::LogLevel::GENERAL, std::cerr);
        FERRY_THROW_ERROR(message.str(), libferry::LogLevel::INFO);
    }
    auto factory = cli::CommandObjectsFactory{};
    return factory.makeCommandObjectHelpOfCommand(positionalArgs.argv()[0]);
}

}
}
