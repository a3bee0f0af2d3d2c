/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "cli/Utility.hpp"

#include <cstring>

#include "libferry/Error.hpp"
#include "libferry/Logger.hpp"
#include "libferry/utility/string.hpp"


namespace ferry {
namespace cli {
namespace utility {

static bool hasDashPrefix(const char* s) {
    return strlen(s) > 1 && s[0]=='-' && s[1]!='-';
}

static bool hasDashDashPrefix(const char* s) {
    return strlen(s) > 2 && s[0]=='-' && s[1]=='-' && s[2]!='-';
}

static bool isOption(const char* s) {
    return hasDashPrefix(s) || hasDashDashPrefix(s);
}

static bool optionTakesValue(const boost::program_options::option_description* option) {
    return option->semantic()->max_tokens() > 0;
}

// Appends the option token and, if the next token is not an option, its value
static libferry::CLIArguments::const_iterator appendOptionWithValue(libferry::CLIArguments::const_iterator arg,
        libferry::CLIArguments::const_iterator argsEnd, libferry::CLIArguments& group) {
    group.push_back(*arg);

    auto nextArg = arg+1;
    if(nextArg != argsEnd && !hasDashPrefix(*nextArg)) {
        group.push_back(*nextArg);
        ++arg;
    }
    return arg;
}

static libferry::CLIArguments::const_iterator processLongOption(libferry::CLIArguments::const_iterator arg,
        libferry::CLIArguments::const_iterator argsEnd, libferry::CLIArguments& group,
        const boost::program_options::options_description& optionsDescription) {
    auto argString = std::string{*arg};

    // adjacent style, e.g. --engine=apptainer
    if(argString.find('=') != std::string::npos) {
        group.push_back(argString);
        return arg;
    }

    // unknown options are left to boost::program_options to report
    auto option = optionsDescription.find_nothrow(argString.substr(2), false);
    if(option && optionTakesValue(option)) {
        return appendOptionWithValue(arg, argsEnd, group);
    }
    group.push_back(*arg);
    return arg;
}

static libferry::CLIArguments::const_iterator processShortOptions(libferry::CLIArguments::const_iterator arg,
        libferry::CLIArguments::const_iterator argsEnd, libferry::CLIArguments& group,
        const boost::program_options::options_description& optionsDescription) {
    auto letters = std::string{*arg}.substr(1);

    for(auto it = letters.cbegin(); it != letters.cend(); ++it) {
        auto option = optionsDescription.find_nothrow(std::string{"-"} + *it, false);
        bool isLastLetter = it+1 == letters.cend();

        if(!option) {
            group.push_back(*arg);
            break;
        }
        if(optionTakesValue(option)) {
            // "-eKEY=VALUE" carries its value, "-e KEY=VALUE" takes the next token
            if(isLastLetter) {
                return appendOptionWithValue(arg, argsEnd, group);
            }
            group.push_back(*arg);
            break;
        }
        if(isLastLetter) {
            group.push_back(*arg);
        }
    }

    return arg;
}

/**
 * Splits the CLI arguments into two groups.
 *
 * The first group contains the program or command name followed by its options and
 * their values, ready to be processed by boost::program_options.
 * The second group contains everything from the first positional argument onwards,
 * e.g. a command name followed by the command's own options.
 *
 * E.g. "ferry --verbose run --engine apptainer request.json" is split into
 * "ferry --verbose" and "run --engine apptainer request.json".
 */
std::tuple<libferry::CLIArguments, libferry::CLIArguments> groupOptionsAndPositionalArguments(
        const libferry::CLIArguments& args,
        const boost::program_options::options_description& optionsDescription) {

    libferry::CLIArguments nameAndOptionArgs, positionalArgs;

    if(args.argc() == 0) {
        return std::tuple<libferry::CLIArguments, libferry::CLIArguments>{nameAndOptionArgs, positionalArgs};
    }

    if(isOption(args.argv()[0])) {
        auto message = boost::format("Expected a program or command name as first CLI argument, got '%s'")
            % args.argv()[0];
        FERRY_THROW_ERROR(message.str());
    }
    nameAndOptionArgs.push_back(args.argv()[0]);

    for(auto arg = args.begin()+1; arg != args.end(); ++arg) {
        if(!isOption(*arg)) {
            positionalArgs = libferry::CLIArguments{arg, args.end()};
            break;
        }

        if(hasDashDashPrefix(*arg)) {
            arg = processLongOption(arg, args.end(), nameAndOptionArgs, optionsDescription);
        }
        else {
            arg = processShortOptions(arg, args.end(), nameAndOptionArgs, optionsDescription);
        }
    }

    return std::tuple<libferry::CLIArguments, libferry::CLIArguments>{nameAndOptionArgs, positionalArgs};
}

void validateNumberOfPositionalArguments(const libferry::CLIArguments& positionalArgs, const int min, const int max,
        const std::string& command) {
    auto numberOfArguments = positionalArgs.argc();
    if(numberOfArguments < min || numberOfArguments > max) {
        auto quantity = numberOfArguments < min ? std::string("few") : std::string("many");
        auto message = boost::format("Too %s arguments for command '%s'\n"
                                     "See 'ferry help %s'") % quantity % command % command;
        printLog(message, libferry::LogLevel::GENERAL, std::cerr);
        FERRY_THROW_ERROR(message.str(), libferry::LogLevel::INFO);
    }
}

/**
 * Parses repeated "KEY=VALUE" option values. A later occurrence of a key
 * overrides an earlier one.
 */
std::map<std::string, std::string> parseKeyValueOptions(const std::vector<std::string>& options,
                                                        const std::string& optionName) {
    auto values = std::map<std::string, std::string>{};
    for(const auto& option : options) {
        if(option.find('=') == std::string::npos) {
            auto message = boost::format("Invalid value '%s' for option '--%s': expected KEY=VALUE")
                % option % optionName;
            printLog(message, libferry::LogLevel::GENERAL, std::cerr);
            FERRY_THROW_ERROR(message.str(), libferry::LogLevel::INFO);
        }
        try {
            auto pair = libferry::string::parseKeyValuePair(option);
            values[pair.first] = pair.second;
        }
        catch(libferry::Error& e) {
            auto message = boost::format("Invalid value '%s' for option '--%s'") % option % optionName;
            printLog(message, libferry::LogLevel::GENERAL, std::cerr);
            FERRY_RETHROW_ERROR(e, message.str(), libferry::LogLevel::INFO);
        }
    }
    return values;
}

rapidjson::Document makeOutputsJSON(const runner::OutputMap& outputs) {
    auto json = rapidjson::Document{};
    json.SetObject();
    auto& allocator = json.GetAllocator();
    for(const auto& output : outputs) {
        json.AddMember(rapidjson::Value{output.first.c_str(), allocator},
                       rapidjson::Value{output.second.string().c_str(), allocator},
                       allocator);
    }
    return json;
}

void printHelpMessage(std::ostream& os,
                      const std::string& usage,
                      const std::string& description,
                      const boost::program_options::options_description& optionsDescription) {
    os  << "Usage: " << usage << "\n"
        << "\n"
        << description << "\n";
    if(!optionsDescription.options().empty()) {
        os << "\n" << optionsDescription;
    }
}

void printLog(const std::string& message, libferry::LogLevel LogLevel, std::ostream& outStream, std::ostream& errStream) {
    auto systemName = "CLI";
    libferry::Logger::getInstance().log(message, systemName, LogLevel, outStream, errStream);
}

void printLog(const boost::format& message, libferry::LogLevel LogLevel, std::ostream& outStream, std::ostream& errStream) {
    printLog(message.str(), LogLevel, outStream, errStream);
}

}
}
}
