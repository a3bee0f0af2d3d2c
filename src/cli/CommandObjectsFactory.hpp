/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ferry_cli_CommandObjectsFactory_hpp
#define ferry_cli_CommandObjectsFactory_hpp

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "libferry/CLIArguments.hpp"
#include "cli/Command.hpp"


namespace ferry {
namespace cli {

class CommandObjectsFactory {
public:
    CommandObjectsFactory();

    template<class CommandType>
    void addCommand(const std::string& commandName) {
        map[commandName] = []() {
            return std::unique_ptr<cli::Command>{new CommandType{}};
        };
        mapWithArguments[commandName] = [](const libferry::CLIArguments& commandArgs, std::shared_ptr<const Context> context) {
            return std::unique_ptr<cli::Command>{new CommandType{commandArgs, std::move(context)}};
        };
    }

    bool isValidCommandName(const std::string& commandName) const;
    std::vector<std::string> getCommandNames() const;
    std::unique_ptr<cli::Command> makeCommandObject(const std::string& commandName) const;
    std::unique_ptr<cli::Command> makeCommandObject(const std::string& commandName,
                                                    const libferry::CLIArguments& commandArgs,
                                                    std::shared_ptr<const Context> context) const;
    std::unique_ptr<cli::Command> makeCommandObjectHelpOfCommand(const std::string& commandName) const;

private:
    void checkCommandName(const std::string& commandName) const;

private:
    std::unordered_map<std::string, std::function<std::unique_ptr<cli::Command>()>> map;
    std::unordered_map<std::string, std::function<std::unique_ptr<cli::Command>(
        const libferry::CLIArguments&,
        std::shared_ptr<const Context>)>> mapWithArguments;
};

}
}

#endif
