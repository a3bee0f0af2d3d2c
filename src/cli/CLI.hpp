/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ferry_cli_CLI_hpp
#define ferry_cli_CLI_hpp

#include <memory>

#include <boost/program_options.hpp>

#include "libferry/CLIArguments.hpp"
#include "cli/Command.hpp"


namespace ferry {
namespace cli {

class CLI {
public:
    CLI();
    std::unique_ptr<cli::Command> parseCommandLine(const libferry::CLIArguments&, std::shared_ptr<const Context>) const;

// these methods are public for test purpose
public:
    const boost::program_options::options_description& getOptionsDescription() const;

private:
    std::unique_ptr<cli::Command> parseCommandHelpOfCommand(const libferry::CLIArguments&) const;

private:
    boost::program_options::options_description optionsDescription{"Options"};
};

}
}

#endif
