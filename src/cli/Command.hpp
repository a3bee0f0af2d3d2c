/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ferry_cli_Command_hpp
#define ferry_cli_Command_hpp

#include <string>

#include <boost/filesystem.hpp>

namespace ferry {
namespace cli {

// Installation-dependent settings shared by all commands
struct Context {
    boost::filesystem::path schemaDirectory;
};

class Command {
public:
    virtual ~Command() {}
    virtual void execute() = 0;
    virtual std::string getBriefDescription() const = 0;
    virtual void printHelpMessage() const = 0;
};

}
}

#endif
