/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ferry_cli_Utility_hpp
#define ferry_cli_Utility_hpp

#include <iostream>
#include <map>
#include <ostream>
#include <string>
#include <tuple>
#include <vector>

#include <boost/format.hpp>
#include <boost/program_options.hpp>
#include <rapidjson/document.h>

#include "libferry/CLIArguments.hpp"
#include "libferry/LogLevel.hpp"
#include "runner/Runner.hpp"

namespace ferry {
namespace cli {
namespace utility {

std::tuple<libferry::CLIArguments, libferry::CLIArguments> groupOptionsAndPositionalArguments(
        const libferry::CLIArguments&,
        const boost::program_options::options_description& optionsDescription);

void validateNumberOfPositionalArguments(const libferry::CLIArguments& positionalArgs,
        const int min, const int max, const std::string& command);

std::map<std::string, std::string> parseKeyValueOptions(const std::vector<std::string>& options,
                                                        const std::string& optionName);

rapidjson::Document makeOutputsJSON(const runner::OutputMap&);

void printHelpMessage(std::ostream&,
                      const std::string& usage,
                      const std::string& description,
                      const boost::program_options::options_description& optionsDescription
                        = boost::program_options::options_description{});

void printLog(  const std::string& message, libferry::LogLevel LogLevel,
                std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr);

void printLog(  const boost::format& message, libferry::LogLevel LogLevel,
                std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr);

}
}
}

#endif
