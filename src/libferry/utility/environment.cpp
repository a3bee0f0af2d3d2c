/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "environment.hpp"

#include <boost/format.hpp>

#include "libferry/Error.hpp"
#include "libferry/utility/string.hpp"

/**
 * Utility functions for environment variables
 */

namespace libferry {
namespace environment {

std::unordered_map<std::string, std::string> parseVariables(char** env) {
    auto map = std::unordered_map<std::string, std::string>{};
    for(size_t i=0; env[i] != nullptr; ++i) {
        std::string key, value;
        std::tie(key, value) = parseVariable(env[i]);
        map[key] = value;
    }
    return map;
}

std::pair<std::string, std::string> parseVariable(const std::string& variable) {
    std::pair<std::string, std::string> kvPair;
    try {
        kvPair = string::parseKeyValuePair(variable);
    }
    catch(libferry::Error& e) {
        auto message = boost::format("Failed to parse environment variable: %s") % e.what();
        FERRY_RETHROW_ERROR(e, message.str());
    }
    return kvPair;
}

}}
