/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libferry_utility_string_hpp
#define libferry_utility_string_hpp

#include <string>
#include <tuple>
#include <sys/types.h>

/**
 * Utility functions for string manipulation
 */

namespace libferry {
namespace string {

std::string removeWhitespaces(const std::string&);
std::pair<std::string, std::string> parseKeyValuePair(const std::string& pairString, const char separator = '=');
std::string generateRandom(size_t size);

}}

#endif
