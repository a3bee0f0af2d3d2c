/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ferry_test_utilities_unittest_main_function_hpp
#define ferry_test_utilities_unittest_main_function_hpp

#include "libferry/Error.hpp"
#include "libferry/Logger.hpp"

// WATCH OUT!
// boost libraries must be included before CppUTest, so in order to be
// on the safe side include this file as the last header file in the test code
#include <CppUTest/CommandLineTestRunner.h>
#include <CppUTest/MemoryLeakWarningPlugin.h>


#define FERRY_UNITTEST_MAIN_FUNCTION() \
int main(int argc, char **argv) { \
    /* singletons and library caches outlive the single tests */ \
    MemoryLeakWarningPlugin::turnOffNewDeleteOverloads(); \
    try { \
        return CommandLineTestRunner::RunAllTests(argc, argv); \
    } \
    catch(const libferry::Error& e) { \
        libferry::Logger::getInstance().logErrorTrace(e, "test"); \
        throw; \
    } \
}

#endif
