/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

/**
 * @brief Filesystem utility functions to be used in the tests.
 */

#ifndef ferry_test_utility_filesystem_hpp
#define ferry_test_utility_filesystem_hpp

#include <string>

#include <boost/filesystem.hpp>

#include "libferry/PathRAII.hpp"


namespace test_utility {
namespace filesystem {

// Creates a uniquely named directory under the system's temporary directory.
// The returned path is canonical.
libferry::PathRAII makeTemporaryDirectory(const std::string& prefix);
void createFile(const boost::filesystem::path& path, const std::string& content = "");
void createExecutable(const boost::filesystem::path& path, const std::string& script);

}
}

#endif
