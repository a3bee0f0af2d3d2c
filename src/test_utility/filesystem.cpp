/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "filesystem.hpp"

#include "libferry/utility/filesystem.hpp"


namespace test_utility {
namespace filesystem {

libferry::PathRAII makeTemporaryDirectory(const std::string& prefix) {
    auto path = libferry::filesystem::makeUniquePathWithRandomSuffix(boost::filesystem::temp_directory_path() / prefix);
    libferry::filesystem::createFoldersIfNecessary(path);
    return libferry::PathRAII{boost::filesystem::canonical(path)};
}

void createFile(const boost::filesystem::path& path, const std::string& content) {
    libferry::filesystem::createFoldersIfNecessary(path.parent_path());
    libferry::filesystem::writeTextFile(content, path);
}

void createExecutable(const boost::filesystem::path& path, const std::string& script) {
    createFile(path, "#!/bin/sh\n" + script + "\n");
    boost::filesystem::permissions(path, boost::filesystem::owner_all
                                       | boost::filesystem::group_read | boost::filesystem::group_exe
                                       | boost::filesystem::others_read | boost::filesystem::others_exe);
}

}
}
