/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libferry_utility_filesystem_hpp
#define libferry_utility_filesystem_hpp

#include <string>
#include <ios>

#include <boost/filesystem.hpp>

/**
 * Utility functions for filesystem manipulation and investigation
 */

namespace libferry {
namespace filesystem {

void createFoldersIfNecessary(const boost::filesystem::path&);
void createFileIfNecessary(const boost::filesystem::path&);
std::string readFile(const boost::filesystem::path& path);
void writeTextFile(const std::string& text,
                   const boost::filesystem::path& filename,
                   const std::ios_base::openmode mode = std::ios_base::out);
boost::filesystem::path makeUniquePathWithRandomSuffix(const boost::filesystem::path&);
bool isSymlink(const boost::filesystem::path& path);
bool isExecutableFile(const boost::filesystem::path& path);
bool isPathPrefix(const boost::filesystem::path& prefix, const boost::filesystem::path& path);

}}

#endif
