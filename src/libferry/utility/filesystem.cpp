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

#include <algorithm>
#include <fstream>
#include <iterator>
#include <vector>
#include <unistd.h>
#include <sys/stat.h>

#include <boost/format.hpp>

#include "libferry/Error.hpp"
#include "libferry/utility/logging.hpp"
#include "libferry/utility/string.hpp"

/**
 * Utility functions for filesystem manipulation
 */

namespace libferry {
namespace filesystem {

void createFoldersIfNecessary(const boost::filesystem::path& path) {
    auto currentPath = boost::filesystem::path("");

    if(!boost::filesystem::exists(path)) {
        logMessage(boost::format{"Creating directory %s"} % path, LogLevel::DEBUG);
    }

    for(const auto& element : path) {
        currentPath /= element;
        if(!boost::filesystem::exists(currentPath)) {
            bool created = false;
            try {
                created = boost::filesystem::create_directory(currentPath);
            } catch(const std::exception& e) {
                // another process or thread could have concurrently created the same directory
                if(boost::filesystem::is_directory(currentPath)) {
                    continue;
                }
                auto message = boost::format("Failed to create directory %s") % currentPath;
                FERRY_RETHROW_ERROR(e, message.str());
            }
            if(!created) {
                // the creation might have failed because another process concurrently
                // created the same directory. So check whether the directory was indeed
                // created by another process.
                if(!boost::filesystem::is_directory(currentPath)) {
                    auto message = boost::format("Failed to create directory %s") % currentPath;
                    FERRY_THROW_ERROR(message.str());
                }
            }
        }
    }
}

void createFileIfNecessary(const boost::filesystem::path& path) {
    // NOTE: Broken symlinks will NOT be recognized as existing and hence will be overridden.
    if(boost::filesystem::exists(path)){
        logMessage(boost::format{"File %s already exists"} % path, LogLevel::DEBUG);
        return;
    }

    logMessage(boost::format{"Creating file %s"} % path, LogLevel::DEBUG);
    if(!path.parent_path().empty() && !boost::filesystem::exists(path.parent_path())) {
        createFoldersIfNecessary(path.parent_path());
    }
    std::ofstream of(path.c_str());
    if(!of.is_open()) {
        auto message = boost::format("Failed to create file %s") % path;
        FERRY_THROW_ERROR(message.str());
    }
}

std::string readFile(const boost::filesystem::path& path) {
    std::ifstream ifs(path.string());
    if(!ifs) {
        auto message = boost::format("Failed to open std::ifstream for %s") % path;
        FERRY_THROW_ERROR(message.str());
    }
    auto s = std::string(   std::istreambuf_iterator<char>(ifs),
                            std::istreambuf_iterator<char>());
    return s;
}

void writeTextFile(const std::string& text, const boost::filesystem::path& filename, const std::ios_base::openmode mode) {
    try {
        if(!filename.parent_path().empty()) {
            createFoldersIfNecessary(filename.parent_path());
        }
        auto ofs = std::ofstream{filename.string(), mode};
        if (!ofs) {
            auto message = boost::format("Failed to open std::ofstream for %s") % filename;
            FERRY_THROW_ERROR(message.str());
        }
        ofs << text;
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to write text file %s") % filename;
        FERRY_RETHROW_ERROR(e, message.str());
    }
}

/**
 * Generates a random suffix and append it to the given path. If the generated random
 * path exists, tries again with another suffix until the operation succeedes.
 *
 * Note: boost::filesystem::unique_path offers a similar functionality. However, it
 * fails (throws exception) when the locale configuration is invalid. More specifically,
 * we experienced the problem when LC_CTYPE was set to UTF-8 and the locale UTF-8 was not
 * installed.
 */
boost::filesystem::path makeUniquePathWithRandomSuffix(const boost::filesystem::path& path) {
    auto uniquePath = std::string{};

    do {
        const size_t sizeOfRandomSuffix = 16;
        uniquePath = path.string() + "-" + string::generateRandom(sizeOfRandomSuffix);
    } while(boost::filesystem::exists(uniquePath));

    return uniquePath;
}

bool isSymlink(const boost::filesystem::path& path) {
    struct stat sb;
    if (lstat(path.c_str(), &sb) != 0) {
        return false;
    }
    return S_ISLNK(sb.st_mode);
}

bool isExecutableFile(const boost::filesystem::path& path) {
    struct stat sb;
    if (stat(path.c_str(), &sb) != 0) {
        return false;
    }
    return S_ISREG(sb.st_mode) && access(path.c_str(), X_OK) == 0;
}

static std::vector<std::string> getPathElements(const boost::filesystem::path& path) {
    auto elements = std::vector<std::string>{};
    for(const auto& element : path.lexically_normal()) {
        if(element != ".") {
            elements.push_back(element.string());
        }
    }
    return elements;
}

/**
 * Element-wise prefix check, e.g. "/a/b" is a prefix of "/a/b/c" and of "/a/b",
 * but not of "/a/bc".
 */
bool isPathPrefix(const boost::filesystem::path& prefix, const boost::filesystem::path& path) {
    auto prefixElements = getPathElements(prefix);
    auto pathElements = getPathElements(path);
    if(prefixElements.size() > pathElements.size()) {
        return false;
    }
    return std::equal(prefixElements.cbegin(), prefixElements.cend(), pathElements.cbegin());
}

}}
