/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "PathRAII.hpp"
#include "Error.hpp"
#include "libferry/utility/filesystem.hpp"

namespace libferry {

PathRAII::PathRAII(const boost::filesystem::path& path)
    : path{path}
{}

PathRAII::PathRAII(PathRAII&& rhs)
    : path{std::move(rhs.path)}
{
    rhs.release();
}

PathRAII& PathRAII::operator=(PathRAII&& rhs) {
    path = std::move(rhs.path);
    rhs.release();
    return *this;
}

PathRAII::~PathRAII() {
    auto ec = boost::system::error_code{};
    if(path && boost::filesystem::exists(*path, ec)) {
        // Containers started with a user namespace may leave behind files
        // without owner write or search permissions in the output folders
        setFilesAsRemovableByOwner();
        boost::filesystem::remove_all(*path, ec);
    }
}

const boost::filesystem::path& PathRAII::getPath() const {
    return path.value();
}

void PathRAII::release() {
    path.reset();
}

void PathRAII::setFilesAsRemovableByOwner() const {
    auto requiredPermissions = boost::filesystem::perms::owner_write | boost::filesystem::perms::owner_exe;
    auto ec = boost::system::error_code{};
    boost::filesystem::permissions(*path, boost::filesystem::perms::add_perms | requiredPermissions, ec);

    if (boost::filesystem::is_regular_file(*path, ec)) {
        return;
    }

    auto it = boost::filesystem::recursive_directory_iterator(*path, ec);
    for (; !ec && it != boost::filesystem::recursive_directory_iterator{}; it.increment(ec)) {
        if (!libferry::filesystem::isSymlink(it->path())) {
            boost::filesystem::permissions(it->path(), boost::filesystem::perms::add_perms | requiredPermissions, ec);
        }
    }
}

}
