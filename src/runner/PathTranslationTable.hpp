/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ferry_runner_PathTranslationTable_hpp
#define ferry_runner_PathTranslationTable_hpp

#include <vector>

#include <boost/optional.hpp>
#include <boost/filesystem.hpp>

#include "runner/MountEntry.hpp"


namespace ferry {
namespace runner {

/**
 * Bidirectional lookup between host paths and container paths, built once per
 * invocation from its mount set.
 *
 * Both directions resolve against the mount with the longest matching prefix,
 * so that nested mounts take precedence over the mounts containing them.
 * Host paths are canonicalized (as far as they exist) before the lookup.
 */
class PathTranslationTable {
public:
    PathTranslationTable() = default;
    explicit PathTranslationTable(const std::vector<MountEntry>& mounts);

    boost::optional<boost::filesystem::path> toContainer(const boost::filesystem::path& hostPath) const;
    boost::optional<boost::filesystem::path> toHost(const boost::filesystem::path& containerPath) const;

    const std::vector<MountEntry>& getMounts() const { return mounts; }

private:
    using PathMember = boost::filesystem::path MountEntry::*;
    boost::optional<boost::filesystem::path> translate(const boost::filesystem::path& path,
                                                       PathMember from,
                                                       PathMember to) const;

private:
    std::vector<MountEntry> mounts;
};

}
}

#endif
