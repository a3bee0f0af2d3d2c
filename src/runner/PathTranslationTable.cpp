/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "runner/PathTranslationTable.hpp"

#include <iterator>

#include "libferry/utility/filesystem.hpp"


namespace ferry {
namespace runner {

PathTranslationTable::PathTranslationTable(const std::vector<MountEntry>& mounts)
    : mounts{mounts}
{}

boost::optional<boost::filesystem::path> PathTranslationTable::toContainer(const boost::filesystem::path& hostPath) const {
    auto ec = boost::system::error_code{};
    auto canonicalPath = boost::filesystem::weakly_canonical(boost::filesystem::absolute(hostPath), ec);
    if(ec) {
        canonicalPath = boost::filesystem::absolute(hostPath).lexically_normal();
    }
    return translate(canonicalPath, &MountEntry::hostPath, &MountEntry::containerPath);
}

boost::optional<boost::filesystem::path> PathTranslationTable::toHost(const boost::filesystem::path& containerPath) const {
    if(!containerPath.is_absolute()) {
        return boost::none;
    }
    return translate(containerPath.lexically_normal(), &MountEntry::containerPath, &MountEntry::hostPath);
}

boost::optional<boost::filesystem::path> PathTranslationTable::translate(const boost::filesystem::path& path,
                                                                         PathMember from,
                                                                         PathMember to) const {
    const MountEntry* bestMatch = nullptr;
    size_t bestMatchLength = 0;

    for(const auto& mount : mounts) {
        const auto& prefix = mount.*from;
        if(!libferry::filesystem::isPathPrefix(prefix, path)) {
            continue;
        }
        auto length = static_cast<size_t>(std::distance(prefix.begin(), prefix.end()));
        if(bestMatch == nullptr || length > bestMatchLength) {
            bestMatch = &mount;
            bestMatchLength = length;
        }
    }

    if(bestMatch == nullptr) {
        return boost::none;
    }

    auto relativePath = path.lexically_relative(bestMatch->*from);
    if(relativePath.empty() || relativePath == ".") {
        return bestMatch->*to;
    }
    return bestMatch->*to / relativePath;
}

}
}
