/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ferry_runner_MountEntry_hpp
#define ferry_runner_MountEntry_hpp

#include <ostream>
#include <string>

#include <boost/filesystem.hpp>


namespace ferry {
namespace runner {

enum class AccessMode {ReadOnly, ReadWrite};

// One bind mount of a host directory into the container
struct MountEntry {
    boost::filesystem::path hostPath;
    boost::filesystem::path containerPath;
    AccessMode accessMode;
};

inline std::string toString(AccessMode mode) {
    return mode == AccessMode::ReadOnly ? "ro" : "rw";
}

inline bool operator==(const MountEntry& lhs, const MountEntry& rhs) {
    return lhs.hostPath == rhs.hostPath
        && lhs.containerPath == rhs.containerPath
        && lhs.accessMode == rhs.accessMode;
}

inline bool operator!=(const MountEntry& lhs, const MountEntry& rhs) {
    return !(lhs == rhs);
}

// <host>:<container>:ro|rw, the bind syntax shared by podman and apptainer
inline std::ostream& operator<<(std::ostream& os, const MountEntry& mount) {
    os << mount.hostPath.string() << ":" << mount.containerPath.string() << ":" << toString(mount.accessMode);
    return os;
}

}
}

#endif
