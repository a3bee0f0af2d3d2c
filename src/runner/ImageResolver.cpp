/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "runner/ImageResolver.hpp"

#include <array>

#include <boost/format.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include "libferry/Error.hpp"
#include "libferry/Logger.hpp"


namespace ferry {
namespace runner {

std::string resolveImage(const std::string& logicalImage, const ImageOverrideTable& overrides) {
    if(logicalImage.empty()) {
        FERRY_THROW_ERROR("No container image specified for the invocation");
    }

    auto it = overrides.find(logicalImage);
    if(it == overrides.cend()) {
        return logicalImage;
    }

    auto message = boost::format("Overriding image %s with %s") % logicalImage % it->second;
    libferry::Logger::getInstance().log(message, "ImageResolver", libferry::LogLevel::DEBUG);
    return it->second;
}

static bool hasTransport(const std::string& image) {
    // transports of apptainer that are not followed by "//"
    static const auto transports = std::array<const char*, 4>{
        "docker-archive:", "docker-daemon:", "oci-archive:", "oci:"
    };

    if(image.find("://") != std::string::npos) {
        return true;
    }
    for(const auto* transport : transports) {
        if(boost::starts_with(image, transport)) {
            return true;
        }
    }
    return false;
}

static bool isLocalImage(const std::string& image) {
    return boost::starts_with(image, "/")
        || boost::starts_with(image, "./")
        || boost::starts_with(image, "../")
        || boost::ends_with(image, ".sif");
}

std::string qualifyImage(const std::string& image, Engine engine) {
    if(engine != Engine::Apptainer || hasTransport(image) || isLocalImage(image)) {
        return image;
    }
    return "docker://" + image;
}

}
}
