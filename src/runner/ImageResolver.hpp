/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ferry_runner_ImageResolver_hpp
#define ferry_runner_ImageResolver_hpp

#include <string>

#include "runner/Config.hpp"


namespace ferry {
namespace runner {

// Returns the override of the logical image, or the logical image itself
std::string resolveImage(const std::string& logicalImage, const ImageOverrideTable& overrides);

// Adds the transport prefix the engine needs to pull a registry reference
std::string qualifyImage(const std::string& image, Engine engine);

}
}

#endif
