/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "config.hpp"

#include "libferry/PathRAII.hpp"
#include "libferry/utility/filesystem.hpp"

namespace test_utility {
namespace config {

ConfigRAII::~ConfigRAII() {
    // PathRAII makes the files left behind by containers removable before deleting them
    auto dataDirRAII = libferry::PathRAII{config->dataDir};
}

ConfigRAII makeConfig() {
    auto raii = ConfigRAII{};
    raii.config = std::make_shared<ferry::runner::Config>();
    raii.config->dataDir = libferry::filesystem::makeUniquePathWithRandomSuffix(
        boost::filesystem::temp_directory_path() / "ferry-test-data");
    raii.config->engine = ferry::runner::Engine::Podman;
    raii.config->engineEnvironment = {"PATH"};
    return raii;
}

boost::filesystem::path getSchemaDirectory() {
    return FERRY_TEST_SCHEMA_DIR;
}

}
}
