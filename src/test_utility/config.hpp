/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

/**
 * @brief Utility functions to be used in the tests.
 */

#ifndef ferry_test_utility_config_hpp
#define ferry_test_utility_config_hpp

#include <memory>

#include <boost/filesystem.hpp>

#include "runner/Config.hpp"

namespace test_utility {
namespace config {

// Runner configuration with a private data directory, removed on destruction
struct ConfigRAII {
    ~ConfigRAII();
    std::shared_ptr<ferry::runner::Config> config;
};

ConfigRAII makeConfig();

// Directory containing ferry.schema.json and request.schema.json
boost::filesystem::path getSchemaDirectory();

}
}

#endif
