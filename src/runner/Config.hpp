/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ferry_runner_Config_hpp
#define ferry_runner_Config_hpp

#include <chrono>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/filesystem.hpp>
#include <rapidjson/document.h>


namespace ferry {
namespace runner {

enum class Engine {Podman, Apptainer};

std::string toString(Engine);
Engine parseEngine(const std::string&);

using ImageOverrideTable = std::unordered_map<std::string, std::string>;
using EnvironmentSpec = std::map<std::string, std::string>;

/**
 * Configuration of a Runner. A Runner keeps it as an immutable snapshot
 * (std::shared_ptr<const Config>) shared by all its invocations.
 */
struct Config {
    static Config fromFile(const boost::filesystem::path& configFile,
                           const boost::filesystem::path& schemaFile);
    static Config fromJSON(const rapidjson::Value& json);

    // The configured executable path, or the engine's name to be looked up in PATH
    std::string getEngineExecutable() const;

    ImageOverrideTable imageOverrides;
    Engine engine = Engine::Podman;
    std::string engineExecutablePath;
    std::vector<std::string> engineExtraArgs;
    boost::filesystem::path dataDir; // empty: a fresh temporary directory
    EnvironmentSpec environ;
    bool keepUserIdentity = true;
    bool perExecutionDirectories = false;
    bool requireOutputs = false;
    std::chrono::seconds timeout{0}; // zero: no timeout
    std::vector<std::string> engineEnvironment = {"PATH", "HOME", "USER", "LOGNAME", "XDG_RUNTIME_DIR", "TMPDIR"};
};

}
}

#endif
