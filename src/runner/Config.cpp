/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "runner/Config.hpp"

#include <boost/format.hpp>

#include "libferry/Error.hpp"
#include "libferry/utility/json.hpp"


namespace ferry {
namespace runner {

namespace rj = rapidjson;

std::string toString(Engine engine) {
    switch(engine) {
        case Engine::Podman:
            return "podman";
        case Engine::Apptainer:
            return "apptainer";
    }
    FERRY_THROW_ERROR("Unknown container engine");
}

Engine parseEngine(const std::string& name) {
    if(name == "podman") {
        return Engine::Podman;
    }
    if(name == "apptainer") {
        return Engine::Apptainer;
    }
    auto message = boost::format("Unsupported container engine '%s'. Supported engines are 'podman' and 'apptainer'")
        % name;
    FERRY_THROW_ERROR(message.str());
}

std::string Config::getEngineExecutable() const {
    if(!engineExecutablePath.empty()) {
        return engineExecutablePath;
    }
    return toString(engine);
}

static std::vector<std::string> parseStringArray(const rj::Value& json, const char* key) {
    if(!json[key].IsArray()) {
        auto message = boost::format("Invalid configuration: '%s' must be an array of strings") % key;
        FERRY_THROW_ERROR(message.str());
    }
    auto strings = std::vector<std::string>{};
    for(const auto& value : json[key].GetArray()) {
        if(!value.IsString()) {
            auto message = boost::format("Invalid configuration: '%s' must be an array of strings") % key;
            FERRY_THROW_ERROR(message.str());
        }
        strings.push_back(value.GetString());
    }
    return strings;
}

template<class Map>
static Map parseStringMap(const rj::Value& json, const char* key) {
    if(!json[key].IsObject()) {
        auto message = boost::format("Invalid configuration: '%s' must be an object of strings") % key;
        FERRY_THROW_ERROR(message.str());
    }
    auto map = Map{};
    for(const auto& member : json[key].GetObject()) {
        if(!member.value.IsString()) {
            auto message = boost::format("Invalid configuration: value of '%s' in '%s' must be a string")
                % member.name.GetString() % key;
            FERRY_THROW_ERROR(message.str());
        }
        map[member.name.GetString()] = member.value.GetString();
    }
    return map;
}

static bool parseBool(const rj::Value& json, const char* key) {
    if(!json[key].IsBool()) {
        auto message = boost::format("Invalid configuration: '%s' must be a boolean") % key;
        FERRY_THROW_ERROR(message.str());
    }
    return json[key].GetBool();
}

static std::string parseString(const rj::Value& json, const char* key) {
    if(!json[key].IsString()) {
        auto message = boost::format("Invalid configuration: '%s' must be a string") % key;
        FERRY_THROW_ERROR(message.str());
    }
    return json[key].GetString();
}

Config Config::fromJSON(const rj::Value& json) {
    if(!json.IsObject()) {
        FERRY_THROW_ERROR("Invalid configuration: expected a JSON object");
    }

    auto config = Config{};

    if(json.HasMember("imageOverrides")) {
        config.imageOverrides = parseStringMap<ImageOverrideTable>(json, "imageOverrides");
    }
    if(json.HasMember("engine")) {
        config.engine = parseEngine(parseString(json, "engine"));
    }
    if(json.HasMember("engineExecutablePath")) {
        config.engineExecutablePath = parseString(json, "engineExecutablePath");
    }
    if(json.HasMember("engineExtraArgs")) {
        config.engineExtraArgs = parseStringArray(json, "engineExtraArgs");
    }
    if(json.HasMember("dataDir")) {
        config.dataDir = parseString(json, "dataDir");
    }
    if(json.HasMember("environ")) {
        config.environ = parseStringMap<EnvironmentSpec>(json, "environ");
    }
    if(json.HasMember("keepUserIdentity")) {
        config.keepUserIdentity = parseBool(json, "keepUserIdentity");
    }
    if(json.HasMember("perExecutionDirectories")) {
        config.perExecutionDirectories = parseBool(json, "perExecutionDirectories");
    }
    if(json.HasMember("requireOutputs")) {
        config.requireOutputs = parseBool(json, "requireOutputs");
    }
    if(json.HasMember("timeout")) {
        if(!json["timeout"].IsUint()) {
            FERRY_THROW_ERROR("Invalid configuration: 'timeout' must be a non-negative integer (seconds)");
        }
        config.timeout = std::chrono::seconds{json["timeout"].GetUint()};
    }
    if(json.HasMember("engineEnvironment")) {
        config.engineEnvironment = parseStringArray(json, "engineEnvironment");
    }

    return config;
}

Config Config::fromFile(const boost::filesystem::path& configFile, const boost::filesystem::path& schemaFile) {
    try {
        auto json = libferry::json::readAndValidate(configFile, schemaFile);
        return fromJSON(json);
    }
    catch(libferry::Error& e) {
        auto message = boost::format("Failed to load configuration from %s") % configFile;
        FERRY_RETHROW_ERROR(e, message.str());
    }
}

}
}
