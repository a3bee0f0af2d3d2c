/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "runner/InvocationRequest.hpp"

#include <algorithm>

#include <boost/format.hpp>

#include "libferry/Error.hpp"
#include "libferry/utility/json.hpp"


namespace ferry {
namespace runner {

namespace rj = rapidjson;

ArgumentToken ArgumentToken::literal(const std::string& value) {
    auto token = ArgumentToken{};
    token.kind = Kind::Literal;
    token.value = value;
    return token;
}

ArgumentToken ArgumentToken::input(const boost::filesystem::path& hostPath, bool resolveParent, bool isMutable) {
    auto token = ArgumentToken{};
    token.kind = Kind::Input;
    token.value = hostPath.string();
    token.resolveParent = resolveParent;
    token.isMutable = isMutable;
    return token;
}

ArgumentToken ArgumentToken::output(const std::string& outputTemplate, bool optional) {
    auto token = ArgumentToken{};
    token.kind = Kind::Output;
    token.value = outputTemplate;
    token.optional = optional;
    return token;
}

static bool getOptionalBool(const rj::Value& json, const char* key) {
    if(!json.HasMember(key)) {
        return false;
    }
    if(!json[key].IsBool()) {
        auto message = boost::format("Invalid invocation request: '%s' must be a boolean") % key;
        FERRY_THROW_ERROR(message.str());
    }
    return json[key].GetBool();
}

static std::string getString(const rj::Value& json, const char* key) {
    if(!json.HasMember(key) || !json[key].IsString()) {
        auto message = boost::format("Invalid invocation request: '%s' must be a string") % key;
        FERRY_THROW_ERROR(message.str());
    }
    return json[key].GetString();
}

static ArgumentToken parseArgumentToken(const rj::Value& json) {
    if(json.IsString()) {
        return ArgumentToken::literal(json.GetString());
    }
    if(json.IsObject()) {
        if(json.HasMember("literal")) {
            return ArgumentToken::literal(getString(json, "literal"));
        }
        if(json.HasMember("input")) {
            return ArgumentToken::input(getString(json, "input"),
                                        getOptionalBool(json, "resolveParent"),
                                        getOptionalBool(json, "mutable"));
        }
        if(json.HasMember("output")) {
            return ArgumentToken::output(getString(json, "output"), getOptionalBool(json, "optional"));
        }
    }
    FERRY_THROW_ERROR("Invalid invocation request: an argument must be a string or"
                      " an object with one of the keys 'literal', 'input' or 'output'");
}

static OutputDeclaration parseOutputDeclaration(const rj::Value& json) {
    auto output = OutputDeclaration{};
    if(json.IsString()) {
        output.outputTemplate = json.GetString();
    }
    else if(json.IsObject()) {
        output.outputTemplate = getString(json, "template");
        output.optional = getOptionalBool(json, "optional");
    }
    else {
        FERRY_THROW_ERROR("Invalid invocation request: an output must be a string or"
                          " an object with the key 'template'");
    }
    return output;
}

InvocationRequest InvocationRequest::fromJSON(const rj::Value& json) {
    if(!json.IsObject()) {
        FERRY_THROW_ERROR("Invalid invocation request: expected a JSON object");
    }

    auto request = InvocationRequest{};
    request.toolName = getString(json, "toolName");
    if(json.HasMember("packageName")) {
        request.packageName = getString(json, "packageName");
    }
    request.image = getString(json, "image");

    if(json.HasMember("arguments")) {
        if(!json["arguments"].IsArray()) {
            FERRY_THROW_ERROR("Invalid invocation request: 'arguments' must be an array");
        }
        for(const auto& argument : json["arguments"].GetArray()) {
            request.arguments.push_back(parseArgumentToken(argument));
        }
    }

    if(json.HasMember("workingDirectory")) {
        request.workingDirectory = boost::filesystem::path{getString(json, "workingDirectory")};
    }

    if(json.HasMember("outputs")) {
        if(!json["outputs"].IsArray()) {
            FERRY_THROW_ERROR("Invalid invocation request: 'outputs' must be an array");
        }
        for(const auto& output : json["outputs"].GetArray()) {
            request.outputs.push_back(parseOutputDeclaration(output));
        }
    }

    if(json.HasMember("environment")) {
        if(!json["environment"].IsObject()) {
            FERRY_THROW_ERROR("Invalid invocation request: 'environment' must be an object");
        }
        for(const auto& variable : json["environment"].GetObject()) {
            if(!variable.value.IsString()) {
                auto message = boost::format("Invalid invocation request: value of environment variable '%s'"
                                             " must be a string") % variable.name.GetString();
                FERRY_THROW_ERROR(message.str());
            }
            request.environment[variable.name.GetString()] = variable.value.GetString();
        }
    }

    return request;
}

InvocationRequest InvocationRequest::fromFile(const boost::filesystem::path& requestFile,
                                              const boost::filesystem::path& schemaFile) {
    try {
        auto json = libferry::json::readAndValidate(requestFile, schemaFile);
        return fromJSON(json);
    }
    catch(libferry::Error& e) {
        auto message = boost::format("Failed to load invocation request from %s") % requestFile;
        FERRY_RETHROW_ERROR(e, message.str());
    }
}

std::vector<OutputDeclaration> InvocationRequest::getDeclaredOutputs() const {
    auto declared = std::vector<OutputDeclaration>{};

    auto add = [&declared](const std::string& outputTemplate, bool optional) {
        auto it = std::find_if(declared.begin(), declared.end(), [&outputTemplate](const OutputDeclaration& output) {
            return output.outputTemplate == outputTemplate;
        });
        if(it == declared.end()) {
            declared.push_back(OutputDeclaration{outputTemplate, optional});
        }
        else {
            // required as soon as one of the declarations requires it
            it->optional = it->optional && optional;
        }
    };

    for(const auto& argument : arguments) {
        if(argument.kind == ArgumentToken::Kind::Output) {
            add(argument.value, argument.optional);
        }
    }
    for(const auto& output : outputs) {
        add(output.outputTemplate, output.optional);
    }

    return declared;
}

}
}
