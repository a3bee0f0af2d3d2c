/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ferry_runner_InvocationRequest_hpp
#define ferry_runner_InvocationRequest_hpp

#include <map>
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <boost/filesystem.hpp>
#include <rapidjson/document.h>


namespace ferry {
namespace runner {

/**
 * One token of the tool's command line.
 *
 * Literal tokens are passed to the container unchanged. Input tokens are host paths
 * that get bind mounted and rewritten to their container location. Output tokens are
 * relative templates under the output root; they are rewritten to their container
 * location and implicitly declared as outputs of the invocation.
 */
struct ArgumentToken {
    enum class Kind {Literal, Input, Output};

    static ArgumentToken literal(const std::string& value);
    static ArgumentToken input(const boost::filesystem::path& hostPath, bool resolveParent=false, bool isMutable=false);
    static ArgumentToken output(const std::string& outputTemplate, bool optional=false);

    Kind kind = Kind::Literal;
    std::string value;
    bool resolveParent = false; // input: only the parent directory has to exist
    bool isMutable = false;     // input: mount read-write
    bool optional = false;      // output: the tool may not create it
};

struct OutputDeclaration {
    std::string outputTemplate;
    bool optional = false;
};

inline bool operator==(const OutputDeclaration& lhs, const OutputDeclaration& rhs) {
    return lhs.outputTemplate == rhs.outputTemplate && lhs.optional == rhs.optional;
}

struct InvocationRequest {
    static InvocationRequest fromJSON(const rapidjson::Value& json);
    static InvocationRequest fromFile(const boost::filesystem::path& requestFile,
                                      const boost::filesystem::path& schemaFile);

    // Outputs referenced by the arguments, followed by the additional ones,
    // in declaration order and without duplicates
    std::vector<OutputDeclaration> getDeclaredOutputs() const;

    std::string toolName;
    std::string packageName;
    std::string image;
    std::vector<ArgumentToken> arguments;
    boost::optional<boost::filesystem::path> workingDirectory;
    std::vector<OutputDeclaration> outputs;
    std::map<std::string, std::string> environment;
};

}
}

#endif
