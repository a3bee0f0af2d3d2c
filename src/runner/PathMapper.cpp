/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "runner/PathMapper.hpp"

#include <map>

#include "libferry/Error.hpp"
#include "libferry/Logger.hpp"
#include "libferry/utility/filesystem.hpp"
#include "runner/Errors.hpp"


namespace ferry {
namespace runner {

const boost::filesystem::path PathMapper::outputRootContainerPath = "/mnt/out0";

namespace {

// The bind syntax of the engines separates fields with ':' and options with ','
void checkMountablePath(const boost::filesystem::path& path) {
    if(path.string().find_first_of(":,\\") != std::string::npos) {
        auto message = boost::format("Cannot mount %s into the container: the path contains one of the"
                                     " characters ':', ',' or '\\'") % path;
        throw PathResolutionError{FERRY_ERROR_TRACE_ENTRY(message.str()), path};
    }
}

boost::filesystem::path canonicalize(const boost::filesystem::path& path) {
    try {
        return boost::filesystem::canonical(path);
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to canonicalize %s") % path;
        FERRY_RETHROW_ERROR(e, message.str());
    }
}

// Relative path below the output root with '.' elements removed
boost::filesystem::path normalizeOutputTemplate(const std::string& outputTemplate) {
    auto templatePath = boost::filesystem::path{outputTemplate};
    if(templatePath.is_absolute()) {
        auto message = boost::format("Invalid output template '%s': the template must be a relative path")
            % outputTemplate;
        throw PathResolutionError{FERRY_ERROR_TRACE_ENTRY(message.str()), templatePath};
    }

    auto normalized = boost::filesystem::path{};
    for(const auto& element : templatePath.lexically_normal()) {
        if(element == "..") {
            auto message = boost::format("Invalid output template '%s': the template must not"
                                         " escape the output directory") % outputTemplate;
            throw PathResolutionError{FERRY_ERROR_TRACE_ENTRY(message.str()), templatePath};
        }
        if(element != "." && !element.empty()) {
            normalized /= element;
        }
    }

    if(normalized.empty()) {
        auto message = boost::format("Invalid output template '%s': the template is empty") % outputTemplate;
        throw PathResolutionError{FERRY_ERROR_TRACE_ENTRY(message.str()), templatePath};
    }
    return normalized;
}

class MountSetBuilder {
public:
    explicit MountSetBuilder(const std::string& sysname)
        : sysname{sysname}
    {}

    boost::filesystem::path addInput(const ArgumentToken& token) {
        if(token.value.empty()) {
            throw PathResolutionError{FERRY_ERROR_TRACE_ENTRY("Input path is empty"), token.value};
        }

        auto hostPath = boost::filesystem::absolute(token.value);

        if(token.resolveParent) {
            auto parent = hostPath.parent_path();
            if(!boost::filesystem::is_directory(parent)) {
                auto message = boost::format("Input folder not found: %s") % parent;
                throw PathResolutionError{FERRY_ERROR_TRACE_ENTRY(message.str()), parent};
            }
            return mountInputDirectory(canonicalize(parent), token.isMutable) / hostPath.filename();
        }

        if(!boost::filesystem::exists(hostPath)) {
            auto message = boost::format("Input file not found: %s") % hostPath;
            throw PathResolutionError{FERRY_ERROR_TRACE_ENTRY(message.str()), hostPath};
        }

        auto canonicalPath = canonicalize(hostPath);
        if(boost::filesystem::is_directory(canonicalPath)) {
            return mountInputDirectory(canonicalPath, token.isMutable);
        }
        return mountInputDirectory(canonicalPath.parent_path(), token.isMutable) / canonicalPath.filename();
    }

    // The output root reuses the mount of an input folder it coincides with
    void setOutputRoot(const boost::filesystem::path& outputDir) {
        libferry::filesystem::createFoldersIfNecessary(outputDir);
        outputRoot = canonicalize(outputDir);
        auto* mount = findMount(outputRoot, AccessMode::ReadWrite);
        if(mount) {
            outputRootContainerPath = mount->containerPath;
            return;
        }
        checkMountablePath(outputRoot);
        outputRootContainerPath = addMount(outputRoot, PathMapper::outputRootContainerPath, AccessMode::ReadWrite);
    }

    boost::filesystem::path addOutput(const std::string& outputTemplate) {
        auto normalized = normalizeOutputTemplate(outputTemplate);
        auto hostDirectory = outputRoot / normalized.parent_path();
        libferry::filesystem::createFoldersIfNecessary(hostDirectory);
        return mountOutputDirectory(canonicalize(hostDirectory)) / normalized.filename();
    }

    const std::vector<MountEntry>& getMounts() const {
        return mounts;
    }

    const boost::filesystem::path& getOutputRoot() const {
        return outputRoot;
    }

    const boost::filesystem::path& getOutputRootContainerPath() const {
        return outputRootContainerPath;
    }

private:
    const boost::filesystem::path& mountInputDirectory(const boost::filesystem::path& directory, bool isMutable) {
        auto accessMode = isMutable ? AccessMode::ReadWrite : AccessMode::ReadOnly;
        auto* mount = findMount(directory, accessMode);
        if(mount) {
            return mount->containerPath;
        }
        checkMountablePath(directory);
        return addMount(directory, "/mnt/in" + std::to_string(nextInputId++), accessMode);
    }

    const boost::filesystem::path& mountOutputDirectory(const boost::filesystem::path& directory) {
        auto* mount = findMount(directory, AccessMode::ReadWrite);
        if(mount) {
            return mount->containerPath;
        }
        checkMountablePath(directory);
        return addMount(directory, "/mnt/out" + std::to_string(nextOutputId++), AccessMode::ReadWrite);
    }

    // One mount per canonical host directory, whatever role it was first mounted for.
    // Returns nullptr if the directory is not mounted yet.
    MountEntry* findMount(const boost::filesystem::path& directory, AccessMode accessMode) {
        auto it = mountIndices.find(directory);
        if(it == mountIndices.cend()) {
            return nullptr;
        }
        auto& mount = mounts[it->second];
        if(accessMode == AccessMode::ReadWrite && mount.accessMode == AccessMode::ReadOnly) {
            mount.accessMode = AccessMode::ReadWrite;
            logMount(mount);
        }
        return &mount;
    }

    const boost::filesystem::path& addMount(const boost::filesystem::path& directory,
                                            const boost::filesystem::path& containerPath,
                                            AccessMode accessMode) {
        mountIndices[directory] = mounts.size();
        mounts.push_back(MountEntry{directory, containerPath, accessMode});
        logMount(mounts.back());
        return mounts.back().containerPath;
    }

    void logMount(const MountEntry& mount) const {
        auto message = boost::format("Mount %s") % mount;
        libferry::Logger::getInstance().log(message, sysname, libferry::LogLevel::DEBUG);
    }

private:
    std::string sysname;
    std::vector<MountEntry> mounts;
    std::map<boost::filesystem::path, size_t> mountIndices;
    size_t nextInputId = 0;
    size_t nextOutputId = 1;
    boost::filesystem::path outputRoot;
    boost::filesystem::path outputRootContainerPath;
};

} // namespace

PathMapper::PathMapper(const boost::filesystem::path& outputDir)
    : outputDir{outputDir}
{}

MountSet PathMapper::computeMounts(const InvocationRequest& request) const {
    printLog(boost::format("Computing mounts of %s (output directory %s)") % request.toolName % outputDir,
             libferry::LogLevel::DEBUG);

    auto builder = MountSetBuilder{sysname};

    // inputs first: a missing input must not leave output directories behind
    auto inputContainerPaths = std::vector<boost::filesystem::path>(request.arguments.size());
    for(size_t i=0; i<request.arguments.size(); ++i) {
        const auto& argument = request.arguments[i];
        if(argument.kind == ArgumentToken::Kind::Input) {
            inputContainerPaths[i] = builder.addInput(argument);
        }
    }

    // validate all output templates before creating anything on the host
    auto declaredOutputs = request.getDeclaredOutputs();
    for(const auto& output : declaredOutputs) {
        normalizeOutputTemplate(output.outputTemplate);
    }

    builder.setOutputRoot(outputDir);

    auto mountSet = MountSet{};
    for(size_t i=0; i<request.arguments.size(); ++i) {
        const auto& argument = request.arguments[i];
        switch(argument.kind) {
            case ArgumentToken::Kind::Literal:
                mountSet.containerArguments.push_back(argument.value);
                break;
            case ArgumentToken::Kind::Input:
                mountSet.containerArguments.push_back(inputContainerPaths[i].string());
                break;
            case ArgumentToken::Kind::Output:
                mountSet.containerArguments.push_back(builder.addOutput(argument.value).string());
                break;
        }
    }

    for(const auto& output : declaredOutputs) {
        auto containerPath = builder.addOutput(output.outputTemplate);
        mountSet.outputs.push_back(OutputLocation{output.outputTemplate, output.optional, containerPath});
    }

    mountSet.mounts = builder.getMounts();
    mountSet.translationTable = PathTranslationTable{mountSet.mounts};
    mountSet.outputRoot = builder.getOutputRoot();
    mountSet.outputRootContainerPath = builder.getOutputRootContainerPath();

    printLog(boost::format("Computed %d mounts") % mountSet.mounts.size(), libferry::LogLevel::DEBUG);
    return mountSet;
}

void PathMapper::printLog(const boost::format& message, libferry::LogLevel level,
                          std::ostream& outStream, std::ostream& errStream) const {
    libferry::Logger::getInstance().log(message, sysname, level, outStream, errStream);
}

}
}
