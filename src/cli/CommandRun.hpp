/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ferry_cli_CommandRun_hpp
#define ferry_cli_CommandRun_hpp

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <boost/format.hpp>
#include <boost/optional.hpp>
#include <boost/program_options.hpp>

#include "libferry/CLIArguments.hpp"
#include "libferry/Error.hpp"
#include "libferry/utility/json.hpp"
#include "cli/Command.hpp"
#include "cli/Utility.hpp"
#include "runner/Config.hpp"
#include "runner/InvocationRequest.hpp"
#include "runner/Runner.hpp"


namespace ferry {
namespace cli {

class CommandRun : public Command {
public:
    CommandRun() {
        initializeOptionsDescription();
    }

    CommandRun(const libferry::CLIArguments& args, std::shared_ptr<const Context> context)
        : context{std::move(context)}
    {
        initializeOptionsDescription();
        parseCommandArguments(args);
    }

    void execute() override {
        cli::utility::printLog("Executing run command", libferry::LogLevel::INFO);

        auto runner = runner::Runner{config};
        auto outputs = runner.execute(request);
        auto json = cli::utility::makeOutputsJSON(outputs);

        if(outputFile) {
            libferry::json::write(json, *outputFile);
            cli::utility::printLog(boost::format("Wrote output mapping to %s") % *outputFile, libferry::LogLevel::INFO);
        }
        else {
            cli::utility::printLog(libferry::json::serialize(json), libferry::LogLevel::GENERAL);
        }

        cli::utility::printLog("Successfully executed run command", libferry::LogLevel::INFO);
    }

    std::string getBriefDescription() const override {
        return "Run the tool invocation described by a request file in a container";
    }

    void printHelpMessage() const override {
        cli::utility::printHelpMessage(std::cout,
            "ferry run [OPTIONS] REQUEST\n"
            "\n"
            "Note: options taking a value that starts with a dash have to be\n"
            "      written in the adjacent form, e.g. --engine-arg=--network=none",
            getBriefDescription(),
            optionsDescription);
    }

// these methods are public for test purpose
public:
    std::shared_ptr<const runner::Config> getConfig() const { return config; }
    const runner::InvocationRequest& getRequest() const { return request; }
    const boost::optional<boost::filesystem::path>& getOutputFile() const { return outputFile; }

private:
    void initializeOptionsDescription() {
        optionsDescription.add_options()
            ("config,c",
                boost::program_options::value<std::string>(&configFile),
                "Load the runner configuration from a JSON file")
            ("data-dir",
                boost::program_options::value<std::string>(&dataDir),
                "Directory where outputs are written. Default: a new temporary directory")
            ("engine",
                boost::program_options::value<std::string>(&engine),
                "Container engine: 'podman' or 'apptainer'")
            ("engine-arg",
                boost::program_options::value<std::vector<std::string>>(&engineArgs),
                "Pass an extra argument to the container engine (repeatable)")
            ("engine-path",
                boost::program_options::value<std::string>(&enginePath),
                "Path of the container engine executable. Default: look up the engine in PATH")
            ("env,e",
                boost::program_options::value<std::vector<std::string>>(&environment),
                "Set an environment variable in the container (NAME=VALUE, repeatable)")
            ("image-override",
                boost::program_options::value<std::vector<std::string>>(&imageOverrides),
                "Use image TO wherever image FROM is requested (FROM=TO, repeatable)")
            ("no-user-mapping", "Do not run the container as the invoking user")
            ("output-file,o",
                boost::program_options::value<std::string>(),
                "Write the output mapping as JSON to this file instead of stdout")
            ("per-execution-dirs", "Write the outputs of each execution into a separate directory")
            ("require-outputs", "Fail if a declared output is missing after a successful execution")
            ("timeout",
                boost::program_options::value<unsigned int>(),
                "Kill the container engine after this many seconds. Default: no timeout");
    }

    void parseCommandArguments(const libferry::CLIArguments& args) {
        cli::utility::printLog("parsing CLI arguments of run command", libferry::LogLevel::DEBUG);

        libferry::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);

        // the run command expects exactly one positional argument (the request file)
        cli::utility::validateNumberOfPositionalArguments(positionalArgs, 1, 1, "run");

        boost::program_options::variables_map values;
        try {
            boost::program_options::store(
                boost::program_options::command_line_parser(nameAndOptionArgs.argc(), nameAndOptionArgs.argv())
                        .options(optionsDescription)
                        .style(boost::program_options::command_line_style::unix_style)
                        .run(), values);
            boost::program_options::notify(values);
        }
        catch(std::exception& e) {
            auto message = boost::format("%s\nSee 'ferry help run'") % e.what();
            cli::utility::printLog(message, libferry::LogLevel::GENERAL, std::cerr);
            FERRY_THROW_ERROR(message.str(), libferry::LogLevel::INFO);
        }

        config = makeConfig(values);
        if(values.count("output-file")) {
            outputFile = boost::filesystem::absolute(values["output-file"].as<std::string>());
        }

        auto requestFile = boost::filesystem::path{positionalArgs.argv()[0]};
        request = runner::InvocationRequest::fromFile(requestFile, context->schemaDirectory / "request.schema.json");

        cli::utility::printLog("successfully parsed CLI arguments", libferry::LogLevel::DEBUG);
    }

    // Options given on the command line override the values of the configuration file
    std::shared_ptr<const runner::Config> makeConfig(const boost::program_options::variables_map& values) const {
        auto conf = std::make_shared<runner::Config>();

        if(values.count("config")) {
            *conf = runner::Config::fromFile(configFile, context->schemaDirectory / "ferry.schema.json");
        }
        if(values.count("engine")) {
            try {
                conf->engine = runner::parseEngine(engine);
            }
            catch(libferry::Error& e) {
                auto message = boost::format("Invalid value '%s' for option '--engine'\nSee 'ferry help run'") % engine;
                cli::utility::printLog(message, libferry::LogLevel::GENERAL, std::cerr);
                FERRY_RETHROW_ERROR(e, message.str(), libferry::LogLevel::INFO);
            }
        }
        if(values.count("engine-path")) {
            conf->engineExecutablePath = enginePath;
        }
        conf->engineExtraArgs.insert(conf->engineExtraArgs.end(), engineArgs.cbegin(), engineArgs.cend());
        if(values.count("data-dir")) {
            conf->dataDir = dataDir;
        }
        for(const auto& entry : cli::utility::parseKeyValueOptions(imageOverrides, "image-override")) {
            conf->imageOverrides[entry.first] = entry.second;
        }
        for(const auto& variable : cli::utility::parseKeyValueOptions(environment, "env")) {
            conf->environ[variable.first] = variable.second;
        }
        if(values.count("timeout")) {
            conf->timeout = std::chrono::seconds{values["timeout"].as<unsigned int>()};
        }
        if(values.count("no-user-mapping")) {
            conf->keepUserIdentity = false;
        }
        if(values.count("per-execution-dirs")) {
            conf->perExecutionDirectories = true;
        }
        if(values.count("require-outputs")) {
            conf->requireOutputs = true;
        }

        return conf;
    }

private:
    boost::program_options::options_description optionsDescription{"Options"};
    std::shared_ptr<const Context> context;
    std::shared_ptr<const runner::Config> config;
    runner::InvocationRequest request;
    boost::optional<boost::filesystem::path> outputFile;
    std::string configFile;
    std::string dataDir;
    std::string engine;
    std::string enginePath;
    std::vector<std::string> engineArgs;
    std::vector<std::string> environment;
    std::vector<std::string> imageOverrides;
};

}
}

#endif
