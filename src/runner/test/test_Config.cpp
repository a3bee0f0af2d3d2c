/*
 * Ferry
 *
 * Copyright (c) 2018-2024, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <boost/filesystem.hpp>

#include "libferry/Error.hpp"
#include "libferry/utility/json.hpp"
#include "runner/Config.hpp"
#include "test_utility/config.hpp"
#include "test_utility/filesystem.hpp"
#include "test_utility/unittest_main_function.hpp"


using namespace ferry;

TEST_GROUP(ConfigTestGroup) {
    libferry::PathRAII testDirRAII = test_utility::filesystem::makeTemporaryDirectory("ferry-test-config");
    boost::filesystem::path configFile = testDirRAII.getPath() / "ferry.json";
    boost::filesystem::path schemaFile = test_utility::config::getSchemaDirectory() / "ferry.schema.json";
};

TEST(ConfigTestGroup, defaults) {
    auto config = runner::Config{};
    CHECK(config.engine == runner::Engine::Podman);
    CHECK_EQUAL(config.getEngineExecutable(), std::string{"podman"});
    CHECK(config.engineExtraArgs.empty());
    CHECK(config.dataDir.empty());
    CHECK(config.imageOverrides.empty());
    CHECK(config.environ.empty());
    CHECK(config.keepUserIdentity);
    CHECK(!config.perExecutionDirectories);
    CHECK(!config.requireOutputs);
    CHECK(config.timeout.count() == 0);
    CHECK((config.engineEnvironment == std::vector<std::string>{"PATH", "HOME", "USER", "LOGNAME", "XDG_RUNTIME_DIR", "TMPDIR"}));

    config.engine = runner::Engine::Apptainer;
    CHECK_EQUAL(config.getEngineExecutable(), std::string{"apptainer"});
}

TEST(ConfigTestGroup, engineNames) {
    CHECK(runner::parseEngine("podman") == runner::Engine::Podman);
    CHECK(runner::parseEngine("apptainer") == runner::Engine::Apptainer);
    CHECK_EQUAL(runner::toString(runner::Engine::Apptainer), std::string{"apptainer"});
    CHECK_THROWS(libferry::Error, runner::parseEngine("docker"));
}

TEST(ConfigTestGroup, fromFile) {
    test_utility::filesystem::createFile(configFile, R"({
        "engine": "apptainer",
        "engineExecutablePath": "/opt/apptainer/bin/apptainer",
        "engineExtraArgs": ["--cleanenv", "--containall"],
        "dataDir": "/scratch/ferry",
        "imageOverrides": {"ubuntu:22.04": "ubuntu:24.04"},
        "environ": {"OMP_NUM_THREADS": "4"},
        "keepUserIdentity": false,
        "perExecutionDirectories": true,
        "requireOutputs": true,
        "timeout": 3600,
        "engineEnvironment": ["PATH", "APPTAINER_CACHEDIR"]
    })");

    auto config = runner::Config::fromFile(configFile, schemaFile);

    CHECK(config.engine == runner::Engine::Apptainer);
    CHECK_EQUAL(config.getEngineExecutable(), std::string{"/opt/apptainer/bin/apptainer"});
    CHECK((config.engineExtraArgs == std::vector<std::string>{"--cleanenv", "--containall"}));
    CHECK(config.dataDir == "/scratch/ferry");
    CHECK_EQUAL(config.imageOverrides.at("ubuntu:22.04"), std::string{"ubuntu:24.04"});
    CHECK_EQUAL(config.environ.at("OMP_NUM_THREADS"), std::string{"4"});
    CHECK(!config.keepUserIdentity);
    CHECK(config.perExecutionDirectories);
    CHECK(config.requireOutputs);
    CHECK(config.timeout == std::chrono::seconds{3600});
    CHECK((config.engineEnvironment == std::vector<std::string>{"PATH", "APPTAINER_CACHEDIR"}));
}

TEST(ConfigTestGroup, fromFile_emptyObjectKeepsDefaults) {
    test_utility::filesystem::createFile(configFile, "{}");
    auto config = runner::Config::fromFile(configFile, schemaFile);
    CHECK(config.engine == runner::Engine::Podman);
    CHECK(config.keepUserIdentity);
    CHECK_EQUAL(config.engineEnvironment.size(), 6u);
}

TEST(ConfigTestGroup, fromFile_schemaViolations) {
    // unknown engine
    test_utility::filesystem::createFile(configFile, R"({"engine": "docker"})");
    CHECK_THROWS(libferry::Error, runner::Config::fromFile(configFile, schemaFile));

    // unknown property
    test_utility::filesystem::createFile(configFile, R"({"podmanExecutable": "podman"})");
    CHECK_THROWS(libferry::Error, runner::Config::fromFile(configFile, schemaFile));

    // negative timeout
    test_utility::filesystem::createFile(configFile, R"({"timeout": -1})");
    CHECK_THROWS(libferry::Error, runner::Config::fromFile(configFile, schemaFile));

    // override values must be strings
    test_utility::filesystem::createFile(configFile, R"({"imageOverrides": {"a": 1}})");
    CHECK_THROWS(libferry::Error, runner::Config::fromFile(configFile, schemaFile));

    // not JSON
    test_utility::filesystem::createFile(configFile, "engine = podman");
    CHECK_THROWS(libferry::Error, runner::Config::fromFile(configFile, schemaFile));

    // missing file
    CHECK_THROWS(libferry::Error, runner::Config::fromFile(testDirRAII.getPath() / "missing.json", schemaFile));
}

TEST(ConfigTestGroup, fromJSON_typeErrors) {
    CHECK_THROWS(libferry::Error, runner::Config::fromJSON(libferry::json::parse(R"(["podman"])")));
    CHECK_THROWS(libferry::Error, runner::Config::fromJSON(libferry::json::parse(R"({"keepUserIdentity": "yes"})")));
    CHECK_THROWS(libferry::Error, runner::Config::fromJSON(libferry::json::parse(R"({"engineExtraArgs": [1]})")));
    CHECK_THROWS(libferry::Error, runner::Config::fromJSON(libferry::json::parse(R"({"environ": {"A": 1}})")));
}

FERRY_UNITTEST_MAIN_FUNCTION();
