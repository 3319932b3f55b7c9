// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

/*
 * test_obscalc_config.cpp
 *
 * Tests for loading the whole service configuration from JSON and YAML
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "config/obscalc_config.hpp"

using namespace obscalc::config;

class ObscalcConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = std::filesystem::temp_directory_path() / "obscalc_config_test";
        std::filesystem::create_directories(dir);
    }

    void TearDown() override { std::filesystem::remove_all(dir); }

    std::filesystem::path write(const std::string& name,
                                const std::string& content) {
        auto path = dir / name;
        std::ofstream out(path);
        out << content;
        return path;
    }

    std::filesystem::path dir;
};

TEST_F(ObscalcConfigTest, EmptyDocumentYieldsDefaults) {
    auto config = ObscalcConfig::parse("{}");
    ASSERT_TRUE(config.has_value()) << config.error();
    EXPECT_EQ(config->database.path, "obscalc.db");
    EXPECT_EQ(config->retry.maxRetries, 5);
    EXPECT_EQ(config->worker.workerThreads, 8u);
    EXPECT_EQ(config->logging.level, "info");
    EXPECT_EQ(config->notifier.historySize, 1000u);
}

TEST_F(ObscalcConfigTest, JsonSectionsOverrideDefaults) {
    auto config = ObscalcConfig::parse(R"({
        // comments are allowed
        "obscalc": {
            "database": { "path": ":memory:" },
            "retry": { "maxRetries": 3, "initialDelayMs": 1000,
                       "maxDelayMs": 8000 },
            "worker": { "workerThreads": 2, "computeTimeoutMs": 0 }
        }
    })");

    ASSERT_TRUE(config.has_value()) << config.error();
    EXPECT_EQ(config->database.path, ":memory:");
    EXPECT_EQ(config->retry.maxRetries, 3);
    EXPECT_EQ(config->retry.maxDelayMs, 8000);
    EXPECT_EQ(config->worker.workerThreads, 2u);
    EXPECT_EQ(config->worker.computeTimeoutMs, 0);
    EXPECT_EQ(config->worker.pollIntervalMs, 5000);
}

TEST_F(ObscalcConfigTest, YamlIsAccepted) {
    auto config = ObscalcConfig::parse(R"(
obscalc:
  retry:
    maxRetries: 3
    multiplier: 1.5
  logging:
    level: debug
    console: false
  database:
    pragmas:
      cache_size: -8000
)",
                                       "yaml");

    ASSERT_TRUE(config.has_value()) << config.error();
    EXPECT_EQ(config->retry.maxRetries, 3);
    EXPECT_DOUBLE_EQ(config->retry.multiplier, 1.5);
    EXPECT_EQ(config->logging.level, "debug");
    EXPECT_FALSE(config->logging.console);
    EXPECT_EQ(config->database.pragmas.at("cache_size"), "-8000");
}

TEST_F(ObscalcConfigTest, EmptyYamlYieldsDefaults) {
    auto config = ObscalcConfig::parse("", "yaml");
    ASSERT_TRUE(config.has_value()) << config.error();
    EXPECT_EQ(config->worker.batchSize, 8u);
}

TEST_F(ObscalcConfigTest, MalformedInputIsReported) {
    auto json = ObscalcConfig::parse("{ \"obscalc\": ");
    ASSERT_FALSE(json.has_value());
    EXPECT_EQ(json.error(), "JSON parse error");

    auto yaml = ObscalcConfig::parse("obscalc: [unclosed", "yaml");
    ASSERT_FALSE(yaml.has_value());
    EXPECT_EQ(yaml.error().rfind("YAML parse error", 0), 0u);
}

TEST_F(ObscalcConfigTest, NonObjectDocumentIsRejected) {
    auto config = ObscalcConfig::parse("[1, 2, 3]");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error(), "Configuration must be an object");
}

TEST_F(ObscalcConfigTest, WrongValueTypeIsRejected) {
    auto config =
        ObscalcConfig::parse(R"({"obscalc": {"worker": {"batchSize": "all"}}})");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().rfind("Invalid configuration value", 0), 0u);
}

TEST_F(ObscalcConfigTest, ValidationErrorsNameTheField) {
    auto config =
        ObscalcConfig::parse(R"({"obscalc": {"retry": {"maxRetries": -2}}})");
    ASSERT_FALSE(config.has_value());
    EXPECT_NE(config.error().find("/obscalc/retry/maxRetries"),
              std::string::npos);
}

TEST_F(ObscalcConfigTest, LoadFromFileChoosesParserByExtension) {
    auto jsonPath =
        write("obscalc.json", R"({"obscalc": {"notifier": {"historySize": 10}}})");
    auto yamlPath = write("obscalc.yaml", "obscalc:\n  notifier:\n    historySize: 20\n");

    auto fromJson = ObscalcConfig::loadFromFile(jsonPath);
    ASSERT_TRUE(fromJson.has_value()) << fromJson.error();
    EXPECT_EQ(fromJson->notifier.historySize, 10u);

    auto fromYaml = ObscalcConfig::loadFromFile(yamlPath);
    ASSERT_TRUE(fromYaml.has_value()) << fromYaml.error();
    EXPECT_EQ(fromYaml->notifier.historySize, 20u);
}

TEST_F(ObscalcConfigTest, LoadErrorsNameTheFile) {
    auto missing = ObscalcConfig::loadFromFile(dir / "absent.json");
    ASSERT_FALSE(missing.has_value());
    EXPECT_NE(missing.error().find("absent.json"), std::string::npos);

    auto badPath = write("bad.json", R"({"obscalc": {"worker": {"workerThreads": 0}}})");
    auto bad = ObscalcConfig::loadFromFile(badPath);
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().rfind(badPath.string(), 0), 0u);
}

TEST_F(ObscalcConfigTest, ToJsonNestsSectionsByPath) {
    ObscalcConfig config;
    config.worker.workerThreads = 3;

    auto document = config.toJson();
    EXPECT_EQ(document["obscalc"]["worker"]["workerThreads"], 3);
    EXPECT_EQ(document["obscalc"]["database"]["path"], "obscalc.db");

    auto reparsed = ObscalcConfig::fromDocument(document);
    ASSERT_TRUE(reparsed.has_value()) << reparsed.error();
    EXPECT_EQ(reparsed->worker.workerThreads, 3u);
}

TEST_F(ObscalcConfigTest, DumpedConfigParsesBackUnchanged) {
    ObscalcConfig config;
    config.database.path = "/var/lib/obscalc/cache.db";
    config.retry.maxRetries = 2;
    config.worker.commitAttempts = 4;
    config.worker.maxAbandonedComputes = 3;
    config.logging.level = "debug";
    config.notifier.historySize = 50;

    auto reparsed = ObscalcConfig::parse(config.toJson().dump());
    ASSERT_TRUE(reparsed.has_value()) << reparsed.error();
    EXPECT_EQ(reparsed->database.path, "/var/lib/obscalc/cache.db");
    EXPECT_EQ(reparsed->retry.maxRetries, 2);
    EXPECT_EQ(reparsed->worker.commitAttempts, 4);
    EXPECT_EQ(reparsed->worker.maxAbandonedComputes, 3u);
    EXPECT_EQ(reparsed->logging.level, "debug");
    EXPECT_EQ(reparsed->notifier.historySize, 50u);
    EXPECT_EQ(reparsed->toJson(), config.toJson());
}
