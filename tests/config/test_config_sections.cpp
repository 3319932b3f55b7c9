// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

/*
 * test_config_sections.cpp
 *
 * Tests for the typed configuration sections
 * - Defaults and partial JSON
 * - Range validation with error paths
 * - Locating a section inside a whole document
 */

#include <gtest/gtest.h>

#include "config/sections/sections.hpp"

using namespace obscalc::config;

// ==================== Defaults ====================

TEST(ConfigSectionsTest, DefaultsAreValid) {
    EXPECT_TRUE(DatabaseConfig::defaults().validate().isValid());
    EXPECT_TRUE(RetrySettings::defaults().validate().isValid());
    EXPECT_TRUE(WorkerConfig::defaults().validate().isValid());
    EXPECT_TRUE(LoggingConfig::defaults().validate().isValid());
    EXPECT_TRUE(NotifierConfig::defaults().validate().isValid());
}

TEST(ConfigSectionsTest, RetryDefaultsDoubleFromOneMinute) {
    RetrySettings retry;
    EXPECT_EQ(retry.maxRetries, 5);
    EXPECT_EQ(retry.initialDelayMs, 60000);
    EXPECT_EQ(retry.maxDelayMs, 1920000);
    EXPECT_DOUBLE_EQ(retry.multiplier, 2.0);
}

TEST(ConfigSectionsTest, PathsAreRootedAtObscalc) {
    EXPECT_EQ(DatabaseConfig::PATH, "/obscalc/database");
    EXPECT_EQ(RetrySettings::PATH, "/obscalc/retry");
    EXPECT_EQ(WorkerConfig::PATH, "/obscalc/worker");
    EXPECT_EQ(LoggingConfig::PATH, "/obscalc/logging");
    EXPECT_EQ(NotifierConfig::PATH, "/obscalc/notifier");
}

// ==================== Deserialization ====================

TEST(ConfigSectionsTest, MissingKeysKeepDefaults) {
    auto worker = WorkerConfig::fromJson({{"workerThreads", 2}});
    EXPECT_EQ(worker.workerThreads, 2u);
    EXPECT_EQ(worker.pollIntervalMs, 5000);
    EXPECT_EQ(worker.batchSize, 8u);
}

TEST(ConfigSectionsTest, PragmaValuesAreStringified) {
    auto db = DatabaseConfig::fromJson(
        {{"path", "/var/lib/obscalc.db"},
         {"pragmas", {{"cache_size", -4000}, {"temp_store", "MEMORY"}}}});

    EXPECT_EQ(db.path, "/var/lib/obscalc.db");
    EXPECT_EQ(db.pragmas.at("cache_size"), "-4000");
    EXPECT_EQ(db.pragmas.at("temp_store"), "MEMORY");
    EXPECT_EQ(db.busyTimeoutMs, 5000);
}

TEST(ConfigSectionsTest, SerializeRoundTrips) {
    LoggingConfig logging;
    logging.level = "debug";
    logging.logFile = "/tmp/obscalc.log";

    auto restored = LoggingConfig::fromJson(logging.toJson());
    EXPECT_EQ(restored.level, "debug");
    EXPECT_EQ(restored.logFile, "/tmp/obscalc.log");
    EXPECT_EQ(restored.maxFiles, logging.maxFiles);
}

TEST(ConfigSectionsTest, WrongTypeThrowsFromJson) {
    json bad = {{"maxRetries", "three"}};
    EXPECT_THROW(RetrySettings::fromJson(bad), json::exception);
    EXPECT_FALSE(RetrySettings::tryFromJson(bad).has_value());
    EXPECT_TRUE(RetrySettings::tryFromJson({{"maxRetries", 3}}).has_value());
}

TEST(ConfigSectionsTest, FromDocumentFindsSectionByPath) {
    json document = {
        {"obscalc", {{"notifier", {{"historySize", 50}}}}}};

    EXPECT_EQ(NotifierConfig::fromDocument(document).historySize, 50u);
    EXPECT_EQ(WorkerConfig::fromDocument(document).workerThreads, 8u);
}

// ==================== Validation ====================

TEST(ConfigSectionsTest, RetryValidationReportsEachField) {
    RetrySettings retry;
    retry.maxRetries = -1;
    retry.initialDelayMs = 0;
    retry.multiplier = 0.5;

    auto result = retry.validate();
    EXPECT_FALSE(result.isValid());
    EXPECT_FALSE(static_cast<bool>(result));
    ASSERT_EQ(result.errors.size(), 3u);
    EXPECT_EQ(result.errors[0].path, "/obscalc/retry/maxRetries");
    EXPECT_EQ(result.errors[1].path, "/obscalc/retry/initialDelayMs");
    EXPECT_EQ(result.errors[2].path, "/obscalc/retry/multiplier");
}

TEST(ConfigSectionsTest, MaxDelayBelowInitialDelayIsInvalid) {
    RetrySettings retry;
    retry.maxDelayMs = retry.initialDelayMs - 1;
    EXPECT_FALSE(retry.validate().isValid());
}

TEST(ConfigSectionsTest, WorkerBoundsAreChecked) {
    WorkerConfig worker;
    worker.workerThreads = 0;
    EXPECT_FALSE(worker.validate().isValid());

    worker.workerThreads = 257;
    EXPECT_FALSE(worker.validate().isValid());

    worker.workerThreads = 4;
    worker.computeTimeoutMs = 0;
    EXPECT_TRUE(worker.validate().isValid());

    worker.pollIntervalMs = 0;
    EXPECT_FALSE(worker.validate().isValid());
}

TEST(ConfigSectionsTest, CommitSettingsAreChecked) {
    WorkerConfig worker;
    worker.commitAttempts = 0;
    worker.commitRetryDelayMs = -1;
    worker.maxAbandonedComputes = 0;

    auto result = worker.validate();
    ASSERT_FALSE(result.isValid());
    ASSERT_EQ(result.errors.size(), 3u);
    EXPECT_EQ(result.errors[0].path, "/obscalc/worker/commitAttempts");
    EXPECT_EQ(result.errors[1].path, "/obscalc/worker/commitRetryDelayMs");
    EXPECT_EQ(result.errors[2].path, "/obscalc/worker/maxAbandonedComputes");

    worker.commitAttempts = 1;
    worker.commitRetryDelayMs = 0;
    worker.maxAbandonedComputes = 1;
    EXPECT_TRUE(worker.validate().isValid());
}

TEST(ConfigSectionsTest, UnknownLogLevelIsInvalid) {
    LoggingConfig logging;
    logging.level = "verbose";

    auto result = logging.validate();
    ASSERT_FALSE(result.isValid());
    EXPECT_NE(result.summary().find("verbose"), std::string::npos);
}

TEST(ConfigSectionsTest, PragmaNamesMustBePlain) {
    DatabaseConfig db;
    db.pragmas["cache_size; DROP TABLE t_obscalc"] = "1";
    EXPECT_FALSE(db.validate().isValid());

    db.pragmas.clear();
    db.busyTimeoutMs = -1;
    EXPECT_FALSE(db.validate().isValid());

    db.busyTimeoutMs = 0;
    db.path.clear();
    EXPECT_FALSE(db.validate().isValid());
}

TEST(ConfigSectionsTest, MergeCollectsErrors) {
    ConfigValidationResult combined;
    EXPECT_TRUE(combined.isValid());

    WorkerConfig worker;
    worker.batchSize = 0;
    NotifierConfig notifier;
    notifier.historySize = 2000000;

    combined.merge(worker.validate());
    combined.merge(notifier.validate());
    EXPECT_FALSE(combined.isValid());
    EXPECT_EQ(combined.errors.size(), 2u);
    EXPECT_EQ(combined.summary(),
              "/obscalc/worker/batchSize: must be >= 1; "
              "/obscalc/notifier/historySize: must be <= 1000000");
}
