// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

#include "obscalc_daemon.hpp"

#include <chrono>
#include <unordered_map>

#include "database/core/database.hpp"
#include "logging/core/logging_manager.hpp"

namespace obscalc::calc {

RetryConfig toRetryConfig(const config::RetrySettings& settings) {
    RetryConfig config;
    config.maxRetries = settings.maxRetries;
    config.initialDelay = std::chrono::milliseconds{settings.initialDelayMs};
    config.maxDelay = std::chrono::milliseconds{settings.maxDelayMs};
    config.multiplier = settings.multiplier;
    return config;
}

WorkerPoolConfig toWorkerPoolConfig(const config::WorkerConfig& settings) {
    WorkerPoolConfig config;
    config.workerThreads = settings.workerThreads;
    config.pollInterval = std::chrono::milliseconds{settings.pollIntervalMs};
    config.computeTimeout = std::chrono::milliseconds{settings.computeTimeoutMs};
    config.batchSize = settings.batchSize;
    config.commitAttempts = settings.commitAttempts;
    config.commitRetryDelay =
        std::chrono::milliseconds{settings.commitRetryDelayMs};
    config.maxAbandonedComputes = settings.maxAbandonedComputes;
    return config;
}

ObscalcDaemon::ObscalcDaemon(config::ObscalcConfig config,
                             std::shared_ptr<SnapshotProvider> snapshots,
                             std::shared_ptr<Calculator> calculator,
                             std::shared_ptr<ObservationDirectory> directory)
    : config_(std::move(config)),
      snapshots_(std::move(snapshots)),
      calculator_(std::move(calculator)),
      directory_(std::move(directory)) {}

ObscalcDaemon::~ObscalcDaemon() {
    stop();
}

auto ObscalcDaemon::initialize() -> std::expected<void, std::string> {
    if (initialized_) {
        return {};
    }

    configureLogging();

    try {
        db_ = std::make_shared<database::core::Database>(
            config_.database.path,
            SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
            std::chrono::milliseconds(config_.database.busyTimeoutMs));
        if (!config_.database.pragmas.empty()) {
            std::unordered_map<std::string, std::string> pragmas(
                config_.database.pragmas.begin(),
                config_.database.pragmas.end());
            db_->configure(pragmas);
        }

        notifier_ =
            std::make_shared<ChangeNotifier>(config_.notifier.historySize);
        store_ = std::make_shared<CalcStore>(db_, notifier_);
        if (!directory_) {
            directory_ = std::make_shared<SqliteObservationDirectory>(db_);
        }
        tracker_ = std::make_shared<InvalidationTracker>(store_, directory_);
        service_ = std::make_shared<CalcService>(
            store_, tracker_, RetryPolicy(toRetryConfig(config_.retry)));
        workers_ = std::make_shared<WorkerPool>(
            service_, snapshots_, calculator_,
            toWorkerPoolConfig(config_.worker));
    } catch (const std::exception& e) {
        logger_->error("Failed to initialize obscalc: {}", e.what());
        workers_.reset();
        service_.reset();
        tracker_.reset();
        store_.reset();
        notifier_.reset();
        db_.reset();
        return std::unexpected(std::string(e.what()));
    }

    // Claims of a previous process can never complete
    auto released = service_->resetCalculating();
    if (!released) {
        return std::unexpected("Cannot release abandoned claims: " +
                               std::string(serviceErrorToString(
                                   released.error())));
    }

    initialized_ = true;
    logger_->info("obscalc initialized on {}", config_.database.path);
    return {};
}

auto ObscalcDaemon::start() -> std::expected<void, std::string> {
    if (!initialized_) {
        if (auto init = initialize(); !init) {
            return init;
        }
    }

    auto started = workers_->start();
    if (!started) {
        logger_->error("Cannot start workers: {}",
                       workerPoolErrorToString(started.error()));
        return std::unexpected(
            std::string(workerPoolErrorToString(started.error())));
    }
    logger_->info("obscalc started with {} worker(s)",
                  workers_->getConfig().workerThreads);
    return {};
}

void ObscalcDaemon::stop() {
    if (workers_ && workers_->isRunning()) {
        workers_->stop();
        logger_->info("obscalc stopped");
    }
}

bool ObscalcDaemon::isInitialized() const noexcept {
    return initialized_;
}

auto ObscalcDaemon::service() const -> std::shared_ptr<CalcService> {
    return service_;
}

auto ObscalcDaemon::workers() const -> std::shared_ptr<WorkerPool> {
    return workers_;
}

auto ObscalcDaemon::notifier() const -> std::shared_ptr<ChangeNotifier> {
    return notifier_;
}

auto ObscalcDaemon::tracker() const -> std::shared_ptr<InvalidationTracker> {
    return tracker_;
}

const config::ObscalcConfig& ObscalcDaemon::getConfig() const noexcept {
    return config_;
}

void ObscalcDaemon::configureLogging() {
    const auto& settings = config_.logging;

    logging::LoggingConfig logConfig;
    logConfig.default_level = logging::levelFromString(settings.level);
    logConfig.default_pattern = settings.pattern;

    if (settings.console) {
        logging::SinkConfig console;
        console.name = "console";
        console.type = "console";
        console.level = logConfig.default_level;
        logConfig.sinks.push_back(console);
    }
    if (!settings.logFile.empty()) {
        logging::SinkConfig file;
        file.name = "file";
        file.type = settings.maxFileSize > 0 ? "rotating_file" : "file";
        file.level = logConfig.default_level;
        file.file_path = settings.logFile;
        file.max_file_size = settings.maxFileSize;
        file.max_files = settings.maxFiles;
        logConfig.sinks.push_back(file);
    }

    auto& manager = logging::LoggingManager::getInstance();
    manager.initialize(logConfig);
    logger_ = manager.getLogger("obscalc.daemon");
}

}  // namespace obscalc::calc
