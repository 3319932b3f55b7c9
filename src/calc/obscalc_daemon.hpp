// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

/*************************************************

Date: 2024-12

Description: Wires configuration, storage, service and workers together

**************************************************/

#ifndef OBSCALC_CALC_OBSCALC_DAEMON_HPP
#define OBSCALC_CALC_OBSCALC_DAEMON_HPP

#include <expected>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "calc_service.hpp"
#include "calculator.hpp"
#include "config/obscalc_config.hpp"
#include "observation_directory.hpp"
#include "worker_pool.hpp"

namespace obscalc::database::core {
class Database;
}  // namespace obscalc::database::core

namespace obscalc::calc {

/// RetryPolicy parameters from the `/obscalc/retry` section.
[[nodiscard]] RetryConfig toRetryConfig(const config::RetrySettings& settings);

/// WorkerPool parameters from the `/obscalc/worker` section.
[[nodiscard]] WorkerPoolConfig toWorkerPoolConfig(
    const config::WorkerConfig& settings);

/**
 * @brief Owns every component of a running cache.
 *
 * initialize() opens the database, builds the component graph and releases
 * claims left behind by a previous process. start() then launches the
 * workers. Nothing is started implicitly.
 */
class ObscalcDaemon {
public:
    /**
     * @param directory Upstream lookup; a SqliteObservationDirectory over the
     * cache database when null
     */
    ObscalcDaemon(config::ObscalcConfig config,
                  std::shared_ptr<SnapshotProvider> snapshots,
                  std::shared_ptr<Calculator> calculator,
                  std::shared_ptr<ObservationDirectory> directory = nullptr);

    ~ObscalcDaemon();

    ObscalcDaemon(const ObscalcDaemon&) = delete;
    ObscalcDaemon& operator=(const ObscalcDaemon&) = delete;

    /**
     * @brief Configure logging, open the store and recover claims
     */
    auto initialize() -> std::expected<void, std::string>;

    auto start() -> std::expected<void, std::string>;

    void stop();

    [[nodiscard]] bool isInitialized() const noexcept;

    [[nodiscard]] auto service() const -> std::shared_ptr<CalcService>;

    [[nodiscard]] auto workers() const -> std::shared_ptr<WorkerPool>;

    [[nodiscard]] auto notifier() const -> std::shared_ptr<ChangeNotifier>;

    [[nodiscard]] auto tracker() const -> std::shared_ptr<InvalidationTracker>;

    [[nodiscard]] const config::ObscalcConfig& getConfig() const noexcept;

private:
    void configureLogging();

    config::ObscalcConfig config_;
    std::shared_ptr<SnapshotProvider> snapshots_;
    std::shared_ptr<Calculator> calculator_;
    std::shared_ptr<ObservationDirectory> directory_;

    std::shared_ptr<database::core::Database> db_;
    std::shared_ptr<ChangeNotifier> notifier_;
    std::shared_ptr<CalcStore> store_;
    std::shared_ptr<InvalidationTracker> tracker_;
    std::shared_ptr<CalcService> service_;
    std::shared_ptr<WorkerPool> workers_;
    std::shared_ptr<spdlog::logger> logger_;
    bool initialized_{false};
};

}  // namespace obscalc::calc

#endif  // OBSCALC_CALC_OBSCALC_DAEMON_HPP
