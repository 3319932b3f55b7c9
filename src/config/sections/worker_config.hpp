// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

/*************************************************

Date: 2024-12

Description: Worker pool configuration

**************************************************/

#ifndef OBSCALC_CONFIG_SECTIONS_WORKER_CONFIG_HPP
#define OBSCALC_CONFIG_SECTIONS_WORKER_CONFIG_HPP

#include <cstddef>
#include <cstdint>

#include "../core/config_section.hpp"

namespace obscalc::config {

struct WorkerConfig : ConfigSection<WorkerConfig> {
    static constexpr std::string_view PATH = "/obscalc/worker";

    size_t workerThreads{8};
    int64_t pollIntervalMs{5000};     ///< Idle poll, picks up due retries
    int64_t computeTimeoutMs{60000};  ///< 0 runs the calculator inline
    size_t batchSize{8};
    int commitAttempts{3};            ///< Tries to record an outcome
    int64_t commitRetryDelayMs{200};  ///< Doubles between tries
    size_t maxAbandonedComputes{16};  ///< Timed-out computes still running

    [[nodiscard]] json serialize() const {
        return {{"workerThreads", workerThreads},
                {"pollIntervalMs", pollIntervalMs},
                {"computeTimeoutMs", computeTimeoutMs},
                {"batchSize", batchSize},
                {"commitAttempts", commitAttempts},
                {"commitRetryDelayMs", commitRetryDelayMs},
                {"maxAbandonedComputes", maxAbandonedComputes}};
    }

    [[nodiscard]] static WorkerConfig deserialize(const json& j) {
        WorkerConfig cfg;
        cfg.workerThreads = j.value("workerThreads", cfg.workerThreads);
        cfg.pollIntervalMs = j.value("pollIntervalMs", cfg.pollIntervalMs);
        cfg.computeTimeoutMs = j.value("computeTimeoutMs", cfg.computeTimeoutMs);
        cfg.batchSize = j.value("batchSize", cfg.batchSize);
        cfg.commitAttempts = j.value("commitAttempts", cfg.commitAttempts);
        cfg.commitRetryDelayMs =
            j.value("commitRetryDelayMs", cfg.commitRetryDelayMs);
        cfg.maxAbandonedComputes =
            j.value("maxAbandonedComputes", cfg.maxAbandonedComputes);
        return cfg;
    }

    [[nodiscard]] ConfigValidationResult validate() const {
        ConfigValidationResult result;
        require(result, workerThreads >= 1 && workerThreads <= 256,
                "workerThreads", "must be between 1 and 256");
        require(result, pollIntervalMs > 0, "pollIntervalMs", "must be > 0");
        require(result, computeTimeoutMs >= 0, "computeTimeoutMs",
                "must be >= 0");
        require(result, batchSize >= 1, "batchSize", "must be >= 1");
        require(result, commitAttempts >= 1, "commitAttempts", "must be >= 1");
        require(result, commitRetryDelayMs >= 0, "commitRetryDelayMs",
                "must be >= 0");
        require(result, maxAbandonedComputes >= 1, "maxAbandonedComputes",
                "must be >= 1");
        return result;
    }
};

}  // namespace obscalc::config

#endif  // OBSCALC_CONFIG_SECTIONS_WORKER_CONFIG_HPP
