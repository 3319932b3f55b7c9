// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

/**
 * @file worker_pool.hpp
 * @brief Worker threads that drain claimable calculations
 * @date 2024
 *
 * Each worker runs the loop:
 * - drain queued owner sweeps and claim the oldest claimable record
 * - load the observation snapshot
 * - run the calculator under the compute timeout
 * - commit the result or record the failure
 *
 * Workers sleep between polls and are woken by new pending records.
 */

#ifndef OBSCALC_CALC_WORKER_POOL_HPP
#define OBSCALC_CALC_WORKER_POOL_HPP

#include <chrono>
#include <cstddef>
#include <expected>
#include <memory>
#include <string_view>

#include "calc_service.hpp"
#include "calculator.hpp"

namespace obscalc::calc {

/**
 * @brief Error codes for worker pool operations
 */
enum class WorkerPoolError {
    InvalidConfiguration,
    ShutdownInProgress,
    StoreUnavailable
};

[[nodiscard]] constexpr std::string_view workerPoolErrorToString(
    WorkerPoolError error) noexcept {
    switch (error) {
        case WorkerPoolError::InvalidConfiguration:
            return "Invalid configuration";
        case WorkerPoolError::ShutdownInProgress:
            return "Shutdown in progress";
        case WorkerPoolError::StoreUnavailable: return "Store unavailable";
    }
    return "Unknown error";
}

template <typename T>
using WorkerResult = std::expected<T, WorkerPoolError>;

/**
 * @brief Configuration for the worker pool
 */
struct WorkerPoolConfig {
    size_t workerThreads{8};                          ///< Worker threads
    std::chrono::milliseconds pollInterval{5000};     ///< Idle poll period
    std::chrono::milliseconds computeTimeout{60000};  ///< 0 runs inline
    size_t batchSize{8};                              ///< drainOnce default
    int commitAttempts{3};                            ///< Tries per outcome
    std::chrono::milliseconds commitRetryDelay{200};  ///< Doubles per try
    size_t maxAbandonedComputes{16};  ///< Timed-out computes still running
};

/**
 * @brief Statistics for the worker pool
 */
struct WorkerPoolStats {
    size_t claimed{0};        ///< Claims won
    size_t completed{0};      ///< Results committed as ready
    size_t superseded{0};     ///< Results dropped by a later invalidation
    size_t retried{0};        ///< Failures scheduled for retry
    size_t failed{0};         ///< Terminal failures
    size_t timedOut{0};       ///< Computes that hit the timeout
    size_t claimLost{0};      ///< Commits rejected because the claim was lost
    size_t storeErrors{0};    ///< Store calls that reported unavailable
    size_t released{0};       ///< Claims handed back after commit failures
    size_t pendingReleases{0};    ///< Claims still waiting to be handed back
    size_t abandonedComputes{0};  ///< Timed-out computes still running
    size_t refusedComputes{0};    ///< Computes refused at the abandoned cap
    double averageComputeTimeMs{0};
    double maxComputeTimeMs{0};
    std::chrono::system_clock::time_point lastCompletion;
};

/**
 * @brief Fixed set of threads computing claimed observations.
 *
 * A timed-out compute keeps running on its own thread; its late result is
 * never committed. Calculator exceptions and timeouts are transient
 * failures, CalcError::InvalidInput is permanent. While
 * maxAbandonedComputes timed-out computes are still running, new computes
 * fail transiently instead of starting another thread.
 *
 * An outcome the store cannot record is retried commitAttempts times. The
 * claim is then released so the record can be claimed again; a release
 * that also fails is retried before every later claim.
 */
class WorkerPool {
public:
    WorkerPool(std::shared_ptr<CalcService> service,
               std::shared_ptr<SnapshotProvider> snapshots,
               std::shared_ptr<Calculator> calculator,
               const WorkerPoolConfig& config = {});

    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Start the worker threads. No-op if already running.
     */
    WorkerResult<void> start();

    /**
     * @brief Stop and join the workers. In-flight computes finish first.
     */
    void stop();

    [[nodiscard]] bool isRunning() const noexcept;

    /**
     * @brief Claim and process up to batchSize records on this thread.
     * @return Number of claims processed
     */
    WorkerResult<size_t> drainOnce();

    WorkerResult<size_t> drainOnce(size_t max);

    /// Wake idle workers, e.g. after an invalidation.
    void wake();

    [[nodiscard]] WorkerPoolStats statistics() const;

    [[nodiscard]] const WorkerPoolConfig& getConfig() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

}  // namespace obscalc::calc

#endif  // OBSCALC_CALC_WORKER_POOL_HPP
