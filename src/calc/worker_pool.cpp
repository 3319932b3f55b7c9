// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

#include "worker_pool.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

namespace obscalc::calc {

namespace {

using ComputeOutcome = std::expected<CalcResult, CalcFailure>;

/// Wake state shared with notifier and tracker callbacks, which may run
/// after the pool is gone.
struct WakeSignal {
    std::mutex mutex;
    std::condition_variable condition;
    bool stopping{false};
    uint64_t generation{0};

    void notify() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            ++generation;
        }
        condition.notify_all();
    }
};

/// Hand-off between a compute thread and the worker waiting on it.
struct ComputeSlot {
    std::mutex mutex;
    bool finished{false};
    bool abandoned{false};
};

CalcFailure thrownFailure(std::string_view what) {
    return CalcFailure{CalcError::RemoteService,
                       std::string("Calculator threw: ") + std::string(what)};
}

ComputeOutcome runCalculator(Calculator& calculator,
                             const ObservationSnapshot& snapshot) {
    try {
        return calculator.calculate(snapshot);
    } catch (const std::exception& e) {
        return std::unexpected(thrownFailure(e.what()));
    } catch (...) {
        return std::unexpected(thrownFailure("non-standard exception"));
    }
}

}  // namespace

class WorkerPool::Impl {
public:
    Impl(std::shared_ptr<CalcService> service,
         std::shared_ptr<SnapshotProvider> snapshots,
         std::shared_ptr<Calculator> calculator,
         const WorkerPoolConfig& config)
        : service_(std::move(service)),
          snapshots_(std::move(snapshots)),
          calculator_(std::move(calculator)),
          config_(config) {
        if (!service_ || !snapshots_ || !calculator_) {
            throw std::invalid_argument(
                "WorkerPool requires a service, a snapshot provider and a "
                "calculator");
        }
        spdlog::info("WorkerPool created with {} worker(s)",
                     config_.workerThreads);
    }

    ~Impl() { stop(); }

    WorkerResult<void> start() {
        std::lock_guard<std::mutex> lock(lifecycleMutex_);

        if (running_) {
            return {};
        }
        if (config_.workerThreads == 0 ||
            config_.pollInterval <= std::chrono::milliseconds::zero() ||
            config_.computeTimeout < std::chrono::milliseconds::zero() ||
            config_.commitAttempts < 1 ||
            config_.commitRetryDelay < std::chrono::milliseconds::zero() ||
            config_.maxAbandonedComputes == 0) {
            spdlog::error("Invalid worker pool configuration");
            return std::unexpected(WorkerPoolError::InvalidConfiguration);
        }

        {
            std::lock_guard<std::mutex> wakeLock(wake_->mutex);
            wake_->stopping = false;
        }

        std::weak_ptr<WakeSignal> signal = wake_;
        if (auto notifier = service_->getNotifier()) {
            pendingSubscription_ = notifier->subscribe(
                CalcState::Pending, [signal](const CalcChangeEvent&) {
                    if (auto wake = signal.lock()) {
                        wake->notify();
                    }
                });
        }
        service_->getTracker()->setSweepListener([signal] {
            if (auto wake = signal.lock()) {
                wake->notify();
            }
        });

        for (size_t i = 0; i < config_.workerThreads; ++i) {
            workers_.emplace_back([this, i] { workerThread(i); });
        }

        running_ = true;
        spdlog::info("WorkerPool started with {} worker(s)", workers_.size());
        return {};
    }

    void stop() {
        std::lock_guard<std::mutex> lock(lifecycleMutex_);

        if (!running_) {
            return;
        }

        spdlog::info("Stopping worker pool");
        {
            std::lock_guard<std::mutex> wakeLock(wake_->mutex);
            wake_->stopping = true;
        }
        wake_->condition.notify_all();

        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers_.clear();

        if (pendingSubscription_) {
            if (auto notifier = service_->getNotifier()) {
                notifier->unsubscribe(*pendingSubscription_);
            }
            pendingSubscription_.reset();
        }
        service_->getTracker()->setSweepListener(nullptr);

        running_ = false;
        spdlog::info("Worker pool stopped");
    }

    bool isRunning() const noexcept { return running_; }

    WorkerResult<size_t> drainOnce(size_t max) {
        {
            std::lock_guard<std::mutex> lock(wake_->mutex);
            if (wake_->stopping && running_) {
                return std::unexpected(WorkerPoolError::ShutdownInProgress);
            }
        }

        releaseOrphans();

        auto batch = service_->claimBatch(max);
        if (!batch) {
            recordStoreError();
            return std::unexpected(WorkerPoolError::StoreUnavailable);
        }

        for (const auto& pending : *batch) {
            process(pending);
        }
        return batch->size();
    }

    void wake() { wake_->notify(); }

    WorkerPoolStats statistics() const {
        WorkerPoolStats stats;
        {
            std::lock_guard<std::mutex> lock(statsMutex_);
            stats = stats_;
        }
        {
            std::lock_guard<std::mutex> lock(orphanMutex_);
            stats.pendingReleases = orphaned_.size();
        }
        stats.abandonedComputes = abandoned_->load();
        return stats;
    }

    const WorkerPoolConfig& config() const noexcept { return config_; }

private:
    void workerThread(size_t workerId) {
        spdlog::debug("Worker {} started", workerId);

        while (true) {
            uint64_t seen;
            {
                std::lock_guard<std::mutex> lock(wake_->mutex);
                if (wake_->stopping) {
                    break;
                }
                seen = wake_->generation;
            }

            if (processNext()) {
                continue;
            }

            std::unique_lock<std::mutex> lock(wake_->mutex);
            wake_->condition.wait_for(lock, config_.pollInterval, [&] {
                return wake_->stopping || wake_->generation != seen;
            });
        }

        spdlog::debug("Worker {} stopped", workerId);
    }

    /// Claims and processes one record; false when nothing was claimable.
    bool processNext() {
        releaseOrphans();

        auto pending = service_->claim();
        if (!pending) {
            recordStoreError();
            return false;
        }
        if (!pending->has_value()) {
            return false;
        }
        process(**pending);
        return true;
    }

    void process(const PendingCalc& pending) {
        {
            std::lock_guard<std::mutex> lock(statsMutex_);
            stats_.claimed++;
        }
        spdlog::debug("Calculating {} (version {}, attempt {})",
                      pending.observationId, pending.snapshotVersion,
                      pending.failureCount + 1);

        auto snapshot = snapshots_->loadSnapshot(pending);
        if (!snapshot) {
            recordFailure(pending, snapshot.error());
            return;
        }

        auto start = std::chrono::steady_clock::now();
        bool timedOut = false;
        auto outcome = compute(*snapshot, timedOut);
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        {
            std::lock_guard<std::mutex> lock(statsMutex_);
            if (timedOut) {
                stats_.timedOut++;
            }
            double elapsedMs = static_cast<double>(elapsed.count());
            size_t samples = ++computeSamples_;
            stats_.averageComputeTimeMs =
                (stats_.averageComputeTimeMs * (samples - 1) + elapsedMs) /
                samples;
            stats_.maxComputeTimeMs =
                std::max(stats_.maxComputeTimeMs, elapsedMs);
        }

        if (!outcome) {
            recordFailure(pending, outcome.error());
            return;
        }

        auto committed = commitWithRetry(pending, [&] {
            return service_->complete(pending.observationId,
                                      pending.snapshotVersion, *outcome);
        });
        if (!committed) {
            recordCommitError(pending, committed.error());
            return;
        }

        std::lock_guard<std::mutex> lock(statsMutex_);
        if (committed->superseded) {
            stats_.superseded++;
        } else {
            stats_.completed++;
            stats_.lastCompletion = std::chrono::system_clock::now();
        }
    }

    ComputeOutcome compute(const ObservationSnapshot& snapshot,
                           bool& timedOut) {
        if (config_.computeTimeout == std::chrono::milliseconds::zero()) {
            return runCalculator(*calculator_, snapshot);
        }

        size_t abandoned = abandoned_->load();
        if (abandoned >= config_.maxAbandonedComputes) {
            spdlog::warn(
                "Not computing {}: {} timed-out computes are still running",
                snapshot.observationId, abandoned);
            {
                std::lock_guard<std::mutex> lock(statsMutex_);
                stats_.refusedComputes++;
            }
            return std::unexpected(CalcFailure{
                CalcError::RemoteService,
                "Too many timed-out calculations still running"});
        }

        // The compute thread owns what it touches, so it may outlive us
        auto promise = std::make_shared<std::promise<ComputeOutcome>>();
        auto future = promise->get_future();
        auto slot = std::make_shared<ComputeSlot>();
        std::thread([calculator = calculator_, snapshot, promise, slot,
                     counter = abandoned_] {
            promise->set_value(runCalculator(*calculator, snapshot));

            std::lock_guard<std::mutex> lock(slot->mutex);
            slot->finished = true;
            if (slot->abandoned) {
                counter->fetch_sub(1);
            }
        }).detach();

        if (future.wait_for(config_.computeTimeout) ==
            std::future_status::timeout) {
            std::lock_guard<std::mutex> lock(slot->mutex);
            if (!slot->finished) {
                slot->abandoned = true;
                size_t running = abandoned_->fetch_add(1) + 1;
                timedOut = true;
                spdlog::warn(
                    "Calculation of {} timed out after {} ms ({} abandoned "
                    "compute(s) running)",
                    snapshot.observationId, config_.computeTimeout.count(),
                    running);
                return std::unexpected(CalcFailure{
                    CalcError::RemoteService,
                    "Calculation timed out after " +
                        std::to_string(config_.computeTimeout.count()) +
                        " ms"});
            }
        }
        return future.get();
    }

    void recordFailure(const PendingCalc& pending, const CalcFailure& failure) {
        bool transient = failure.error != CalcError::InvalidInput;
        spdlog::debug("Calculation of {} failed: {} ({})",
                      pending.observationId, failure.message,
                      calcErrorToString(failure.error));

        auto recorded = commitWithRetry(pending, [&] {
            return service_->fail(pending.observationId,
                                  pending.snapshotVersion, transient,
                                  failure.message);
        });
        if (!recorded) {
            recordCommitError(pending, recorded.error());
            return;
        }

        std::lock_guard<std::mutex> lock(statsMutex_);
        if (recorded->superseded) {
            stats_.superseded++;
        } else if (recorded->newState == CalcState::Retry) {
            stats_.retried++;
        } else {
            stats_.failed++;
        }
    }

    /// Repeats a token-checked commit while the store reports unavailable.
    template <typename Commit>
    ServiceResult<StoreOutcome> commitWithRetry(const PendingCalc& pending,
                                                Commit&& commit) {
        auto delay = config_.commitRetryDelay;
        auto result = commit();
        for (int attempt = 1; !result &&
                              result.error() == ServiceError::StoreUnavailable &&
                              attempt < config_.commitAttempts;
             ++attempt) {
            recordStoreError();
            spdlog::warn("Recording outcome for {} failed (attempt {} of {}), "
                         "retrying in {} ms",
                         pending.observationId, attempt,
                         config_.commitAttempts, delay.count());
            if (!pauseUnlessStopping(delay)) {
                break;
            }
            delay *= 2;
            result = commit();
        }
        return result;
    }

    /// False when the pool started stopping during the pause.
    bool pauseUnlessStopping(std::chrono::milliseconds delay) {
        std::unique_lock<std::mutex> lock(wake_->mutex);
        return !wake_->condition.wait_for(lock, delay,
                                          [&] { return wake_->stopping; });
    }

    void recordCommitError(const PendingCalc& pending, ServiceError error) {
        if (error == ServiceError::ClaimLost) {
            spdlog::warn("Dropping result for {}: claim lost",
                         pending.observationId);
            std::lock_guard<std::mutex> lock(statsMutex_);
            stats_.claimLost++;
            return;
        }
        spdlog::error("Cannot record outcome for {}: {}",
                      pending.observationId, serviceErrorToString(error));
        recordStoreError();
        if (!releaseClaim(pending)) {
            std::lock_guard<std::mutex> lock(orphanMutex_);
            orphaned_.push_back(pending);
        }
    }

    /// Hands a claim back to the store; false while the store is down.
    bool releaseClaim(const PendingCalc& pending) {
        auto released =
            service_->release(pending.observationId, pending.snapshotVersion);
        if (released) {
            spdlog::info("Released claim on {} (version {})",
                         pending.observationId, pending.snapshotVersion);
            std::lock_guard<std::mutex> lock(statsMutex_);
            stats_.released++;
            return true;
        }
        if (released.error() == ServiceError::ClaimLost ||
            released.error() == ServiceError::NotFound) {
            spdlog::debug("Claim on {} already gone: {}", pending.observationId,
                          serviceErrorToString(released.error()));
            return true;
        }
        spdlog::error("Cannot release claim on {}: {}", pending.observationId,
                      serviceErrorToString(released.error()));
        recordStoreError();
        return false;
    }

    void releaseOrphans() {
        std::vector<PendingCalc> orphans;
        {
            std::lock_guard<std::mutex> lock(orphanMutex_);
            orphans.swap(orphaned_);
        }
        if (orphans.empty()) {
            return;
        }

        std::vector<PendingCalc> remaining;
        for (const auto& pending : orphans) {
            if (!releaseClaim(pending)) {
                remaining.push_back(pending);
            }
        }
        if (!remaining.empty()) {
            std::lock_guard<std::mutex> lock(orphanMutex_);
            orphaned_.insert(orphaned_.end(), remaining.begin(),
                             remaining.end());
        }
    }

    void recordStoreError() {
        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_.storeErrors++;
    }

    std::shared_ptr<CalcService> service_;
    std::shared_ptr<SnapshotProvider> snapshots_;
    std::shared_ptr<Calculator> calculator_;
    WorkerPoolConfig config_;

    std::mutex lifecycleMutex_;
    std::atomic<bool> running_{false};
    std::vector<std::thread> workers_;
    std::optional<SubscriptionId> pendingSubscription_;

    std::shared_ptr<WakeSignal> wake_{std::make_shared<WakeSignal>()};
    std::shared_ptr<std::atomic<size_t>> abandoned_{
        std::make_shared<std::atomic<size_t>>(0)};

    mutable std::mutex orphanMutex_;
    std::vector<PendingCalc> orphaned_;

    mutable std::mutex statsMutex_;
    WorkerPoolStats stats_;
    size_t computeSamples_{0};
};

// WorkerPool public methods forwarding to Impl

WorkerPool::WorkerPool(std::shared_ptr<CalcService> service,
                       std::shared_ptr<SnapshotProvider> snapshots,
                       std::shared_ptr<Calculator> calculator,
                       const WorkerPoolConfig& config)
    : pImpl_(std::make_unique<Impl>(std::move(service), std::move(snapshots),
                                    std::move(calculator), config)) {}

WorkerPool::~WorkerPool() = default;

WorkerResult<void> WorkerPool::start() {
    return pImpl_->start();
}

void WorkerPool::stop() {
    pImpl_->stop();
}

bool WorkerPool::isRunning() const noexcept {
    return pImpl_->isRunning();
}

WorkerResult<size_t> WorkerPool::drainOnce() {
    return pImpl_->drainOnce(pImpl_->config().batchSize);
}

WorkerResult<size_t> WorkerPool::drainOnce(size_t max) {
    return pImpl_->drainOnce(max);
}

void WorkerPool::wake() {
    pImpl_->wake();
}

WorkerPoolStats WorkerPool::statistics() const {
    return pImpl_->statistics();
}

const WorkerPoolConfig& WorkerPool::getConfig() const noexcept {
    return pImpl_->config();
}

}  // namespace obscalc::calc
