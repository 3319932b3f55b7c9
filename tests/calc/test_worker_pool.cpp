// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

/*
 * test_worker_pool.cpp
 *
 * Tests for the background calculation workers
 * - Synchronous drain with success, retry and terminal failure
 * - Results superseded by invalidation during compute
 * - Compute timeout and the cap on abandoned computes
 * - Commit retry and claim release while the store is locked
 * - Background threads woken by new invalidations
 * - Notifications in flight while the pool is destroyed
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "calc/calc_service.hpp"
#include "calc/calc_test_support.hpp"
#include "calc/worker_pool.hpp"
#include "database/core/database.hpp"
#include "database/core/transaction.hpp"

using namespace obscalc::calc;
using namespace testing;
using namespace std::chrono_literals;
using obscalc::calc::test::CalcOutcome;
using obscalc::calc::test::FixedCalculator;
using obscalc::calc::test::MockCalculator;
using obscalc::calc::test::MockSnapshotProvider;
using obscalc::calc::test::PassThroughSnapshots;
using obscalc::calc::test::sampleResult;
using obscalc::calc::test::snapshotFor;
using obscalc::calc::test::SnapshotOutcome;
using obscalc::calc::test::StaticDirectory;
using obscalc::database::core::Database;
using obscalc::database::core::Transaction;
using obscalc::database::core::TransactionMode;

namespace {

/// Blocks every compute until release() is called.
class GatedCalculator : public Calculator {
public:
    GatedCalculator() : gate_(released_.get_future().share()) {}

    auto calculate(const ObservationSnapshot&) -> CalcOutcome override {
        calls_++;
        gate_.wait();
        return sampleResult();
    }

    void release() { released_.set_value(); }

    int calls() const { return calls_.load(); }

private:
    std::promise<void> released_;
    std::shared_future<void> gate_;
    std::atomic<int> calls_{0};
};

/// Takes the write lock on a second connection during its first compute,
/// so the worker cannot record the outcome until unlock().
class StoreLockingCalculator : public Calculator {
public:
    explicit StoreLockingCalculator(std::shared_ptr<Database> other)
        : other_(std::move(other)), locked_(lockedPromise_.get_future()) {}

    auto calculate(const ObservationSnapshot&) -> CalcOutcome override {
        if (calls_++ == 0) {
            lock_ = other_->beginTransaction(TransactionMode::Immediate);
            lockedPromise_.set_value();
        }
        return sampleResult();
    }

    void waitLocked() { locked_.wait(); }

    void unlock() { lock_->rollback(); }

    int calls() const { return calls_.load(); }

private:
    std::shared_ptr<Database> other_;
    std::unique_ptr<Transaction> lock_;
    std::promise<void> lockedPromise_;
    std::future<void> locked_;
    std::atomic<int> calls_{0};
};

}  // namespace

class WorkerPoolTest : public Test {
protected:
    void SetUp() override {
        db = std::make_shared<Database>(":memory:");
        auto notifier = std::make_shared<ChangeNotifier>();
        auto store = std::make_shared<CalcStore>(db, notifier);
        directory = std::make_shared<StaticDirectory>();
        for (auto id : {"o-1", "o-2", "o-3"}) {
            directory->addObservation(id, "p-1");
        }
        auto tracker = std::make_shared<InvalidationTracker>(store, directory);
        service = std::make_shared<CalcService>(store, tracker);

        snapshots = std::make_shared<NiceMock<MockSnapshotProvider>>();
        calculator = std::make_shared<NiceMock<MockCalculator>>();
        ON_CALL(*snapshots, loadSnapshot(_))
            .WillByDefault([](const PendingCalc& pending) -> SnapshotOutcome {
                return snapshotFor(pending);
            });

        config.workerThreads = 1;
        config.pollInterval = 20ms;
        config.computeTimeout = 0ms;
        config.batchSize = 8;
    }

    void TearDown() override {
        service.reset();
        db.reset();
    }

    void invalidate(const ObservationId& observationId) {
        ASSERT_TRUE(service->notifyChanged(observationId, currentTime()));
    }

    CalcState stateOf(const ObservationId& observationId) {
        auto view = service->getResult(observationId);
        EXPECT_TRUE(view.has_value());
        return view ? view->state : CalcState::Pending;
    }

    bool waitForState(const ObservationId& observationId, CalcState state,
                      std::chrono::milliseconds timeout = 5s) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            auto view = service->getResult(observationId);
            if (view && view->state == state) {
                return true;
            }
            std::this_thread::sleep_for(5ms);
        }
        return false;
    }

    std::shared_ptr<Database> db;
    std::shared_ptr<StaticDirectory> directory;
    std::shared_ptr<CalcService> service;
    std::shared_ptr<NiceMock<MockSnapshotProvider>> snapshots;
    std::shared_ptr<NiceMock<MockCalculator>> calculator;
    WorkerPoolConfig config;
};

// ==================== Synchronous drain ====================

TEST_F(WorkerPoolTest, DrainCompletesClaimableRecords) {
    invalidate("o-1");
    invalidate("o-2");
    EXPECT_CALL(*calculator, calculate(_))
        .Times(2)
        .WillRepeatedly(Return(CalcOutcome(sampleResult())));

    WorkerPool pool(service, snapshots, calculator, config);
    auto drained = pool.drainOnce();
    ASSERT_TRUE(drained.has_value());
    EXPECT_EQ(*drained, 2u);

    EXPECT_EQ(stateOf("o-1"), CalcState::Ready);
    EXPECT_EQ(stateOf("o-2"), CalcState::Ready);

    auto stats = pool.statistics();
    EXPECT_EQ(stats.claimed, 2u);
    EXPECT_EQ(stats.completed, 2u);
    EXPECT_EQ(stats.failed, 0u);
}

TEST_F(WorkerPoolTest, DrainRespectsMaximum) {
    invalidate("o-1");
    invalidate("o-2");
    invalidate("o-3");
    ON_CALL(*calculator, calculate(_))
        .WillByDefault(Return(CalcOutcome(sampleResult())));

    WorkerPool pool(service, snapshots, calculator, config);
    EXPECT_EQ(*pool.drainOnce(2), 2u);
    EXPECT_EQ(*pool.drainOnce(2), 1u);
    EXPECT_EQ(*pool.drainOnce(2), 0u);
}

TEST_F(WorkerPoolTest, RemoteServiceErrorSchedulesRetry) {
    invalidate("o-1");
    EXPECT_CALL(*calculator, calculate(_))
        .WillOnce(Return(CalcOutcome(std::unexpected(
            CalcFailure{CalcError::RemoteService, "ITC unreachable"}))));

    WorkerPool pool(service, snapshots, calculator, config);
    ASSERT_TRUE(pool.drainOnce());

    EXPECT_EQ(stateOf("o-1"), CalcState::Retry);
    EXPECT_EQ(pool.statistics().retried, 1u);
}

TEST_F(WorkerPoolTest, InvalidInputFailsPermanently) {
    invalidate("o-1");
    EXPECT_CALL(*calculator, calculate(_))
        .WillOnce(Return(CalcOutcome(std::unexpected(
            CalcFailure{CalcError::InvalidInput, "No science band"}))));

    WorkerPool pool(service, snapshots, calculator, config);
    ASSERT_TRUE(pool.drainOnce());

    auto view = service->getResult("o-1");
    ASSERT_TRUE(view.has_value());
    EXPECT_EQ(view->state, CalcState::Failed);
    EXPECT_EQ(view->errorMessage, "No science band");
    EXPECT_EQ(pool.statistics().failed, 1u);
}

TEST_F(WorkerPoolTest, SnapshotFailureIsRecorded) {
    invalidate("o-1");
    EXPECT_CALL(*snapshots, loadSnapshot(_))
        .WillOnce(Return(SnapshotOutcome(std::unexpected(
            CalcFailure{CalcError::InvalidInput, "Observation incomplete"}))));
    EXPECT_CALL(*calculator, calculate(_)).Times(0);

    WorkerPool pool(service, snapshots, calculator, config);
    ASSERT_TRUE(pool.drainOnce());

    EXPECT_EQ(stateOf("o-1"), CalcState::Failed);
}

TEST_F(WorkerPoolTest, CalculatorExceptionIsTransient) {
    invalidate("o-1");
    EXPECT_CALL(*calculator, calculate(_))
        .WillOnce(Throw(std::runtime_error("connection reset")));

    WorkerPool pool(service, snapshots, calculator, config);
    ASSERT_TRUE(pool.drainOnce());

    EXPECT_EQ(stateOf("o-1"), CalcState::Retry);
}

TEST_F(WorkerPoolTest, NonStandardCalculatorThrowIsTransient) {
    invalidate("o-1");
    invalidate("o-2");
    EXPECT_CALL(*calculator, calculate(_))
        .Times(2)
        .WillRepeatedly([](const ObservationSnapshot&) -> CalcOutcome {
            throw 7;
        });

    WorkerPool inlinePool(service, snapshots, calculator, config);
    ASSERT_TRUE(inlinePool.drainOnce(1));

    config.computeTimeout = 5000ms;
    WorkerPool threadedPool(service, snapshots, calculator, config);
    ASSERT_TRUE(threadedPool.drainOnce(1));

    EXPECT_EQ(stateOf("o-1"), CalcState::Retry);
    EXPECT_EQ(stateOf("o-2"), CalcState::Retry);
    EXPECT_EQ(inlinePool.statistics().retried, 1u);
    EXPECT_EQ(threadedPool.statistics().retried, 1u);
}

TEST_F(WorkerPoolTest, InvalidationDuringComputeSupersedesResult) {
    invalidate("o-1");
    EXPECT_CALL(*calculator, calculate(_))
        .WillOnce([this](const ObservationSnapshot& snapshot) -> CalcOutcome {
            EXPECT_EQ(*service->notifyChanged(snapshot.observationId,
                                              currentTime() + 1s),
                      InvalidationOutcome::Superseded);
            return sampleResult();
        });

    WorkerPool pool(service, snapshots, calculator, config);
    ASSERT_TRUE(pool.drainOnce());

    auto view = service->getResult("o-1");
    ASSERT_TRUE(view.has_value());
    EXPECT_EQ(view->state, CalcState::Pending);
    EXPECT_FALSE(view->result.has_value());
    EXPECT_EQ(pool.statistics().superseded, 1u);
    EXPECT_EQ(pool.statistics().completed, 0u);
}

TEST_F(WorkerPoolTest, ComputeTimeoutIsTransient) {
    invalidate("o-1");
    auto gated = std::make_shared<GatedCalculator>();
    config.computeTimeout = 50ms;

    WorkerPool pool(service, snapshots, gated, config);
    ASSERT_TRUE(pool.drainOnce());
    gated->release();

    EXPECT_EQ(stateOf("o-1"), CalcState::Retry);
    auto stats = pool.statistics();
    EXPECT_EQ(stats.timedOut, 1u);
    EXPECT_EQ(stats.retried, 1u);
}

TEST_F(WorkerPoolTest, ComputeWithinTimeoutCompletes) {
    invalidate("o-1");
    config.computeTimeout = 5000ms;

    WorkerPool pool(service, snapshots, std::make_shared<FixedCalculator>(),
                    config);
    ASSERT_TRUE(pool.drainOnce());

    EXPECT_EQ(stateOf("o-1"), CalcState::Ready);
    EXPECT_EQ(pool.statistics().timedOut, 0u);
}

TEST_F(WorkerPoolTest, AbandonedComputesAreCapped) {
    invalidate("o-1");
    invalidate("o-2");
    auto gated = std::make_shared<GatedCalculator>();
    config.computeTimeout = 20ms;
    config.maxAbandonedComputes = 1;

    WorkerPool pool(service, snapshots, gated, config);
    auto drained = pool.drainOnce();
    ASSERT_TRUE(drained);
    EXPECT_EQ(*drained, 2u);

    // The second record is refused without starting another compute
    EXPECT_EQ(gated->calls(), 1);
    EXPECT_EQ(stateOf("o-1"), CalcState::Retry);
    EXPECT_EQ(stateOf("o-2"), CalcState::Retry);
    auto stats = pool.statistics();
    EXPECT_EQ(stats.timedOut, 1u);
    EXPECT_EQ(stats.refusedComputes, 1u);
    EXPECT_EQ(stats.abandonedComputes, 1u);
    EXPECT_EQ(stats.retried, 2u);

    gated->release();
    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (pool.statistics().abandonedComputes != 0 &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_EQ(pool.statistics().abandonedComputes, 0u);
}

// ==================== Background workers ====================

TEST_F(WorkerPoolTest, RejectsInvalidConfiguration) {
    config.workerThreads = 0;
    WorkerPool pool(service, snapshots, calculator, config);

    auto started = pool.start();
    ASSERT_FALSE(started.has_value());
    EXPECT_EQ(started.error(), WorkerPoolError::InvalidConfiguration);
    EXPECT_FALSE(pool.isRunning());
}

TEST_F(WorkerPoolTest, BackgroundWorkersProcessPendingRecords) {
    invalidate("o-1");
    config.workerThreads = 2;

    WorkerPool pool(service, std::make_shared<PassThroughSnapshots>(),
                    std::make_shared<FixedCalculator>(), config);
    ASSERT_TRUE(pool.start());
    EXPECT_TRUE(pool.isRunning());

    EXPECT_TRUE(waitForState("o-1", CalcState::Ready));

    pool.stop();
    EXPECT_FALSE(pool.isRunning());
}

TEST_F(WorkerPoolTest, NewInvalidationWakesIdleWorkers) {
    config.pollInterval = 60s;

    WorkerPool pool(service, std::make_shared<PassThroughSnapshots>(),
                    std::make_shared<FixedCalculator>(), config);
    ASSERT_TRUE(pool.start());

    invalidate("o-2");
    EXPECT_TRUE(waitForState("o-2", CalcState::Ready));

    pool.stop();
}

TEST_F(WorkerPoolTest, OwnerSweepWakesIdleWorkers) {
    config.pollInterval = 60s;

    WorkerPool pool(service, std::make_shared<PassThroughSnapshots>(),
                    std::make_shared<FixedCalculator>(), config);
    ASSERT_TRUE(pool.start());

    service->notifyChangedForOwner(OwnerRef::program("p-1"), currentTime());
    EXPECT_TRUE(waitForState("o-3", CalcState::Ready));

    pool.stop();
}

TEST_F(WorkerPoolTest, StartTwiceIsNoOp) {
    WorkerPool pool(service, snapshots, calculator, config);
    ASSERT_TRUE(pool.start());
    EXPECT_TRUE(pool.start().has_value());
    pool.stop();
    pool.stop();
    EXPECT_FALSE(pool.isRunning());
}

TEST_F(WorkerPoolTest, RequiresAllCollaborators) {
    EXPECT_THROW(
        std::make_shared<WorkerPool>(service, nullptr, calculator, config),
        std::invalid_argument);
    EXPECT_THROW(
        std::make_shared<WorkerPool>(nullptr, snapshots, calculator, config),
        std::invalid_argument);
}

TEST_F(WorkerPoolTest, InFlightNotificationOutlivesPool) {
    std::atomic<bool> firstEvent{true};
    std::promise<void> entered;
    std::promise<void> gate;
    std::shared_future<void> gateOpen = gate.get_future().share();

    // Registered before the pool so it runs first and holds the dispatch
    service->getNotifier()->subscribeAll([&](const CalcChangeEvent&) {
        if (firstEvent.exchange(false)) {
            entered.set_value();
            gateOpen.wait();
        }
    });

    config.pollInterval = 60s;
    auto pool = std::make_unique<WorkerPool>(
        service, std::make_shared<PassThroughSnapshots>(),
        std::make_shared<FixedCalculator>(), config);
    ASSERT_TRUE(pool->start());

    std::thread publisher([this] {
        EXPECT_TRUE(service->notifyChanged("o-1", currentTime()));
    });
    entered.get_future().wait();

    // The dispatch already holds a copy of the pool's wake callback
    pool.reset();
    gate.set_value();
    publisher.join();

    service->notifyChangedForOwner(OwnerRef::program("p-1"), currentTime());
    EXPECT_TRUE(service->getResult("o-1").has_value());
}

// ==================== Commit failures ====================

class WorkerPoolCommitTest : public Test {
protected:
    void SetUp() override {
        path = std::filesystem::temp_directory_path() /
               "obscalc_worker_commit_test.db";
        removeFiles();

        auto db = std::make_shared<Database>(
            path.string(),
            SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
            50ms);
        auto store =
            std::make_shared<CalcStore>(db, std::make_shared<ChangeNotifier>());
        auto directory = std::make_shared<StaticDirectory>();
        directory->addObservation("o-1", "p-1");
        service = std::make_shared<CalcService>(
            store, std::make_shared<InvalidationTracker>(store, directory));
        calculator = std::make_shared<StoreLockingCalculator>(
            std::make_shared<Database>(path.string()));

        config.workerThreads = 1;
        config.computeTimeout = 0ms;
        config.commitRetryDelay = 30ms;

        ASSERT_TRUE(service->notifyChanged("o-1", currentTime()));
    }

    void TearDown() override {
        calculator.reset();
        service.reset();
        removeFiles();
    }

    void removeFiles() {
        std::filesystem::remove(path);
        std::filesystem::remove(path.string() + "-wal");
        std::filesystem::remove(path.string() + "-shm");
    }

    CalcState stateOf(const ObservationId& observationId) {
        auto view = service->getResult(observationId);
        EXPECT_TRUE(view.has_value());
        return view ? view->state : CalcState::Pending;
    }

    std::filesystem::path path;
    std::shared_ptr<CalcService> service;
    std::shared_ptr<StoreLockingCalculator> calculator;
    WorkerPoolConfig config;
};

TEST_F(WorkerPoolCommitTest, CommitRetriesUntilStoreRecovers) {
    config.commitAttempts = 6;
    WorkerPool pool(service, std::make_shared<PassThroughSnapshots>(),
                    calculator, config);

    std::thread unlocker([this] {
        calculator->waitLocked();
        std::this_thread::sleep_for(80ms);
        calculator->unlock();
    });
    auto drained = pool.drainOnce();
    unlocker.join();

    ASSERT_TRUE(drained);
    EXPECT_EQ(*drained, 1u);
    EXPECT_EQ(stateOf("o-1"), CalcState::Ready);
    auto stats = pool.statistics();
    EXPECT_GE(stats.storeErrors, 1u);
    EXPECT_EQ(stats.completed, 1u);
    EXPECT_EQ(stats.released, 0u);
    EXPECT_EQ(calculator->calls(), 1);
}

TEST_F(WorkerPoolCommitTest, UnrecordableOutcomeReleasesClaimLater) {
    config.commitAttempts = 1;
    WorkerPool pool(service, std::make_shared<PassThroughSnapshots>(),
                    calculator, config);

    // Neither the commit nor the release can take the write lock
    auto drained = pool.drainOnce();
    ASSERT_TRUE(drained);
    EXPECT_EQ(*drained, 1u);
    EXPECT_EQ(stateOf("o-1"), CalcState::Calculating);
    auto stats = pool.statistics();
    EXPECT_GE(stats.storeErrors, 2u);
    EXPECT_EQ(stats.pendingReleases, 1u);
    EXPECT_EQ(stats.completed, 0u);

    // Once the store recovers the claim is handed back and recomputed
    calculator->unlock();
    drained = pool.drainOnce();
    ASSERT_TRUE(drained);
    EXPECT_EQ(*drained, 1u);

    EXPECT_EQ(stateOf("o-1"), CalcState::Ready);
    stats = pool.statistics();
    EXPECT_EQ(stats.released, 1u);
    EXPECT_EQ(stats.pendingReleases, 0u);
    EXPECT_EQ(stats.completed, 1u);
    EXPECT_EQ(calculator->calls(), 2);
}
