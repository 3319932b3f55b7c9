// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

/*
 * test_calc_service.cpp
 *
 * Tests for the CalcService facade with an injected clock
 * - Full lifecycle from invalidation to ready
 * - Invalidation while calculating
 * - Retry budget and terminal failure
 * - Owner sweeps before claims and reads
 * - Views and statistics
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <string>

#include "calc/calc_service.hpp"
#include "calc/calc_test_support.hpp"
#include "database/core/database.hpp"

using namespace obscalc::calc;
using namespace testing;
using obscalc::calc::test::at;
using obscalc::calc::test::IdList;
using obscalc::calc::test::MockObservationDirectory;
using obscalc::calc::test::sampleResult;
using obscalc::calc::test::StaticDirectory;
using obscalc::database::core::Database;

class CalcServiceTest : public Test {
protected:
    void SetUp() override {
        db = std::make_shared<Database>(":memory:");
        notifier = std::make_shared<ChangeNotifier>();
        store = std::make_shared<CalcStore>(db, notifier);
        directory = std::make_shared<StaticDirectory>();
        directory->addObservation("o-1", "p-1");
        directory->addObservation("o-2", "p-1");
        directory->addObservation("o-3", "p-2");
        tracker = std::make_shared<InvalidationTracker>(store, directory);

        RetryConfig config;
        config.maxRetries = 3;
        service = std::make_unique<CalcService>(
            store, tracker, RetryPolicy(config), [this] { return now; });
    }

    void TearDown() override {
        service.reset();
        tracker.reset();
        store.reset();
        db.reset();
    }

    PendingCalc claimOrFail(const ObservationId& observationId) {
        auto pending = service->claimObservation(observationId);
        EXPECT_TRUE(pending.has_value());
        EXPECT_TRUE(pending->has_value());
        return **pending;
    }

    CalcResultView view(const ObservationId& observationId) {
        auto result = service->getResult(observationId);
        EXPECT_TRUE(result.has_value());
        return *result;
    }

    Timestamp now = at(0);
    std::shared_ptr<Database> db;
    std::shared_ptr<ChangeNotifier> notifier;
    std::shared_ptr<CalcStore> store;
    std::shared_ptr<StaticDirectory> directory;
    std::shared_ptr<InvalidationTracker> tracker;
    std::unique_ptr<CalcService> service;
};

// ==================== Lifecycle ====================

TEST_F(CalcServiceTest, InvalidateClaimCompleteYieldsReady) {
    now = at(10);
    ASSERT_EQ(*service->notifyChanged("o-1", at(10)),
              InvalidationOutcome::Created);

    auto pending = claimOrFail("o-1");
    EXPECT_EQ(pending.programId, "p-1");
    EXPECT_EQ(pending.failureCount, 0);

    now = at(12);
    auto outcome = service->complete("o-1", pending.snapshotVersion,
                                     sampleResult());
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->newState, CalcState::Ready);

    auto v = view("o-1");
    EXPECT_EQ(v.state, CalcState::Ready);
    EXPECT_EQ(v.lastUpdate, at(12));
    EXPECT_EQ(v.result, sampleResult());
    EXPECT_TRUE(v.isCurrent());
}

TEST_F(CalcServiceTest, InvalidationWhileCalculatingLeavesRecordPending) {
    now = at(10);
    ASSERT_TRUE(service->notifyChanged("o-1", at(10)));
    auto pending = claimOrFail("o-1");

    now = at(11);
    EXPECT_EQ(*service->notifyChanged("o-1", at(11)),
              InvalidationOutcome::Superseded);

    now = at(12);
    auto outcome = service->complete("o-1", pending.snapshotVersion,
                                     sampleResult());
    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->superseded);

    auto v = view("o-1");
    EXPECT_EQ(v.state, CalcState::Pending);
    EXPECT_EQ(v.lastInvalidation, at(11));
    EXPECT_FALSE(v.lastUpdate.has_value());
    EXPECT_FALSE(v.isCurrent());

    auto next = claimOrFail("o-1");
    EXPECT_GT(next.snapshotVersion, pending.snapshotVersion);
}

TEST_F(CalcServiceTest, FourthTransientFailureIsTerminal) {
    now = at(10);
    ASSERT_TRUE(service->notifyChanged("o-1", at(10)));

    for (int attempt = 1; attempt <= 3; ++attempt) {
        auto pending = claimOrFail("o-1");
        EXPECT_EQ(pending.failureCount, attempt - 1);

        auto outcome = service->fail("o-1", pending.snapshotVersion, true,
                                     "ITC service unavailable");
        ASSERT_TRUE(outcome.has_value());
        EXPECT_EQ(outcome->newState, CalcState::Retry);

        auto record = store->get("o-1");
        ASSERT_TRUE(record.has_value() && record->has_value());
        EXPECT_EQ((*record)->failureCount, attempt);
        now = *(*record)->retryAt;
    }

    auto pending = claimOrFail("o-1");
    auto outcome = service->fail("o-1", pending.snapshotVersion, true,
                                 "ITC service unavailable");
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->newState, CalcState::Failed);

    auto v = view("o-1");
    EXPECT_EQ(v.state, CalcState::Failed);
    EXPECT_EQ(v.errorMessage, "ITC service unavailable");
    EXPECT_FALSE(v.result.has_value());

    auto record = store->get("o-1");
    EXPECT_EQ((*record)->failureCount, 0);
    EXPECT_FALSE((*record)->retryAt.has_value());
}

TEST_F(CalcServiceTest, RetryIsNotClaimableBeforeItIsDue) {
    now = at(10);
    ASSERT_TRUE(service->notifyChanged("o-1", at(10)));
    auto pending = claimOrFail("o-1");
    ASSERT_TRUE(service->fail("o-1", pending.snapshotVersion, true, "timeout"));

    now = at(69);
    auto early = service->claim();
    ASSERT_TRUE(early.has_value());
    EXPECT_FALSE(early->has_value());

    now = at(70);
    auto due = service->claim();
    ASSERT_TRUE(due.has_value());
    ASSERT_TRUE(due->has_value());
    EXPECT_EQ((*due)->failureCount, 1);
}

TEST_F(CalcServiceTest, NewInvalidationClearsFailure) {
    now = at(10);
    ASSERT_TRUE(service->notifyChanged("o-1", at(10)));
    auto pending = claimOrFail("o-1");
    ASSERT_TRUE(service->fail("o-1", pending.snapshotVersion, false,
                              "Missing instrument configuration"));
    EXPECT_EQ(view("o-1").state, CalcState::Failed);

    now = at(20);
    EXPECT_EQ(*service->notifyChanged("o-1", at(20)),
              InvalidationOutcome::Reset);

    auto v = view("o-1");
    EXPECT_EQ(v.state, CalcState::Pending);
    EXPECT_FALSE(v.errorMessage.has_value());
}

TEST_F(CalcServiceTest, StaleVersionLosesClaim) {
    now = at(10);
    ASSERT_TRUE(service->notifyChanged("o-1", at(10)));
    auto pending = claimOrFail("o-1");

    auto outcome = service->complete("o-1", pending.snapshotVersion - 1,
                                     sampleResult());
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error(), ServiceError::ClaimLost);

    auto failed = service->fail("o-2", 1, true, "never claimed");
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error(), ServiceError::ClaimLost);
}

// ==================== Owner sweeps ====================

TEST_F(CalcServiceTest, ClaimDrainsOwnerSweepsFirst) {
    now = at(10);
    service->notifyChangedForOwner(OwnerRef::program("p-1"), at(10));

    auto batch = service->claimBatch(10);
    ASSERT_TRUE(batch.has_value());
    ASSERT_EQ(batch->size(), 2u);
    EXPECT_EQ((*batch)[0].observationId, "o-1");
    EXPECT_EQ((*batch)[1].observationId, "o-2");
    EXPECT_EQ(tracker->pendingSweepCount(), 0u);
}

TEST_F(CalcServiceTest, ReadsSeeOwnerSweeps) {
    now = at(10);
    ASSERT_TRUE(service->notifyChanged("o-1", at(10)));
    auto pending = claimOrFail("o-1");
    ASSERT_TRUE(service->complete("o-1", pending.snapshotVersion,
                                  sampleResult()));
    EXPECT_TRUE(view("o-1").isCurrent());

    service->notifyChangedForOwner(OwnerRef::program("p-1"), at(20));

    auto v = view("o-1");
    EXPECT_EQ(v.state, CalcState::Pending);
    EXPECT_FALSE(v.isCurrent());
}

TEST(CalcServiceSweepFailureTest, ReadsFailButClaimsProceed) {
    auto db = std::make_shared<Database>(":memory:");
    auto store = std::make_shared<CalcStore>(db);
    auto directory = std::make_shared<NiceMock<MockObservationDirectory>>();
    auto tracker = std::make_shared<InvalidationTracker>(store, directory);
    CalcService service(store, tracker, RetryPolicy(), [] { return at(10); });

    ON_CALL(*directory, observationsForOwner(_))
        .WillByDefault(Return(IdList(std::unexpected(std::string("offline")))));
    ASSERT_TRUE(store->upsertDirty("o-1", "p-1", at(5)));

    service.notifyChangedForOwner(OwnerRef::program("p-1"), at(10));

    auto read = service.getResult("o-1");
    ASSERT_FALSE(read.has_value());
    EXPECT_EQ(read.error(), ServiceError::StoreUnavailable);

    auto programRead = service.getProgramResults("p-1");
    ASSERT_FALSE(programRead.has_value());
    EXPECT_EQ(programRead.error(), ServiceError::StoreUnavailable);

    auto claimed = service.claim();
    ASSERT_TRUE(claimed.has_value());
    ASSERT_TRUE(claimed->has_value());
    EXPECT_EQ((*claimed)->observationId, "o-1");
    EXPECT_EQ(tracker->pendingSweepCount(), 1u);
}

// ==================== Reads ====================

TEST_F(CalcServiceTest, UnknownRecordIsNotFound) {
    auto result = service->getResult("o-1");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), ServiceError::NotFound);
}

TEST_F(CalcServiceTest, ProgramResultsListOnlyThatProgram) {
    now = at(10);
    ASSERT_TRUE(service->notifyChanged("o-1", at(10)));
    ASSERT_TRUE(service->notifyChanged("o-2", at(10)));
    ASSERT_TRUE(service->notifyChanged("o-3", at(10)));

    auto views = service->getProgramResults("p-1");
    ASSERT_TRUE(views.has_value());
    ASSERT_EQ(views->size(), 2u);
    EXPECT_EQ((*views)[0].observationId, "o-1");
    EXPECT_EQ((*views)[1].observationId, "o-2");

    auto empty = service->getProgramResults("p-9");
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());
}

TEST_F(CalcServiceTest, ViewJsonCarriesStateAndResult) {
    now = at(10);
    ASSERT_TRUE(service->notifyChanged("o-1", at(10)));
    auto pending = claimOrFail("o-1");
    now = at(12);
    ASSERT_TRUE(service->complete("o-1", pending.snapshotVersion,
                                  sampleResult()));

    auto j = view("o-1").toJson();
    EXPECT_EQ(j["state"], "ready");
    EXPECT_EQ(j["programId"], "p-1");
    EXPECT_EQ(j["lastUpdate"], 12'000'000);
    EXPECT_EQ(j["result"]["workflow"]["state"], "defined");
    EXPECT_TRUE(j["errorMessage"].is_null());
}

// ==================== Maintenance ====================

TEST_F(CalcServiceTest, ResetCalculatingReleasesClaims) {
    now = at(10);
    ASSERT_TRUE(service->notifyChanged("o-1", at(10)));
    auto pending = claimOrFail("o-1");

    auto released = service->resetCalculating();
    ASSERT_TRUE(released.has_value());
    EXPECT_EQ(*released, 1u);
    EXPECT_EQ(view("o-1").state, CalcState::Pending);

    auto late = service->complete("o-1", pending.snapshotVersion,
                                  sampleResult());
    ASSERT_FALSE(late.has_value());
    EXPECT_EQ(late.error(), ServiceError::ClaimLost);
}

TEST_F(CalcServiceTest, RemoveObservationDropsRecord) {
    now = at(10);
    ASSERT_TRUE(service->notifyChanged("o-1", at(10)));

    auto removed = service->removeObservation("o-1");
    ASSERT_TRUE(removed.has_value());
    EXPECT_TRUE(*removed);
    EXPECT_EQ(service->getResult("o-1").error(), ServiceError::NotFound);
}

TEST_F(CalcServiceTest, StatisticsCountRecordsByState) {
    now = at(10);
    ASSERT_TRUE(service->notifyChanged("o-1", at(10)));
    ASSERT_TRUE(service->notifyChanged("o-2", at(10)));
    auto pending = claimOrFail("o-1");
    ASSERT_TRUE(service->complete("o-1", pending.snapshotVersion,
                                  sampleResult()));

    auto stats = service->statistics();
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ((*stats)["records"]["ready"], 1);
    EXPECT_EQ((*stats)["records"]["pending"], 1);
    EXPECT_EQ((*stats)["pendingSweeps"], 0);
    EXPECT_TRUE(stats->contains("notifier"));
}

TEST_F(CalcServiceTest, ClockIsInjected) {
    now = at(42);
    EXPECT_EQ(service->now(), at(42));
    EXPECT_EQ(service->getNotifier(), notifier);
    EXPECT_EQ(service->getTracker(), tracker);
    EXPECT_EQ(service->getRetryPolicy().getRetryConfig().maxRetries, 3);
}

TEST(CalcServiceConstructionTest, RequiresStoreAndTracker) {
    auto db = std::make_shared<Database>(":memory:");
    auto store = std::make_shared<CalcStore>(db);

    EXPECT_THROW(std::make_shared<CalcService>(store, nullptr),
                 std::invalid_argument);
    EXPECT_THROW(std::make_shared<CalcService>(nullptr, nullptr),
                 std::invalid_argument);
}
