// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

/*************************************************

Date: 2024-12

Description: Translates upstream writes into dirty marks on CalcRecords

**************************************************/

#ifndef OBSCALC_CALC_INVALIDATION_TRACKER_HPP
#define OBSCALC_CALC_INVALIDATION_TRACKER_HPP

#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <vector>

#include "calc_store.hpp"
#include "observation_directory.hpp"
#include "types.hpp"

namespace obscalc::calc {

/**
 * @brief QA state recorded on a dataset.
 */
enum class QaState { Pass, Usable, Fail };

class InvalidationBatch;

/**
 * @brief Entry point for upstream change notifications.
 *
 * Single-observation changes are applied immediately. Owner-wide changes
 * (a program or a call for proposals) are queued and coalesced per owner,
 * then resolved to observation ids by sweep(). Readers must call sweep()
 * before trusting a ready record; CalcService and the workers do so.
 *
 * @note Thread-safe.
 */
class InvalidationTracker {
public:
    InvalidationTracker(std::shared_ptr<CalcStore> store,
                        std::shared_ptr<ObservationDirectory> directory);

    InvalidationTracker(const InvalidationTracker&) = delete;
    InvalidationTracker& operator=(const InvalidationTracker&) = delete;

    // ==================== Invalidation intake ====================

    /**
     * @brief Mark one observation dirty as of @p changeTime.
     * @return InvalidationOutcome::Ignored if the observation does not exist
     */
    auto notifyChanged(const ObservationId& observationId,
                       Timestamp changeTime)
        -> StoreResult<InvalidationOutcome>;

    /**
     * @brief Queue a sweep of every observation under @p owner.
     *
     * Repeated requests for the same owner collapse; the latest time wins.
     */
    void notifyChangedForOwner(const OwnerRef& owner, Timestamp changeTime);

    /**
     * @brief Resolve and apply all queued owner sweeps.
     *
     * Concurrent callers are serialized, so a caller returns only after
     * every sweep queued before the call has been applied. Owners whose
     * sweep failed are re-queued.
     *
     * @return Number of records whose state or version changed
     */
    auto sweep() -> StoreResult<size_t>;

    [[nodiscard]] size_t pendingSweepCount() const;

    /// Called after an owner sweep has been queued, e.g. to wake workers.
    void setSweepListener(std::function<void()> listener);

    // ==================== Upstream hooks ====================

    auto onObservationEdited(const ObservationId& observationId,
                             Timestamp changeTime)
        -> StoreResult<InvalidationOutcome>;

    auto onAsterismChanged(const ObservationId& observationId,
                           Timestamp changeTime)
        -> StoreResult<InvalidationOutcome>;

    /// Fans out to every observation whose asterism contains the target.
    auto onTargetChanged(const TargetId& targetId, Timestamp changeTime)
        -> StoreResult<size_t>;

    auto onInstrumentModeChanged(const ObservationId& observationId,
                                 Timestamp changeTime)
        -> StoreResult<InvalidationOutcome>;

    void onConfigurationRequestChanged(const ProgramId& programId,
                                       Timestamp changeTime);

    void onCallForProposalsChanged(const CallForProposalsId& cfpId,
                                   Timestamp changeTime);

    void onProgramAttributesChanged(const ProgramId& programId,
                                    Timestamp changeTime);

    /**
     * @brief Invalidates only when the QA state crosses between
     * {none, Pass} and {Usable, Fail}.
     * @return Ignored when the transition does not affect execution
     */
    auto onDatasetQaStateChanged(const ObservationId& observationId,
                                 std::optional<QaState> oldState,
                                 std::optional<QaState> newState,
                                 Timestamp changeTime)
        -> StoreResult<InvalidationOutcome>;

    /**
     * @brief Invalidates only when step completion flips.
     */
    auto onStepCompletionChanged(const ObservationId& observationId,
                                 bool wasComplete, bool isComplete,
                                 Timestamp changeTime)
        -> StoreResult<InvalidationOutcome>;

    /// The record follows its observation.
    auto onObservationDeleted(const ObservationId& observationId,
                              Timestamp changeTime) -> StoreResult<bool>;

    // ==================== Batching ====================

    /**
     * @brief Collect the changes of one upstream transaction.
     */
    [[nodiscard]] InvalidationBatch beginBatch();

private:
    friend class InvalidationBatch;

    struct OwnerKey {
        OwnerKind kind;
        std::string id;

        bool operator<(const OwnerKey& other) const {
            return std::tie(kind, id) < std::tie(other.kind, other.id);
        }
    };

    /// Pairs each existing observation with its program.
    auto resolvePrograms(const std::vector<ObservationId>& observationIds,
                         const std::optional<ProgramId>& knownProgram)
        -> std::expected<std::vector<std::pair<ObservationId, ProgramId>>,
                         std::string>;

    auto invalidateMany(const std::vector<ObservationId>& observationIds,
                        Timestamp changeTime) -> StoreResult<size_t>;

    std::shared_ptr<CalcStore> store_;
    std::shared_ptr<ObservationDirectory> directory_;

    mutable std::mutex queueMutex_;
    std::map<OwnerKey, Timestamp> queuedSweeps_;
    std::function<void()> sweepListener_;

    /// Held for the whole drain so callers wait for in-flight sweeps.
    std::mutex sweepMutex_;
};

/**
 * @brief RAII collector for the invalidations of one upstream transaction.
 *
 * Multiple changes to the same observation collapse to one dirty mark at
 * the latest time. commit() applies them; destruction commits anything
 * not yet committed or cancelled.
 */
class InvalidationBatch {
public:
    explicit InvalidationBatch(InvalidationTracker& tracker);
    ~InvalidationBatch();

    InvalidationBatch(const InvalidationBatch&) = delete;
    InvalidationBatch& operator=(const InvalidationBatch&) = delete;

    InvalidationBatch(InvalidationBatch&& other) noexcept;
    InvalidationBatch& operator=(InvalidationBatch&&) = delete;

    void add(const ObservationId& observationId, Timestamp changeTime);

    void addOwner(const OwnerRef& owner, Timestamp changeTime);

    /**
     * @brief Apply the collected changes.
     *
     * On failure the unapplied observations stay in the batch, so a later
     * commit() or the destructor applies them.
     * @return Number of records whose state or version changed
     */
    auto commit() -> StoreResult<size_t>;

    /// Drop the collected changes, e.g. when the upstream write rolled back.
    void cancel();

    [[nodiscard]] size_t size() const;

private:
    InvalidationTracker* tracker_;
    std::unordered_map<ObservationId, Timestamp> observations_;
    std::vector<std::pair<OwnerRef, Timestamp>> owners_;
    bool done_{false};
};

}  // namespace obscalc::calc

#endif  // OBSCALC_CALC_INVALIDATION_TRACKER_HPP
