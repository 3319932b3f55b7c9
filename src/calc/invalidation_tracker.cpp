// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

#include "invalidation_tracker.hpp"

#include <algorithm>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace obscalc::calc {

namespace {

/// Usable and Fail datasets change what remains to be executed.
bool affectsExecution(std::optional<QaState> state) {
    return state == QaState::Usable || state == QaState::Fail;
}

}  // namespace

// ============================================================================
// InvalidationTracker Implementation
// ============================================================================

InvalidationTracker::InvalidationTracker(
    std::shared_ptr<CalcStore> store,
    std::shared_ptr<ObservationDirectory> directory)
    : store_(std::move(store)), directory_(std::move(directory)) {
    if (!store_ || !directory_) {
        throw std::invalid_argument(
            "InvalidationTracker requires a store and a directory");
    }
}

auto InvalidationTracker::notifyChanged(const ObservationId& observationId,
                                        Timestamp changeTime)
    -> StoreResult<InvalidationOutcome> {
    auto program = directory_->findProgram(observationId);
    if (!program) {
        spdlog::error("Cannot invalidate {}: {}", observationId,
                      program.error());
        return std::unexpected(StoreError::Unavailable);
    }
    if (!program->has_value()) {
        spdlog::debug("Ignoring change for unknown observation {}",
                      observationId);
        return InvalidationOutcome::Ignored;
    }
    return store_->upsertDirty(observationId, **program, changeTime);
}

void InvalidationTracker::notifyChangedForOwner(const OwnerRef& owner,
                                                Timestamp changeTime) {
    std::function<void()> listener;
    {
        std::lock_guard lock(queueMutex_);
        auto [it, inserted] =
            queuedSweeps_.try_emplace(OwnerKey{owner.kind, owner.id}, changeTime);
        if (!inserted) {
            it->second = std::max(it->second, changeTime);
        }
        listener = sweepListener_;
    }

    spdlog::debug("Queued sweep of {} {}", ownerKindToString(owner.kind),
                  owner.id);
    if (listener) {
        listener();
    }
}

auto InvalidationTracker::sweep() -> StoreResult<size_t> {
    std::lock_guard sweepLock(sweepMutex_);

    std::map<OwnerKey, Timestamp> work;
    {
        std::lock_guard lock(queueMutex_);
        work.swap(queuedSweeps_);
    }
    if (work.empty()) {
        return size_t{0};
    }

    size_t changed = 0;
    std::map<OwnerKey, Timestamp> failed;

    for (const auto& [key, changeTime] : work) {
        OwnerRef owner{key.kind, key.id};

        auto ids = directory_->observationsForOwner(owner);
        if (!ids) {
            spdlog::error("Sweep of {} {} failed: {}",
                          ownerKindToString(key.kind), key.id, ids.error());
            failed.emplace(key, changeTime);
            continue;
        }

        std::optional<ProgramId> knownProgram;
        if (key.kind == OwnerKind::Program) {
            knownProgram = key.id;
        }
        auto pairs = resolvePrograms(*ids, knownProgram);
        if (!pairs) {
            spdlog::error("Sweep of {} {} failed: {}",
                          ownerKindToString(key.kind), key.id, pairs.error());
            failed.emplace(key, changeTime);
            continue;
        }

        auto result = store_->upsertDirtyMany(*pairs, changeTime);
        if (!result) {
            failed.emplace(key, changeTime);
            continue;
        }
        changed += *result;
        spdlog::debug("Swept {} {}: {} observation(s), {} changed",
                      ownerKindToString(key.kind), key.id, pairs->size(),
                      *result);
    }

    if (!failed.empty()) {
        std::lock_guard lock(queueMutex_);
        for (const auto& [key, changeTime] : failed) {
            auto [it, inserted] = queuedSweeps_.try_emplace(key, changeTime);
            if (!inserted) {
                it->second = std::max(it->second, changeTime);
            }
        }
        spdlog::warn("{} owner sweep(s) re-queued after failure",
                     failed.size());
        return std::unexpected(StoreError::Unavailable);
    }

    return changed;
}

size_t InvalidationTracker::pendingSweepCount() const {
    std::lock_guard lock(queueMutex_);
    return queuedSweeps_.size();
}

void InvalidationTracker::setSweepListener(std::function<void()> listener) {
    std::lock_guard lock(queueMutex_);
    sweepListener_ = std::move(listener);
}

auto InvalidationTracker::resolvePrograms(
    const std::vector<ObservationId>& observationIds,
    const std::optional<ProgramId>& knownProgram)
    -> std::expected<std::vector<std::pair<ObservationId, ProgramId>>,
                     std::string> {
    std::vector<std::pair<ObservationId, ProgramId>> pairs;
    pairs.reserve(observationIds.size());

    for (const auto& observationId : observationIds) {
        if (knownProgram) {
            pairs.emplace_back(observationId, *knownProgram);
            continue;
        }
        auto program = directory_->findProgram(observationId);
        if (!program) {
            return std::unexpected(program.error());
        }
        if (program->has_value()) {
            pairs.emplace_back(observationId, **program);
        }
    }
    return pairs;
}

auto InvalidationTracker::invalidateMany(
    const std::vector<ObservationId>& observationIds, Timestamp changeTime)
    -> StoreResult<size_t> {
    auto pairs = resolvePrograms(observationIds, std::nullopt);
    if (!pairs) {
        spdlog::error("Cannot resolve observations: {}", pairs.error());
        return std::unexpected(StoreError::Unavailable);
    }
    return store_->upsertDirtyMany(*pairs, changeTime);
}

// ==================== Upstream hooks ====================

auto InvalidationTracker::onObservationEdited(
    const ObservationId& observationId, Timestamp changeTime)
    -> StoreResult<InvalidationOutcome> {
    return notifyChanged(observationId, changeTime);
}

auto InvalidationTracker::onAsterismChanged(const ObservationId& observationId,
                                            Timestamp changeTime)
    -> StoreResult<InvalidationOutcome> {
    return notifyChanged(observationId, changeTime);
}

auto InvalidationTracker::onTargetChanged(const TargetId& targetId,
                                          Timestamp changeTime)
    -> StoreResult<size_t> {
    auto ids = directory_->observationsForTarget(targetId);
    if (!ids) {
        spdlog::error("Cannot resolve asterisms of target {}: {}", targetId,
                      ids.error());
        return std::unexpected(StoreError::Unavailable);
    }
    return invalidateMany(*ids, changeTime);
}

auto InvalidationTracker::onInstrumentModeChanged(
    const ObservationId& observationId, Timestamp changeTime)
    -> StoreResult<InvalidationOutcome> {
    return notifyChanged(observationId, changeTime);
}

void InvalidationTracker::onConfigurationRequestChanged(
    const ProgramId& programId, Timestamp changeTime) {
    notifyChangedForOwner(OwnerRef::program(programId), changeTime);
}

void InvalidationTracker::onCallForProposalsChanged(
    const CallForProposalsId& cfpId, Timestamp changeTime) {
    notifyChangedForOwner(OwnerRef::callForProposals(cfpId), changeTime);
}

void InvalidationTracker::onProgramAttributesChanged(
    const ProgramId& programId, Timestamp changeTime) {
    notifyChangedForOwner(OwnerRef::program(programId), changeTime);
}

auto InvalidationTracker::onDatasetQaStateChanged(
    const ObservationId& observationId, std::optional<QaState> oldState,
    std::optional<QaState> newState, Timestamp changeTime)
    -> StoreResult<InvalidationOutcome> {
    if (affectsExecution(oldState) == affectsExecution(newState)) {
        return InvalidationOutcome::Ignored;
    }
    return notifyChanged(observationId, changeTime);
}

auto InvalidationTracker::onStepCompletionChanged(
    const ObservationId& observationId, bool wasComplete, bool isComplete,
    Timestamp changeTime) -> StoreResult<InvalidationOutcome> {
    if (wasComplete == isComplete) {
        return InvalidationOutcome::Ignored;
    }
    return notifyChanged(observationId, changeTime);
}

auto InvalidationTracker::onObservationDeleted(
    const ObservationId& observationId, Timestamp changeTime)
    -> StoreResult<bool> {
    return store_->remove(observationId, changeTime);
}

InvalidationBatch InvalidationTracker::beginBatch() {
    return InvalidationBatch(*this);
}

// ============================================================================
// InvalidationBatch Implementation
// ============================================================================

InvalidationBatch::InvalidationBatch(InvalidationTracker& tracker)
    : tracker_(&tracker) {}

InvalidationBatch::InvalidationBatch(InvalidationBatch&& other) noexcept
    : tracker_(other.tracker_),
      observations_(std::move(other.observations_)),
      owners_(std::move(other.owners_)),
      done_(other.done_) {
    other.done_ = true;
}

InvalidationBatch::~InvalidationBatch() {
    if (!done_ && size() > 0) {
        auto result = commit();
        if (!result) {
            spdlog::error("Invalidation batch dropped on destruction: {}",
                          storeErrorToString(result.error()));
        }
    }
}

void InvalidationBatch::add(const ObservationId& observationId,
                            Timestamp changeTime) {
    auto [it, inserted] = observations_.try_emplace(observationId, changeTime);
    if (!inserted) {
        it->second = std::max(it->second, changeTime);
    }
}

void InvalidationBatch::addOwner(const OwnerRef& owner, Timestamp changeTime) {
    owners_.emplace_back(owner, changeTime);
}

auto InvalidationBatch::commit() -> StoreResult<size_t> {
    if (done_) {
        return size_t{0};
    }

    for (const auto& [owner, changeTime] : owners_) {
        tracker_->notifyChangedForOwner(owner, changeTime);
    }
    owners_.clear();

    // One store transaction per distinct change time
    std::map<Timestamp, std::vector<ObservationId>> byTime;
    for (const auto& [observationId, changeTime] : observations_) {
        byTime[changeTime].push_back(observationId);
    }

    // Applied groups leave the batch; the rest stay for the next commit
    size_t changed = 0;
    for (auto& [changeTime, ids] : byTime) {
        std::sort(ids.begin(), ids.end());
        auto result = tracker_->invalidateMany(ids, changeTime);
        if (!result) {
            spdlog::warn("Invalidation batch stopped with {} observation(s) "
                         "unapplied",
                         observations_.size());
            return std::unexpected(result.error());
        }
        changed += *result;
        for (const auto& observationId : ids) {
            observations_.erase(observationId);
        }
    }

    done_ = true;
    return changed;
}

void InvalidationBatch::cancel() {
    observations_.clear();
    owners_.clear();
    done_ = true;
}

size_t InvalidationBatch::size() const {
    return observations_.size() + owners_.size();
}

}  // namespace obscalc::calc
