// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

#include "calc_service.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>

namespace obscalc::calc {

namespace {

ServiceError fromStoreError(StoreError error) {
    switch (error) {
        case StoreError::Unavailable: return ServiceError::StoreUnavailable;
        case StoreError::ClaimLost: return ServiceError::ClaimLost;
        case StoreError::InvalidPayload: return ServiceError::InvalidPayload;
    }
    return ServiceError::StoreUnavailable;
}

}  // namespace

auto CalcResultView::toJson() const -> nlohmann::json {
    nlohmann::json j = {
        {"observationId", observationId},
        {"programId", programId},
        {"state", std::string(calcStateToString(state))},
        {"lastInvalidation", toMicros(lastInvalidation)},
    };
    j["lastUpdate"] =
        lastUpdate ? nlohmann::json(toMicros(*lastUpdate)) : nlohmann::json();
    j["result"] = result ? result->toJson() : nlohmann::json();
    j["errorMessage"] =
        errorMessage ? nlohmann::json(*errorMessage) : nlohmann::json();
    return j;
}

CalcService::CalcService(std::shared_ptr<CalcStore> store,
                         std::shared_ptr<InvalidationTracker> tracker,
                         RetryPolicy retryPolicy, TimeSource clock)
    : store_(std::move(store)),
      tracker_(std::move(tracker)),
      retryPolicy_(std::move(retryPolicy)),
      clock_(clock ? std::move(clock) : TimeSource(currentTime)) {
    if (!store_ || !tracker_) {
        throw std::invalid_argument(
            "CalcService requires a store and an invalidation tracker");
    }
}

// ==================== Invalidation intake ====================

auto CalcService::notifyChanged(const ObservationId& observationId,
                                Timestamp changeTime)
    -> ServiceResult<InvalidationOutcome> {
    auto outcome = tracker_->notifyChanged(observationId, changeTime);
    if (!outcome) {
        return std::unexpected(fromStoreError(outcome.error()));
    }
    spdlog::debug("Invalidation of {}: {}", observationId,
                  invalidationOutcomeToString(*outcome));
    return *outcome;
}

void CalcService::notifyChangedForOwner(const OwnerRef& owner,
                                        Timestamp changeTime) {
    tracker_->notifyChangedForOwner(owner, changeTime);
}

// ==================== Claim / complete ====================

auto CalcService::claim() -> ServiceResult<std::optional<PendingCalc>> {
    // A failed sweep only delays invalidation; a later bump supersedes
    // anything computed from the claim.
    if (auto swept = drainSweeps(); !swept) {
        spdlog::warn("Claiming with owner sweeps outstanding");
    }

    auto token = store_->claimNext(now());
    if (!token) {
        return std::unexpected(fromStoreError(token.error()));
    }
    if (!token->has_value()) {
        return std::optional<PendingCalc>{};
    }
    return std::optional<PendingCalc>{toPending(**token)};
}

auto CalcService::claimObservation(const ObservationId& observationId)
    -> ServiceResult<std::optional<PendingCalc>> {
    if (auto swept = drainSweeps(); !swept) {
        spdlog::warn("Claiming {} with owner sweeps outstanding",
                     observationId);
    }

    auto token = store_->claim(observationId, now());
    if (!token) {
        return std::unexpected(fromStoreError(token.error()));
    }
    if (!token->has_value()) {
        return std::optional<PendingCalc>{};
    }
    return std::optional<PendingCalc>{toPending(**token)};
}

auto CalcService::claimBatch(size_t max)
    -> ServiceResult<std::vector<PendingCalc>> {
    if (auto swept = drainSweeps(); !swept) {
        spdlog::warn("Claiming batch with owner sweeps outstanding");
    }

    auto tokens = store_->claimBatch(max, now());
    if (!tokens) {
        return std::unexpected(fromStoreError(tokens.error()));
    }

    std::vector<PendingCalc> pending;
    pending.reserve(tokens->size());
    for (const auto& token : *tokens) {
        pending.push_back(toPending(token));
    }
    return pending;
}

auto CalcService::complete(const ObservationId& observationId,
                           Version snapshotVersion, const CalcResult& result)
    -> ServiceResult<StoreOutcome> {
    ClaimToken token;
    token.observationId = observationId;
    token.snapshotVersion = snapshotVersion;

    auto outcome = store_->complete(token, result, now());
    if (!outcome) {
        return std::unexpected(fromStoreError(outcome.error()));
    }
    return *outcome;
}

auto CalcService::fail(const ObservationId& observationId,
                       Version snapshotVersion, bool transient,
                       const std::string& message)
    -> ServiceResult<StoreOutcome> {
    ClaimToken token;
    token.observationId = observationId;
    token.snapshotVersion = snapshotVersion;

    auto outcome = store_->fail(
        token, transient ? FailureKind::Transient : FailureKind::Permanent,
        message, retryPolicy_, now());
    if (!outcome) {
        return std::unexpected(fromStoreError(outcome.error()));
    }
    return *outcome;
}

auto CalcService::release(const ObservationId& observationId,
                          Version snapshotVersion)
    -> ServiceResult<StoreOutcome> {
    ClaimToken token;
    token.observationId = observationId;
    token.snapshotVersion = snapshotVersion;

    auto outcome = store_->release(token, now());
    if (!outcome) {
        return std::unexpected(fromStoreError(outcome.error()));
    }
    return *outcome;
}

// ==================== Reads ====================

auto CalcService::getResult(const ObservationId& observationId)
    -> ServiceResult<CalcResultView> {
    if (auto swept = drainSweeps(); !swept) {
        return std::unexpected(swept.error());
    }

    auto record = store_->get(observationId);
    if (!record) {
        return std::unexpected(fromStoreError(record.error()));
    }
    if (!record->has_value()) {
        return std::unexpected(ServiceError::NotFound);
    }
    return toView(**record);
}

auto CalcService::getProgramResults(const ProgramId& programId)
    -> ServiceResult<std::vector<CalcResultView>> {
    if (auto swept = drainSweeps(); !swept) {
        return std::unexpected(swept.error());
    }

    auto records = store_->getProgram(programId);
    if (!records) {
        return std::unexpected(fromStoreError(records.error()));
    }

    std::vector<CalcResultView> views;
    views.reserve(records->size());
    for (const auto& record : *records) {
        views.push_back(toView(record));
    }
    return views;
}

// ==================== Maintenance ====================

auto CalcService::resetCalculating() -> ServiceResult<size_t> {
    auto count = store_->resetCalculating(now());
    if (!count) {
        return std::unexpected(fromStoreError(count.error()));
    }
    if (*count > 0) {
        spdlog::info("Released {} abandoned claim(s)", *count);
    }
    return *count;
}

auto CalcService::removeObservation(const ObservationId& observationId)
    -> ServiceResult<bool> {
    auto removed = store_->remove(observationId, now());
    if (!removed) {
        return std::unexpected(fromStoreError(removed.error()));
    }
    return *removed;
}

auto CalcService::statistics() -> ServiceResult<nlohmann::json> {
    auto counts = store_->countByState();
    if (!counts) {
        return std::unexpected(fromStoreError(counts.error()));
    }

    nlohmann::json byState = nlohmann::json::object();
    for (const auto& [state, count] : *counts) {
        byState[std::string(calcStateToString(state))] = count;
    }

    nlohmann::json stats = {
        {"records", byState},
        {"pendingSweeps", tracker_->pendingSweepCount()},
    };
    if (auto notifier = store_->getNotifier()) {
        stats["notifier"] = notifier->getStatistics();
    }
    return stats;
}

auto CalcService::getNotifier() const -> std::shared_ptr<ChangeNotifier> {
    return store_->getNotifier();
}

auto CalcService::getTracker() const -> std::shared_ptr<InvalidationTracker> {
    return tracker_;
}

const RetryPolicy& CalcService::getRetryPolicy() const {
    return retryPolicy_;
}

Timestamp CalcService::now() const {
    return clock_();
}

auto CalcService::drainSweeps() -> ServiceResult<void> {
    auto swept = tracker_->sweep();
    if (!swept) {
        spdlog::error("Owner sweep failed: {}",
                      storeErrorToString(swept.error()));
        return std::unexpected(fromStoreError(swept.error()));
    }
    return {};
}

auto CalcService::toPending(const ClaimToken& token) -> PendingCalc {
    return PendingCalc{token.observationId, token.programId,
                       token.snapshotVersion, token.failureCount};
}

auto CalcService::toView(const CalcRecord& record) -> CalcResultView {
    CalcResultView view;
    view.observationId = record.observationId;
    view.programId = record.programId;
    view.state = record.state;
    view.result = record.result;
    view.errorMessage = record.errorMessage;
    view.lastUpdate = record.lastUpdate;
    view.lastInvalidation = record.lastInvalidation;
    return view;
}

}  // namespace obscalc::calc
