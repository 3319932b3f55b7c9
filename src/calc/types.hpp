// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

/*************************************************

Date: 2024-12

Description: Core types of the observation calculation cache

**************************************************/

#ifndef OBSCALC_CALC_TYPES_HPP
#define OBSCALC_CALC_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "result.hpp"

namespace obscalc::calc {

using Clock = std::chrono::system_clock;

/// Microsecond resolution, matching the persisted representation.
using Timestamp = std::chrono::time_point<Clock, std::chrono::microseconds>;

using ObservationId = std::string;
using ProgramId = std::string;
using CallForProposalsId = std::string;
using TargetId = std::string;

/// Optimistic concurrency token, bumped by every invalidation and claim.
using Version = int64_t;

/**
 * @brief Cache state of one observation's derived result.
 */
enum class CalcState {
    Pending,      ///< Needs (re)computation
    Retry,        ///< Failed transiently, claimable again at retryAt
    Calculating,  ///< Claimed by exactly one worker
    Ready,        ///< Result committed
    Failed        ///< Permanent failure, errorMessage set
};

[[nodiscard]] constexpr std::string_view calcStateToString(
    CalcState state) noexcept {
    switch (state) {
        case CalcState::Pending: return "pending";
        case CalcState::Retry: return "retry";
        case CalcState::Calculating: return "calculating";
        case CalcState::Ready: return "ready";
        case CalcState::Failed: return "failed";
    }
    return "pending";
}

[[nodiscard]] std::optional<CalcState> calcStateFromString(
    std::string_view str) noexcept;

[[nodiscard]] inline int64_t toMicros(Timestamp ts) noexcept {
    return ts.time_since_epoch().count();
}

[[nodiscard]] inline Timestamp fromMicros(int64_t micros) noexcept {
    return Timestamp{std::chrono::microseconds{micros}};
}

[[nodiscard]] inline Timestamp currentTime() {
    return std::chrono::time_point_cast<std::chrono::microseconds>(
        Clock::now());
}

/**
 * @brief Persistent cache record, one per observation.
 */
struct CalcRecord {
    ObservationId observationId;
    ProgramId programId;
    CalcState state{CalcState::Pending};
    Timestamp lastInvalidation{};
    std::optional<Timestamp> lastUpdate;  ///< Absent until first commit
    std::optional<Timestamp> retryAt;
    int failureCount{0};
    Version version{0};
    std::optional<Version> claimedVersion;  ///< Set only while calculating
    std::optional<CalcResult> result;
    std::optional<std::string> errorMessage;

    /// lastInvalidation > lastUpdate
    [[nodiscard]] bool isStale() const noexcept {
        return !lastUpdate || lastInvalidation > *lastUpdate;
    }

    [[nodiscard]] bool isClaimable(Timestamp now) const noexcept {
        return state == CalcState::Pending ||
               (state == CalcState::Retry && retryAt && *retryAt <= now);
    }
};

/**
 * @brief Grant of exclusive computation rights returned by a claim.
 *
 * snapshotVersion is the record version written by the claim. A later
 * invalidation moves the version past it; a reset or a new claim replaces
 * the record's claimedVersion, which makes the token stale.
 */
struct ClaimToken {
    ObservationId observationId;
    ProgramId programId;
    Version snapshotVersion{0};
    Timestamp lastInvalidation{};
    int failureCount{0};  ///< Failures before this attempt
    std::optional<Timestamp> retryAt;
};

/**
 * @brief Outcome of applying an invalidation to a record.
 */
enum class InvalidationOutcome {
    Created,      ///< New pending record
    Advanced,     ///< Already pending, lastInvalidation moved forward
    Reset,        ///< retry/ready/failed moved back to pending
    Superseded,   ///< Calculating record, in-flight result will be dropped
    Unchanged,    ///< Earlier or equal timestamp on a pending record
    Ignored       ///< Observation does not exist
};

[[nodiscard]] constexpr std::string_view invalidationOutcomeToString(
    InvalidationOutcome outcome) noexcept {
    switch (outcome) {
        case InvalidationOutcome::Created: return "created";
        case InvalidationOutcome::Advanced: return "advanced";
        case InvalidationOutcome::Reset: return "reset";
        case InvalidationOutcome::Superseded: return "superseded";
        case InvalidationOutcome::Unchanged: return "unchanged";
        case InvalidationOutcome::Ignored: return "ignored";
    }
    return "unchanged";
}

/**
 * @brief Result of a token-checked complete/fail.
 */
struct StoreOutcome {
    CalcState previousState{CalcState::Calculating};
    CalcState newState{CalcState::Pending};
    bool superseded{false};  ///< Invalidated after the claim; result dropped
};

enum class FailureKind { Transient, Permanent };

}  // namespace obscalc::calc

#endif  // OBSCALC_CALC_TYPES_HPP
