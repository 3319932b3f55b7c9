// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

/*************************************************

Date: 2024-12

Description: Seams to the snapshot loader and the external calculators

**************************************************/

#ifndef OBSCALC_CALC_CALCULATOR_HPP
#define OBSCALC_CALC_CALCULATOR_HPP

#include <expected>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "result.hpp"
#include "types.hpp"

namespace obscalc::calc {

/**
 * @brief Failure categories reported by a calculator
 */
enum class CalcError {
    RemoteService,  ///< ITC or sequence service unreachable, retried
    InvalidInput    ///< Observation cannot be calculated as defined
};

[[nodiscard]] constexpr std::string_view calcErrorToString(
    CalcError error) noexcept {
    switch (error) {
        case CalcError::RemoteService: return "Remote service error";
        case CalcError::InvalidInput: return "Invalid input";
    }
    return "Unknown error";
}

struct CalcFailure {
    CalcError error{CalcError::RemoteService};
    std::string message;
};

/**
 * @brief Work item handed out by a claim.
 */
struct PendingCalc {
    ObservationId observationId;
    ProgramId programId;
    Version snapshotVersion{0};
    int failureCount{0};  ///< Failures before this attempt
};

/**
 * @brief Observation inputs read for one claimed calculation.
 */
struct ObservationSnapshot {
    ObservationId observationId;
    ProgramId programId;
    Version snapshotVersion{0};
    nlohmann::json data;
};

/**
 * @brief Reads the inputs of a claimed observation.
 *
 * Implementations may read after the claim; an edit that lands in between
 * bumps the record version, so the computed result is discarded.
 */
class SnapshotProvider {
public:
    virtual ~SnapshotProvider() = default;

    virtual auto loadSnapshot(const PendingCalc& pending)
        -> std::expected<ObservationSnapshot, CalcFailure> = 0;
};

/**
 * @brief Computes the derived result of one observation.
 *
 * May block on remote services. Must be safe to call from several worker
 * threads at once.
 */
class Calculator {
public:
    virtual ~Calculator() = default;

    virtual auto calculate(const ObservationSnapshot& snapshot)
        -> std::expected<CalcResult, CalcFailure> = 0;
};

}  // namespace obscalc::calc

#endif  // OBSCALC_CALC_CALCULATOR_HPP
