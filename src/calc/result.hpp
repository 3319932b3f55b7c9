// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

/*************************************************

Date: 2024-12

Description: Derived result payload (ITC, execution digest, workflow) and
its JSON representation

**************************************************/

#ifndef OBSCALC_CALC_RESULT_HPP
#define OBSCALC_CALC_RESULT_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace obscalc::calc {

using json = nlohmann::json;

// ============================================================================
// ITC
// ============================================================================

/**
 * @brief Signal-to-noise figures at a given wavelength.
 */
struct SignalToNoiseAt {
    int64_t wavelengthPm{0};  ///< Wavelength in picometers
    double single{0.0};       ///< Per-exposure S/N
    double total{0.0};        ///< Total S/N

    bool operator==(const SignalToNoiseAt&) const = default;
};

/**
 * @brief Exposure-time estimate for the selected target.
 */
struct TargetResult {
    std::string targetId;
    int64_t exposureTimeMicros{0};
    int exposureCount{0};
    std::optional<SignalToNoiseAt> signalToNoise;

    bool operator==(const TargetResult&) const = default;
};

struct ItcResult {
    TargetResult imaging;
    TargetResult spectroscopy;

    bool operator==(const ItcResult&) const = default;
};

// ============================================================================
// Execution digest
// ============================================================================

struct SetupDigest {
    int64_t fullMicros{0};
    int64_t reacquisitionMicros{0};

    bool operator==(const SetupDigest&) const = default;
};

struct SequenceDigest {
    std::string observeClass{"science"};
    int64_t nonChargedTimeMicros{0};
    int64_t programTimeMicros{0};
    int atomCount{0};
    std::string executionState{"not_started"};

    bool operator==(const SequenceDigest&) const = default;
};

struct ExecutionDigest {
    SetupDigest setup;
    SequenceDigest acquisition;
    SequenceDigest science;

    bool operator==(const ExecutionDigest&) const = default;
};

// ============================================================================
// Workflow
// ============================================================================

enum class WorkflowState {
    Inactive,
    Undefined,
    Unapproved,
    Defined,
    Ready,
    Ongoing,
    Completed
};

[[nodiscard]] constexpr std::string_view workflowStateToString(
    WorkflowState state) noexcept {
    switch (state) {
        case WorkflowState::Inactive: return "inactive";
        case WorkflowState::Undefined: return "undefined";
        case WorkflowState::Unapproved: return "unapproved";
        case WorkflowState::Defined: return "defined";
        case WorkflowState::Ready: return "ready";
        case WorkflowState::Ongoing: return "ongoing";
        case WorkflowState::Completed: return "completed";
    }
    return "undefined";
}

[[nodiscard]] std::optional<WorkflowState> workflowStateFromString(
    std::string_view str) noexcept;

struct ObservationValidation {
    std::string code;  ///< e.g. "configuration_error", "itc_error"
    std::vector<std::string> messages;

    bool operator==(const ObservationValidation&) const = default;
};

struct ObservationWorkflow {
    WorkflowState state{WorkflowState::Undefined};
    std::vector<WorkflowState> validTransitions{WorkflowState::Inactive};
    std::vector<ObservationValidation> validations;

    /// Used when the workflow cannot be computed.
    [[nodiscard]] static ObservationWorkflow undefined() { return {}; }

    bool operator==(const ObservationWorkflow&) const = default;
};

// ============================================================================
// CalcResult
// ============================================================================

/**
 * @brief The cached payload. Opaque to the cache machinery, persisted as
 * JSON text.
 */
struct CalcResult {
    std::optional<ItcResult> itc;
    std::optional<ExecutionDigest> digest;
    ObservationWorkflow workflow;
    std::optional<std::string> warning;  ///< Error text for a partial result

    [[nodiscard]] json toJson() const;

    /**
     * @brief Decode a payload.
     * @throws nlohmann::json::exception on malformed input,
     * std::invalid_argument on an unknown workflow state
     */
    static CalcResult fromJson(const json& j);

    bool operator==(const CalcResult&) const = default;
};

}  // namespace obscalc::calc

#endif  // OBSCALC_CALC_RESULT_HPP
