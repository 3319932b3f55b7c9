// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

/**
 * @file retry_policy.hpp
 * @brief Bounded retry with capped exponential backoff for failed
 * calculations
 */

#ifndef OBSCALC_CALC_RETRY_POLICY_HPP
#define OBSCALC_CALC_RETRY_POLICY_HPP

#include <chrono>
#include <optional>

#include "types.hpp"

namespace obscalc::calc {

/**
 * @brief Configuration for retry behavior
 */
struct RetryConfig {
    /// Transient failures tolerated before the record is marked failed
    int maxRetries{5};

    /// Delay before the first retry
    std::chrono::milliseconds initialDelay{std::chrono::minutes{1}};

    /// Upper bound on any single delay
    std::chrono::milliseconds maxDelay{std::chrono::minutes{32}};

    /// Multiplier for exponential backoff
    double multiplier{2.0};

    /// Observation calculation: 1 min, doubling, capped at 32 min.
    [[nodiscard]] static RetryConfig observationDefaults() { return {}; }

    /// Telluric target resolution: 30 s, doubling, capped at 1 h.
    [[nodiscard]] static RetryConfig telluricDefaults() {
        RetryConfig config;
        config.initialDelay = std::chrono::seconds{30};
        config.maxDelay = std::chrono::hours{1};
        return config;
    }
};

/**
 * @brief Next state of a record after a failed attempt.
 */
struct RetryDecision {
    CalcState state{CalcState::Failed};
    int failureCount{0};
    std::optional<Timestamp> retryAt;
};

/**
 * @brief Decides between retry and terminal failure.
 *
 * A transient failure with `priorFailures < maxRetries` schedules a retry at
 * `now + calculateDelay(priorFailures)`; otherwise the record fails. With
 * maxRetries = 3 the fourth consecutive failure is terminal.
 */
class RetryPolicy {
public:
    RetryPolicy() = default;
    explicit RetryPolicy(const RetryConfig& config);

    [[nodiscard]] const RetryConfig& getRetryConfig() const;

    /**
     * @brief min(initialDelay * multiplier^priorFailures, maxDelay)
     * @param priorFailures Failures recorded before this one (0-based)
     */
    [[nodiscard]] std::chrono::milliseconds calculateDelay(
        int priorFailures) const;

    [[nodiscard]] RetryDecision onTransientFailure(int priorFailures,
                                                   Timestamp now) const;

    /// Terminal: failureCount and retryAt are cleared.
    [[nodiscard]] RetryDecision onPermanentFailure() const;

    [[nodiscard]] RetryDecision decide(FailureKind kind, int priorFailures,
                                       Timestamp now) const;

private:
    RetryConfig config_;
};

}  // namespace obscalc::calc

#endif  // OBSCALC_CALC_RETRY_POLICY_HPP
