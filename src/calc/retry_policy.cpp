// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

#include "retry_policy.hpp"

#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>

namespace obscalc::calc {

RetryPolicy::RetryPolicy(const RetryConfig& config) : config_(config) {}

const RetryConfig& RetryPolicy::getRetryConfig() const { return config_; }

std::chrono::milliseconds RetryPolicy::calculateDelay(int priorFailures) const {
    if (priorFailures < 0) {
        return std::chrono::milliseconds(0);
    }

    // Computed in floating point so large exponents saturate at maxDelay
    double expDelay = static_cast<double>(config_.initialDelay.count()) *
                      std::pow(config_.multiplier, priorFailures);
    double cap = static_cast<double>(config_.maxDelay.count());

    if (!std::isfinite(expDelay) || expDelay > cap) {
        spdlog::debug(
            "RetryPolicy: delay for failure {} exceeds max delay {}ms, "
            "capping",
            priorFailures, config_.maxDelay.count());
        return config_.maxDelay;
    }
    return std::chrono::milliseconds(static_cast<long long>(expDelay));
}

RetryDecision RetryPolicy::onTransientFailure(int priorFailures,
                                              Timestamp now) const {
    priorFailures = std::max(priorFailures, 0);
    if (priorFailures >= config_.maxRetries) {
        spdlog::debug("RetryPolicy: {} prior failures, giving up",
                      priorFailures);
        return onPermanentFailure();
    }

    auto delay = calculateDelay(priorFailures);
    RetryDecision decision;
    decision.state = CalcState::Retry;
    decision.failureCount = priorFailures + 1;
    decision.retryAt =
        now + std::chrono::duration_cast<std::chrono::microseconds>(delay);
    return decision;
}

RetryDecision RetryPolicy::onPermanentFailure() const {
    return RetryDecision{CalcState::Failed, 0, std::nullopt};
}

RetryDecision RetryPolicy::decide(FailureKind kind, int priorFailures,
                                  Timestamp now) const {
    return kind == FailureKind::Transient
               ? onTransientFailure(priorFailures, now)
               : onPermanentFailure();
}

}  // namespace obscalc::calc
