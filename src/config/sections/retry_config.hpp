// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

#ifndef OBSCALC_CONFIG_SECTIONS_RETRY_CONFIG_HPP
#define OBSCALC_CONFIG_SECTIONS_RETRY_CONFIG_HPP

#include <cmath>
#include <cstdint>

#include "../core/config_section.hpp"

namespace obscalc::config {

/**
 * @brief Backoff applied to transient calculation failures
 */
struct RetrySettings : ConfigSection<RetrySettings> {
    static constexpr std::string_view PATH = "/obscalc/retry";

    int maxRetries{5};
    int64_t initialDelayMs{60 * 1000};
    int64_t maxDelayMs{32 * 60 * 1000};
    double multiplier{2.0};

    [[nodiscard]] json serialize() const {
        return {{"maxRetries", maxRetries},
                {"initialDelayMs", initialDelayMs},
                {"maxDelayMs", maxDelayMs},
                {"multiplier", multiplier}};
    }

    [[nodiscard]] static RetrySettings deserialize(const json& j) {
        RetrySettings cfg;
        cfg.maxRetries = j.value("maxRetries", cfg.maxRetries);
        cfg.initialDelayMs = j.value("initialDelayMs", cfg.initialDelayMs);
        cfg.maxDelayMs = j.value("maxDelayMs", cfg.maxDelayMs);
        cfg.multiplier = j.value("multiplier", cfg.multiplier);
        return cfg;
    }

    [[nodiscard]] ConfigValidationResult validate() const {
        ConfigValidationResult result;
        require(result, maxRetries >= 0, "maxRetries", "must be >= 0");
        require(result, initialDelayMs > 0, "initialDelayMs", "must be > 0");
        require(result, maxDelayMs >= initialDelayMs, "maxDelayMs",
                "must be >= initialDelayMs");
        require(result, std::isfinite(multiplier) && multiplier >= 1.0,
                "multiplier", "must be >= 1.0");
        return result;
    }
};

}  // namespace obscalc::config

#endif  // OBSCALC_CONFIG_SECTIONS_RETRY_CONFIG_HPP
