// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

#ifndef OBSCALC_CONFIG_SECTIONS_NOTIFIER_CONFIG_HPP
#define OBSCALC_CONFIG_SECTIONS_NOTIFIER_CONFIG_HPP

#include <cstddef>

#include "../core/config_section.hpp"

namespace obscalc::config {

struct NotifierConfig : ConfigSection<NotifierConfig> {
    static constexpr std::string_view PATH = "/obscalc/notifier";

    size_t historySize{1000};  ///< Events kept for getRecentEvents

    [[nodiscard]] json serialize() const {
        return {{"historySize", historySize}};
    }

    [[nodiscard]] static NotifierConfig deserialize(const json& j) {
        NotifierConfig cfg;
        cfg.historySize = j.value("historySize", cfg.historySize);
        return cfg;
    }

    [[nodiscard]] ConfigValidationResult validate() const {
        ConfigValidationResult result;
        require(result, historySize <= 1000000, "historySize",
                "must be <= 1000000");
        return result;
    }
};

}  // namespace obscalc::config

#endif  // OBSCALC_CONFIG_SECTIONS_NOTIFIER_CONFIG_HPP
