// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

/*************************************************

Date: 2024-12

Description: Whole-service configuration assembled from its sections

**************************************************/

#ifndef OBSCALC_CONFIG_OBSCALC_CONFIG_HPP
#define OBSCALC_CONFIG_OBSCALC_CONFIG_HPP

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

#include "sections/sections.hpp"

namespace obscalc::config {

/**
 * @brief All configuration sections of the service.
 *
 * Sections live at their PATH inside one document, e.g.
 * `{"obscalc": {"retry": {"maxRetries": 3}}}`. Absent sections and keys
 * keep their defaults.
 */
struct ObscalcConfig {
    DatabaseConfig database;
    RetrySettings retry;
    WorkerConfig worker;
    LoggingConfig logging;
    NotifierConfig notifier;

    /**
     * @brief Load a JSON (or, by extension, YAML) configuration file
     * @return The validated configuration or a description of what is wrong
     */
    [[nodiscard]] static auto loadFromFile(const std::filesystem::path& path)
        -> std::expected<ObscalcConfig, std::string>;

    /**
     * @brief Parse and validate configuration text
     * @param format "json" or "yaml"
     */
    [[nodiscard]] static auto parse(std::string_view content,
                                    std::string_view format = "json")
        -> std::expected<ObscalcConfig, std::string>;

    [[nodiscard]] static auto fromDocument(const json& document)
        -> std::expected<ObscalcConfig, std::string>;

    [[nodiscard]] ConfigValidationResult validate() const;

    [[nodiscard]] json toJson() const;
};

}  // namespace obscalc::config

#endif  // OBSCALC_CONFIG_OBSCALC_CONFIG_HPP
