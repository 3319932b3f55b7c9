// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

/*************************************************

Date: 2024-12

Description: Logging configuration section

**************************************************/

#ifndef OBSCALC_CONFIG_SECTIONS_LOGGING_CONFIG_HPP
#define OBSCALC_CONFIG_SECTIONS_LOGGING_CONFIG_HPP

#include <array>
#include <string>
#include <string_view>

#include "../core/config_section.hpp"

namespace obscalc::config {

/**
 * @brief Console and file logging
 *
 * An empty logFile disables file output. A maxFileSize of 0 writes a single
 * file without rotation.
 *
 * @example
 * ```json
 * {"obscalc": {"logging": {
 *     "level": "debug",
 *     "console": true,
 *     "logFile": "logs/obscalc.log",
 *     "maxFileSize": 10485760,
 *     "maxFiles": 5
 * }}}
 * ```
 */
struct LoggingConfig : ConfigSection<LoggingConfig> {
    static constexpr std::string_view PATH = "/obscalc/logging";

    static constexpr std::array<std::string_view, 7> LEVELS = {
        "trace", "debug", "info", "warn", "error", "critical", "off"};

    std::string level{"info"};
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v"};
    bool console{true};
    std::string logFile;
    size_t maxFileSize{10 * 1024 * 1024};  ///< Rotation threshold (10 MB)
    size_t maxFiles{5};

    [[nodiscard]] json serialize() const {
        return {{"level", level},
                {"pattern", pattern},
                {"console", console},
                {"logFile", logFile},
                {"maxFileSize", maxFileSize},
                {"maxFiles", maxFiles}};
    }

    [[nodiscard]] static LoggingConfig deserialize(const json& j) {
        LoggingConfig cfg;
        cfg.level = j.value("level", cfg.level);
        cfg.pattern = j.value("pattern", cfg.pattern);
        cfg.console = j.value("console", cfg.console);
        cfg.logFile = j.value("logFile", cfg.logFile);
        cfg.maxFileSize = j.value("maxFileSize", cfg.maxFileSize);
        cfg.maxFiles = j.value("maxFiles", cfg.maxFiles);
        return cfg;
    }

    [[nodiscard]] ConfigValidationResult validate() const {
        ConfigValidationResult result;
        bool knownLevel = false;
        for (auto name : LEVELS) {
            knownLevel = knownLevel || name == level;
        }
        require(result, knownLevel, "level", "unknown level '" + level + "'");
        require(result, !pattern.empty(), "pattern", "must not be empty");
        require(result, maxFiles >= 1 && maxFiles <= 100, "maxFiles",
                "must be between 1 and 100");
        return result;
    }
};

}  // namespace obscalc::config

#endif  // OBSCALC_CONFIG_SECTIONS_LOGGING_CONFIG_HPP
