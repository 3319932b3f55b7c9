// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

/*************************************************

Date: 2024-12

Description: Logging types shared by the sink factory and the manager

**************************************************/

#ifndef OBSCALC_LOGGING_CORE_TYPES_HPP
#define OBSCALC_LOGGING_CORE_TYPES_HPP

#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace obscalc::logging {

/**
 * @brief Sink configuration
 */
struct SinkConfig {
    std::string name;
    std::string type;  // "console", "file", "rotating_file"
    spdlog::level::level_enum level{spdlog::level::trace};
    std::string pattern;

    // File sink options
    std::string file_path;
    size_t max_file_size{10 * 1024 * 1024};  // 10MB default
    size_t max_files{5};

    [[nodiscard]] auto toJson() const -> nlohmann::json;

    [[nodiscard]] static auto fromJson(const nlohmann::json& j) -> SinkConfig;
};

/**
 * @brief Logger information for listing
 */
struct LoggerInfo {
    std::string name;
    spdlog::level::level_enum level{spdlog::level::info};
    std::string pattern;

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

/**
 * @brief Logging manager configuration
 *
 * Built from the `/obscalc/logging` config section by the daemon.
 */
struct LoggingConfig {
    spdlog::level::level_enum default_level{spdlog::level::info};
    std::string default_pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v"};
    std::vector<SinkConfig> sinks;

    [[nodiscard]] auto toJson() const -> nlohmann::json;

    [[nodiscard]] static auto fromJson(const nlohmann::json& j)
        -> LoggingConfig;

    /**
     * @brief Console-only configuration
     */
    [[nodiscard]] static auto createDefault() -> LoggingConfig;
};

/**
 * @brief Convert level string to spdlog enum
 */
[[nodiscard]] auto levelFromString(const std::string& level)
    -> spdlog::level::level_enum;

/**
 * @brief Convert spdlog level enum to string
 */
[[nodiscard]] auto levelToString(spdlog::level::level_enum level)
    -> std::string;

}  // namespace obscalc::logging

#endif  // OBSCALC_LOGGING_CORE_TYPES_HPP
