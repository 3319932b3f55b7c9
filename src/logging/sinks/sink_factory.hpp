// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

/*************************************************

Date: 2024-12

Description: Factory for creating spdlog sinks from configuration

**************************************************/

#ifndef OBSCALC_LOGGING_SINKS_SINK_FACTORY_HPP
#define OBSCALC_LOGGING_SINKS_SINK_FACTORY_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "../core/types.hpp"

namespace obscalc::logging {

/**
 * @brief Factory class for creating spdlog sinks
 *
 * Supports console, basic file and rotating file sinks.
 */
class SinkFactory {
public:
    /**
     * @brief Create a sink from configuration
     * @param config Sink configuration
     * @return Shared pointer to created sink, or nullptr on failure
     */
    [[nodiscard]] static auto createSink(const SinkConfig& config)
        -> spdlog::sink_ptr;

    [[nodiscard]] static auto createConsoleSink(
        spdlog::level::level_enum level = spdlog::level::trace,
        const std::string& pattern = "") -> spdlog::sink_ptr;

    /**
     * @brief Create a basic file sink
     * @param truncate Whether to truncate existing file
     */
    [[nodiscard]] static auto createFileSink(
        const std::string& file_path,
        spdlog::level::level_enum level = spdlog::level::trace,
        const std::string& pattern = "", bool truncate = false)
        -> spdlog::sink_ptr;

    /**
     * @brief Create a rotating file sink
     * @param max_size Maximum file size before rotation
     * @param max_files Maximum number of rotated files to keep
     */
    [[nodiscard]] static auto createRotatingFileSink(
        const std::string& file_path, size_t max_size, size_t max_files,
        spdlog::level::level_enum level = spdlog::level::trace,
        const std::string& pattern = "") -> spdlog::sink_ptr;

private:
    static void ensureDirectoryExists(const std::string& file_path);
};

}  // namespace obscalc::logging

#endif  // OBSCALC_LOGGING_SINKS_SINK_FACTORY_HPP
