// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

/*************************************************

Date: 2024-12

Description: Central Logging Manager - owns the sinks and named loggers

**************************************************/

#ifndef OBSCALC_LOGGING_CORE_LOGGING_MANAGER_HPP
#define OBSCALC_LOGGING_CORE_LOGGING_MANAGER_HPP

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "../sinks/sink_factory.hpp"
#include "types.hpp"

namespace obscalc::logging {

/**
 * @brief Central logging manager with spdlog integration
 *
 * Builds the sinks described by LoggingConfig, installs a default logger
 * over them so spdlog free functions reach every sink, and hands out named
 * loggers (`obscalc.store`, `obscalc.worker`, ...) sharing the same sinks.
 */
class LoggingManager {
public:
    static auto getInstance() -> LoggingManager&;

    /**
     * @brief Initialize logging system with configuration
     *
     * Calling it again replaces the sinks of every logger handed out so far.
     */
    void initialize(const LoggingConfig& config);

    /**
     * @brief Flush and drop the named loggers
     */
    void shutdown();

    [[nodiscard]] auto isInitialized() const -> bool;

    // ========== Logger Management ==========

    /**
     * @brief Get or create a named logger
     */
    auto getLogger(const std::string& name) -> std::shared_ptr<spdlog::logger>;

    [[nodiscard]] auto listLoggers() const -> std::vector<LoggerInfo>;

    /**
     * @brief Set log level for a specific logger
     * @return false if the logger was not created by this manager
     */
    auto setLoggerLevel(const std::string& name,
                        spdlog::level::level_enum level) -> bool;

    void setGlobalLevel(spdlog::level::level_enum level);

    // ========== Sink Management ==========

    /**
     * @brief Add a new sink to every logger
     * @return false if the name is taken or the sink cannot be created
     */
    auto addSink(const SinkConfig& config) -> bool;

    auto removeSink(const std::string& name) -> bool;

    [[nodiscard]] auto listSinks() const -> std::vector<std::string>;

    // ========== Utility ==========

    void flush();

    [[nodiscard]] auto getConfig() const -> LoggingConfig;

private:
    LoggingManager() = default;
    ~LoggingManager();

    LoggingManager(const LoggingManager&) = delete;
    LoggingManager& operator=(const LoggingManager&) = delete;

    [[nodiscard]] auto sinkList() const -> std::vector<spdlog::sink_ptr>;

    void setupDefaultLogger();

    mutable std::shared_mutex mutex_;
    LoggingConfig config_;
    bool initialized_{false};

    std::map<std::string, spdlog::sink_ptr> sinks_;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers_;
};

}  // namespace obscalc::logging

#endif  // OBSCALC_LOGGING_CORE_LOGGING_MANAGER_HPP
