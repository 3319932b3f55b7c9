// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

#include "logging_manager.hpp"

namespace obscalc::logging {

auto LoggingManager::getInstance() -> LoggingManager& {
    static LoggingManager instance;
    return instance;
}

LoggingManager::~LoggingManager() {
    if (initialized_) {
        shutdown();
    }
}

void LoggingManager::initialize(const LoggingConfig& config) {
    std::unique_lock lock(mutex_);

    if (initialized_) {
        spdlog::warn("LoggingManager already initialized, reinitializing...");
    }
    sinks_.clear();

    config_ = config;

    for (const auto& sink_config : config.sinks) {
        auto sink = SinkFactory::createSink(sink_config);
        if (sink) {
            sinks_[sink_config.name] = sink;
        }
    }

    auto sink_list = sinkList();
    for (auto& [name, logger] : loggers_) {
        logger->sinks() = sink_list;
        logger->set_level(config_.default_level);
        logger->set_pattern(config_.default_pattern);
    }

    setupDefaultLogger();

    initialized_ = true;
    spdlog::info("LoggingManager initialized with {} sinks", sinks_.size());
}

void LoggingManager::shutdown() {
    std::unique_lock lock(mutex_);

    if (!initialized_) {
        return;
    }

    spdlog::info("LoggingManager shutting down...");

    for (auto& [name, logger] : loggers_) {
        logger->flush();
        spdlog::drop(name);
    }
    loggers_.clear();
    spdlog::default_logger()->flush();

    initialized_ = false;
}

auto LoggingManager::isInitialized() const -> bool {
    std::shared_lock lock(mutex_);
    return initialized_;
}

auto LoggingManager::getLogger(const std::string& name)
    -> std::shared_ptr<spdlog::logger> {
    std::unique_lock lock(mutex_);

    if (auto it = loggers_.find(name); it != loggers_.end()) {
        return it->second;
    }

    auto sink_list = sinkList();
    auto logger =
        std::make_shared<spdlog::logger>(name, sink_list.begin(), sink_list.end());
    logger->set_level(config_.default_level);
    logger->set_pattern(config_.default_pattern);

    // Replace any logger registered under the same name outside the manager
    spdlog::drop(name);
    spdlog::register_logger(logger);
    loggers_[name] = logger;
    return logger;
}

auto LoggingManager::listLoggers() const -> std::vector<LoggerInfo> {
    std::shared_lock lock(mutex_);

    std::vector<LoggerInfo> result;
    result.reserve(loggers_.size());
    for (const auto& [name, logger] : loggers_) {
        result.push_back({name, logger->level(), config_.default_pattern});
    }
    return result;
}

auto LoggingManager::setLoggerLevel(const std::string& name,
                                    spdlog::level::level_enum level) -> bool {
    std::unique_lock lock(mutex_);

    auto it = loggers_.find(name);
    if (it == loggers_.end()) {
        return false;
    }
    it->second->set_level(level);
    spdlog::info("Logger '{}' level set to {}", name,
                 spdlog::level::to_string_view(level));
    return true;
}

void LoggingManager::setGlobalLevel(spdlog::level::level_enum level) {
    std::unique_lock lock(mutex_);

    config_.default_level = level;
    for (auto& [name, logger] : loggers_) {
        logger->set_level(level);
    }
    spdlog::set_level(level);
    spdlog::info("Global log level set to {}",
                 spdlog::level::to_string_view(level));
}

auto LoggingManager::addSink(const SinkConfig& config) -> bool {
    std::unique_lock lock(mutex_);

    if (sinks_.contains(config.name)) {
        spdlog::warn("Sink '{}' already exists", config.name);
        return false;
    }

    auto sink = SinkFactory::createSink(config);
    if (!sink) {
        return false;
    }

    sinks_[config.name] = sink;
    config_.sinks.push_back(config);
    for (auto& [name, logger] : loggers_) {
        logger->sinks().push_back(sink);
    }
    spdlog::default_logger()->sinks().push_back(sink);

    spdlog::info("Sink '{}' added", config.name);
    return true;
}

auto LoggingManager::removeSink(const std::string& name) -> bool {
    std::unique_lock lock(mutex_);

    auto it = sinks_.find(name);
    if (it == sinks_.end()) {
        return false;
    }

    auto removed = it->second;
    sinks_.erase(it);
    std::erase_if(config_.sinks,
                  [&name](const SinkConfig& s) { return s.name == name; });

    auto detach = [&removed](spdlog::logger& logger) {
        std::erase_if(logger.sinks(), [&removed](const spdlog::sink_ptr& s) {
            return s.get() == removed.get();
        });
    };
    for (auto& [logger_name, logger] : loggers_) {
        detach(*logger);
    }
    detach(*spdlog::default_logger());

    spdlog::info("Sink '{}' removed", name);
    return true;
}

auto LoggingManager::listSinks() const -> std::vector<std::string> {
    std::shared_lock lock(mutex_);

    std::vector<std::string> names;
    for (const auto& [name, sink] : sinks_) {
        names.push_back(name);
    }
    return names;
}

void LoggingManager::flush() {
    std::shared_lock lock(mutex_);

    for (const auto& [name, logger] : loggers_) {
        logger->flush();
    }
    spdlog::default_logger()->flush();
}

auto LoggingManager::getConfig() const -> LoggingConfig {
    std::shared_lock lock(mutex_);
    return config_;
}

auto LoggingManager::sinkList() const -> std::vector<spdlog::sink_ptr> {
    std::vector<spdlog::sink_ptr> sink_list;
    for (const auto& [name, sink] : sinks_) {
        sink_list.push_back(sink);
    }
    return sink_list;
}

void LoggingManager::setupDefaultLogger() {
    auto sink_list = sinkList();
    auto default_logger = std::make_shared<spdlog::logger>(
        "obscalc", sink_list.begin(), sink_list.end());

    default_logger->set_level(config_.default_level);
    default_logger->set_pattern(config_.default_pattern);

    spdlog::set_default_logger(default_logger);
}

}  // namespace obscalc::logging
