// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

#include "obscalc_config.hpp"

#include <charconv>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace obscalc::config {

namespace {

constexpr size_t MAX_YAML_DEPTH = 64;

json yamlScalarToJson(const std::string& value) {
    if (value == "true" || value == "True" || value == "yes" ||
        value == "on") {
        return true;
    }
    if (value == "false" || value == "False" || value == "no" ||
        value == "off") {
        return false;
    }
    if (value == "null" || value == "~" || value.empty()) {
        return nullptr;
    }

    const char* first = value.data();
    const char* last = value.data() + value.size();

    int64_t intVal = 0;
    auto [intEnd, intErr] = std::from_chars(first, last, intVal);
    if (intErr == std::errc() && intEnd == last) {
        return intVal;
    }

    double doubleVal = 0.0;
    auto [dblEnd, dblErr] = std::from_chars(first, last, doubleVal);
    if (dblErr == std::errc() && dblEnd == last) {
        return doubleVal;
    }

    return value;
}

json yamlNodeToJson(const YAML::Node& node, size_t depth) {
    if (depth > MAX_YAML_DEPTH) {
        throw std::runtime_error("Maximum nesting depth exceeded");
    }

    switch (node.Type()) {
        case YAML::NodeType::Scalar:
            return yamlScalarToJson(node.as<std::string>());

        case YAML::NodeType::Sequence: {
            json array = json::array();
            for (const auto& item : node) {
                array.push_back(yamlNodeToJson(item, depth + 1));
            }
            return array;
        }

        case YAML::NodeType::Map: {
            json object = json::object();
            for (const auto& entry : node) {
                object[entry.first.as<std::string>()] =
                    yamlNodeToJson(entry.second, depth + 1);
            }
            return object;
        }

        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return nullptr;
    }
    return nullptr;
}

}  // namespace

auto ObscalcConfig::loadFromFile(const std::filesystem::path& path)
    -> std::expected<ObscalcConfig, std::string> {
    std::ifstream file(path);
    if (!file) {
        return std::unexpected("Cannot open config file " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto ext = path.extension().string();
    std::string_view format = (ext == ".yaml" || ext == ".yml") ? "yaml" : "json";

    auto config = parse(buffer.str(), format);
    if (!config) {
        return std::unexpected(path.string() + ": " + config.error());
    }
    spdlog::info("Loaded configuration from {}", path.string());
    return config;
}

auto ObscalcConfig::parse(std::string_view content, std::string_view format)
    -> std::expected<ObscalcConfig, std::string> {
    json document;
    if (format == "yaml") {
        try {
            document = yamlNodeToJson(YAML::Load(std::string(content)), 0);
        } catch (const YAML::Exception& e) {
            return std::unexpected(std::string("YAML parse error: ") +
                                   e.what());
        } catch (const std::runtime_error& e) {
            return std::unexpected(std::string("YAML parse error: ") +
                                   e.what());
        }
    } else {
        document = json::parse(content, nullptr, false, true);
        if (document.is_discarded()) {
            return std::unexpected(std::string("JSON parse error"));
        }
    }

    if (document.is_null()) {
        document = json::object();
    }
    return fromDocument(document);
}

auto ObscalcConfig::fromDocument(const json& document)
    -> std::expected<ObscalcConfig, std::string> {
    if (!document.is_object()) {
        return std::unexpected(std::string("Configuration must be an object"));
    }

    ObscalcConfig config;
    try {
        config.database = DatabaseConfig::fromDocument(document);
        config.retry = RetrySettings::fromDocument(document);
        config.worker = WorkerConfig::fromDocument(document);
        config.logging = LoggingConfig::fromDocument(document);
        config.notifier = NotifierConfig::fromDocument(document);
    } catch (const json::exception& e) {
        return std::unexpected(std::string("Invalid configuration value: ") +
                               e.what());
    }

    auto validation = config.validate();
    if (!validation) {
        return std::unexpected(validation.summary());
    }
    return config;
}

ConfigValidationResult ObscalcConfig::validate() const {
    ConfigValidationResult result;
    result.merge(database.validate());
    result.merge(retry.validate());
    result.merge(worker.validate());
    result.merge(logging.validate());
    result.merge(notifier.validate());
    return result;
}

json ObscalcConfig::toJson() const {
    json document = json::object();
    document[json::json_pointer(std::string(DatabaseConfig::PATH))] =
        database.toJson();
    document[json::json_pointer(std::string(RetrySettings::PATH))] =
        retry.toJson();
    document[json::json_pointer(std::string(WorkerConfig::PATH))] =
        worker.toJson();
    document[json::json_pointer(std::string(LoggingConfig::PATH))] =
        logging.toJson();
    document[json::json_pointer(std::string(NotifierConfig::PATH))] =
        notifier.toJson();
    return document;
}

}  // namespace obscalc::config
