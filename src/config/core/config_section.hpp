// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

/*************************************************

Date: 2024-12

Description: ConfigSection CRTP base class for type-safe configuration sections

**************************************************/

#ifndef OBSCALC_CONFIG_CORE_CONFIG_SECTION_HPP
#define OBSCALC_CONFIG_CORE_CONFIG_SECTION_HPP

#include <concepts>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace obscalc::config {

using json = nlohmann::json;

/**
 * @brief A single validation failure
 */
struct ConfigValidationError {
    std::string path;     ///< Section path plus key, e.g. /obscalc/retry/maxRetries
    std::string message;  ///< Human readable description
};

/**
 * @brief Outcome of validating one or more sections
 */
struct ConfigValidationResult {
    bool valid{true};
    std::vector<ConfigValidationError> errors;

    [[nodiscard]] bool isValid() const noexcept { return valid; }

    [[nodiscard]] explicit operator bool() const noexcept { return valid; }

    void addError(std::string path, std::string message) {
        valid = false;
        errors.push_back({std::move(path), std::move(message)});
    }

    void merge(const ConfigValidationResult& other) {
        for (const auto& error : other.errors) {
            addError(error.path, error.message);
        }
    }

    /// All messages joined with "; ".
    [[nodiscard]] std::string summary() const {
        std::string text;
        for (const auto& error : errors) {
            if (!text.empty()) {
                text += "; ";
            }
            text += error.path + ": " + error.message;
        }
        return text;
    }
};

/**
 * @brief Concept for valid ConfigSection derived types
 */
template <typename T>
concept ConfigSectionDerived = requires(T t, const json& j) {
    { T::PATH } -> std::convertible_to<std::string_view>;
    { t.serialize() } -> std::convertible_to<json>;
    { T::deserialize(j) } -> std::convertible_to<T>;
    { t.validate() } -> std::convertible_to<ConfigValidationResult>;
};

/**
 * @brief CRTP base class for type-safe configuration sections
 *
 * Derived classes define:
 *
 * 1. a static constexpr PATH, the JSON pointer of the section
 * 2. serialize() to convert to JSON
 * 3. static deserialize(const json&); missing keys keep their defaults
 * 4. validate() for range checks
 *
 * @tparam Derived The derived configuration struct type (CRTP)
 *
 * @example
 * ```cpp
 * struct NotifierConfig : ConfigSection<NotifierConfig> {
 *     static constexpr std::string_view PATH = "/obscalc/notifier";
 *
 *     size_t historySize = 1000;
 *
 *     [[nodiscard]] json serialize() const {
 *         return {{"historySize", historySize}};
 *     }
 *
 *     [[nodiscard]] static NotifierConfig deserialize(const json& j) {
 *         NotifierConfig config;
 *         config.historySize = j.value("historySize", config.historySize);
 *         return config;
 *     }
 * };
 * ```
 */
template <typename Derived>
class ConfigSection {
public:
    /**
     * @brief Get the configuration path for this section
     */
    [[nodiscard]] static constexpr std::string_view path() noexcept {
        return Derived::PATH;
    }

    [[nodiscard]] json toJson() const {
        return static_cast<const Derived*>(this)->serialize();
    }

    /**
     * @brief Create a configuration from JSON
     * @throws json::exception on a key of the wrong type
     */
    [[nodiscard]] static Derived fromJson(const json& j) {
        return Derived::deserialize(j);
    }

    /**
     * @brief Read the section at PATH inside a whole config document
     *
     * An absent section yields the defaults.
     *
     * @throws json::exception on a key of the wrong type
     */
    [[nodiscard]] static Derived fromDocument(const json& document) {
        json::json_pointer pointer{std::string(Derived::PATH)};
        if (!document.contains(pointer)) {
            return Derived{};
        }
        return Derived::deserialize(document.at(pointer));
    }

    /**
     * @brief Try to create a configuration from JSON with error handling
     * @return Configuration instance or nullopt on error
     */
    [[nodiscard]] static std::optional<Derived> tryFromJson(const json& j) {
        try {
            return Derived::deserialize(j);
        } catch (const json::exception& e) {
            spdlog::warn("Invalid {} section: {}", Derived::PATH, e.what());
            return std::nullopt;
        }
    }

    [[nodiscard]] static Derived defaults() { return Derived{}; }

protected:
    /**
     * @brief Record an error unless @p condition holds
     */
    static void require(ConfigValidationResult& result, bool condition,
                        std::string_view key, std::string message) {
        if (!condition) {
            result.addError(std::string(Derived::PATH) + "/" + std::string(key),
                            std::move(message));
        }
    }
};

}  // namespace obscalc::config

#endif  // OBSCALC_CONFIG_CORE_CONFIG_SECTION_HPP
