// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

/*************************************************

Date: 2024-12

Description: SQLite connection configuration

**************************************************/

#ifndef OBSCALC_CONFIG_SECTIONS_DATABASE_CONFIG_HPP
#define OBSCALC_CONFIG_SECTIONS_DATABASE_CONFIG_HPP

#include <map>
#include <string>

#include "../core/config_section.hpp"

namespace obscalc::config {

/**
 * @brief Database file and extra PRAGMAs applied after open
 *
 * @example
 * ```json
 * {"obscalc": {"database": {
 *     "path": "/var/lib/obscalc/obscalc.db",
 *     "pragmas": {"cache_size": "-65536"},
 *     "busyTimeoutMs": 5000
 * }}}
 * ```
 */
struct DatabaseConfig : ConfigSection<DatabaseConfig> {
    static constexpr std::string_view PATH = "/obscalc/database";

    std::string path{"obscalc.db"};                ///< ":memory:" for tests
    std::map<std::string, std::string> pragmas;    ///< name -> value
    int busyTimeoutMs{5000};                       ///< wait on a locked file

    [[nodiscard]] json serialize() const {
        return {{"path", path},
                {"pragmas", pragmas},
                {"busyTimeoutMs", busyTimeoutMs}};
    }

    [[nodiscard]] static DatabaseConfig deserialize(const json& j) {
        DatabaseConfig cfg;
        cfg.path = j.value("path", cfg.path);
        cfg.busyTimeoutMs = j.value("busyTimeoutMs", cfg.busyTimeoutMs);
        if (j.contains("pragmas") && j["pragmas"].is_object()) {
            for (const auto& [name, value] : j["pragmas"].items()) {
                cfg.pragmas[name] = value.is_string() ? value.get<std::string>()
                                                      : value.dump();
            }
        }
        return cfg;
    }

    [[nodiscard]] ConfigValidationResult validate() const {
        ConfigValidationResult result;
        require(result, !path.empty(), "path", "must not be empty");
        require(result, busyTimeoutMs >= 0, "busyTimeoutMs", "must be >= 0");
        for (const auto& [name, value] : pragmas) {
            require(result,
                    !name.empty() &&
                        name.find_first_of(" ;=") == std::string::npos,
                    "pragmas", "invalid pragma name '" + name + "'");
        }
        return result;
    }
};

}  // namespace obscalc::config

#endif  // OBSCALC_CONFIG_SECTIONS_DATABASE_CONFIG_HPP
