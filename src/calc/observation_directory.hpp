// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

#ifndef OBSCALC_CALC_OBSERVATION_DIRECTORY_HPP
#define OBSCALC_CALC_OBSERVATION_DIRECTORY_HPP

#include <expected>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace obscalc::database::core {
class Database;
}  // namespace obscalc::database::core

namespace obscalc::calc {

enum class OwnerKind { Program, CallForProposals };

[[nodiscard]] constexpr std::string_view ownerKindToString(
    OwnerKind kind) noexcept {
    switch (kind) {
        case OwnerKind::Program: return "program";
        case OwnerKind::CallForProposals: return "call_for_proposals";
    }
    return "program";
}

/**
 * @brief A coarse-grained upstream entity owning many observations.
 */
struct OwnerRef {
    OwnerKind kind{OwnerKind::Program};
    std::string id;

    [[nodiscard]] static OwnerRef program(ProgramId programId) {
        return {OwnerKind::Program, std::move(programId)};
    }

    [[nodiscard]] static OwnerRef callForProposals(CallForProposalsId cfpId) {
        return {OwnerKind::CallForProposals, std::move(cfpId)};
    }

    bool operator==(const OwnerRef&) const = default;
};

/**
 * @brief Read-only view of the upstream observation store.
 *
 * Error Handling:
 * - Returns std::expected<T, std::string> for fallible lookups
 * - Implementations must be thread-safe
 */
class ObservationDirectory {
public:
    virtual ~ObservationDirectory() = default;

    // Prevent copying
    ObservationDirectory(const ObservationDirectory&) = delete;
    ObservationDirectory& operator=(const ObservationDirectory&) = delete;

    /**
     * @brief Owning program of an observation
     * @return nullopt if the observation does not exist
     */
    [[nodiscard]] virtual auto findProgram(const ObservationId& observationId)
        -> std::expected<std::optional<ProgramId>, std::string> = 0;

    /**
     * @brief All observations under a program, or under every program
     * assigned to a call for proposals
     */
    [[nodiscard]] virtual auto observationsForOwner(const OwnerRef& owner)
        -> std::expected<std::vector<ObservationId>, std::string> = 0;

    /**
     * @brief Observations whose asterism contains @p targetId
     */
    [[nodiscard]] virtual auto observationsForTarget(const TargetId& targetId)
        -> std::expected<std::vector<ObservationId>, std::string> = 0;

protected:
    ObservationDirectory() = default;
};

/**
 * @brief ObservationDirectory over the upstream SQLite tables
 * `t_observation`, `t_program` and `t_asterism_target`.
 *
 * The tables are created if missing so the cache can run against a fresh
 * database; their contents belong to the surrounding application.
 */
class SqliteObservationDirectory : public ObservationDirectory {
public:
    /**
     * @throws std::runtime_error if database is invalid
     */
    explicit SqliteObservationDirectory(
        std::shared_ptr<database::core::Database> db);

    ~SqliteObservationDirectory() override = default;

    [[nodiscard]] auto findProgram(const ObservationId& observationId)
        -> std::expected<std::optional<ProgramId>, std::string> override;

    [[nodiscard]] auto observationsForOwner(const OwnerRef& owner)
        -> std::expected<std::vector<ObservationId>, std::string> override;

    [[nodiscard]] auto observationsForTarget(const TargetId& targetId)
        -> std::expected<std::vector<ObservationId>, std::string> override;

private:
    void initializeSchema();

    auto queryIds(const std::string& sql, const std::string& param)
        -> std::expected<std::vector<ObservationId>, std::string>;

    std::shared_ptr<database::core::Database> db_;
    mutable std::shared_mutex mutex_;
};

}  // namespace obscalc::calc

#endif  // OBSCALC_CALC_OBSERVATION_DIRECTORY_HPP
