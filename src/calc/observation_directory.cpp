// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

#include "observation_directory.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>

#include "database/core/database.hpp"
#include "database/core/statement.hpp"

namespace obscalc::calc {

SqliteObservationDirectory::SqliteObservationDirectory(
    std::shared_ptr<database::core::Database> db)
    : db_(std::move(db)) {
    if (!db_ || !db_->isValid()) {
        throw std::runtime_error("Invalid database connection");
    }
    initializeSchema();
}

void SqliteObservationDirectory::initializeSchema() {
    std::unique_lock lock(mutex_);

    db_->execute(R"(
        CREATE TABLE IF NOT EXISTS t_program (
            c_program_id TEXT PRIMARY KEY,
            c_cfp_id     TEXT
        )
    )");
    db_->execute(R"(
        CREATE TABLE IF NOT EXISTS t_observation (
            c_observation_id TEXT PRIMARY KEY,
            c_program_id     TEXT NOT NULL
        )
    )");
    db_->execute(R"(
        CREATE TABLE IF NOT EXISTS t_asterism_target (
            c_observation_id TEXT NOT NULL,
            c_target_id      TEXT NOT NULL,
            PRIMARY KEY (c_observation_id, c_target_id)
        )
    )");
    db_->execute(
        "CREATE INDEX IF NOT EXISTS i_observation_program "
        "ON t_observation(c_program_id)");
    db_->execute(
        "CREATE INDEX IF NOT EXISTS i_asterism_target "
        "ON t_asterism_target(c_target_id)");
}

auto SqliteObservationDirectory::findProgram(const ObservationId& observationId)
    -> std::expected<std::optional<ProgramId>, std::string> {
    try {
        std::shared_lock lock(mutex_);

        auto stmt = db_->prepare(
            "SELECT c_program_id FROM t_observation "
            "WHERE c_observation_id = ?");
        stmt->bind(1, observationId);
        if (!stmt->step()) {
            return std::optional<ProgramId>{};
        }
        return std::optional<ProgramId>{stmt->getText(0)};
    } catch (const std::exception& e) {
        std::string error = "Observation lookup failed: " + std::string(e.what());
        SPDLOG_ERROR("{}", error);
        return std::unexpected(error);
    }
}

auto SqliteObservationDirectory::observationsForOwner(const OwnerRef& owner)
    -> std::expected<std::vector<ObservationId>, std::string> {
    switch (owner.kind) {
        case OwnerKind::Program:
            return queryIds(
                "SELECT c_observation_id FROM t_observation "
                "WHERE c_program_id = ? ORDER BY c_observation_id",
                owner.id);
        case OwnerKind::CallForProposals:
            return queryIds(R"(
                SELECT o.c_observation_id
                FROM t_observation o
                JOIN t_program p ON p.c_program_id = o.c_program_id
                WHERE p.c_cfp_id = ?
                ORDER BY o.c_observation_id
            )",
                            owner.id);
    }
    return std::unexpected(std::string("Unknown owner kind"));
}

auto SqliteObservationDirectory::observationsForTarget(const TargetId& targetId)
    -> std::expected<std::vector<ObservationId>, std::string> {
    return queryIds(
        "SELECT c_observation_id FROM t_asterism_target "
        "WHERE c_target_id = ? ORDER BY c_observation_id",
        targetId);
}

auto SqliteObservationDirectory::queryIds(const std::string& sql,
                                          const std::string& param)
    -> std::expected<std::vector<ObservationId>, std::string> {
    try {
        std::shared_lock lock(mutex_);

        auto stmt = db_->prepare(sql);
        stmt->bind(1, param);

        std::vector<ObservationId> ids;
        while (stmt->step()) {
            ids.push_back(stmt->getText(0));
        }
        return ids;
    } catch (const std::exception& e) {
        std::string error = "Observation fan-out failed: " + std::string(e.what());
        SPDLOG_ERROR("{}", error);
        return std::unexpected(error);
    }
}

}  // namespace obscalc::calc
