// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

#include "statement.hpp"

#include <spdlog/spdlog.h>

#include "database.hpp"

namespace obscalc::database::core {

Statement::Statement(Database& db, const std::string& sql) : db(db), sql(sql) {
    sqlite3_stmt* prepared = nullptr;
    int rc = sqlite3_prepare_v2(db.get(), sql.c_str(),
                                static_cast<int>(sql.size()), &prepared,
                                nullptr);
    stmt.reset(prepared);
    if (rc != SQLITE_OK) {
        fail("Failed to prepare SQL statement: ", true);
    }
    spdlog::trace("Prepared statement: {}", sql);
}

void Statement::fail(const char* what, bool prepareStage) const {
    std::string error = std::string(what) + sqlite3_errmsg(db.get());
    spdlog::error("{} [{}]", error, sql);
    if (prepareStage) {
        THROW_STATEMENT_PREPARE_ERROR(error);
    }
    THROW_SQL_EXECUTION_ERROR(error);
}

void Statement::requireParam(int index) const {
    if (index < 1 || index > sqlite3_bind_parameter_count(stmt.get())) {
        THROW_VALIDATION_ERROR("Parameter index out of bounds: " +
                               std::to_string(index));
    }
}

void Statement::requireColumn(int index) const {
    if (index < 0 || index >= sqlite3_column_count(stmt.get())) {
        THROW_VALIDATION_ERROR("Column index out of bounds: " +
                               std::to_string(index));
    }
}

void Statement::checkBind(int rc, int index, const char* kind) const {
    if (rc != SQLITE_OK) {
        std::string what = std::string("Failed to bind ") + kind +
                           " parameter " + std::to_string(index) + ": ";
        fail(what.c_str(), true);
    }
}

// ---- binding ----

Statement& Statement::bind(int index, int value) {
    requireParam(index);
    checkBind(sqlite3_bind_int(stmt.get(), index, value), index, "int");
    return *this;
}

Statement& Statement::bind(int index, int64_t value) {
    requireParam(index);
    checkBind(sqlite3_bind_int64(stmt.get(), index, value), index, "int64");
    return *this;
}

Statement& Statement::bind(int index, const std::string& value) {
    requireParam(index);
    // Length-delimited so payloads with embedded NULs survive
    checkBind(sqlite3_bind_text(stmt.get(), index, value.data(),
                                static_cast<int>(value.size()),
                                SQLITE_TRANSIENT),
              index, "text");
    return *this;
}

Statement& Statement::bindNull(int index) {
    requireParam(index);
    checkBind(sqlite3_bind_null(stmt.get(), index), index, "NULL");
    return *this;
}

Statement& Statement::bindOptional(int index,
                                   const std::optional<int64_t>& value) {
    return value ? bind(index, *value) : bindNull(index);
}

Statement& Statement::bindOptional(int index,
                                   const std::optional<std::string>& value) {
    return value ? bind(index, *value) : bindNull(index);
}

// ---- execution ----

bool Statement::execute() {
    switch (sqlite3_step(stmt.get())) {
        case SQLITE_DONE:
        case SQLITE_ROW:
            return true;
        default:
            fail("Failed to execute statement: ", false);
    }
}

bool Statement::step() {
    switch (sqlite3_step(stmt.get())) {
        case SQLITE_ROW:
            return true;
        case SQLITE_DONE:
            return false;
        default:
            fail("Failed to step statement: ", false);
    }
}

Statement& Statement::reset() {
    // sqlite3_reset repeats the error of the last step; bindings are
    // cleared regardless so the statement is reusable.
    int rc = sqlite3_reset(stmt.get());
    sqlite3_clear_bindings(stmt.get());
    if (rc != SQLITE_OK) {
        fail("Failed to reset statement: ", true);
    }
    return *this;
}

// ---- columns ----

int Statement::getInt(int index) const {
    requireColumn(index);
    return sqlite3_column_int(stmt.get(), index);
}

int64_t Statement::getInt64(int index) const {
    requireColumn(index);
    return sqlite3_column_int64(stmt.get(), index);
}

std::string Statement::getText(int index) const {
    requireColumn(index);
    const auto* text = sqlite3_column_text(stmt.get(), index);
    if (text == nullptr) {
        return {};
    }
    return {reinterpret_cast<const char*>(text),
            static_cast<size_t>(sqlite3_column_bytes(stmt.get(), index))};
}

std::optional<int64_t> Statement::getOptionalInt64(int index) const {
    return isNull(index) ? std::nullopt
                         : std::optional<int64_t>(getInt64(index));
}

std::optional<std::string> Statement::getOptionalText(int index) const {
    return isNull(index) ? std::nullopt
                         : std::optional<std::string>(getText(index));
}

bool Statement::isNull(int index) const {
    requireColumn(index);
    return sqlite3_column_type(stmt.get(), index) == SQLITE_NULL;
}

int Statement::getColumnCount() const {
    return sqlite3_column_count(stmt.get());
}

std::string Statement::getColumnName(int index) const {
    requireColumn(index);
    const char* name = sqlite3_column_name(stmt.get(), index);
    return name != nullptr ? name : "";
}

std::string Statement::getSql() const { return sql; }

}  // namespace obscalc::database::core
