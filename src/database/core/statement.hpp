// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

#ifndef OBSCALC_DATABASE_CORE_STATEMENT_HPP
#define OBSCALC_DATABASE_CORE_STATEMENT_HPP

#include <sqlite3.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "types.hpp"

namespace obscalc::database::core {

// Forward declaration
class Database;

class Statement {
public:
    /**
     * @brief Prepares @p sql against @p db.
     *
     * @throws StatementPrepareError if preparation fails
     */
    Statement(Database& db, const std::string& sql);

    ~Statement() = default;

    // Non-copyable
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    /**
     * @brief Binds an integer value to a parameter.
     *
     * @param index Parameter index (1-based).
     * @param value Integer value to bind.
     * @return Reference to this Statement for chaining.
     * @throws StatementPrepareError if binding fails
     */
    Statement& bind(int index, int value);

    /**
     * @brief Binds a 64-bit integer value to a parameter.
     *
     * @param index Parameter index (1-based).
     * @param value Integer value to bind.
     * @return Reference to this Statement for chaining.
     * @throws StatementPrepareError if binding fails
     */
    Statement& bind(int index, int64_t value);

    /**
     * @brief Binds a string value to a parameter.
     *
     * @param index Parameter index (1-based).
     * @param value String value to bind.
     * @return Reference to this Statement for chaining.
     * @throws StatementPrepareError if binding fails
     */
    Statement& bind(int index, const std::string& value);

    /**
     * @brief Binds a null value to a parameter.
     *
     * @param index Parameter index (1-based).
     * @return Reference to this Statement for chaining.
     * @throws StatementPrepareError if binding fails
     */
    Statement& bindNull(int index);

    /// Binds @p value, or NULL when empty.
    Statement& bindOptional(int index, const std::optional<int64_t>& value);

    /// Binds @p value, or NULL when empty.
    Statement& bindOptional(int index, const std::optional<std::string>& value);

    /**
     * @brief Executes the statement without returning results.
     *
     * @return True if execution was successful.
     * @throws SqlExecutionError if execution fails
     */
    bool execute();

    /**
     * @brief Steps through the statement results.
     *
     * @return True if a row was retrieved, false if no more rows.
     * @throws SqlExecutionError if stepping fails
     */
    bool step();

    /**
     * @brief Resets the statement and clears its bindings for reuse.
     *
     * @return Reference to this Statement for chaining.
     * @throws StatementPrepareError if reset fails
     */
    Statement& reset();

    int getInt(int index) const;

    int64_t getInt64(int index) const;

    /// Empty string for NULL columns.
    std::string getText(int index) const;

    std::optional<int64_t> getOptionalInt64(int index) const;

    std::optional<std::string> getOptionalText(int index) const;

    /**
     * @brief Checks if a column contains NULL.
     *
     * @param index Column index (0-based).
     * @return True if the column contains NULL.
     */
    bool isNull(int index) const;

    int getColumnCount() const;

    std::string getColumnName(int index) const;

    std::string getSql() const;

private:
    Database& db;
    std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)> stmt{
        nullptr, sqlite3_finalize};
    std::string sql;

    /// @throws ValidationError unless 1 <= index <= parameter count
    void requireParam(int index) const;

    /// @throws ValidationError unless 0 <= index < column count
    void requireColumn(int index) const;

    /// Throws StatementPrepareError carrying the connection's last error
    /// when @p rc is not SQLITE_OK.
    void checkBind(int rc, int index, const char* kind) const;

    [[noreturn]] void fail(const char* what, bool prepareStage) const;
};

}  // namespace obscalc::database::core

#endif  // OBSCALC_DATABASE_CORE_STATEMENT_HPP
