// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

#ifndef OBSCALC_DATABASE_CORE_DATABASE_HPP
#define OBSCALC_DATABASE_CORE_DATABASE_HPP

#include <sqlite3.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

#include "types.hpp"

namespace obscalc::database::core {

// Forward declarations
class Statement;
class Transaction;

/**
 * @brief Owning handle for one SQLite connection.
 *
 * Every connection is opened with foreign keys on, WAL journaling and a
 * busy timeout so concurrent writers queue instead of failing.
 */
class Database {
public:
    static constexpr std::chrono::milliseconds kDefaultBusyTimeout{5000};

    /**
     * @brief Opens the SQLite database at @p path.
     *
     * @param path Database file, or ":memory:" for a private in-memory
     * database.
     * @param flags SQLite open flags.
     * @param busyTimeout How long a statement waits on a locked database.
     * @throws DatabaseOpenError if the file cannot be opened or the
     * connection defaults cannot be applied
     */
    explicit Database(const std::string& path,
                      int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                                  SQLITE_OPEN_FULLMUTEX,
                      std::chrono::milliseconds busyTimeout =
                          kDefaultBusyTimeout);

    ~Database();

    // Prevent copying
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    // Allow moving
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    /**
     * @brief Gets the SQLite database handle.
     * @throws ValidationError if the connection is not valid
     */
    sqlite3* get();

    /**
     * @brief Creates a prepared statement from an SQL query.
     *
     * @param sql The SQL query to prepare.
     * @return A unique pointer to the created Statement.
     * @throws StatementPrepareError if statement preparation fails
     */
    std::unique_ptr<Statement> prepare(const std::string& sql);

    /**
     * @brief Begins a database transaction.
     *
     * @param mode Deferred (default) or Immediate locking.
     * @return A unique pointer to the created Transaction.
     * @throws TransactionError if transaction cannot be started
     */
    std::unique_ptr<Transaction> beginTransaction(
        TransactionMode mode = TransactionMode::Deferred);

    /**
     * @brief Executes an SQL statement directly.
     *
     * @param sql The SQL statement to execute.
     * @throws SqlExecutionError if execution fails
     */
    void execute(const std::string& sql);

    /**
     * @brief Number of rows modified by the most recent INSERT, UPDATE or
     * DELETE on this connection.
     */
    int changes();

    /**
     * @brief Rowid of the most recent successful INSERT on this connection.
     */
    int64_t lastInsertRowId();

    bool isValid() const noexcept;

    /**
     * @brief True while an explicit BEGIN is open on this connection.
     */
    bool inTransaction();

    /**
     * @brief Schema version stamped in the file header (PRAGMA user_version).
     */
    int userVersion();
    void setUserVersion(int version);

    /**
     * @brief Applies PRAGMA settings.
     *
     * @param pragmas Map of PRAGMA name to value
     * @throws ValidationError if a name is not a plain identifier
     * @throws SqlExecutionError if SQLite rejects a setting
     */
    void configure(const std::unordered_map<std::string, std::string>& pragmas);

private:
    void requireValid(const char* action) const;
    void applyConnectionDefaults(std::chrono::milliseconds busyTimeout);

    std::unique_ptr<sqlite3, decltype(&sqlite3_close)> db{nullptr,
                                                          sqlite3_close};
    std::atomic<bool> valid{false};
};

}  // namespace obscalc::database::core

#endif  // OBSCALC_DATABASE_CORE_DATABASE_HPP
