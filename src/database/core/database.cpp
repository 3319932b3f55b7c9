// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

#include "database.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

#include "statement.hpp"
#include "transaction.hpp"

namespace obscalc::database::core {

namespace {

bool isPragmaName(const std::string& name) {
    return !name.empty() &&
           std::all_of(name.begin(), name.end(), [](unsigned char c) {
               return std::isalnum(c) != 0 || c == '_';
           });
}

}  // namespace

Database::Database(const std::string& path, int flags,
                   std::chrono::milliseconds busyTimeout) {
    sqlite3* handle = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &handle, flags, nullptr);
    // sqlite3_open_v2 hands back a handle even on failure; it must be closed
    db.reset(handle);

    if (rc != SQLITE_OK) {
        std::string reason =
            handle != nullptr ? sqlite3_errmsg(handle) : sqlite3_errstr(rc);
        spdlog::error("Cannot open database '{}': {}", path, reason);
        THROW_DATABASE_OPEN_ERROR("Can't open database '" + path +
                                  "': " + reason);
    }

    valid.store(true);
    try {
        applyConnectionDefaults(busyTimeout);
    } catch (const std::exception& e) {
        valid.store(false);
        spdlog::error("Cannot configure database '{}': {}", path, e.what());
        THROW_DATABASE_OPEN_ERROR("Can't configure database '" + path +
                                  "': " + e.what());
    }
    spdlog::info("Database opened: {}", path);
}

Database::~Database() {
    if (!valid.load()) {
        return;
    }
    try {
        execute("PRAGMA optimize;");
    } catch (const std::exception& e) {
        spdlog::warn("PRAGMA optimize failed on close: {}", e.what());
    }
}

Database::Database(Database&& other) noexcept : db(std::move(other.db)) {
    valid.store(other.valid.exchange(false));
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        db = std::move(other.db);
        valid.store(other.valid.exchange(false));
    }
    return *this;
}

void Database::requireValid(const char* action) const {
    if (!valid.load()) {
        THROW_VALIDATION_ERROR(std::string("Attempted to ") + action +
                               " on an invalid database connection");
    }
}

void Database::applyConnectionDefaults(std::chrono::milliseconds busyTimeout) {
    sqlite3_busy_timeout(db.get(), static_cast<int>(busyTimeout.count()));
    execute("PRAGMA foreign_keys = ON;");
    execute("PRAGMA journal_mode = WAL;");
    execute("PRAGMA synchronous = NORMAL;");
}

sqlite3* Database::get() {
    requireValid("use the handle");
    return db.get();
}

std::unique_ptr<Statement> Database::prepare(const std::string& sql) {
    requireValid("prepare a statement");
    return std::make_unique<Statement>(*this, sql);
}

std::unique_ptr<Transaction> Database::beginTransaction(TransactionMode mode) {
    requireValid("begin a transaction");
    return std::make_unique<Transaction>(*this, mode);
}

void Database::execute(const std::string& sql) {
    requireValid("execute SQL");

    char* raw = nullptr;
    int rc = sqlite3_exec(db.get(), sql.c_str(), nullptr, nullptr, &raw);
    std::unique_ptr<char, decltype(&sqlite3_free)> message(raw, sqlite3_free);

    if (rc != SQLITE_OK) {
        std::string error = "SQL Error: ";
        error += message ? message.get() : sqlite3_errstr(rc);
        spdlog::error("{}", error);
        THROW_SQL_EXECUTION_ERROR(error);
    }
}

int Database::changes() { return sqlite3_changes(get()); }

int64_t Database::lastInsertRowId() {
    return sqlite3_last_insert_rowid(get());
}

bool Database::isValid() const noexcept { return valid.load(); }

bool Database::inTransaction() { return sqlite3_get_autocommit(get()) == 0; }

int Database::userVersion() {
    auto stmt = prepare("PRAGMA user_version;");
    return stmt->step() ? stmt->getInt(0) : 0;
}

void Database::setUserVersion(int version) {
    execute("PRAGMA user_version = " + std::to_string(version) + ";");
}

void Database::configure(
    const std::unordered_map<std::string, std::string>& pragmas) {
    requireValid("configure");

    for (const auto& [name, value] : pragmas) {
        if (!isPragmaName(name)) {
            THROW_VALIDATION_ERROR("Invalid PRAGMA name: '" + name + "'");
        }
        execute("PRAGMA " + name + " = " + value + ";");
        spdlog::debug("PRAGMA {} = {}", name, value);
    }
}

}  // namespace obscalc::database::core
