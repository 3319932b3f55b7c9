// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

#include "transaction.hpp"

#include <spdlog/spdlog.h>

#include "database.hpp"

namespace obscalc::database::core {

namespace {

const char* beginSql(TransactionMode mode) {
    switch (mode) {
        case TransactionMode::Immediate:
            return "BEGIN IMMEDIATE;";
        case TransactionMode::Deferred:
            break;
    }
    return "BEGIN DEFERRED;";
}

}  // namespace

Transaction::Transaction(Database& db, TransactionMode mode)
    : db_(db), mode_(mode) {
    if (db_.inTransaction()) {
        THROW_TRANSACTION_ERROR(
            "Cannot begin: a transaction is already open on this connection");
    }
    try {
        db_.execute(beginSql(mode_));
    } catch (const SqlExecutionError& e) {
        THROW_TRANSACTION_ERROR(std::string("Failed to begin transaction: ") +
                                e.what());
    }
}

Transaction::~Transaction() {
    if (state_ != State::Active) {
        return;
    }
    try {
        finish("ROLLBACK;", State::RolledBack);
    } catch (const std::exception& e) {
        spdlog::error("Rollback of abandoned transaction failed: {}",
                      e.what());
    }
}

void Transaction::commit() { finish("COMMIT;", State::Committed); }

void Transaction::rollback() { finish("ROLLBACK;", State::RolledBack); }

void Transaction::finish(const char* sql, State next) {
    if (state_ != State::Active) {
        THROW_TRANSACTION_ERROR("Transaction already committed or rolled back");
    }
    try {
        db_.execute(sql);
    } catch (const SqlExecutionError& e) {
        THROW_TRANSACTION_ERROR(std::string("Failed to finish transaction (") +
                                sql + "): " + e.what());
    }
    state_ = next;
    spdlog::trace("Transaction {}",
                  next == State::Committed ? "committed" : "rolled back");
}

}  // namespace obscalc::database::core
