// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

#ifndef OBSCALC_DATABASE_CORE_TRANSACTION_HPP
#define OBSCALC_DATABASE_CORE_TRANSACTION_HPP

#include "types.hpp"

namespace obscalc::database::core {

class Database;

/**
 * @brief Scoped SQLite transaction. Rolls back on destruction unless
 * committed.
 *
 * SQLite has no nested BEGIN, so opening a second transaction on a
 * connection that already has one fails.
 */
class Transaction {
public:
    /**
     * @brief Begins a transaction on @p db.
     *
     * @throws TransactionError if a transaction is already open or BEGIN
     * fails
     */
    explicit Transaction(Database& db,
                         TransactionMode mode = TransactionMode::Deferred);

    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    /**
     * @throws TransactionError if already finished or COMMIT fails
     */
    void commit();

    /**
     * @throws TransactionError if already finished or ROLLBACK fails
     */
    void rollback();

    [[nodiscard]] TransactionMode mode() const noexcept { return mode_; }
    [[nodiscard]] bool isActive() const noexcept {
        return state_ == State::Active;
    }

private:
    enum class State { Active, Committed, RolledBack };

    void finish(const char* sql, State next);

    Database& db_;
    TransactionMode mode_;
    State state_{State::Active};
};

}  // namespace obscalc::database::core

#endif  // OBSCALC_DATABASE_CORE_TRANSACTION_HPP
