// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Obscalc - Observation calculation cache
 * Copyright (C) 2024 Max Qian
 */

#ifndef OBSCALC_DATABASE_CORE_TYPES_HPP
#define OBSCALC_DATABASE_CORE_TYPES_HPP

#include "atom/error/exception.hpp"

namespace obscalc::database::core {

// Exception classes - all follow the XxxError naming convention
class DatabaseOpenError : public atom::error::Exception {
    using Exception::Exception;
};

class SqlExecutionError : public atom::error::Exception {
    using Exception::Exception;
};

class StatementPrepareError : public atom::error::Exception {
    using Exception::Exception;
};

class TransactionError : public atom::error::Exception {
    using Exception::Exception;
};

class ValidationError : public atom::error::Exception {
    using Exception::Exception;
};

/**
 * @brief Locking behaviour requested when a transaction begins.
 *
 * Deferred acquires the write lock on first write. Immediate takes the
 * RESERVED lock up front so a read-modify-write cannot be interleaved by
 * another writer.
 */
enum class TransactionMode { Deferred, Immediate };

#define THROW_DATABASE_OPEN_ERROR(...)                \
    throw obscalc::database::core::DatabaseOpenError( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_SQL_EXECUTION_ERROR(...)                \
    throw obscalc::database::core::SqlExecutionError( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_STATEMENT_PREPARE_ERROR(...)                \
    throw obscalc::database::core::StatementPrepareError( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_TRANSACTION_ERROR(...)                 \
    throw obscalc::database::core::TransactionError( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_VALIDATION_ERROR(...)                 \
    throw obscalc::database::core::ValidationError( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

}  // namespace obscalc::database::core

#endif  // OBSCALC_DATABASE_CORE_TYPES_HPP
