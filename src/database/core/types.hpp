#ifndef TEARDOWN_DATABASE_CORE_TYPES_HPP
#define TEARDOWN_DATABASE_CORE_TYPES_HPP

#include "atom/error/exception.hpp"

namespace teardown::database::core {

// Exception classes - all follow the XxxError naming convention
class DatabaseOpenError : public atom::error::Exception {
    using Exception::Exception;
};

class SqlExecutionError : public atom::error::Exception {
    using Exception::Exception;
};

/**
 * @brief Raised when SQLite reports SQLITE_CONSTRAINT (unique, check,
 * foreign key or not-null violation).
 */
class ConstraintViolationError : public SqlExecutionError {
    using SqlExecutionError::SqlExecutionError;
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

#define THROW_DATABASE_OPEN_ERROR(...)                 \
    throw teardown::database::core::DatabaseOpenError( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_SQL_EXECUTION_ERROR(...)                 \
    throw teardown::database::core::SqlExecutionError( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_CONSTRAINT_VIOLATION_ERROR(...)                 \
    throw teardown::database::core::ConstraintViolationError( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_STATEMENT_PREPARE_ERROR(...)                 \
    throw teardown::database::core::StatementPrepareError( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_TRANSACTION_ERROR(...)                  \
    throw teardown::database::core::TransactionError( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_VALIDATION_ERROR(...)                  \
    throw teardown::database::core::ValidationError( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Throws the exception matching a failed sqlite3 result code.
 *
 * Constraint failures map to ConstraintViolationError so that callers can
 * report them as conflicts; everything else is a SqlExecutionError.
 */
#define THROW_FOR_SQLITE_RESULT(code, ...)              \
    do {                                                \
        if (((code) & 0xff) == SQLITE_CONSTRAINT) {     \
            THROW_CONSTRAINT_VIOLATION_ERROR(__VA_ARGS__); \
        }                                               \
        THROW_SQL_EXECUTION_ERROR(__VA_ARGS__);         \
    } while (false)

}  // namespace teardown::database::core

#endif  // TEARDOWN_DATABASE_CORE_TYPES_HPP
