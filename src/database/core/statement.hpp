#ifndef TEARDOWN_DATABASE_CORE_STATEMENT_HPP
#define TEARDOWN_DATABASE_CORE_STATEMENT_HPP

#include <sqlite3.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "types.hpp"

namespace teardown::database::core {

// Forward declaration
class Database;

class Statement {
public:
    /**
     * @brief Constructs a Statement object.
     *
     * @param db Reference to the database connection.
     * @param sql The SQL statement to prepare.
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
     */
    Statement& bind(int index, int64_t value);

    /**
     * @brief Binds a double value to a parameter.
     */
    Statement& bind(int index, double value);

    /**
     * @brief Binds a string value to a parameter. The text is copied.
     */
    Statement& bind(int index, const std::string& value);

    /**
     * @brief Binds a null value to a parameter.
     */
    Statement& bindNull(int index);

    /**
     * @brief Binds the contained value, or NULL when empty.
     */
    template <typename T>
    Statement& bindOptional(int index, const std::optional<T>& value) {
        if (value) {
            return bind(index, *value);
        }
        return bindNull(index);
    }

    /**
     * @brief Executes the statement without returning results.
     *
     * @return True if execution was successful.
     * @throws ConstraintViolationError if a constraint rejects the row
     * @throws SqlExecutionError if execution fails otherwise
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
     */
    Statement& reset();

    int getInt(int index) const;
    int64_t getInt64(int index) const;
    double getDouble(int index) const;

    /**
     * @brief Gets a string column value. NULL reads as an empty string.
     */
    std::string getText(int index) const;

    std::optional<int64_t> getOptionalInt64(int index) const;
    std::optional<double> getOptionalDouble(int index) const;
    std::optional<std::string> getOptionalText(int index) const;

    /**
     * @brief Checks if a column contains NULL.
     *
     * @param index Column index (0-based).
     */
    bool isNull(int index) const;

private:
    Database& db;
    std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)> stmt{
        nullptr, sqlite3_finalize};
    std::string sql;

    /**
     * @brief Validates that an index is within the valid range.
     *
     * @param index The index to validate.
     * @param isParam Whether this is a parameter index (1-based) or a column
     * index (0-based).
     * @throws ValidationError if index is out of range
     */
    void validateIndex(int index, bool isParam) const;

    bool checkColumnType(int index, int expectedType) const;

    [[noreturn]] void failBind(const char* kind) const;
};

}  // namespace teardown::database::core

#endif  // TEARDOWN_DATABASE_CORE_STATEMENT_HPP
