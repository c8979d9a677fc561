#ifndef TEARDOWN_DATABASE_CORE_DATABASE_HPP
#define TEARDOWN_DATABASE_CORE_DATABASE_HPP

#include <sqlite3.h>
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

#include "types.hpp"

namespace teardown::database::core {

// Forward declarations
class Statement;
class Transaction;

class Database {
public:
    /**
     * @brief Constructs a Database instance and opens the specified SQLite
     * database.
     *
     * Foreign keys are switched on and extended result codes are enabled so
     * that constraint failures can be told apart from other errors.
     *
     * @param db_name The name of the database file (":memory:" for a
     * private in-memory database).
     * @param flags SQLite open flags (default: SQLITE_OPEN_READWRITE |
     * SQLITE_OPEN_CREATE)
     * @throws DatabaseOpenError if database cannot be opened
     */
    explicit Database(const std::string& db_name,
                      int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);

    /**
     * @brief Destructs the Database instance and closes the database
     * connection.
     */
    ~Database();

    // Prevent copying
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    // Allow moving
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    /**
     * @brief Gets the SQLite database handle.
     *
     * @return A pointer to the SQLite database handle.
     * @throws ValidationError if the connection is no longer valid
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
     * @return A unique pointer to the created Transaction.
     * @throws TransactionError if transaction cannot be started
     */
    std::unique_ptr<Transaction> beginTransaction();

    /**
     * @brief Executes an SQL statement directly.
     *
     * @param sql The SQL statement to execute.
     * @throws ConstraintViolationError if a constraint rejects the statement
     * @throws SqlExecutionError if execution fails otherwise
     */
    void execute(const std::string& sql);

    /**
     * @brief Check if database connection is valid
     */
    bool isValid() const noexcept;

    /**
     * @brief Configure SQLite connection parameters
     *
     * @param pragmas Map of PRAGMA name to value
     */
    void configure(const std::unordered_map<std::string, std::string>& pragmas);

    /**
     * @brief Sets how long a statement waits on a locked database.
     */
    void setBusyTimeout(int milliseconds);

    /**
     * @brief Row id assigned by the most recent successful INSERT on this
     * connection. Visible inside the open transaction before it commits.
     */
    int64_t lastInsertRowId();

    /**
     * @brief Number of rows changed by the most recent INSERT, UPDATE or
     * DELETE.
     */
    int changes();

    /**
     * @brief True while a transaction is open on this connection.
     */
    bool inTransaction();

private:
    std::unique_ptr<sqlite3, decltype(&sqlite3_close)> db{nullptr,
                                                          sqlite3_close};
    std::atomic<bool> valid{false};
};

}  // namespace teardown::database::core

#endif  // TEARDOWN_DATABASE_CORE_DATABASE_HPP
