#ifndef TEARDOWN_DATABASE_HPP
#define TEARDOWN_DATABASE_HPP

/**
 * @file database.hpp
 * @brief Facade header for the teardown database module.
 *
 * @par Usage Example:
 * @code
 * #include "database/database.hpp"
 *
 * using namespace teardown::database;
 *
 * auto db = createDatabase(":memory:");
 * db->execute("CREATE TABLE materials (id INTEGER PRIMARY KEY, name TEXT)");
 *
 * auto txn = db->beginTransaction();
 * auto stmt = db->prepare("INSERT INTO materials (name) VALUES (?)");
 * stmt->bind(1, std::string("Steel"));
 * stmt->execute();
 * txn->commit();
 * @endcode
 */

#include <memory>
#include <string>

#include "core/database.hpp"
#include "core/statement.hpp"
#include "core/transaction.hpp"
#include "core/types.hpp"

namespace teardown::database {

using core::Database;
using core::Statement;
using core::Transaction;

using core::ConstraintViolationError;
using core::DatabaseOpenError;
using core::SqlExecutionError;
using core::StatementPrepareError;
using core::TransactionError;

using DatabasePtr = std::unique_ptr<Database>;
using StatementPtr = std::unique_ptr<Statement>;
using TransactionPtr = std::unique_ptr<Transaction>;

[[nodiscard]] inline DatabasePtr createDatabase(const std::string& dbName) {
    return std::make_unique<Database>(dbName);
}

[[nodiscard]] inline DatabasePtr createDatabase(const std::string& dbName,
                                                int flags) {
    return std::make_unique<Database>(dbName, flags);
}

}  // namespace teardown::database

#endif  // TEARDOWN_DATABASE_HPP
