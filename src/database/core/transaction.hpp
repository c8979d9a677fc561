#ifndef TEARDOWN_DATABASE_CORE_TRANSACTION_HPP
#define TEARDOWN_DATABASE_CORE_TRANSACTION_HPP

#include "types.hpp"

namespace teardown::database::core {

// Forward declaration
class Database;

/**
 * @brief Scoped database transaction.
 *
 * BEGIN IMMEDIATE runs on construction so the write lock is taken up front.
 * A transaction that is neither committed nor rolled back when it goes out
 * of scope is rolled back.
 */
class Transaction {
public:
    /**
     * @throws TransactionError if transaction cannot be started
     */
    explicit Transaction(Database& db);

    ~Transaction();

    // Non-copyable
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    /**
     * @brief Commits the transaction.
     *
     * A deferred constraint failing at COMMIT is reported as
     * ConstraintViolationError and the transaction is rolled back.
     *
     * @throws TransactionError if already finished or commit fails
     * @throws ConstraintViolationError on a commit-time constraint conflict
     */
    void commit();

    /**
     * @brief Rolls back the transaction.
     *
     * @throws TransactionError if already finished or rollback fails
     */
    void rollback();

    bool isActive() const noexcept { return !committed && !rolledBack; }

private:
    Database& db;
    bool committed = false;
    bool rolledBack = false;
};

}  // namespace teardown::database::core

#endif  // TEARDOWN_DATABASE_CORE_TRANSACTION_HPP
