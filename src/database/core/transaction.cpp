#include "transaction.hpp"

#include <spdlog/spdlog.h>

#include "database.hpp"

namespace teardown::database::core {

//------------------------------------------------------------------------------
// Transaction Implementation
//------------------------------------------------------------------------------

Transaction::Transaction(Database& db)
    : db(db), committed(false), rolledBack(false) {
    try {
        db.execute("BEGIN IMMEDIATE TRANSACTION;");
    } catch (const std::exception& e) {
        spdlog::error("Failed to begin transaction: {}", e.what());
        THROW_TRANSACTION_ERROR("Failed to begin transaction: " +
                                std::string(e.what()));
    }
    SPDLOG_DEBUG("Transaction started");
}

Transaction::~Transaction() {
    if (isActive()) {
        try {
            rollback();
        } catch (const std::exception& e) {
            spdlog::error(
                "Failed to auto-rollback transaction in destructor: {}",
                e.what());
        }
    }
}

void Transaction::commit() {
    if (!isActive()) {
        THROW_TRANSACTION_ERROR("Transaction already committed or rolled back");
    }

    try {
        db.execute("COMMIT;");
    } catch (const ConstraintViolationError& e) {
        spdlog::error("Constraint conflict at commit: {}", e.what());
        if (db.inTransaction()) {
            rollback();
        } else {
            rolledBack = true;
        }
        throw;
    } catch (const std::exception& e) {
        spdlog::error("Failed to commit transaction: {}", e.what());
        THROW_TRANSACTION_ERROR("Failed to commit transaction: " +
                                std::string(e.what()));
    }
    committed = true;
    SPDLOG_DEBUG("Transaction committed");
}

void Transaction::rollback() {
    if (!isActive()) {
        THROW_TRANSACTION_ERROR("Transaction already committed or rolled back");
    }

    try {
        db.execute("ROLLBACK;");
        rolledBack = true;
        SPDLOG_DEBUG("Transaction rolled back");
    } catch (const std::exception& e) {
        rolledBack = true;
        spdlog::error("Failed to rollback transaction: {}", e.what());
        THROW_TRANSACTION_ERROR("Failed to rollback transaction: " +
                                std::string(e.what()));
    }
}

}  // namespace teardown::database::core
