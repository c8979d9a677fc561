#include "database.hpp"

#include <spdlog/spdlog.h>

#include "statement.hpp"
#include "transaction.hpp"

namespace teardown::database::core {

//------------------------------------------------------------------------------
// Database Implementation
//------------------------------------------------------------------------------

Database::Database(const std::string& db_name, int flags)
    : db(nullptr, sqlite3_close) {
    sqlite3* raw_db = nullptr;
    int result = sqlite3_open_v2(db_name.c_str(), &raw_db, flags, nullptr);
    db.reset(raw_db);

    if (result != SQLITE_OK) {
        std::string error_msg = "Can't open database '" + db_name + "': ";
        if (raw_db) {
            error_msg += sqlite3_errmsg(raw_db);
        } else {
            error_msg += "out of memory";
        }
        spdlog::error("{}", error_msg);
        THROW_DATABASE_OPEN_ERROR(error_msg);
    }

    sqlite3_extended_result_codes(raw_db, 1);

    // The composition schema relies on cascading deletes
    valid.store(true);
    try {
        execute("PRAGMA foreign_keys = ON;");
        if (db_name != ":memory:") {
            execute("PRAGMA journal_mode = WAL;");
        }
        execute("PRAGMA synchronous = NORMAL;");
        spdlog::info("Database opened: {}", db_name);
    } catch (const std::exception& e) {
        valid.store(false);
        spdlog::error("Failed to configure database {}: {}", db_name,
                      e.what());
        throw;
    }
}

Database::~Database() {
    if (!valid.load()) {
        return;
    }
    try {
        execute("PRAGMA optimize;");
    } catch (const std::exception& e) {
        spdlog::warn("Error during database cleanup: {}", e.what());
    }
    valid.store(false);
}

Database::Database(Database&& other) noexcept : db(std::move(other.db)) {
    valid.store(other.valid.load());
    other.valid.store(false);
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        db = std::move(other.db);
        valid.store(other.valid.load());
        other.valid.store(false);
    }
    return *this;
}

sqlite3* Database::get() {
    if (!valid.load()) {
        THROW_VALIDATION_ERROR(
            "Attempted to use an invalid database connection");
    }
    return db.get();
}

std::unique_ptr<Statement> Database::prepare(const std::string& sql) {
    if (!valid.load()) {
        THROW_VALIDATION_ERROR(
            "Attempted to prepare statement on invalid database connection");
    }
    return std::make_unique<Statement>(*this, sql);
}

std::unique_ptr<Transaction> Database::beginTransaction() {
    if (!valid.load()) {
        THROW_VALIDATION_ERROR(
            "Attempted to begin transaction on invalid database connection");
    }
    return std::make_unique<Transaction>(*this);
}

void Database::execute(const std::string& sql) {
    if (!valid.load()) {
        THROW_VALIDATION_ERROR(
            "Attempted to execute SQL on invalid database connection");
    }

    char* errMsg = nullptr;
    int result = sqlite3_exec(db.get(), sql.c_str(), nullptr, nullptr, &errMsg);

    if (result != SQLITE_OK) {
        std::string error = "SQL Error: ";
        if (errMsg) {
            error += errMsg;
            sqlite3_free(errMsg);
        } else {
            error += sqlite3_errstr(result);
        }
        spdlog::error("{}", error);
        THROW_FOR_SQLITE_RESULT(result, error);
    }
}

bool Database::isValid() const noexcept { return valid.load(); }

void Database::configure(
    const std::unordered_map<std::string, std::string>& pragmas) {
    if (!valid.load()) {
        THROW_VALIDATION_ERROR(
            "Attempted to configure invalid database connection");
    }

    for (const auto& [name, value] : pragmas) {
        try {
            execute("PRAGMA " + name + " = " + value + ";");
            spdlog::debug("Set PRAGMA {}: {}", name, value);
        } catch (const std::exception& e) {
            spdlog::error("Failed to set PRAGMA {}: {}", name, e.what());
            throw;
        }
    }
}

void Database::setBusyTimeout(int milliseconds) {
    if (sqlite3_busy_timeout(get(), milliseconds) != SQLITE_OK) {
        THROW_SQL_EXECUTION_ERROR("Failed to set busy timeout: " +
                                  std::string(sqlite3_errmsg(db.get())));
    }
}

int64_t Database::lastInsertRowId() {
    return static_cast<int64_t>(sqlite3_last_insert_rowid(get()));
}

int Database::changes() { return sqlite3_changes(get()); }

bool Database::inTransaction() { return sqlite3_get_autocommit(get()) == 0; }

}  // namespace teardown::database::core
