#include "statement.hpp"

#include <spdlog/spdlog.h>

#include "database.hpp"

namespace teardown::database::core {

//------------------------------------------------------------------------------
// Statement Implementation
//------------------------------------------------------------------------------

Statement::Statement(Database& db, const std::string& sql)
    : db(db), stmt(nullptr, sqlite3_finalize), sql(sql) {
    sqlite3_stmt* raw_stmt = nullptr;
    int result =
        sqlite3_prepare_v2(db.get(), sql.c_str(), -1, &raw_stmt, nullptr);
    stmt.reset(raw_stmt);

    if (result != SQLITE_OK) {
        std::string error = "Failed to prepare SQL statement: ";
        error += sqlite3_errmsg(db.get());
        spdlog::error("{} [{}]", error, sql);
        THROW_STATEMENT_PREPARE_ERROR(error);
    }

    SPDLOG_TRACE("Prepared statement: {}", sql);
}

void Statement::failBind(const char* kind) const {
    std::string error = "Failed to bind ";
    error += kind;
    error += " parameter: ";
    error += sqlite3_errmsg(db.get());
    spdlog::error("{}", error);
    THROW_STATEMENT_PREPARE_ERROR(error);
}

Statement& Statement::bind(int index, int value) {
    validateIndex(index, true);
    if (sqlite3_bind_int(stmt.get(), index, value) != SQLITE_OK) {
        failBind("int");
    }
    return *this;
}

Statement& Statement::bind(int index, int64_t value) {
    validateIndex(index, true);
    if (sqlite3_bind_int64(stmt.get(), index, value) != SQLITE_OK) {
        failBind("int64");
    }
    return *this;
}

Statement& Statement::bind(int index, double value) {
    validateIndex(index, true);
    if (sqlite3_bind_double(stmt.get(), index, value) != SQLITE_OK) {
        failBind("double");
    }
    return *this;
}

Statement& Statement::bind(int index, const std::string& value) {
    validateIndex(index, true);
    // SQLITE_TRANSIENT makes SQLite copy the data
    if (sqlite3_bind_text(stmt.get(), index, value.c_str(),
                          static_cast<int>(value.size()),
                          SQLITE_TRANSIENT) != SQLITE_OK) {
        failBind("text");
    }
    return *this;
}

Statement& Statement::bindNull(int index) {
    validateIndex(index, true);
    if (sqlite3_bind_null(stmt.get(), index) != SQLITE_OK) {
        failBind("NULL");
    }
    return *this;
}

bool Statement::execute() {
    int result = sqlite3_step(stmt.get());
    if (result != SQLITE_DONE && result != SQLITE_ROW) {
        std::string error = "Failed to execute statement: ";
        error += sqlite3_errmsg(db.get());
        spdlog::error("{}", error);
        THROW_FOR_SQLITE_RESULT(result, error);
    }
    return true;
}

bool Statement::step() {
    int result = sqlite3_step(stmt.get());
    if (result == SQLITE_ROW) {
        return true;
    }

    if (result != SQLITE_DONE) {
        std::string error = "Failed to step statement: ";
        error += sqlite3_errmsg(db.get());
        spdlog::error("{}", error);
        THROW_FOR_SQLITE_RESULT(result, error);
    }

    return false;
}

Statement& Statement::reset() {
    // sqlite3_reset repeats the error of the last step; that error has
    // already been reported by execute() or step().
    sqlite3_reset(stmt.get());
    sqlite3_clear_bindings(stmt.get());
    return *this;
}

int Statement::getInt(int index) const {
    validateIndex(index, false);
    if (!checkColumnType(index, SQLITE_INTEGER)) {
        spdlog::warn("Column {} type mismatch: expected INTEGER", index);
    }
    return sqlite3_column_int(stmt.get(), index);
}

int64_t Statement::getInt64(int index) const {
    validateIndex(index, false);
    if (!checkColumnType(index, SQLITE_INTEGER)) {
        spdlog::warn("Column {} type mismatch: expected INTEGER", index);
    }
    return sqlite3_column_int64(stmt.get(), index);
}

double Statement::getDouble(int index) const {
    validateIndex(index, false);
    // Integer affinity is fine for REAL columns holding whole numbers
    if (!checkColumnType(index, SQLITE_FLOAT) &&
        !checkColumnType(index, SQLITE_INTEGER)) {
        spdlog::warn("Column {} type mismatch: expected FLOAT", index);
    }
    return sqlite3_column_double(stmt.get(), index);
}

std::string Statement::getText(int index) const {
    validateIndex(index, false);
    if (isNull(index)) {
        return "";
    }

    const unsigned char* text = sqlite3_column_text(stmt.get(), index);
    if (!text) {
        return "";
    }
    int size = sqlite3_column_bytes(stmt.get(), index);
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(size));
}

std::optional<int64_t> Statement::getOptionalInt64(int index) const {
    if (isNull(index)) {
        return std::nullopt;
    }
    return getInt64(index);
}

std::optional<double> Statement::getOptionalDouble(int index) const {
    if (isNull(index)) {
        return std::nullopt;
    }
    return getDouble(index);
}

std::optional<std::string> Statement::getOptionalText(int index) const {
    if (isNull(index)) {
        return std::nullopt;
    }
    return getText(index);
}

bool Statement::isNull(int index) const {
    validateIndex(index, false);
    return sqlite3_column_type(stmt.get(), index) == SQLITE_NULL;
}

void Statement::validateIndex(int index, bool isParam) const {
    if (isParam) {
        if (index <= 0 || index > sqlite3_bind_parameter_count(stmt.get())) {
            THROW_VALIDATION_ERROR("Parameter index out of bounds: " +
                                   std::to_string(index));
        }
    } else if (index < 0 || index >= sqlite3_column_count(stmt.get())) {
        THROW_VALIDATION_ERROR("Column index out of bounds: " +
                               std::to_string(index));
    }
}

bool Statement::checkColumnType(int index, int expectedType) const {
    return sqlite3_column_type(stmt.get(), index) == expectedType;
}

}  // namespace teardown::database::core
