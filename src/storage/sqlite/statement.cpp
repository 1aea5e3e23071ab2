/*
 * statement.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "statement.hpp"

#include "database.hpp"

namespace codepage::storage::sqlite {

Statement::Statement(Database& db, const std::string& sql) : db_(db) {
    sqlite3_stmt* raw = nullptr;
    int result = sqlite3_prepare_v2(db.get(), sql.c_str(), -1, &raw, nullptr);
    stmt_.reset(raw);
    if (result != SQLITE_OK) {
        CODEPAGE_THROW_SQLITE(Prepare, "Failed to prepare '{}': {}", sql,
                              db.lastError());
    }
}

void Statement::check(int result, const char* what) {
    if (result != SQLITE_OK) {
        CODEPAGE_THROW_SQLITE(Prepare, "Failed to bind {} parameter: {}", what,
                              db_.lastError());
    }
}

Statement& Statement::bind(int index, int64_t value) {
    check(sqlite3_bind_int64(stmt_.get(), index, value), "int64");
    return *this;
}

Statement& Statement::bind(int index, double value) {
    check(sqlite3_bind_double(stmt_.get(), index, value), "double");
    return *this;
}

Statement& Statement::bind(int index, const std::string& value) {
    check(sqlite3_bind_text(stmt_.get(), index, value.c_str(),
                            static_cast<int>(value.size()), SQLITE_TRANSIENT),
          "text");
    return *this;
}

Statement& Statement::bindNull(int index) {
    check(sqlite3_bind_null(stmt_.get(), index), "null");
    return *this;
}

void Statement::execute() {
    while (step()) {
    }
}

bool Statement::step() {
    int result = sqlite3_step(stmt_.get());
    if (result == SQLITE_ROW) {
        return true;
    }
    if (result != SQLITE_DONE) {
        CODEPAGE_THROW_SQLITE(Execute, "Failed to step statement: {}",
                              db_.lastError());
    }
    return false;
}

Statement& Statement::reset() {
    sqlite3_reset(stmt_.get());
    sqlite3_clear_bindings(stmt_.get());
    return *this;
}

int64_t Statement::getInt64(int index) const {
    return sqlite3_column_int64(stmt_.get(), index);
}

double Statement::getDouble(int index) const {
    return sqlite3_column_double(stmt_.get(), index);
}

std::string Statement::getText(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_.get(), index);
    if (!text) {
        return "";
    }
    return {reinterpret_cast<const char*>(text),
            static_cast<size_t>(sqlite3_column_bytes(stmt_.get(), index))};
}

bool Statement::isNull(int index) const {
    return sqlite3_column_type(stmt_.get(), index) == SQLITE_NULL;
}

}  // namespace codepage::storage::sqlite
