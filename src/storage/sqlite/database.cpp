/*
 * database.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "database.hpp"

#include "logging/logging_manager.hpp"
#include "statement.hpp"
#include "transaction.hpp"

namespace codepage::storage::sqlite {

Database::Database(const std::string& path, int flags) : path_(path) {
    sqlite3* raw = nullptr;
    int result = sqlite3_open_v2(path.c_str(), &raw, flags, nullptr);
    db_.reset(raw);

    if (result != SQLITE_OK) {
        std::string reason = raw ? sqlite3_errmsg(raw) : "out of memory";
        db_.reset();
        logging::logger("storage")->error("Can't open database {}: {}", path,
                                          reason);
        CODEPAGE_THROW_SQLITE(Open, "Can't open database {}: {}", path,
                              reason);
    }

    execute("PRAGMA journal_mode = WAL;");
    execute("PRAGMA synchronous = NORMAL;");
    logging::logger("storage")->info("Database opened: {}", path);
}

Database::~Database() {
    if (!db_) {
        return;
    }
    char* errMsg = nullptr;
    if (sqlite3_exec(db_.get(), "PRAGMA optimize;", nullptr, nullptr,
                     &errMsg) != SQLITE_OK) {
        logging::logger("storage")->warn("PRAGMA optimize failed on {}: {}",
                                         path_, errMsg ? errMsg : "unknown");
    }
    sqlite3_free(errMsg);
}

sqlite3* Database::get() {
    if (!db_) {
        CODEPAGE_THROW_SQLITE(Misuse, "Use of a closed database connection");
    }
    return db_.get();
}

std::unique_ptr<Statement> Database::prepare(const std::string& sql) {
    return std::make_unique<Statement>(*this, sql);
}

std::unique_ptr<Transaction> Database::beginTransaction() {
    return std::make_unique<Transaction>(*this);
}

void Database::execute(const std::string& sql) {
    char* errMsg = nullptr;
    int result = sqlite3_exec(get(), sql.c_str(), nullptr, nullptr, &errMsg);
    if (result != SQLITE_OK) {
        std::string reason = errMsg ? errMsg : "unknown error";
        sqlite3_free(errMsg);
        logging::logger("storage")->error("SQL error: {}", reason);
        CODEPAGE_THROW_SQLITE(Execute, "SQL error: {}", reason);
    }
}

std::string Database::lastError() const {
    return db_ ? sqlite3_errmsg(db_.get()) : "closed";
}

}  // namespace codepage::storage::sqlite
