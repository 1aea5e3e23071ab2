/*
 * database.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef CODEPAGE_STORAGE_SQLITE_DATABASE_HPP
#define CODEPAGE_STORAGE_SQLITE_DATABASE_HPP

#include <sqlite3.h>

#include <memory>
#include <string>

#include "errors.hpp"

namespace codepage::storage::sqlite {

class Statement;
class Transaction;

/**
 * @brief Owning handle of one SQLite connection
 *
 * Opened in WAL mode with synchronous=NORMAL. Not thread-safe: callers
 * serialise access.
 */
class Database {
public:
    /**
     * @param path Database file, or ":memory:"
     * @throws SqliteError if the database cannot be opened or configured
     */
    explicit Database(const std::string& path,
                      int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    Database(Database&& other) noexcept = default;
    Database& operator=(Database&& other) noexcept = default;

    sqlite3* get();

    /**
     * @throws SqliteError if preparation fails
     */
    std::unique_ptr<Statement> prepare(const std::string& sql);

    /**
     * @brief Begin a transaction that rolls back unless committed
     */
    std::unique_ptr<Transaction> beginTransaction();

    /**
     * @throws SqliteError if execution fails
     */
    void execute(const std::string& sql);

    [[nodiscard]] bool isValid() const noexcept { return db_ != nullptr; }

    [[nodiscard]] std::string lastError() const;

private:
    std::unique_ptr<sqlite3, decltype(&sqlite3_close)> db_{nullptr,
                                                           sqlite3_close};
    std::string path_;
};

}  // namespace codepage::storage::sqlite

#endif  // CODEPAGE_STORAGE_SQLITE_DATABASE_HPP
