/*
 * statement.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef CODEPAGE_STORAGE_SQLITE_STATEMENT_HPP
#define CODEPAGE_STORAGE_SQLITE_STATEMENT_HPP

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <string>

#include "errors.hpp"

namespace codepage::storage::sqlite {

class Database;

/**
 * @brief Prepared statement; parameters are 1-based, columns 0-based
 */
class Statement {
public:
    /**
     * @throws SqliteError if preparation fails
     */
    Statement(Database& db, const std::string& sql);

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int index, int64_t value);
    Statement& bind(int index, double value);
    Statement& bind(int index, const std::string& value);
    Statement& bindNull(int index);

    /**
     * @brief Run to completion, ignoring any rows
     * @throws SqliteError if execution fails
     */
    void execute();

    /**
     * @return true while a row is available
     * @throws SqliteError if stepping fails
     */
    bool step();

    /**
     * @brief Reset and clear bindings for the next execution
     */
    Statement& reset();

    [[nodiscard]] int64_t getInt64(int index) const;
    [[nodiscard]] double getDouble(int index) const;
    [[nodiscard]] std::string getText(int index) const;
    [[nodiscard]] bool isNull(int index) const;

private:
    void check(int result, const char* what);

    Database& db_;
    std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)> stmt_{
        nullptr, sqlite3_finalize};
};

}  // namespace codepage::storage::sqlite

#endif  // CODEPAGE_STORAGE_SQLITE_STATEMENT_HPP
