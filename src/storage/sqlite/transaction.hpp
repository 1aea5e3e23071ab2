/*
 * transaction.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef CODEPAGE_STORAGE_SQLITE_TRANSACTION_HPP
#define CODEPAGE_STORAGE_SQLITE_TRANSACTION_HPP

#include "errors.hpp"

namespace codepage::storage::sqlite {

class Database;

/**
 * @brief Scoped transaction, rolled back on destruction unless committed
 */
class Transaction {
public:
    /**
     * @throws SqliteError if the transaction cannot be started
     */
    explicit Transaction(Database& db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();
    void rollback();

private:
    Database& db_;
    bool finished_{false};
};

}  // namespace codepage::storage::sqlite

#endif  // CODEPAGE_STORAGE_SQLITE_TRANSACTION_HPP
