/*
 * transaction.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "transaction.hpp"

#include "database.hpp"
#include "logging/logging_manager.hpp"

namespace codepage::storage::sqlite {

Transaction::Transaction(Database& db) : db_(db) {
    db_.execute("BEGIN IMMEDIATE TRANSACTION;");
}

Transaction::~Transaction() {
    if (finished_) {
        return;
    }
    try {
        rollback();
    } catch (const SqliteError& e) {
        logging::logger("storage")->error(
            "Failed to auto-rollback transaction: {}", e.what());
    }
}

void Transaction::commit() {
    if (finished_) {
        CODEPAGE_THROW_SQLITE(Transaction, "Transaction already finished");
    }
    db_.execute("COMMIT;");
    finished_ = true;
}

void Transaction::rollback() {
    if (finished_) {
        CODEPAGE_THROW_SQLITE(Transaction, "Transaction already finished");
    }
    finished_ = true;
    db_.execute("ROLLBACK;");
}

}  // namespace codepage::storage::sqlite
