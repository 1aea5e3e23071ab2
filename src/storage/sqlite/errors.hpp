/*
 * errors.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef CODEPAGE_STORAGE_SQLITE_ERRORS_HPP
#define CODEPAGE_STORAGE_SQLITE_ERRORS_HPP

#include <string_view>

#include "exception/exception.hpp"

namespace codepage::storage::sqlite {

enum class SqliteErrorCode : uint32_t {
    Open = 1,
    Execute = 2,
    Prepare = 3,
    Transaction = 4,
    Misuse = 5
};

/**
 * @brief Failure reported by SQLite or by misuse of a closed connection
 */
class SqliteError : public exception::CodepageException {
public:
    SqliteError(SqliteErrorCode code, std::string_view message,
                const std::source_location& location =
                    std::source_location::current())
        : CodepageException(codepage::exception::ErrorCategory::STORAGE,
                            static_cast<uint32_t>(code), message,
                            codepage::exception::ErrorContext("sqlite", "storage"),
                            codepage::exception::ErrorSeverity::ERROR, location),
          code_(code) {}

    [[nodiscard]] auto code() const noexcept -> SqliteErrorCode {
        return code_;
    }

private:
    SqliteErrorCode code_;
};

}  // namespace codepage::storage::sqlite

#define CODEPAGE_THROW_SQLITE(code, ...)                                  \
    throw codepage::storage::sqlite::SqliteError(                         \
        codepage::storage::sqlite::SqliteErrorCode::code,                 \
        fmt::format(__VA_ARGS__))

#endif  // CODEPAGE_STORAGE_SQLITE_ERRORS_HPP
