/*
 * script_guard.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef CODEPAGE_SCRIPT_SANDBOX_SCRIPT_GUARD_HPP
#define CODEPAGE_SCRIPT_SANDBOX_SCRIPT_GUARD_HPP

#include <expected>
#include <string>
#include <string_view>

#include "types.hpp"

namespace codepage::sandbox {

/**
 * @brief Static checks applied to a script before it may run
 *
 * The source is parsed with the interpreter's own ast module and rejected
 * when it contains imports, dunder names, underscore-prefixed attributes,
 * frame or code introspection attributes, string formatting methods, bare
 * except clauses, special methods beyond a small safe set, and jumps out of
 * finally blocks. Parse failures are reported as SyntaxError. Requires the
 * GIL.
 */
class ScriptGuard {
public:
    static constexpr size_t kMaxSourceBytes = 512 * 1024;

    /**
     * @return the rejection as an ExecutionError (kind SecurityViolation or
     * SyntaxError) when the script may not run
     */
    [[nodiscard]] static std::expected<void, ExecutionError> check(
        std::string_view source);

    [[nodiscard]] static bool isBlockedAttribute(std::string_view name);
    [[nodiscard]] static bool isBlockedFunctionName(std::string_view name);
};

}  // namespace codepage::sandbox

#endif  // CODEPAGE_SCRIPT_SANDBOX_SCRIPT_GUARD_HPP
