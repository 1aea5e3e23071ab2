/*
 * id_generator.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef CODEPAGE_UTILS_ID_GENERATOR_HPP
#define CODEPAGE_UTILS_ID_GENERATOR_HPP

#include <string>
#include <string_view>

#include "time_utils.hpp"

namespace codepage::utils {

/**
 * @brief Build an identifier of the form <prefix>-<epoch ms>-<9 base36 chars>
 */
[[nodiscard]] auto generateId(std::string_view prefix, TimePoint now)
    -> std::string;

[[nodiscard]] auto generateId(std::string_view prefix) -> std::string;

}  // namespace codepage::utils

#endif  // CODEPAGE_UTILS_ID_GENERATOR_HPP
