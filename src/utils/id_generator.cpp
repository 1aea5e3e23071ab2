/*
 * id_generator.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "id_generator.hpp"

#include <random>

#include <spdlog/fmt/fmt.h>

namespace codepage::utils {

namespace {

constexpr std::string_view kBase36 = "0123456789abcdefghijklmnopqrstuvwxyz";
constexpr size_t kSuffixLength = 9;

auto randomSuffix() -> std::string {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<size_t> dist(0, kBase36.size() - 1);
    std::string suffix(kSuffixLength, '0');
    for (auto& c : suffix) {
        c = kBase36[dist(engine)];
    }
    return suffix;
}

}  // namespace

auto generateId(std::string_view prefix, TimePoint now) -> std::string {
    return fmt::format("{}-{}-{}", prefix, toEpochMillis(now), randomSuffix());
}

auto generateId(std::string_view prefix) -> std::string {
    return generateId(prefix, std::chrono::system_clock::now());
}

}  // namespace codepage::utils
