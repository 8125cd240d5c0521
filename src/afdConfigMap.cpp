// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC

#include "afdConfigMap.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>

#include "afdUtil.hpp"
#include "fmt/core.h"

namespace afd_sim {

namespace {

std::optional<double> parseNumber(const std::string &str) {
    if (str.empty()) {
        return std::nullopt;
    }
    char *end = nullptr;
    double parsed = std::strtod(str.c_str(), &end);
    if (end != str.c_str() + str.size()) {
        return std::nullopt;
    }
    return parsed;
}

template <typename T>
KeyCandidates<T> buildCandidates(std::initializer_list<std::string> keys, ValueParser<T> parser) {
    KeyCandidates<T> candidates;
    candidates.reserve(keys.size());
    for (const auto &key : keys) {
        candidates.push_back({key, parser});
    }
    return candidates;
}

}  // namespace

std::optional<int64_t> asInt(const ConfigValue &value) {
    return std::visit(
        overloaded{
            [](bool v) -> std::optional<int64_t> { return v ? 1 : 0; },
            [](int64_t v) -> std::optional<int64_t> { return v; },
            [](double v) -> std::optional<int64_t> {
                // out of range values have no int64 representation
                constexpr double INT64_LOWER = -9223372036854775808.0;  // -2^63
                constexpr double INT64_UPPER = 9223372036854775808.0;   // 2^63
                if (not std::isfinite(v) or v < INT64_LOWER or v >= INT64_UPPER) {
                    return std::nullopt;
                }
                return static_cast<int64_t>(std::trunc(v));
            },
            [](const std::string &v) -> std::optional<int64_t> {
                int64_t parsed = 0;
                auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), parsed);
                if (ec != std::errc() || ptr != v.data() + v.size()) {
                    return std::nullopt;
                }
                return parsed;
            }},
        value);
}

std::optional<double> asDouble(const ConfigValue &value) {
    return std::visit(
        overloaded{
            [](bool v) -> std::optional<double> { return v ? 1.0 : 0.0; },
            [](int64_t v) -> std::optional<double> { return double(v); },
            [](double v) -> std::optional<double> { return v; },
            [](const std::string &v) -> std::optional<double> { return parseNumber(v); }},
        value);
}

std::optional<std::string> asString(const ConfigValue &value) { return to_string(value); }

KeyCandidates<int64_t> intKeys(std::initializer_list<std::string> keys) {
    return buildCandidates<int64_t>(keys, asInt);
}

KeyCandidates<double> doubleKeys(std::initializer_list<std::string> keys) {
    return buildCandidates<double>(keys, asDouble);
}

KeyCandidates<std::string> stringKeys(std::initializer_list<std::string> keys) {
    return buildCandidates<std::string>(keys, asString);
}

std::string to_string(const ConfigValue &value) {
    return std::visit(
        overloaded{
            [](bool v) -> std::string { return v ? "true" : "false"; },
            [](int64_t v) -> std::string { return fmt::format("{}", v); },
            [](double v) -> std::string { return fmt::format("{}", v); },
            [](const std::string &v) -> std::string { return v; }},
        value);
}

}  // namespace afd_sim
