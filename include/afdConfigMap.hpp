// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace afd_sim {

// loosely-typed scalar value as read from a scenario file
using ConfigValue = std::variant<bool, int64_t, double, std::string>;
using ConfigMap = std::unordered_map<std::string, ConfigValue>;

// parsers return nullopt when a value cannot be interpreted as T
std::optional<int64_t> asInt(const ConfigValue &value);
std::optional<double> asDouble(const ConfigValue &value);
std::optional<std::string> asString(const ConfigValue &value);

template <typename T>
using ValueParser = std::function<std::optional<T>(const ConfigValue &)>;

template <typename T>
struct KeyCandidate {
    std::string key;
    ValueParser<T> parse;
};

template <typename T>
using KeyCandidates = std::vector<KeyCandidate<T>>;

// Walks candidates in priority order; the first key that is present and parses
// wins. Returns nullopt if no candidate matched.
template <typename T>
std::optional<T> resolveOptionalField(const ConfigMap &cfg, const KeyCandidates<T> &candidates) {
    for (const auto &candidate : candidates) {
        auto it = cfg.find(candidate.key);
        if (it == cfg.end()) {
            continue;
        }
        if (auto parsed = candidate.parse(it->second)) {
            return parsed;
        }
    }
    return std::nullopt;
}

template <typename T>
T resolveField(const ConfigMap &cfg, const KeyCandidates<T> &candidates, const T &default_val) {
    return resolveOptionalField(cfg, candidates).value_or(default_val);
}

// convenience builders for the common case of one parser shared by all keys
KeyCandidates<int64_t> intKeys(std::initializer_list<std::string> keys);
KeyCandidates<double> doubleKeys(std::initializer_list<std::string> keys);
KeyCandidates<std::string> stringKeys(std::initializer_list<std::string> keys);

std::string to_string(const ConfigValue &value);

}  // namespace afd_sim
