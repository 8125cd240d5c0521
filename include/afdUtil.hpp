// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC

#pragma once

#include <fmt/core.h>
#include <stdio.h>
#include <unistd.h>

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string>
#include <tuple>
#include <utility>

namespace afd_sim {

// log_error/log_warn write to stderr, so colour only when it is a terminal
inline bool is_tty_interactive() { return isatty(fileno(stderr)); }
inline bool enable_color() { return is_tty_interactive(); }

namespace TTYColorCodes {
inline const char *red = "\u001b[31m";
inline const char *yellow = "\u001b[33m";
inline const char *reset = "\u001b[0m";
inline const char *bold = "\033[1m";
}  // namespace TTYColorCodes

template <typename... Args>
static void log_error(fmt::format_string<Args...> fmt, Args &&...args) {
    bool color = enable_color();
    fmt::print(
        stderr,
        "{}{}E: {}{}\n",
        color ? TTYColorCodes::bold : "",
        color ? TTYColorCodes::red : "",
        fmt::format(fmt, std::forward<Args>(args)...),
        color ? TTYColorCodes::reset : "");
}
template <typename... Args>
static void log_warn(fmt::format_string<Args...> fmt, Args &&...args) {
    bool color = enable_color();
    fmt::print(
        stderr,
        "{}{}W: {}{}\n",
        color ? TTYColorCodes::bold : "",
        color ? TTYColorCodes::yellow : "",
        fmt::format(fmt, std::forward<Args>(args)...),
        color ? TTYColorCodes::reset : "");
}
template <typename... Args>
static void log(fmt::format_string<Args...> fmt, Args &&...args) {
    fmt::print("{}\n", fmt::format(fmt, std::forward<Args>(args)...));
}

inline void printDiv(const std::string &title = "") {
    constexpr size_t total_width = 80;
    std::string padded_title = (title != "") ? std::string(" ") + title + " " : "";
    size_t bar_len = total_width - padded_title.size() - 4;
    std::string bar(bar_len, '-');
    fmt::print("\n--{}{}\n", padded_title, bar);
}

// python-like enumerate wrapper for range based loops
// shamelessly stolen from : www.reedbeta.com/blog/python-like-enumerate-in-cpp17/
template <
    typename T,
    typename TIter = decltype(std::begin(std::declval<T>())),
    typename = decltype(std::end(std::declval<T>()))>
constexpr auto enumerate(T &&iterable) {
    struct iterator {
        size_t i;
        TIter iter;
        bool operator!=(const iterator &other) const { return iter != other.iter; }
        void operator++() {
            ++i;
            ++iter;
        }
        auto operator*() const { return std::tie(i, *iter); }
    };
    struct iterable_wrapper {
        T iterable;
        auto begin() { return iterator{0, std::begin(iterable)}; }
        auto end() { return iterator{0, std::end(iterable)}; }
    };
    return iterable_wrapper{std::forward<T>(iterable)};
}

// taken from https://medium.com/@nerudaj/std-visit-is-awesome-heres-why-f183f6437932
// Allows writing nicer handling for std::variant types, like so:
// >  std::visit(overloaded{
// >    [&] (const TypeA&) { ... },
// >    [&] (const TypeB&) { ... }
// >  }, variant);
template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

// Some compilers might require this explicit deduction guide
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace afd_sim
