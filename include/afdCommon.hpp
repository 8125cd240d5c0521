// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC

#pragma once

#include <fmt/core.h>

#include <cstdint>
#include <magic_enum.hpp>
#include <string>

namespace afd_sim {

using FlopCount = double;
using ByteCount = double;
using Milliseconds = double;
using DTypeBits = int;

constexpr DTypeBits DEFAULT_DTYPE_BITS = 16;

enum class afdErrorCode {
    UNDEF = 0,
    INVALID_CONFIG = 1,
    SCENARIO_LOAD_FAILED = 2,
    UNSUPPORTED_LAYER_TYPE = 3,
    UNSUPPORTED_OPERATION = 4,
    EMPTY_SIMULATION = 5
};

class afdException : std::exception {
   public:
    afdException(const afdException &error) = default;

    afdException(afdErrorCode err_code, std::string msg = "") : err_code(err_code), msg(msg) {}

    const char *what() const noexcept {
        format_buf = msg.empty() ?
            fmt::format("{}", magic_enum::enum_name(err_code)) :
            fmt::format("{} - {}", magic_enum::enum_name(err_code), msg);
        return format_buf.c_str();
    }

    const afdErrorCode err_code = afdErrorCode::UNDEF;

   private:
    mutable std::string format_buf;
    std::string msg;
};

};  // namespace afd_sim
