// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC

#pragma once

#include <variant>

#include "afdCommon.hpp"
#include "afdStats.hpp"

namespace afd_sim {
// holds the exception alternative on failure
using afdResult = std::variant<afdException, SimulationResult>;
}  // namespace afd_sim
