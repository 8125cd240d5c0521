// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC

#pragma once
#include "afdConfig.hpp"

namespace afd_sim {
// parse cli options and populate afd config; returns true if successful
bool parse_options(afd_sim::afdConfig& afd_config, int argc, char** argv);
}  // namespace afd_sim
