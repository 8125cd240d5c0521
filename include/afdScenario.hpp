// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC

#pragma once

#include <string>
#include <vector>

#include "afdHardware.hpp"
#include "afdLayerConfig.hpp"

namespace afd_sim {

// a hardware profile plus the ordered list of layers to estimate on it
struct Scenario {
    std::string name;
    HardwareSpec hardware;
    std::vector<LayerConfig> layers;
};

}  // namespace afd_sim
