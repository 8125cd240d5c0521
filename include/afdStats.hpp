// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "afdLayerExecution.hpp"
#include "nlohmann/json.hpp"

namespace afd_sim {

// aggregate output of a simulation run
struct SimulationResult {
    std::vector<LayerExecution> layers;
    FlopCount total_flops = 0.0;
    // layers are assumed to run back to back; no inter-layer overlap
    Milliseconds total_latency_ms = 0.0;
    // per-layer high-water mark of read + written bytes, not a running footprint
    ByteCount peak_memory_bytes = 0.0;
    std::optional<std::string> bottleneck_layer;

    std::string to_string(bool verbose = false) const;

    // write json serialization of result to filepath; returns false on failure
    bool emitToFile(const std::string &filepath) const;
};

FlopCount totalFlops(const std::vector<LayerExecution> &layers);
Milliseconds totalLatencyMs(const std::vector<LayerExecution> &layers);

// throws afdException(EMPTY_SIMULATION) if layers is empty
ByteCount peakMemoryBytes(const std::vector<LayerExecution> &layers);

// layer with the largest dominant latency; first occurrence wins ties.
// returns nullopt if layers is empty
std::optional<std::string> findBottleneckLayer(const std::vector<LayerExecution> &layers);

// folds per-layer results into a SimulationResult; throws
// afdException(EMPTY_SIMULATION) if layers is empty
SimulationResult aggregateExecutions(std::vector<LayerExecution> layers);

void to_json(nlohmann::json &j, const SimulationResult &result);

}  // namespace afd_sim
