// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC

#include "afdStats.hpp"

#include <algorithm>
#include <fstream>

#include "afdCommon.hpp"
#include "afdUtil.hpp"
#include "fmt/core.h"

namespace afd_sim {

FlopCount totalFlops(const std::vector<LayerExecution> &layers) {
    FlopCount total = 0.0;
    for (const auto &layer : layers) {
        total += layer.flops;
    }
    return total;
}

Milliseconds totalLatencyMs(const std::vector<LayerExecution> &layers) {
    Milliseconds total = 0.0;
    for (const auto &layer : layers) {
        total += layer.dominant_latency_ms;
    }
    return total;
}

ByteCount peakMemoryBytes(const std::vector<LayerExecution> &layers) {
    if (layers.empty()) {
        throw afdException(
            afdErrorCode::EMPTY_SIMULATION, "peak memory is undefined for a run with no layers");
    }
    ByteCount peak = layers.front().totalBytes();
    for (const auto &layer : layers) {
        peak = std::max(peak, layer.totalBytes());
    }
    return peak;
}

std::optional<std::string> findBottleneckLayer(const std::vector<LayerExecution> &layers) {
    if (layers.empty()) {
        return std::nullopt;
    }
    const LayerExecution *bottleneck = &layers.front();
    for (const auto &layer : layers) {
        if (layer.dominant_latency_ms > bottleneck->dominant_latency_ms) {
            bottleneck = &layer;
        }
    }
    return bottleneck->layer_name;
}

SimulationResult aggregateExecutions(std::vector<LayerExecution> layers) {
    SimulationResult result;
    result.peak_memory_bytes = peakMemoryBytes(layers);  // throws on empty run
    result.total_flops = totalFlops(layers);
    result.total_latency_ms = totalLatencyMs(layers);
    result.bottleneck_layer = findBottleneckLayer(layers);
    result.layers = std::move(layers);
    return result;
}

std::string SimulationResult::to_string(bool verbose) const {
    std::string output;
    output.append(fmt::format("  Total latency (ms): {:.3f}\n", total_latency_ms));
    output.append(fmt::format("  Total FLOPs (GFLOPs): {:.3f}\n", total_flops / 1e9));
    output.append(fmt::format("  Peak memory (GB): {:.3f}\n", peak_memory_bytes / 1e9));
    output.append(fmt::format("  Bottleneck layer: {}\n", bottleneck_layer.value_or("None")));
    if (verbose) {
        for (const auto &layer : layers) {
            output.append("\n");
            output.append(layer.to_string(verbose));
        }
    }
    return output;
}

bool SimulationResult::emitToFile(const std::string &filepath) const {
    std::ofstream os(filepath);
    if (!os) {
        log_error("Could not open file '{}' for writing", filepath);
        return false;
    }
    nlohmann::json j = *this;
    os << j.dump(2) << '\n';
    return bool(os);
}

void to_json(nlohmann::json &j, const SimulationResult &result) {
    j = nlohmann::json{
        {"layers", result.layers},
        {"total_flops", result.total_flops},
        {"total_latency_ms", result.total_latency_ms},
        {"peak_memory_bytes", result.peak_memory_bytes}};
    if (result.bottleneck_layer.has_value()) {
        j["bottleneck_layer"] = result.bottleneck_layer.value();
    } else {
        j["bottleneck_layer"] = nullptr;
    }
}

}  // namespace afd_sim
