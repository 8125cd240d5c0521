// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC

#include "afdLayerExecution.hpp"

#include "fmt/core.h"

namespace afd_sim {

LayerExecution LayerExecution::withIdentity(
    const std::string &name, const std::string &type, const FeatureMap &default_features) const {
    LayerExecution renamed = *this;
    renamed.layer_name = name;
    renamed.layer_type = type;
    // map::insert does not overwrite existing keys
    renamed.features.insert(default_features.begin(), default_features.end());
    return renamed;
}

std::string LayerExecution::to_string(bool verbose) const {
    std::string output;
    output.append(fmt::format("  {} ({})\n", layer_name, layer_type));
    output.append(fmt::format("              flops: {:.4g}\n", flops));
    output.append(fmt::format("         bytes read: {:.4g}\n", bytes_read));
    output.append(fmt::format("      bytes written: {:.4g}\n", bytes_written));
    output.append(fmt::format("    compute time ms: {:.6f}\n", compute_time_ms));
    output.append(fmt::format("     memory time ms: {:.6f}\n", memory_time_ms));
    output.append(fmt::format("         latency ms: {:.6f}\n", dominant_latency_ms));
    if (verbose) {
        for (const auto &[op_name, op] : breakdown) {
            output.append(
                fmt::format("    {:>24} : {:.4g} flops, {:.4g} bytes\n", op_name, op.flops, op.bytes));
        }
        for (const auto &[feature, value] : features) {
            output.append(fmt::format("    {:>24} = {}\n", feature, value));
        }
    }
    return output;
}

void to_json(nlohmann::json &j, const OpBreakdown &breakdown) {
    j = nlohmann::json{{"flops", breakdown.flops}, {"bytes", breakdown.bytes}};
}

void to_json(nlohmann::json &j, const LayerExecution &execution) {
    j = nlohmann::json{
        {"layer_name", execution.layer_name},
        {"layer_type", execution.layer_type},
        {"flops", execution.flops},
        {"bytes_read", execution.bytes_read},
        {"bytes_written", execution.bytes_written},
        {"compute_time_ms", execution.compute_time_ms},
        {"memory_time_ms", execution.memory_time_ms},
        {"dominant_latency_ms", execution.dominant_latency_ms},
        {"estimated_execution_time_ms", execution.estimated_execution_time_ms},
        {"features", execution.features},
        {"breakdown", execution.breakdown}};
}

}  // namespace afd_sim
