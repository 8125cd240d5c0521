// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC

#include "layer_modules/afdLayerModule.hpp"

#include "afdMetrics.hpp"
#include "fmt/core.h"

namespace afd_sim {

void afdLayerModule::forward() const {
    throw afdException(
        afdErrorCode::UNSUPPORTED_OPERATION,
        fmt::format("numeric forward is not implemented for analytic '{}' layers", kind()));
}

BreakdownMap afdLayerModule::buildBreakdown(const std::vector<FusionMetrics> &metrics) {
    BreakdownMap breakdown;
    for (const auto &metric : metrics) {
        breakdown[metric.name] = OpBreakdown{metric.flops, metric.bytes_accessed};
    }
    return breakdown;
}

LayerExecution afdLayerModule::composeExecution(
    const std::vector<FusionMetrics> &metrics,
    ByteCount output_bytes,
    const HardwareSpec &hardware,
    FeatureMap features) const {
    FlopCount total_flops = 0.0;
    ByteCount total_bytes = 0.0;
    for (const auto &metric : metrics) {
        total_flops += metric.flops;
        total_bytes += metric.bytes_accessed;
    }

    Milliseconds compute_ms = computeTimeMs(total_flops, hardware);
    Milliseconds memory_ms = memoryTimeMs(total_bytes + output_bytes, hardware);
    Milliseconds latency_ms = dominantLatencyMs(compute_ms, memory_ms, hardware);

    return LayerExecution{
        .layer_name = std::string(kind()),
        .layer_type = std::string(kind()),
        .flops = total_flops,
        .bytes_read = total_bytes,
        .bytes_written = output_bytes,
        .compute_time_ms = compute_ms,
        .memory_time_ms = memory_ms,
        .dominant_latency_ms = latency_ms,
        .estimated_execution_time_ms = latency_ms,
        .features = std::move(features),
        .breakdown = buildBreakdown(metrics)};
}

}  // namespace afd_sim
