// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC

#include "layer_modules/communication.hpp"

#include "afdMetrics.hpp"

namespace afd_sim {

CommunicationConfig CommunicationConfig::fromConfigMap(const ConfigMap &cfg) {
    CommunicationConfig defaults;
    CommunicationConfig parsed;
    auto pattern = resolveField<std::string>(cfg, stringKeys({"pattern"}), "all_to_all");
    parsed.pattern = (pattern == "all_reduce") ? CommPattern::ALL_REDUCE : CommPattern::ALL_TO_ALL;
    parsed.payload_mb = resolveField(cfg, doubleKeys({"payload_mb"}), defaults.payload_mb);
    return parsed;
}

FusionMetrics CommunicationModule::fusedMetrics() const {
    if (config.pattern == CommPattern::ALL_REDUCE) {
        return communicationAllReduce(config.payloadBytes());
    }
    return communicationAllToAll(config.payloadBytes());
}

LayerExecution CommunicationModule::estimateExecutionTime(
    int64_t batch, int64_t seq, const HardwareSpec &hardware) const {
    FusionMetrics metric = fusedMetrics();

    Milliseconds interconnect_ms = interconnectTimeMs(metric.bytes_accessed, hardware);
    Milliseconds memory_ms = memoryTimeMs(metric.bytes_accessed, hardware);
    Milliseconds latency_ms = dominantLatencyMs(interconnect_ms, memory_ms, hardware);

    FeatureMap features = {
        {"pattern", config.pattern == CommPattern::ALL_REDUCE ? 1.0 : 0.0},
        {"payload_mb", config.payload_mb},
        {"batch", double(batch)},
        {"seq", double(seq)}};

    // payload is both read and written; there is no separate output tensor
    return LayerExecution{
        .layer_name = std::string(kind()),
        .layer_type = std::string(kind()),
        .flops = 0.0,
        .bytes_read = metric.bytes_accessed,
        .bytes_written = metric.bytes_accessed,
        .compute_time_ms = interconnect_ms,
        .memory_time_ms = memory_ms,
        .dominant_latency_ms = latency_ms,
        .estimated_execution_time_ms = latency_ms,
        .features = std::move(features),
        .breakdown = buildBreakdown({metric})};
}

}  // namespace afd_sim
