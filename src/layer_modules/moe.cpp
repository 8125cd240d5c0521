// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC

#include "layer_modules/moe.hpp"

#include <algorithm>
#include <cmath>

#include "afdMetrics.hpp"

namespace afd_sim {

MoEConfig MoEConfig::fromConfigMap(const ConfigMap &cfg) {
    MoEConfig defaults;
    MoEConfig parsed;
    parsed.d_model = resolveField(cfg, intKeys({"d_model", "model_dim"}), defaults.d_model);
    parsed.expert_hidden =
        resolveField(cfg, intKeys({"moe_intermediate_size", "d_ff"}), defaults.expert_hidden);

    int64_t num_experts =
        resolveField(cfg, intKeys({"n_routed_experts", "num_experts"}), defaults.num_experts);
    int64_t top_k =
        resolveField(cfg, intKeys({"topk_group", "top_k", "num_experts_per_tok"}), defaults.top_k);
    double avg_experts =
        resolveField(cfg, doubleKeys({"num_experts_per_tok"}), static_cast<double>(top_k));
    int64_t num_groups =
        resolveField(cfg, intKeys({"n_group", "num_groups"}), defaults.num_groups);

    parsed.num_experts = std::max<int64_t>(num_experts, 1);
    parsed.top_k = std::max<int64_t>(top_k, 1);
    parsed.avg_experts_per_token = std::max(avg_experts, 1.0);
    parsed.num_groups = std::max<int64_t>(num_groups, 1);
    parsed.dtype_bits = static_cast<DTypeBits>(
        resolveField<int64_t>(cfg, intKeys({"dtype_bits"}), defaults.dtype_bits));
    return parsed;
}

int64_t MoEModule::activeTokens(int64_t batch, int64_t seq) const {
    return static_cast<int64_t>(std::floor(double(batch * seq) * config.avg_experts_per_token));
}

std::vector<FusionMetrics> MoEModule::fusedMetrics(int64_t batch, int64_t seq) const {
    const auto &cfg = config;
    int64_t active_tokens = activeTokens(batch, seq);

    // all-to-all volume is the routed activations, split across expert groups
    ByteCount bytes_per_device =
        tensorBytes({active_tokens, cfg.d_model}, cfg.dtype_bits) / cfg.num_groups;

    return {
        moeRouting(batch, seq, cfg.num_experts, cfg.top_k, cfg.dtype_bits),
        moeExpertForward(active_tokens, cfg.d_model, cfg.expert_hidden, cfg.dtype_bits),
        communicationAllToAll(bytes_per_device)};
}

FlopCount MoEModule::analyticFlops(int64_t batch, int64_t seq) const {
    FlopCount total = 0.0;
    for (const auto &metric : fusedMetrics(batch, seq)) {
        total += metric.flops;
    }
    return total;
}

LayerExecution MoEModule::estimateExecutionTime(
    int64_t batch, int64_t seq, const HardwareSpec &hardware) const {
    ByteCount output_bytes = tensorBytes({batch, seq, config.d_model}, config.dtype_bits);
    FeatureMap features = {
        {"d_model", double(config.d_model)},
        {"expert_hidden", double(config.expert_hidden)},
        {"num_experts", double(config.num_experts)},
        {"top_k", double(config.top_k)},
        {"avg_experts_per_token", config.avg_experts_per_token},
        {"batch", double(batch)},
        {"seq", double(seq)}};
    return composeExecution(fusedMetrics(batch, seq), output_bytes, hardware, std::move(features));
}

}  // namespace afd_sim
