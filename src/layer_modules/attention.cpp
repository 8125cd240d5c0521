// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC

#include "layer_modules/attention.hpp"

#include <algorithm>

#include "afdMetrics.hpp"

namespace afd_sim {

AttentionConfig AttentionConfig::fromConfigMap(const ConfigMap &cfg) {
    AttentionConfig defaults;
    AttentionConfig parsed;
    parsed.d_model = resolveField(cfg, intKeys({"d_model"}), defaults.d_model);
    parsed.num_heads =
        resolveField(cfg, intKeys({"num_attention_heads", "num_heads"}), defaults.num_heads);
    parsed.head_dim = resolveOptionalField(cfg, intKeys({"head_dim"}));
    parsed.dtype_bits = static_cast<DTypeBits>(
        resolveField<int64_t>(cfg, intKeys({"dtype_bits"}), defaults.dtype_bits));
    return parsed;
}

int64_t AttentionConfig::resolvedHeadDim() const {
    if (head_dim.has_value()) {
        return head_dim.value();
    }
    return d_model / std::max<int64_t>(num_heads, 1);
}

std::vector<FusionMetrics> AttentionModule::fusedMetrics(int64_t batch, int64_t seq) const {
    const auto &cfg = config;
    int64_t head_dim = cfg.resolvedHeadDim();
    return {
        attentionQKVProjections(batch, seq, cfg.d_model, cfg.qkvDim(), cfg.dtype_bits),
        attentionScores(batch, seq, cfg.num_heads, head_dim, cfg.dtype_bits),
        attentionWeightedSum(batch, seq, cfg.num_heads, head_dim, cfg.dtype_bits),
        attentionOutputProjection(batch, seq, cfg.d_model, cfg.qkvDim(), cfg.dtype_bits)};
}

FlopCount AttentionModule::analyticFlops(int64_t batch, int64_t seq) const {
    FlopCount total = 0.0;
    for (const auto &metric : fusedMetrics(batch, seq)) {
        total += metric.flops;
    }
    return total;
}

LayerExecution AttentionModule::estimateExecutionTime(
    int64_t batch, int64_t seq, const HardwareSpec &hardware) const {
    ByteCount output_bytes = tensorBytes({batch, seq, config.d_model}, config.dtype_bits);
    FeatureMap features = {
        {"d_model", double(config.d_model)},
        {"num_heads", double(config.num_heads)},
        {"batch", double(batch)},
        {"seq", double(seq)},
        {"dtype_bits", double(config.dtype_bits)}};
    return composeExecution(fusedMetrics(batch, seq), output_bytes, hardware, std::move(features));
}

}  // namespace afd_sim
