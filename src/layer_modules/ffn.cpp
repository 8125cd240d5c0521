// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC

#include "layer_modules/ffn.hpp"

#include "afdMetrics.hpp"

namespace afd_sim {

FFNConfig FFNConfig::fromConfigMap(const ConfigMap &cfg) {
    FFNConfig defaults;
    FFNConfig parsed;
    parsed.d_model = resolveField(cfg, intKeys({"d_model"}), defaults.d_model);
    parsed.d_ff = resolveField(cfg, intKeys({"d_ff", "intermediate_size"}), defaults.d_ff);
    parsed.dtype_bits = static_cast<DTypeBits>(
        resolveField<int64_t>(cfg, intKeys({"dtype_bits"}), defaults.dtype_bits));
    return parsed;
}

FusionMetrics FFNModule::fusedMetrics(int64_t batch, int64_t seq) const {
    return ffnActivation(batch, seq, config.d_model, config.d_ff, config.dtype_bits);
}

FlopCount FFNModule::analyticFlops(int64_t batch, int64_t seq) const {
    return fusedMetrics(batch, seq).flops;
}

LayerExecution FFNModule::estimateExecutionTime(
    int64_t batch, int64_t seq, const HardwareSpec &hardware) const {
    ByteCount output_bytes = tensorBytes({batch, seq, config.d_model}, config.dtype_bits);
    FeatureMap features = {
        {"d_model", double(config.d_model)},
        {"d_ff", double(config.d_ff)},
        {"batch", double(batch)},
        {"seq", double(seq)},
        {"dtype_bits", double(config.dtype_bits)}};
    return composeExecution({fusedMetrics(batch, seq)}, output_bytes, hardware, std::move(features));
}

}  // namespace afd_sim
