// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC

#pragma once

#include <optional>

#include "afdConfigMap.hpp"
#include "layer_modules/afdLayerModule.hpp"

namespace afd_sim {

struct AttentionConfig {
    int64_t d_model = 768;
    int64_t num_heads = 8;
    std::optional<int64_t> head_dim;
    DTypeBits dtype_bits = DEFAULT_DTYPE_BITS;

    static AttentionConfig fromConfigMap(const ConfigMap &cfg);

    // explicit head_dim if given, else d_model split evenly across heads
    int64_t resolvedHeadDim() const;
    int64_t qkvDim() const { return num_heads * resolvedHeadDim(); }
};

class AttentionModule : public afdLayerModule {
   public:
    explicit AttentionModule(const ConfigMap &attn_config) :
        config(AttentionConfig::fromConfigMap(attn_config)) {}

    std::string_view kind() const override { return "attention"; }

    FlopCount analyticFlops(int64_t batch, int64_t seq) const override;

    LayerExecution estimateExecutionTime(
        int64_t batch, int64_t seq, const HardwareSpec &hardware) const override;

    const AttentionConfig &getConfig() const { return config; }

   private:
    // QKV -> scores -> weighted sum -> output projection
    std::vector<FusionMetrics> fusedMetrics(int64_t batch, int64_t seq) const;

    AttentionConfig config;
};

}  // namespace afd_sim
