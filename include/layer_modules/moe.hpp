// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC

#pragma once

#include "afdConfigMap.hpp"
#include "layer_modules/afdLayerModule.hpp"

namespace afd_sim {

struct MoEConfig {
    int64_t d_model = 768;
    int64_t expert_hidden = 3072;
    int64_t num_experts = 1;
    int64_t top_k = 1;
    double avg_experts_per_token = 1.0;
    int64_t num_groups = 1;
    DTypeBits dtype_bits = DEFAULT_DTYPE_BITS;

    // counts are floored at 1; avg_experts_per_token defaults to top_k
    static MoEConfig fromConfigMap(const ConfigMap &cfg);
};

class MoEModule : public afdLayerModule {
   public:
    explicit MoEModule(const ConfigMap &moe_config) : config(MoEConfig::fromConfigMap(moe_config)) {}

    std::string_view kind() const override { return "moe"; }

    FlopCount analyticFlops(int64_t batch, int64_t seq) const override;

    LayerExecution estimateExecutionTime(
        int64_t batch, int64_t seq, const HardwareSpec &hardware) const override;

    // tokens processed by expert FFNs: floor(batch * seq * avg_experts_per_token)
    int64_t activeTokens(int64_t batch, int64_t seq) const;

    const MoEConfig &getConfig() const { return config; }

   private:
    // routing, expert forward, expert-parallel all-to-all
    std::vector<FusionMetrics> fusedMetrics(int64_t batch, int64_t seq) const;

    MoEConfig config;
};

}  // namespace afd_sim
