// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC

#pragma once

#include "afdConfigMap.hpp"
#include "layer_modules/afdLayerModule.hpp"

namespace afd_sim {

struct FFNConfig {
    int64_t d_model = 768;
    int64_t d_ff = 3072;
    DTypeBits dtype_bits = DEFAULT_DTYPE_BITS;

    static FFNConfig fromConfigMap(const ConfigMap &cfg);
};

class FFNModule : public afdLayerModule {
   public:
    explicit FFNModule(const ConfigMap &ffn_config) : config(FFNConfig::fromConfigMap(ffn_config)) {}

    std::string_view kind() const override { return "ffn"; }

    FlopCount analyticFlops(int64_t batch, int64_t seq) const override;

    LayerExecution estimateExecutionTime(
        int64_t batch, int64_t seq, const HardwareSpec &hardware) const override;

    const FFNConfig &getConfig() const { return config; }

   private:
    FusionMetrics fusedMetrics(int64_t batch, int64_t seq) const;

    FFNConfig config;
};

}  // namespace afd_sim
