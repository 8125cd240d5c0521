// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC

#pragma once

#include <string>

#include "afdConfigMap.hpp"
#include "layer_modules/afdLayerModule.hpp"

namespace afd_sim {

enum class CommPattern { ALL_TO_ALL = 0, ALL_REDUCE = 1 };

struct CommunicationConfig {
    CommPattern pattern = CommPattern::ALL_TO_ALL;
    double payload_mb = 1.0;

    static constexpr double BYTES_PER_MB = 1e6;

    // any pattern other than "all_reduce" is treated as all-to-all
    static CommunicationConfig fromConfigMap(const ConfigMap &cfg);

    ByteCount payloadBytes() const { return payload_mb * BYTES_PER_MB; }
};

// Collective communication layer. Bandwidth bound: carries no FLOPs, and its
// compute_time_ms slot reports interconnect time.
class CommunicationModule : public afdLayerModule {
   public:
    explicit CommunicationModule(const ConfigMap &comm_config) :
        config(CommunicationConfig::fromConfigMap(comm_config)) {}

    std::string_view kind() const override { return "communication"; }

    FlopCount analyticFlops(int64_t, int64_t) const override { return 0.0; }

    LayerExecution estimateExecutionTime(
        int64_t batch, int64_t seq, const HardwareSpec &hardware) const override;

    const CommunicationConfig &getConfig() const { return config; }

   private:
    FusionMetrics fusedMetrics() const;

    CommunicationConfig config;
};

}  // namespace afd_sim
