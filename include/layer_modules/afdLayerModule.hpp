// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC

#pragma once

#include <string_view>
#include <vector>

#include "afdCommon.hpp"
#include "afdFusedOps.hpp"
#include "afdHardware.hpp"
#include "afdLayerExecution.hpp"

namespace afd_sim {

// Analytic estimator for one layer kind. Modules are stateless apart from the
// normalized config they are built with.
class afdLayerModule {
   public:
    virtual ~afdLayerModule() {}

    // generic name reported in layer_name/layer_type before the dispatcher
    // substitutes the scenario's naming
    virtual std::string_view kind() const = 0;

    // summed FLOPs of all fused ops in this layer
    virtual FlopCount analyticFlops(int64_t batch, int64_t seq) const = 0;

    virtual LayerExecution estimateExecutionTime(
        int64_t batch, int64_t seq, const HardwareSpec &hardware) const = 0;

    // numeric execution is never supported; always throws UNSUPPORTED_OPERATION
    [[noreturn]] void forward() const;

   protected:
    // builds a LayerExecution for compute/memory bound layers: reads are the
    // summed fused-op bytes, writes are the output activation
    LayerExecution composeExecution(
        const std::vector<FusionMetrics> &metrics,
        ByteCount output_bytes,
        const HardwareSpec &hardware,
        FeatureMap features) const;

    static BreakdownMap buildBreakdown(const std::vector<FusionMetrics> &metrics);
};

}  // namespace afd_sim
