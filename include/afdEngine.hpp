// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC

#pragma once

#include <memory>
#include <vector>

#include "afdHardware.hpp"
#include "afdLayerConfig.hpp"
#include "afdLayerExecution.hpp"
#include "layer_modules/afdLayerModule.hpp"

namespace afd_sim {

// Routes each layer config to the matching analytic estimator module. Holds no
// state other than the hardware and runtime it was built with.
class afdEngine {
   public:
    afdEngine(const HardwareSpec &hardware, const RuntimeSpec &runtime) :
        hardware(hardware), runtime(runtime) {}

    // builds the estimator module matching the config's layer kind
    static std::unique_ptr<afdLayerModule> createLayerModule(const LayerConfig &layer_config);

    // estimate one layer; result carries the config's name/type, plus default
    // layer_id/layer_type features where the module did not set them
    LayerExecution estimateLayer(const LayerConfig &layer_config) const;

    // results are returned in input order
    std::vector<LayerExecution> estimateLayers(const std::vector<LayerConfig> &layer_configs) const;

    const HardwareSpec &getHardware() const { return hardware; }
    const RuntimeSpec &getRuntime() const { return runtime; }

   private:
    HardwareSpec hardware;
    RuntimeSpec runtime;
};

}  // namespace afd_sim
