// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC

#pragma once

#include "afdCommon.hpp"
#include "afdConfig.hpp"
#include "afdEngine.hpp"
#include "afdHardware.hpp"
#include "afdResult.hpp"
#include "afdScenario.hpp"
#include "afdStats.hpp"
#include "ingestScenario.hpp"

namespace afd_sim {

// estimate every layer in the scenario and aggregate; throws
// afdException(EMPTY_SIMULATION) if the scenario has no layers
SimulationResult runSimulation(const Scenario &scenario, const RuntimeSpec &runtime);

class afdAPI {
   public:
    // main constructor : throws afdException if config is invalid
    afdAPI(const afdConfig &cfg);

    // loads the scenario named by the config; throws afdException on failure
    Scenario loadScenario() const;

    // Run an analytic simulation of scenario and report back result
    //   if successful, the result will be a SimulationResult
    //   else, the result will be an afdException
    afdResult runSimulation(const Scenario &scenario) const;

    RuntimeSpec getRuntime() const { return RuntimeSpec{.batch_size = cfg.batch_size, .seq_len = cfg.seq_len}; }
    const afdConfig &getConfig() const { return cfg; }

   private:
    // throws afdException if config is invalid
    void validateConfig() const;

    afdConfig cfg;
};

}  // namespace afd_sim
