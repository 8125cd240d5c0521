// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC

#include "afdAPI.hpp"

#include "ScopedTimer.hpp"
#include "afdCommon.hpp"
#include "afdEngine.hpp"
#include "afdReport.hpp"
#include "afdUtil.hpp"

namespace afd_sim {

SimulationResult runSimulation(const Scenario &scenario, const RuntimeSpec &runtime) {
    afdEngine engine(scenario.hardware, runtime);
    return aggregateExecutions(engine.estimateLayers(scenario.layers));
}

afdAPI::afdAPI(const afdConfig &cfg) : cfg(cfg) {
    validateConfig();  // throws afdException if config is invalid!
}

void afdAPI::validateConfig() const {
    if (cfg.batch_size < 1) {
        throw afdException(
            afdErrorCode::INVALID_CONFIG,
            fmt::format("Illegal batch size '{}' in afdConfig", cfg.batch_size));
    }
    if (cfg.seq_len < 1) {
        throw afdException(
            afdErrorCode::INVALID_CONFIG,
            fmt::format("Illegal sequence length '{}' in afdConfig", cfg.seq_len));
    }
    auto workflow = findWorkflow(cfg.workflow);
    if (not workflow.has_value()) {
        throw afdException(
            afdErrorCode::INVALID_CONFIG, fmt::format("Unknown workflow '{}' in afdConfig", cfg.workflow));
    }
    if (workflow->command != cfg.command) {
        throw afdException(
            afdErrorCode::INVALID_CONFIG,
            fmt::format(
                "Workflow '{}' does not support command '{}' (expected '{}')",
                cfg.workflow,
                cfg.command,
                workflow->command));
    }
}

Scenario afdAPI::loadScenario() const {
    bool verbose = cfg.verbosity > VerbosityLevel::Normal;
    return afd_sim::loadScenario(cfg.scenario_yaml, verbose);
}

afdResult afdAPI::runSimulation(const Scenario &scenario) const {
    bool verbose = cfg.verbosity > VerbosityLevel::Normal;
    ScopedTimer timer;
    try {
        SimulationResult result = afd_sim::runSimulation(scenario, getRuntime());
        if (verbose) {
            log("estimated {} layers in {:.3f} ms", result.layers.size(), timer.elapsedMs());
        }
        return result;
    } catch (const afdException &exp) {
        return exp;
    }
}

}  // namespace afd_sim
