// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC

// sole header needed for libafd_sim
#include "afdAPI.hpp"

// includes for building CLI
#include "ScopedTimer.hpp"
#include "afdReport.hpp"
#include "afdUtil.hpp"
#include "cliOptions.hpp"

int main(int argc, char **argv) {
    afd_sim::afdConfig cfg;
    if (not afd_sim::parse_options(cfg, argc, argv)) {
        return 1;
    }

    try {
        bool verbose = cfg.verbosity != afd_sim::VerbosityLevel::Normal;
        if (verbose) {
            fmt::print("{}\n", cfg.to_string());
        }
        afd_sim::ScopedTimer run_timer("afd_sim_cli", verbose);

        // setup API handle; this may throw afdException!
        afd_sim::afdAPI afd_api(cfg);

        if (verbose) {
            afd_sim::printDiv("Load Scenario");
        }
        afd_sim::Scenario scenario = afd_api.loadScenario();

        if (verbose) {
            afd_sim::printDiv("Run Analytic Estimation");
        }
        afd_sim::afdResult result = afd_api.runSimulation(scenario);

        // Handle errors if they bubble up
        int status = 0;
        std::visit(
            afd_sim::overloaded{
                [&](const afd_sim::SimulationResult &sim_result) {
                    auto workflow = afd_sim::findWorkflow(cfg.workflow);
                    fmt::print(
                        "{}",
                        afd_sim::renderReport(
                            workflow.value(), scenario.name, scenario.hardware.name, sim_result));
                    if (verbose) {
                        afd_sim::printDiv("Layer Details");
                        for (const auto &[idx, layer] : afd_sim::enumerate(sim_result.layers)) {
                            fmt::print("[{}]{}", idx, layer.to_string(true));
                        }
                    }
                    if (not cfg.output_filepath.empty()) {
                        if (sim_result.emitToFile(cfg.output_filepath)) {
                            fmt::print("\nSaved raw result to {}\n", cfg.output_filepath);
                        } else {
                            status = 1;
                        }
                    }
                },
                [&](const afd_sim::afdException &err) {
                    afd_sim::log_error("{}", err.what());
                    status = 1;
                }},
            result);
        return status;

    } catch (const afd_sim::afdException &exp) {
        afd_sim::log_error("{}", exp.what());
        return 1;
    } catch (const std::exception &exp) {
        afd_sim::log_error("{}", exp.what());
        return 1;
    }
}
