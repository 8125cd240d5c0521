// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC

#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "afdLayerExecution.hpp"
#include "afdStats.hpp"

namespace afd_sim {

using TableRenderer = std::function<std::string(const std::vector<LayerExecution> &)>;

// a CLI workflow and the per-layer table it prints
struct WorkflowDefinition {
    std::string name;
    std::string help_text;
    std::string command;
    std::string command_help;
    TableRenderer table_renderer;
};

const std::map<std::string, WorkflowDefinition> &getWorkflows();
std::optional<WorkflowDefinition> findWorkflow(const std::string &name);

// attention/FFN disaggregation view: flops, compute, memory and latency
std::string renderAFDTable(const std::vector<LayerExecution> &layers);
// expert-parallel view: flops, total bytes and latency
std::string renderLargeEPTable(const std::vector<LayerExecution> &layers);

// full report: scenario/hardware banner, workflow table and totals
std::string renderReport(
    const WorkflowDefinition &workflow,
    const std::string &scenario_name,
    const std::string &hardware_name,
    const SimulationResult &result);

std::string formatMs(double value);
std::string formatGFlops(double flops);
std::string formatGB(double bytes);

}  // namespace afd_sim
