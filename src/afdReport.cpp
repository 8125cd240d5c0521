// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC

#include "afdReport.hpp"

#include "fmt/core.h"
#include "fmt/ranges.h"

namespace afd_sim {

namespace {

constexpr size_t HEADER_PAD = 12;

std::string renderHeader(const std::vector<std::string> &headers) {
    std::vector<std::string> padded;
    padded.reserve(headers.size());
    for (const auto &header : headers) {
        padded.push_back(fmt::format("{:>{}}", header, HEADER_PAD));
    }
    return fmt::format("{}\n", fmt::join(padded, " "));
}

}  // namespace

std::string formatMs(double value) { return fmt::format("{:8.3f}", value); }
std::string formatGFlops(double flops) { return fmt::format("{:8.3f}", flops / 1e9); }
std::string formatGB(double bytes) { return fmt::format("{:8.3f}", bytes / 1e9); }

std::string renderAFDTable(const std::vector<LayerExecution> &layers) {
    std::string output =
        renderHeader({"layer", "type", "gflops", "compute_ms", "memory_ms", "latency_ms"});
    for (const auto &layer : layers) {
        output.append(fmt::format(
            "{:>12} {:>10} {:>10} {:>12} {:>12} {:>12}\n",
            layer.layer_name,
            layer.layer_type,
            formatGFlops(layer.flops),
            formatMs(layer.compute_time_ms),
            formatMs(layer.memory_time_ms),
            formatMs(layer.dominant_latency_ms)));
    }
    return output;
}

std::string renderLargeEPTable(const std::vector<LayerExecution> &layers) {
    std::string output = renderHeader({"layer", "type", "gflops", "bytes_gb", "latency_ms"});
    for (const auto &layer : layers) {
        output.append(fmt::format(
            "{:>12} {:>12} {:>10} {:>10} {:>12}\n",
            layer.layer_name,
            layer.layer_type,
            formatGFlops(layer.flops),
            formatGB(layer.totalBytes()),
            formatMs(layer.dominant_latency_ms)));
    }
    return output;
}

const std::map<std::string, WorkflowDefinition> &getWorkflows() {
    static const std::map<std::string, WorkflowDefinition> workflows = {
        {"afd",
         WorkflowDefinition{
             .name = "afd",
             .help_text = "Attention-FFN disaggregation workflows",
             .command = "simulate",
             .command_help = "Run analytic AFD simulation",
             .table_renderer = renderAFDTable}},
        {"large-ep",
         WorkflowDefinition{
             .name = "large-ep",
             .help_text = "Large expert-parallel workflows",
             .command = "evaluate",
             .command_help = "Run expert-parallel analytic simulation",
             .table_renderer = renderLargeEPTable}},
    };
    return workflows;
}

std::optional<WorkflowDefinition> findWorkflow(const std::string &name) {
    const auto &workflows = getWorkflows();
    auto it = workflows.find(name);
    if (it == workflows.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string renderReport(
    const WorkflowDefinition &workflow,
    const std::string &scenario_name,
    const std::string &hardware_name,
    const SimulationResult &result) {
    std::string output;
    output.append(fmt::format("Scenario: {}\n", scenario_name));
    output.append(fmt::format("Hardware: {}\n", hardware_name));
    output.append(workflow.table_renderer(result.layers));
    output.append("\nTotals:\n");
    output.append(result.to_string());
    return output;
}

}  // namespace afd_sim
