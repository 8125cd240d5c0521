// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC

#include <algorithm>

#include "afdReport.hpp"
#include "gtest/gtest.h"

namespace afd_sim {

namespace {
LayerExecution makeExecution(const std::string &name, const std::string &type, Milliseconds latency_ms) {
    return LayerExecution{
        .layer_name = name,
        .layer_type = type,
        .flops = 3e9,
        .bytes_read = 1e9,
        .bytes_written = 1e9,
        .compute_time_ms = latency_ms / 2,
        .memory_time_ms = latency_ms,
        .dominant_latency_ms = latency_ms,
        .estimated_execution_time_ms = latency_ms};
}

size_t countLines(const std::string &text) { return static_cast<size_t>(std::count(text.begin(), text.end(), '\n')); }
}  // namespace

TEST(afdReportTest, CanFormatNumbers) {
    EXPECT_EQ(formatMs(1.5), "   1.500");
    EXPECT_EQ(formatMs(12345.6789), "12345.679");
    EXPECT_EQ(formatGFlops(2.5e9), "   2.500");
    EXPECT_EQ(formatGB(1e9), "   1.000");
}

TEST(afdReportTest, CanRenderAFDTable) {
    std::vector<LayerExecution> layers = {
        makeExecution("attn_0", "attention", 2.0), makeExecution("ffn_1", "ffn", 1.0)};
    auto table = renderAFDTable(layers);

    EXPECT_EQ(countLines(table), 3u);
    EXPECT_EQ(table.substr(0, table.find('\n')),
        "       layer         type       gflops   compute_ms    memory_ms   latency_ms");
    EXPECT_NE(table.find("      attn_0  attention      3.000        1.000        2.000        2.000\n"),
        std::string::npos);
    EXPECT_NE(table.find("       ffn_1        ffn"), std::string::npos);
}

TEST(afdReportTest, CanRenderLargeEPTable) {
    auto table = renderLargeEPTable({makeExecution("moe_0", "moe", 4.0)});
    EXPECT_EQ(countLines(table), 2u);
    EXPECT_EQ(table.substr(0, table.find('\n')),
        "       layer         type       gflops     bytes_gb   latency_ms");
    EXPECT_NE(table.find("       moe_0          moe      3.000      2.000        4.000\n"), std::string::npos);
}

TEST(afdReportTest, CanFindWorkflows) {
    auto afd = findWorkflow("afd");
    ASSERT_TRUE(afd.has_value());
    EXPECT_EQ(afd->command, "simulate");

    auto large_ep = findWorkflow("large-ep");
    ASSERT_TRUE(large_ep.has_value());
    EXPECT_EQ(large_ep->command, "evaluate");

    EXPECT_FALSE(findWorkflow("pipeline").has_value());
    EXPECT_EQ(getWorkflows().size(), 2u);
}

TEST(afdReportTest, CanRenderReport) {
    auto result = aggregateExecutions({makeExecution("attn_0", "attention", 2.0), makeExecution("ffn_1", "ffn", 1.0)});
    for (const auto &[name, workflow] : getWorkflows()) {
        auto report = renderReport(workflow, "test_scenario", "TestGPU", result);
        EXPECT_EQ(report.find("Scenario: test_scenario\nHardware: TestGPU\n"), 0u) << name;
        EXPECT_NE(report.find("\nTotals:\n"), std::string::npos) << name;
        EXPECT_NE(report.find("Total latency (ms): 3.000"), std::string::npos) << name;
        EXPECT_NE(report.find("Bottleneck layer: attn_0"), std::string::npos) << name;
        EXPECT_NE(report.find(workflow.table_renderer(result.layers)), std::string::npos) << name;
    }
}

}  // namespace afd_sim
