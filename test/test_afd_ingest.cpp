// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC

#include <filesystem>
#include <fstream>
#include <string>

#include "afdAPI.hpp"
#include "gtest/gtest.h"
#include "ingestScenario.hpp"

namespace afd_sim {

class afdIngestTest : public ::testing::Test {
   protected:
    std::filesystem::path tempDir;

    void SetUp() override {
        tempDir = std::filesystem::temp_directory_path() / "afd_ingest_test";
        std::filesystem::create_directories(tempDir);
    }

    void TearDown() override { std::filesystem::remove_all(tempDir); }

    std::filesystem::path writeFile(const std::string &filename, const std::string &contents) {
        auto path = tempDir / filename;
        std::ofstream os(path);
        os << contents;
        return path;
    }

    void writeReferencedFiles() {
        writeFile(
            "hardware.yaml",
            "name: TestGPU\n"
            "peak_tflops: 120\n"
            "memory_bandwidth_gbps: 1500\n"
            "hbm_gb: 80\n"
            "interconnect_gbps: 600\n"
            "max_concurrency: 2\n"
            "overlap_efficiency: 1.0\n");
        writeFile(
            "ffn.yaml",
            "attn_config:\n"
            "  d_model: 256\n"
            "  num_attention_heads: 8\n"
            "ffn_config:\n"
            "  d_model: 256\n"
            "  d_ff: 1024\n");
    }

    // runs fn, which must throw, and returns the thrown afdException
    template <typename Fn>
    afdException expectLoadError(Fn &&fn) {
        try {
            fn();
        } catch (const afdException &exp) {
            return exp;
        }
        ADD_FAILURE() << "expected an afdException";
        return afdException(afdErrorCode::UNDEF);
    }

    static bool contains(const afdException &exp, const std::string &text) {
        return std::string(exp.what()).find(text) != std::string::npos;
    }
};

TEST_F(afdIngestTest, CanLoadReferencedScenario) {
    writeReferencedFiles();
    auto scenario_yaml = writeFile(
        "scenario.yaml",
        "name: test_scenario\n"
        "hardware: hardware.yaml\n"
        "layers:\n"
        "  - type: \"ffn_layer\"\n"
        "    config: ffn.yaml\n");

    Scenario scenario = loadScenario(scenario_yaml);
    EXPECT_EQ(scenario.name, "test_scenario");
    EXPECT_EQ(scenario.hardware.name, "TestGPU");
    EXPECT_EQ(scenario.hardware.peak_tflops, 120.0);
    EXPECT_EQ(scenario.hardware.max_concurrency, 2);
    ASSERT_EQ(scenario.layers.size(), 1u);

    const auto &header = getHeader(scenario.layers[0]);
    EXPECT_EQ(header.layer_type, "ffn");
    EXPECT_EQ(header.name, "ffn_0");
    EXPECT_EQ(header.layer_id, 0);
    EXPECT_EQ(std::get<int64_t>(header.attn_config.at("num_attention_heads")), 8);

    const auto &ffn = std::get<FFNLayerConfig>(scenario.layers[0]);
    EXPECT_EQ(std::get<int64_t>(ffn.ffn_config.at("d_ff")), 1024);

    auto result = runSimulation(scenario, RuntimeSpec{.batch_size = 2, .seq_len = 32});
    EXPECT_GT(result.total_latency_ms, 0);
    EXPECT_GT(result.total_flops, 0);
    EXPECT_EQ(result.bottleneck_layer, header.name);
}

TEST_F(afdIngestTest, CanLoadInlineScenario) {
    auto scenario_yaml = writeFile(
        "inline_scenario.yaml",
        "hardware:\n"
        "  name: InlineGPU\n"
        "  peak_tflops: 400\n"
        "  memory_bandwidth_gbps: 3000\n"
        "  hbm_gb: 96\n"
        "  interconnect_gbps: 450\n"
        "layers:\n"
        "  - type: attention\n"
        "    name: attn_block\n"
        "    d_model: 512\n"
        "    num_heads: 4\n"
        "  - type: communication\n"
        "    pattern: all_reduce\n"
        "    payload_mb: 4\n"
        "  - type: moe_layer\n"
        "    moe_config:\n"
        "      d_model: 256\n"
        "      n_routed_experts: 16\n"
        "      num_experts_per_tok: 2\n"
        "    fused_ops: [moe_routing, moe_expert]\n");

    Scenario scenario = loadScenario(scenario_yaml);
    // name falls back to the file stem
    EXPECT_EQ(scenario.name, "inline_scenario");
    EXPECT_EQ(scenario.hardware.name, "InlineGPU");
    EXPECT_EQ(scenario.hardware.max_concurrency, 1);
    EXPECT_EQ(scenario.hardware.overlap_efficiency, 1.0);
    ASSERT_EQ(scenario.layers.size(), 3u);

    // attention params on the entry itself become the attention config
    const auto &attn = std::get<AttentionLayerConfig>(scenario.layers[0]);
    EXPECT_EQ(attn.header.name, "attn_block");
    EXPECT_EQ(std::get<int64_t>(attn.header.attn_config.at("d_model")), 512);

    const auto &comm = std::get<CommunicationLayerConfig>(scenario.layers[1]);
    EXPECT_EQ(comm.header.name, "communication_1");
    EXPECT_EQ(std::get<std::string>(comm.comm_config.at("pattern")), "all_reduce");
    EXPECT_EQ(asDouble(comm.comm_config.at("payload_mb")), 4.0);

    const auto &moe = std::get<MoELayerConfig>(scenario.layers[2]);
    EXPECT_EQ(moe.header.layer_type, "moe");
    EXPECT_EQ(moe.header.layer_id, 2);
    EXPECT_EQ(moe.header.fused_ops, (std::vector<std::string>{"moe_routing", "moe_expert"}));
    EXPECT_EQ(std::get<int64_t>(moe.moe_config.at("n_routed_experts")), 16);
}

TEST_F(afdIngestTest, CanApplyOverrides) {
    writeReferencedFiles();
    auto scenario_yaml = writeFile(
        "scenario.yaml",
        "hardware: hardware.yaml\n"
        "layers:\n"
        "  - type: ffn\n"
        "    name: wide_ffn\n"
        "    config: ffn.yaml\n"
        "    overrides:\n"
        "      ffn_config:\n"
        "        d_ff: 4096\n");

    Scenario scenario = loadScenario(scenario_yaml);
    const auto &ffn = std::get<FFNLayerConfig>(scenario.layers[0]);
    EXPECT_EQ(ffn.header.name, "wide_ffn");
    // overrides replace top level keys wholesale
    EXPECT_EQ(std::get<int64_t>(ffn.ffn_config.at("d_ff")), 4096);
    EXPECT_FALSE(ffn.ffn_config.contains("d_model"));
    // keys without an override still come from the referenced file
    EXPECT_EQ(std::get<int64_t>(ffn.header.attn_config.at("d_model")), 256);
}

TEST_F(afdIngestTest, ConfigNameTakesPrecedenceOverEntryName) {
    writeReferencedFiles();
    writeFile("named_ffn.yaml", "name: from_config\nffn_config:\n  d_ff: 128\n");
    auto scenario_yaml = writeFile(
        "scenario.yaml",
        "hardware: hardware.yaml\n"
        "layers:\n"
        "  - type: ffn\n"
        "    name: from_entry\n"
        "    config: named_ffn.yaml\n");

    Scenario scenario = loadScenario(scenario_yaml);
    EXPECT_EQ(getHeader(scenario.layers[0]).name, "from_config");
}

TEST_F(afdIngestTest, CanConvertScalarValues) {
    YAML::Node node = YAML::Load(
        "int_val: 12\n"
        "float_val: 2.5\n"
        "bool_val: true\n"
        "str_val: all_reduce\n"
        "nested:\n"
        "  d_model: 1\n"
        "list_val: [1, 2]\n");
    ConfigMap cfg = configMapFromYAML(node);
    EXPECT_EQ(std::get<int64_t>(cfg.at("int_val")), 12);
    EXPECT_EQ(std::get<double>(cfg.at("float_val")), 2.5);
    EXPECT_EQ(std::get<bool>(cfg.at("bool_val")), true);
    EXPECT_EQ(std::get<std::string>(cfg.at("str_val")), "all_reduce");
    EXPECT_FALSE(cfg.contains("nested"));
    EXPECT_FALSE(cfg.contains("list_val"));
}

TEST_F(afdIngestTest, CanCanonicalizeLayerTypes) {
    EXPECT_EQ(canonicalLayerType("attention"), "attention");
    EXPECT_EQ(canonicalLayerType("attention_layer"), "attention");
    EXPECT_EQ(canonicalLayerType("ffn_layer"), "ffn");
    EXPECT_EQ(canonicalLayerType("moe_layer"), "moe");
    EXPECT_EQ(canonicalLayerType("communication"), "communication");
    EXPECT_FALSE(canonicalLayerType("communication_layer").has_value());
    EXPECT_FALSE(canonicalLayerType("conv").has_value());
}

TEST_F(afdIngestTest, RejectsMissingHardware) {
    auto scenario_yaml = writeFile("scenario.yaml", "layers:\n  - type: ffn\n");
    auto exp = expectLoadError([&] { loadScenario(scenario_yaml); });
    EXPECT_EQ(exp.err_code, afdErrorCode::SCENARIO_LOAD_FAILED);
    EXPECT_TRUE(contains(exp, "Scenario must specify a 'hardware' block or reference"));
}

TEST_F(afdIngestTest, RejectsIncompleteHardware) {
    auto scenario_yaml = writeFile(
        "scenario.yaml",
        "hardware:\n"
        "  name: Partial\n"
        "  peak_tflops: 100\n"
        "layers:\n"
        "  - type: ffn\n");
    auto exp = expectLoadError([&] { loadScenario(scenario_yaml); });
    EXPECT_EQ(exp.err_code, afdErrorCode::SCENARIO_LOAD_FAILED);
    EXPECT_TRUE(contains(exp, "Hardware config missing keys: [memory_bandwidth_gbps, hbm_gb, interconnect_gbps]"));
}

TEST_F(afdIngestTest, RejectsInvalidHardwareValue) {
    YAML::Node node = YAML::Load(
        "name: Broken\n"
        "peak_tflops: fast\n"
        "memory_bandwidth_gbps: 1500\n"
        "hbm_gb: 80\n"
        "interconnect_gbps: 600\n");
    auto exp = expectLoadError([&] { hardwareFromYAML(node); });
    EXPECT_EQ(exp.err_code, afdErrorCode::SCENARIO_LOAD_FAILED);
    EXPECT_TRUE(contains(exp, "'peak_tflops'"));
}

TEST_F(afdIngestTest, RejectsMissingLayers) {
    writeReferencedFiles();
    auto no_layers = writeFile("no_layers.yaml", "hardware: hardware.yaml\n");
    auto exp = expectLoadError([&] { loadScenario(no_layers); });
    EXPECT_TRUE(contains(exp, "Scenario must include at least one layer entry"));

    auto empty_layers = writeFile("empty_layers.yaml", "hardware: hardware.yaml\nlayers: []\n");
    auto empty_exp = expectLoadError([&] { loadScenario(empty_layers); });
    EXPECT_TRUE(contains(empty_exp, "Scenario must include at least one layer entry"));
}

TEST_F(afdIngestTest, RejectsNonMappingLayerEntry) {
    writeReferencedFiles();
    auto scenario_yaml = writeFile(
        "scenario.yaml",
        "hardware: hardware.yaml\n"
        "layers:\n"
        "  - type: ffn\n"
        "  - just_a_string\n");
    auto exp = expectLoadError([&] { loadScenario(scenario_yaml); });
    EXPECT_TRUE(contains(exp, "Layer entry #1 must be a mapping"));
}

TEST_F(afdIngestTest, RejectsUnsupportedLayerType) {
    writeReferencedFiles();
    auto scenario_yaml = writeFile(
        "scenario.yaml",
        "hardware: hardware.yaml\n"
        "layers:\n"
        "  - type: conv2d\n");
    auto exp = expectLoadError([&] { loadScenario(scenario_yaml); });
    EXPECT_EQ(exp.err_code, afdErrorCode::UNSUPPORTED_LAYER_TYPE);
    EXPECT_TRUE(contains(exp, "Unsupported layer type: conv2d"));

    auto untyped = writeFile("untyped.yaml", "hardware: hardware.yaml\nlayers:\n  - name: mystery\n");
    auto untyped_exp = expectLoadError([&] { loadScenario(untyped); });
    EXPECT_EQ(untyped_exp.err_code, afdErrorCode::UNSUPPORTED_LAYER_TYPE);
}

TEST_F(afdIngestTest, CanLoadLayersWithoutOverrides) {
    writeReferencedFiles();
    auto scenario_yaml = writeFile(
        "scenario.yaml",
        "hardware: hardware.yaml\n"
        "layers:\n"
        "  - type: ffn\n"
        "    config: ffn.yaml\n"
        "  - type: ffn\n"
        "    config: ffn.yaml\n"
        "    overrides: not_a_mapping\n");

    Scenario scenario = loadScenario(scenario_yaml);
    ASSERT_EQ(scenario.layers.size(), 2u);
    for (const auto &layer : scenario.layers) {
        const auto &ffn = std::get<FFNLayerConfig>(layer);
        EXPECT_EQ(std::get<int64_t>(ffn.ffn_config.at("d_ff")), 1024);
    }
}

TEST_F(afdIngestTest, RejectsMalformedLayerEntryValues) {
    writeReferencedFiles();
    auto nested_op = writeFile(
        "nested_op.yaml",
        "hardware: hardware.yaml\n"
        "layers:\n"
        "  - type: ffn\n"
        "    fused_ops: [{a: 1}]\n");
    auto exp = expectLoadError([&] { loadScenario(nested_op); });
    EXPECT_EQ(exp.err_code, afdErrorCode::SCENARIO_LOAD_FAILED);
    EXPECT_TRUE(contains(exp, "Layer entry #0"));

    auto sequence_key = writeFile(
        "sequence_key.yaml",
        "hardware: hardware.yaml\n"
        "layers:\n"
        "  - type: ffn\n"
        "  - type: ffn\n"
        "    ? [a, b]\n"
        "    : 1\n");
    auto key_exp = expectLoadError([&] { loadScenario(sequence_key); });
    EXPECT_EQ(key_exp.err_code, afdErrorCode::SCENARIO_LOAD_FAILED);
    EXPECT_TRUE(contains(key_exp, "Layer entry #1"));
}

TEST_F(afdIngestTest, RejectsMissingOrMalformedFiles) {
    auto exp = expectLoadError([&] { loadScenario(tempDir / "does_not_exist.yaml"); });
    EXPECT_EQ(exp.err_code, afdErrorCode::SCENARIO_LOAD_FAILED);

    auto missing_ref = writeFile("scenario.yaml", "hardware: missing_hw.yaml\nlayers:\n  - type: ffn\n");
    auto ref_exp = expectLoadError([&] { loadScenario(missing_ref); });
    EXPECT_TRUE(contains(ref_exp, "missing_hw.yaml"));

    auto bad_ref = writeFile("bad_ref.yaml", "hardware: [1, 2]\nlayers:\n  - type: ffn\n");
    auto bad_ref_exp = expectLoadError([&] { loadScenario(bad_ref); });
    EXPECT_TRUE(contains(bad_ref_exp, "Unsupported reference value"));

    auto not_a_map = writeFile("list.yaml", "- 1\n- 2\n");
    auto map_exp = expectLoadError([&] { loadScenario(not_a_map); });
    EXPECT_TRUE(contains(map_exp, "must be a mapping"));
}

}  // namespace afd_sim
