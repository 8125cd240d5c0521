// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC

#include "ingestScenario.hpp"

#include <unordered_map>
#include <utility>

#include "ScopedTimer.hpp"
#include "afdCommon.hpp"
#include "afdUtil.hpp"
#include "fmt/core.h"
#include "fmt/ranges.h"
#include "yaml-cpp/yaml.h"

namespace afd_sim {

namespace {

const std::unordered_map<std::string, std::string> SUPPORTED_LAYER_TYPES = {
    {"attention", "attention"},
    {"attention_layer", "attention"},
    {"ffn", "ffn"},
    {"ffn_layer", "ffn"},
    {"moe", "moe"},
    {"moe_layer", "moe"},
    {"communication", "communication"},
};

[[noreturn]] void throwLoadError(const std::string &msg) {
    throw afdException(afdErrorCode::SCENARIO_LOAD_FAILED, msg);
}

YAML::Node readYAML(const std::filesystem::path &path) {
    YAML::Node data;
    try {
        data = YAML::LoadFile(path.string());
    } catch (const YAML::BadFile &) {
        throwLoadError(fmt::format("Could not open YAML file '{}'", path.string()));
    } catch (const YAML::ParserException &exp) {
        throwLoadError(fmt::format("Could not parse YAML file '{}' : {}", path.string(), exp.what()));
    }

    if (data.IsNull()) {
        return YAML::Node(YAML::NodeType::Map);
    }
    if (not data.IsMap()) {
        throwLoadError(fmt::format("YAML at {} must be a mapping", path.string()));
    }
    return data;
}

// a reference is either an inline mapping or a path relative to base_dir
YAML::Node maybeLoadReference(const std::filesystem::path &base_dir, const YAML::Node &value) {
    if (value.IsMap()) {
        return value;
    }
    if (not value.IsScalar()) {
        throwLoadError(fmt::format("Unsupported reference value: {}", YAML::Dump(value)));
    }
    return readYAML(base_dir / value.as<std::string>());
}

// shallow overlay of overrides on top of base; inputs are left untouched
YAML::Node mergeMappings(const YAML::Node &base, const YAML::Node &overrides) {
    YAML::Node merged(YAML::NodeType::Map);
    for (const auto &kv : base) {
        merged[kv.first.as<std::string>()] = YAML::Clone(kv.second);
    }
    // a missing overrides key is an invalid node; IsMap() would throw on it
    if (overrides and overrides.IsMap()) {
        for (const auto &kv : overrides) {
            merged[kv.first.as<std::string>()] = YAML::Clone(kv.second);
        }
    }
    return merged;
}

template <typename T>
T requireField(const YAML::Node &node, const std::string &key, const std::string &context) {
    try {
        return node[key].as<T>();
    } catch (const YAML::Exception &) {
        throwLoadError(fmt::format("{} field '{}' has invalid value '{}'", context, key, YAML::Dump(node[key])));
    }
}

template <typename T>
T optionalField(const YAML::Node &node, const std::string &key, const T &default_val, const std::string &context) {
    if (not node[key] or node[key].IsNull()) {
        return default_val;
    }
    return requireField<T>(node, key, context);
}

ConfigMap subConfig(const YAML::Node &data, const std::string &key) {
    const YAML::Node sub = data[key];
    if (sub and sub.IsMap()) {
        return configMapFromYAML(sub);
    }
    return {};
}

}  // namespace

std::optional<std::string> canonicalLayerType(const std::string &layer_type_tag) {
    auto it = SUPPORTED_LAYER_TYPES.find(layer_type_tag);
    if (it == SUPPORTED_LAYER_TYPES.end()) {
        return std::nullopt;
    }
    return it->second;
}

HardwareSpec hardwareFromYAML(const YAML::Node &node) {
    const std::vector<std::string> required = {
        "name", "peak_tflops", "memory_bandwidth_gbps", "hbm_gb", "interconnect_gbps"};
    std::vector<std::string> missing;
    for (const auto &key : required) {
        if (not node[key]) {
            missing.push_back(key);
        }
    }
    if (not missing.empty()) {
        throwLoadError(fmt::format("Hardware config missing keys: [{}]", fmt::join(missing, ", ")));
    }

    const std::string ctx = "Hardware config";
    HardwareSpec hw;
    hw.name = requireField<std::string>(node, "name", ctx);
    hw.peak_tflops = requireField<double>(node, "peak_tflops", ctx);
    hw.memory_bandwidth_gbps = requireField<double>(node, "memory_bandwidth_gbps", ctx);
    hw.hbm_gb = requireField<double>(node, "hbm_gb", ctx);
    hw.interconnect_gbps = requireField<double>(node, "interconnect_gbps", ctx);
    hw.max_concurrency = optionalField<int>(node, "max_concurrency", 1, ctx);
    hw.overlap_efficiency = optionalField<double>(node, "overlap_efficiency", 1.0, ctx);

    for (const auto &[key, value] :
         {std::pair{"peak_tflops", hw.peak_tflops},
          std::pair{"memory_bandwidth_gbps", hw.memory_bandwidth_gbps},
          std::pair{"interconnect_gbps", hw.interconnect_gbps}}) {
        if (value < 0) {
            log_warn("Hardware '{}' has negative {} ({}); it will be treated as 0", hw.name, key, value);
        }
    }
    return hw;
}

ConfigMap configMapFromYAML(const YAML::Node &node) {
    ConfigMap cfg;
    if (not node.IsMap()) {
        return cfg;
    }
    for (const auto &kv : node) {
        const YAML::Node &value = kv.second;
        if (not value.IsScalar()) {
            continue;
        }
        auto key = kv.first.as<std::string>();
        int64_t int_val;
        double double_val;
        bool bool_val;
        if (YAML::convert<int64_t>::decode(value, int_val)) {
            cfg[key] = int_val;
        } else if (YAML::convert<double>::decode(value, double_val)) {
            cfg[key] = double_val;
        } else if (YAML::convert<bool>::decode(value, bool_val)) {
            cfg[key] = bool_val;
        } else {
            cfg[key] = value.Scalar();
        }
    }
    return cfg;
}

LayerConfig layerConfigFromYAML(int idx, const std::string &layer_type_tag, const YAML::Node &data) {
    auto canonical_type = canonicalLayerType(layer_type_tag);
    if (not canonical_type.has_value()) {
        throw afdException(
            afdErrorCode::UNSUPPORTED_LAYER_TYPE,
            fmt::format("Unsupported layer type: {}", layer_type_tag));
    }

    LayerHeader header;
    header.layer_type = canonical_type.value();
    header.layer_id = idx;
    header.name = optionalField<std::string>(data, "name", "", fmt::format("Layer entry #{}", idx));
    if (header.name.empty()) {
        header.name = fmt::format("{}_{}", header.layer_type, idx);
    }
    header.attn_config = subConfig(data, "attn_config");
    if (data["fused_ops"] and data["fused_ops"].IsSequence()) {
        for (const auto &op : data["fused_ops"]) {
            header.fused_ops.push_back(op.as<std::string>());
        }
    }

    if (header.layer_type == "ffn") {
        return FFNLayerConfig{.header = std::move(header), .ffn_config = subConfig(data, "ffn_config")};
    }
    if (header.layer_type == "moe") {
        return MoELayerConfig{.header = std::move(header), .moe_config = subConfig(data, "moe_config")};
    }
    if (header.layer_type == "communication") {
        // communication parameters may sit directly on the layer entry
        ConfigMap comm_config =
            data["comm_config"] ? subConfig(data, "comm_config") : configMapFromYAML(data);
        return CommunicationLayerConfig{.header = std::move(header), .comm_config = std::move(comm_config)};
    }
    if (header.attn_config.empty()) {
        header.attn_config = configMapFromYAML(data);
    }
    return AttentionLayerConfig{.header = std::move(header)};
}

Scenario loadScenario(const std::filesystem::path &scenario_yaml, bool verbose) {
    ScopedTimer timer;
    auto scenario_path = std::filesystem::absolute(scenario_yaml);
    YAML::Node data = readYAML(scenario_path);
    auto base_dir = scenario_path.parent_path();

    Scenario scenario;

    const YAML::Node hardware_ref = data["hardware"];
    if (not hardware_ref or hardware_ref.IsNull()) {
        throwLoadError("Scenario must specify a 'hardware' block or reference");
    }
    scenario.hardware = hardwareFromYAML(maybeLoadReference(base_dir, hardware_ref));

    const YAML::Node layers_block = data["layers"];
    if (not layers_block or not layers_block.IsSequence() or layers_block.size() == 0) {
        throwLoadError("Scenario must include at least one layer entry");
    }

    for (size_t idx = 0; idx < layers_block.size(); idx++) {
        const YAML::Node layer_entry = layers_block[idx];
        if (not layer_entry.IsMap()) {
            throwLoadError(fmt::format("Layer entry #{} must be a mapping", idx));
        }
        std::string layer_type_tag =
            optionalField<std::string>(layer_entry, "type", "None", fmt::format("Layer entry #{}", idx));

        try {
            YAML::Node config_node =
                layer_entry["config"] ? maybeLoadReference(base_dir, layer_entry["config"]) : layer_entry;
            YAML::Node merged = mergeMappings(config_node, layer_entry["overrides"]);
            if (not merged["name"] and layer_entry["name"]) {
                merged["name"] = YAML::Clone(layer_entry["name"]);
            }

            scenario.layers.push_back(layerConfigFromYAML(int(idx), layer_type_tag, merged));
        } catch (const YAML::Exception &exp) {
            throwLoadError(fmt::format("Layer entry #{}: {}", idx, exp.what()));
        }
    }

    scenario.name = optionalField<std::string>(data, "name", scenario_path.stem().string(), "Scenario");

    if (verbose) {
        log("loaded scenario '{}' ({} layers) in {:.3f} ms",
            scenario.name,
            scenario.layers.size(),
            timer.elapsedMs());
    }
    return scenario;
}

}  // namespace afd_sim
