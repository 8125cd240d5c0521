// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC

#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "afdConfigMap.hpp"
#include "afdScenario.hpp"
#include "yaml-cpp/yaml.h"

namespace afd_sim {

// Load a scenario YAML file. Hardware and per-layer configs may be given inline
// or as paths relative to the scenario file. Throws afdException
// (SCENARIO_LOAD_FAILED or UNSUPPORTED_LAYER_TYPE) naming the offending field.
Scenario loadScenario(const std::filesystem::path &scenario_yaml, bool verbose = false);

// maps a scenario type tag (e.g. "ffn_layer") onto its canonical layer type
std::optional<std::string> canonicalLayerType(const std::string &layer_type_tag);

HardwareSpec hardwareFromYAML(const YAML::Node &node);

// scalar entries only; nested mappings and sequences are skipped
ConfigMap configMapFromYAML(const YAML::Node &node);

LayerConfig layerConfigFromYAML(int idx, const std::string &layer_type_tag, const YAML::Node &data);

}  // namespace afd_sim
