// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC

#pragma once

#include <string>
#include <variant>
#include <vector>

#include "afdConfigMap.hpp"

namespace afd_sim {

// metadata shared by every layer kind
struct LayerHeader {
    std::string layer_type;
    std::string name;
    int layer_id = 0;
    ConfigMap attn_config;
    std::vector<std::string> fused_ops;  // informational only
};

struct AttentionLayerConfig {
    LayerHeader header;
};

struct FFNLayerConfig {
    LayerHeader header;
    ConfigMap ffn_config;
};

struct MoELayerConfig {
    LayerHeader header;
    ConfigMap moe_config;
};

struct CommunicationLayerConfig {
    LayerHeader header;
    ConfigMap comm_config;
};

using LayerConfig =
    std::variant<AttentionLayerConfig, FFNLayerConfig, MoELayerConfig, CommunicationLayerConfig>;

inline const LayerHeader &getHeader(const LayerConfig &cfg) {
    return std::visit([](const auto &layer) -> const LayerHeader & { return layer.header; }, cfg);
}

}  // namespace afd_sim
