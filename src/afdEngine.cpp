// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC

#include "afdEngine.hpp"

#include "afdUtil.hpp"
#include "layer_modules/attention.hpp"
#include "layer_modules/communication.hpp"
#include "layer_modules/ffn.hpp"
#include "layer_modules/moe.hpp"

namespace afd_sim {

std::unique_ptr<afdLayerModule> afdEngine::createLayerModule(const LayerConfig &layer_config) {
    return std::visit(
        overloaded{
            [](const FFNLayerConfig &cfg) -> std::unique_ptr<afdLayerModule> {
                return std::make_unique<FFNModule>(cfg.ffn_config);
            },
            [](const MoELayerConfig &cfg) -> std::unique_ptr<afdLayerModule> {
                return std::make_unique<MoEModule>(cfg.moe_config);
            },
            [](const CommunicationLayerConfig &cfg) -> std::unique_ptr<afdLayerModule> {
                return std::make_unique<CommunicationModule>(cfg.comm_config);
            },
            [](const AttentionLayerConfig &cfg) -> std::unique_ptr<afdLayerModule> {
                return std::make_unique<AttentionModule>(cfg.header.attn_config);
            }},
        layer_config);
}

LayerExecution afdEngine::estimateLayer(const LayerConfig &layer_config) const {
    const LayerHeader &header = getHeader(layer_config);
    auto module = createLayerModule(layer_config);
    LayerExecution execution =
        module->estimateExecutionTime(runtime.batch_size, runtime.seq_len, hardware);

    FeatureMap default_features = {
        {"layer_id", double(header.layer_id)},
        {"layer_type", 0.0}};
    return execution.withIdentity(header.name, header.layer_type, default_features);
}

std::vector<LayerExecution> afdEngine::estimateLayers(
    const std::vector<LayerConfig> &layer_configs) const {
    std::vector<LayerExecution> executions;
    executions.reserve(layer_configs.size());
    for (const auto &layer_config : layer_configs) {
        executions.push_back(estimateLayer(layer_config));
    }
    return executions;
}

}  // namespace afd_sim
