// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC

#pragma once

#include <map>
#include <string>

#include "afdCommon.hpp"
#include "nlohmann/json.hpp"

namespace afd_sim {

struct OpBreakdown {
    FlopCount flops = 0.0;
    ByteCount bytes = 0.0;

    bool operator==(const OpBreakdown &rhs) const = default;
};

using FeatureMap = std::map<std::string, double>;
using BreakdownMap = std::map<std::string, OpBreakdown>;

// analytic estimate for a single layer
struct LayerExecution {
    std::string layer_name;
    std::string layer_type;
    FlopCount flops = 0.0;
    ByteCount bytes_read = 0.0;
    ByteCount bytes_written = 0.0;
    Milliseconds compute_time_ms = 0.0;
    Milliseconds memory_time_ms = 0.0;
    Milliseconds dominant_latency_ms = 0.0;
    Milliseconds estimated_execution_time_ms = 0.0;
    FeatureMap features;
    BreakdownMap breakdown;

    ByteCount totalBytes() const { return bytes_read + bytes_written; }

    // returns a copy renamed to name/type; default_features are only added
    // where this execution does not already carry a value for the key
    LayerExecution withIdentity(
        const std::string &name, const std::string &type, const FeatureMap &default_features) const;

    std::string to_string(bool verbose = false) const;

    bool operator==(const LayerExecution &rhs) const = default;
};

void to_json(nlohmann::json &j, const OpBreakdown &breakdown);
void to_json(nlohmann::json &j, const LayerExecution &execution);

}  // namespace afd_sim
