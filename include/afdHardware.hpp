// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC

#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>

#include "fmt/core.h"

namespace afd_sim {

constexpr double BYTES_PER_GB = 1e9;
constexpr double FLOPS_PER_TFLOP = 1e12;

// hardware capabilities used to convert analytic work into timing; rate fields
// are clamped by the accessors rather than validated on construction
struct HardwareSpec {
    std::string name;
    double peak_tflops = 0.0;
    double memory_bandwidth_gbps = 0.0;
    double hbm_gb = 0.0;
    double interconnect_gbps = 0.0;
    int max_concurrency = 1;
    double overlap_efficiency = 1.0;

    static constexpr double MIN_OVERLAP_EFFICIENCY = 1e-3;

    double computeThroughputTflops() const { return std::max(peak_tflops, 0.0); }
    double computeThroughputFlops() const { return computeThroughputTflops() * FLOPS_PER_TFLOP; }
    double memoryBandwidthBytes() const { return std::max(memory_bandwidth_gbps, 0.0) * BYTES_PER_GB; }
    double interconnectBandwidthBytes() const {
        return std::max(interconnect_gbps, 0.0) * BYTES_PER_GB;
    }
    double effectiveOverlap() const { return std::max(overlap_efficiency, MIN_OVERLAP_EFFICIENCY); }

    std::string to_string() const {
        return fmt::format(
            "{} (peak {} TFLOP/s, mem {} GB/s, hbm {} GB, interconnect {} GB/s, overlap {})",
            name,
            peak_tflops,
            memory_bandwidth_gbps,
            hbm_gb,
            interconnect_gbps,
            overlap_efficiency);
    }
};

// runtime shape of a simulation run; micro_batch and tokens_per_expert are
// carried through but not consumed by the analytic formulas
struct RuntimeSpec {
    int64_t batch_size = 1;
    int64_t seq_len = 1;
    std::optional<int64_t> micro_batch;
    std::optional<double> tokens_per_expert;
};

}  // namespace afd_sim
