// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC

#pragma once

#include <cstdint>
#include <initializer_list>
#include <vector>

#include "afdCommon.hpp"
#include "afdHardware.hpp"

namespace afd_sim {

using TensorShape = std::vector<int64_t>;

// FLOPs for a dense (m x k) * (k x n) matmul; a multiply-add counts as 2 FLOPs
FlopCount matmulFlops(int64_t m, int64_t n, int64_t k);

// number of elements in shape; negative dims count as zero
int64_t tensorElements(const TensorShape &shape);

ByteCount tensorBytes(const TensorShape &shape, DTypeBits dtype_bits = DEFAULT_DTYPE_BITS);

ByteCount sumTensorBytes(
    std::initializer_list<TensorShape> shapes, DTypeBits dtype_bits = DEFAULT_DTYPE_BITS);

// returns +inf if the hardware has no compute throughput
Milliseconds computeTimeMs(FlopCount flops, const HardwareSpec &hardware);

// returns +inf if the hardware has no memory bandwidth
Milliseconds memoryTimeMs(ByteCount bytes_moved, const HardwareSpec &hardware);

// NB: returns 0.0 (not +inf) if the hardware has no interconnect bandwidth, so
// that a missing interconnect never dominates the roofline
Milliseconds interconnectTimeMs(ByteCount bytes_moved, const HardwareSpec &hardware);

// roofline blend: max(compute, memory / overlap_efficiency)
Milliseconds dominantLatencyMs(
    Milliseconds compute_ms, Milliseconds memory_ms, const HardwareSpec &hardware);

}  // namespace afd_sim
