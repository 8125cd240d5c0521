// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC

#include "afdMetrics.hpp"

#include <algorithm>
#include <limits>

namespace afd_sim {

namespace {
constexpr double MS_PER_SECOND = 1e3;
constexpr double BITS_PER_BYTE = 8.0;
}  // namespace

FlopCount matmulFlops(int64_t m, int64_t n, int64_t k) {
    return 2.0 * double(m) * double(n) * double(k);
}

int64_t tensorElements(const TensorShape &shape) {
    int64_t total = 1;
    for (auto dim : shape) {
        total *= std::max<int64_t>(dim, 0);
    }
    return total;
}

ByteCount tensorBytes(const TensorShape &shape, DTypeBits dtype_bits) {
    return double(tensorElements(shape)) * dtype_bits / BITS_PER_BYTE;
}

ByteCount sumTensorBytes(std::initializer_list<TensorShape> shapes, DTypeBits dtype_bits) {
    ByteCount total = 0.0;
    for (const auto &shape : shapes) {
        total += tensorBytes(shape, dtype_bits);
    }
    return total;
}

Milliseconds computeTimeMs(FlopCount flops, const HardwareSpec &hardware) {
    double throughput = hardware.computeThroughputTflops();
    if (throughput <= 0) {
        return std::numeric_limits<double>::infinity();
    }
    double seconds = flops / (throughput * FLOPS_PER_TFLOP);
    return seconds * MS_PER_SECOND;
}

Milliseconds memoryTimeMs(ByteCount bytes_moved, const HardwareSpec &hardware) {
    double bandwidth = hardware.memoryBandwidthBytes();
    if (bandwidth <= 0) {
        return std::numeric_limits<double>::infinity();
    }
    double seconds = bytes_moved / bandwidth;
    return seconds * MS_PER_SECOND;
}

Milliseconds interconnectTimeMs(ByteCount bytes_moved, const HardwareSpec &hardware) {
    double bandwidth = hardware.interconnectBandwidthBytes();
    if (bandwidth <= 0) {
        return 0.0;
    }
    double seconds = bytes_moved / bandwidth;
    return seconds * MS_PER_SECOND;
}

Milliseconds dominantLatencyMs(
    Milliseconds compute_ms, Milliseconds memory_ms, const HardwareSpec &hardware) {
    double adjusted_memory_ms = memory_ms / hardware.effectiveOverlap();
    return std::max(compute_ms, adjusted_memory_ms);
}

}  // namespace afd_sim
