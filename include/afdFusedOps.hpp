// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC

#pragma once

#include <string>

#include "afdCommon.hpp"

namespace afd_sim {

// cost of one fused step in a layer's analytic decomposition; name is used as
// the breakdown key downstream
struct FusionMetrics {
    std::string name;
    FlopCount flops = 0.0;
    ByteCount bytes_accessed = 0.0;
};

// Fused-op catalog. These are deliberately approximate closed forms (softmax and
// the FFN activation are costed at one op per element); they are meant for
// relative comparison across configurations and hardware, not cycle accuracy.

// Q, K and V projections as three independent dense matmuls
FusionMetrics attentionQKVProjections(
    int64_t batch, int64_t seq, int64_t d_model, int64_t qkv_dim, DTypeBits dtype_bits = DEFAULT_DTYPE_BITS);

// Q x K^T per head plus a softmax term of one op per score element
FusionMetrics attentionScores(
    int64_t batch, int64_t seq, int64_t num_heads, int64_t head_dim, DTypeBits dtype_bits = DEFAULT_DTYPE_BITS);

// attention weights x V per head
FusionMetrics attentionWeightedSum(
    int64_t batch, int64_t seq, int64_t num_heads, int64_t head_dim, DTypeBits dtype_bits = DEFAULT_DTYPE_BITS);

FusionMetrics attentionOutputProjection(
    int64_t batch, int64_t seq, int64_t d_model, int64_t qkv_dim, DTypeBits dtype_bits = DEFAULT_DTYPE_BITS);

// up + down projection plus one op per hidden element for the activation
FusionMetrics ffnActivation(
    int64_t batch, int64_t seq, int64_t d_model, int64_t hidden_dim, DTypeBits dtype_bits = DEFAULT_DTYPE_BITS);

// gating scores + top-k selection; gate weights are not costed
FusionMetrics moeRouting(
    int64_t batch, int64_t seq, int64_t num_experts, int64_t top_k, DTypeBits dtype_bits = DEFAULT_DTYPE_BITS);

// same structure as ffnActivation, over the routed (active) token volume
FusionMetrics moeExpertForward(
    int64_t active_tokens, int64_t d_model, int64_t expert_hidden, DTypeBits dtype_bits = DEFAULT_DTYPE_BITS);

FusionMetrics communicationAllToAll(ByteCount bytes_per_device);
FusionMetrics communicationAllReduce(ByteCount bytes_per_device);

}  // namespace afd_sim
