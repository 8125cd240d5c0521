// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: © 2025 Tenstorrent AI ULC

#include "afdFusedOps.hpp"

#include "afdMetrics.hpp"

namespace afd_sim {

FusionMetrics attentionQKVProjections(
    int64_t batch, int64_t seq, int64_t d_model, int64_t qkv_dim, DTypeBits dtype_bits) {
    int64_t tokens = batch * seq;
    FlopCount flops = 3.0 * matmulFlops(tokens, qkv_dim, d_model);
    ByteCount input_bytes = tensorBytes({batch, seq, d_model}, dtype_bits);
    ByteCount weight_bytes = tensorBytes({d_model, qkv_dim}, dtype_bits) * 3;
    ByteCount output_bytes = tensorBytes({batch, seq, qkv_dim}, dtype_bits) * 3;
    return {"attention_qkv_proj", flops, input_bytes + weight_bytes + output_bytes};
}

FusionMetrics attentionScores(
    int64_t batch, int64_t seq, int64_t num_heads, int64_t head_dim, DTypeBits dtype_bits) {
    FlopCount qk_flops = matmulFlops(seq, seq, head_dim) * batch * num_heads;
    FlopCount softmax_flops = double(batch) * num_heads * seq * seq;
    ByteCount total_bytes = sumTensorBytes(
        {{batch, num_heads, seq, head_dim},  // Q
         {batch, num_heads, seq, head_dim},  // K
         {batch, num_heads, seq, seq}},
        dtype_bits);
    return {"attention_scores", qk_flops + softmax_flops, total_bytes};
}

FusionMetrics attentionWeightedSum(
    int64_t batch, int64_t seq, int64_t num_heads, int64_t head_dim, DTypeBits dtype_bits) {
    FlopCount flops = matmulFlops(seq, head_dim, seq) * batch * num_heads;
    ByteCount total_bytes = sumTensorBytes(
        {{batch, num_heads, seq, seq},
         {batch, num_heads, seq, head_dim},  // V
         {batch, seq, num_heads * head_dim}},
        dtype_bits);
    return {"attention_weighted_sum", flops, total_bytes};
}

FusionMetrics attentionOutputProjection(
    int64_t batch, int64_t seq, int64_t d_model, int64_t qkv_dim, DTypeBits dtype_bits) {
    int64_t tokens = batch * seq;
    FlopCount flops = matmulFlops(tokens, d_model, qkv_dim);
    ByteCount total_bytes = sumTensorBytes(
        {{batch, seq, qkv_dim}, {qkv_dim, d_model}, {batch, seq, d_model}}, dtype_bits);
    return {"attention_output_proj", flops, total_bytes};
}

FusionMetrics ffnActivation(
    int64_t batch, int64_t seq, int64_t d_model, int64_t hidden_dim, DTypeBits dtype_bits) {
    int64_t tokens = batch * seq;
    FlopCount up_flops = matmulFlops(tokens, hidden_dim, d_model);
    FlopCount down_flops = matmulFlops(tokens, d_model, hidden_dim);
    FlopCount activation_flops = double(tokens) * hidden_dim;

    ByteCount input_bytes = tensorBytes({batch, seq, d_model}, dtype_bits);
    ByteCount hidden_bytes = tensorBytes({batch, seq, hidden_dim}, dtype_bits) * 2;
    ByteCount weight_bytes =
        sumTensorBytes({{d_model, hidden_dim}, {hidden_dim, d_model}}, dtype_bits);
    return {
        "ffn", up_flops + down_flops + activation_flops, input_bytes + hidden_bytes + weight_bytes};
}

FusionMetrics moeRouting(
    int64_t batch, int64_t seq, int64_t num_experts, int64_t top_k, DTypeBits dtype_bits) {
    int64_t tokens = batch * seq;
    FlopCount gate_flops = double(tokens) * num_experts;
    FlopCount select_flops = double(tokens) * top_k;
    ByteCount gate_bytes = tensorBytes({tokens, num_experts}, dtype_bits);
    return {"moe_routing", gate_flops + select_flops, gate_bytes};
}

FusionMetrics moeExpertForward(
    int64_t active_tokens, int64_t d_model, int64_t expert_hidden, DTypeBits dtype_bits) {
    FlopCount up_flops = matmulFlops(active_tokens, expert_hidden, d_model);
    FlopCount down_flops = matmulFlops(active_tokens, d_model, expert_hidden);
    FlopCount activation_flops = double(active_tokens) * expert_hidden;

    ByteCount total_bytes = sumTensorBytes(
        {{active_tokens, d_model},
         {active_tokens, expert_hidden},
         {d_model, expert_hidden},
         {expert_hidden, d_model}},
        dtype_bits);
    return {"moe_expert", up_flops + down_flops + activation_flops, total_bytes};
}

FusionMetrics communicationAllToAll(ByteCount bytes_per_device) {
    return {"all_to_all", 0.0, bytes_per_device};
}

FusionMetrics communicationAllReduce(ByteCount bytes_per_device) {
    return {"all_reduce", 0.0, bytes_per_device};
}

}  // namespace afd_sim
