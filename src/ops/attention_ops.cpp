/*
 * Copyright (c) 2025 Lummy
 *
 * This software is released under the MIT License.
 * See the LICENSE file in the project root for full details.
 */

#include "afdsim/ops/attention_ops.hpp"

namespace afdsim::ops {

namespace {

struct AttnDims {
  f64 batch;
  f64 seq;
  f64 tokens;
  f64 kv_len;
  f64 d_model;
  f64 heads;
  f64 head_dim;
  f64 q_dim;
  f64 kv_dim;
};

AttnDims dims_of(const OpShape& s, const model::RuntimeShape& r) {
  const f64 batch = static_cast<f64>(r.batch_size);
  const f64 seq = static_cast<f64>(r.seq_len);
  return AttnDims{
      .batch = batch,
      .seq = seq,
      .tokens = batch * seq,
      .kv_len = static_cast<f64>(s.kv_cache_len) + seq,
      .d_model = static_cast<f64>(s.d_model),
      .heads = static_cast<f64>(s.num_heads),
      .head_dim = static_cast<f64>(s.head_dim),
      .q_dim = static_cast<f64>(s.q_dim()),
      .kv_dim = static_cast<f64>(s.kv_dim()),
  };
}

}  // namespace

// ============================================================================
// QKV projection
// ============================================================================

Result<f64> attention_qkv_proj_flops(const OpShape& s, const model::RuntimeShape& r) {
  const AttnDims a = dims_of(s, r);
  return Ok(matmul_flops(a.tokens, a.q_dim + 2.0 * a.kv_dim, a.d_model));
}

Result<ByteCounts> attention_qkv_proj_bytes(const OpShape& s,
                                            const model::RuntimeShape& r) {
  const AttnDims a = dims_of(s, r);
  const f64 out_width = a.q_dim + 2.0 * a.kv_dim;
  return Ok(ByteCounts{
      .read = tensor_bytes(a.tokens, a.d_model, s.dtype_bits) +
              tensor_bytes(a.d_model, out_width, s.dtype_bits),
      .written = tensor_bytes(a.tokens, out_width, s.dtype_bits),
  });
}

// ============================================================================
// Scores / softmax / weighted sum
// ============================================================================

Result<f64> attention_scores_flops(const OpShape& s, const model::RuntimeShape& r) {
  const AttnDims a = dims_of(s, r);
  return Ok(a.batch * a.heads * matmul_flops(a.seq, a.kv_len, a.head_dim));
}

Result<ByteCounts> attention_scores_bytes(const OpShape& s,
                                          const model::RuntimeShape& r) {
  const AttnDims a = dims_of(s, r);
  const f64 q_bytes = tensor_bytes(a.tokens, a.q_dim, s.dtype_bits);
  const f64 k_bytes = tensor_bytes(a.batch * a.kv_len, a.kv_dim, s.dtype_bits);
  return Ok(ByteCounts{
      .read = q_bytes + k_bytes,
      .written = tensor_bytes(a.batch * a.heads * a.seq, a.kv_len, s.dtype_bits),
  });
}

Result<f64> attention_softmax_flops(const OpShape& s, const model::RuntimeShape& r) {
  const AttnDims a = dims_of(s, r);
  return Ok(a.batch * a.heads * a.seq * a.kv_len);
}

Result<ByteCounts> attention_softmax_bytes(const OpShape& s,
                                           const model::RuntimeShape& r) {
  const AttnDims a = dims_of(s, r);
  const f64 scores = tensor_bytes(a.batch * a.heads * a.seq, a.kv_len, s.dtype_bits);
  return Ok(ByteCounts{.read = scores, .written = scores});
}

Result<f64> attention_weighted_sum_flops(const OpShape& s,
                                         const model::RuntimeShape& r) {
  const AttnDims a = dims_of(s, r);
  return Ok(a.batch * a.heads * matmul_flops(a.seq, a.head_dim, a.kv_len));
}

Result<ByteCounts> attention_weighted_sum_bytes(const OpShape& s,
                                                const model::RuntimeShape& r) {
  const AttnDims a = dims_of(s, r);
  const f64 probs = tensor_bytes(a.batch * a.heads * a.seq, a.kv_len, s.dtype_bits);
  const f64 v_bytes = tensor_bytes(a.batch * a.kv_len, a.kv_dim, s.dtype_bits);
  return Ok(ByteCounts{
      .read = probs + v_bytes,
      .written = tensor_bytes(a.tokens, a.q_dim, s.dtype_bits),
  });
}

// ============================================================================
// Output projection
// ============================================================================

Result<f64> attention_output_proj_flops(const OpShape& s,
                                        const model::RuntimeShape& r) {
  const AttnDims a = dims_of(s, r);
  return Ok(matmul_flops(a.tokens, a.d_model, a.q_dim));
}

Result<ByteCounts> attention_output_proj_bytes(const OpShape& s,
                                               const model::RuntimeShape& r) {
  const AttnDims a = dims_of(s, r);
  return Ok(ByteCounts{
      .read = tensor_bytes(a.tokens, a.q_dim, s.dtype_bits) +
              tensor_bytes(a.q_dim, a.d_model, s.dtype_bits),
      .written = tensor_bytes(a.tokens, a.d_model, s.dtype_bits),
  });
}

// ============================================================================
// Registry entries
// ============================================================================

std::span<const FusionOp> attention_ops() noexcept {
  static const FusionOp kOps[] = {
      {kAttentionQkvProj, LayerType::Attention, &attention_qkv_proj_flops,
       &attention_qkv_proj_bytes, "Fused Q/K/V GEMM; K and V sized by num_kv_heads"},
      {kAttentionScores, LayerType::Attention, &attention_scores_flops,
       &attention_scores_bytes, "Q x K^T over kv_cache_len + seq_len keys"},
      {kAttentionSoftmax, LayerType::Attention, &attention_softmax_flops,
       &attention_softmax_bytes, "One FLOP per score element"},
      {kAttentionWeightedSum, LayerType::Attention, &attention_weighted_sum_flops,
       &attention_weighted_sum_bytes, "Probabilities x V"},
      {kAttentionOutputProj, LayerType::Attention, &attention_output_proj_flops,
       &attention_output_proj_bytes, "Head concat back to d_model"},
  };
  return kOps;
}

}  // namespace afdsim::ops
