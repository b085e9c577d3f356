/*
 * Copyright (c) 2025 Lummy
 *
 * This software is released under the MIT License.
 * See the LICENSE file in the project root for full details.
 */

#include "afdsim/ops/ffn_ops.hpp"

namespace afdsim::ops {

namespace {

f64 tokens_of(const model::RuntimeShape& r) {
  return static_cast<f64>(r.tokens());
}

}  // namespace

Result<f64> ffn_up_proj_flops(const OpShape& s, const model::RuntimeShape& r) {
  return Ok(matmul_flops(tokens_of(r), static_cast<f64>(s.d_ff),
                         static_cast<f64>(s.d_model)));
}

Result<ByteCounts> ffn_up_proj_bytes(const OpShape& s, const model::RuntimeShape& r) {
  const f64 t = tokens_of(r);
  const f64 d = static_cast<f64>(s.d_model);
  const f64 ff = static_cast<f64>(s.d_ff);
  return Ok(ByteCounts{
      .read = tensor_bytes(t, d, s.dtype_bits) + tensor_bytes(d, ff, s.dtype_bits),
      .written = tensor_bytes(t, ff, s.dtype_bits),
  });
}

Result<f64> ffn_gate_proj_flops(const OpShape& s, const model::RuntimeShape& r) {
  if (!s.gated) {
    return Ok(0.0);
  }
  return ffn_up_proj_flops(s, r);
}

Result<ByteCounts> ffn_gate_proj_bytes(const OpShape& s, const model::RuntimeShape& r) {
  if (!s.gated) {
    return Ok(ByteCounts{});
  }
  return ffn_up_proj_bytes(s, r);
}

Result<f64> ffn_activation_flops(const OpShape& s, const model::RuntimeShape& r) {
  const f64 hidden = tokens_of(r) * static_cast<f64>(s.d_ff);
  return Ok(s.gated ? 2.0 * hidden : hidden);
}

Result<ByteCounts> ffn_activation_bytes(const OpShape& s, const model::RuntimeShape& r) {
  const f64 hidden = tensor_bytes(tokens_of(r), static_cast<f64>(s.d_ff), s.dtype_bits);
  return Ok(ByteCounts{
      .read = s.gated ? 2.0 * hidden : hidden,
      .written = hidden,
  });
}

Result<f64> ffn_down_proj_flops(const OpShape& s, const model::RuntimeShape& r) {
  return Ok(matmul_flops(tokens_of(r), static_cast<f64>(s.d_model),
                         static_cast<f64>(s.d_ff)));
}

Result<ByteCounts> ffn_down_proj_bytes(const OpShape& s, const model::RuntimeShape& r) {
  const f64 t = tokens_of(r);
  const f64 d = static_cast<f64>(s.d_model);
  const f64 ff = static_cast<f64>(s.d_ff);
  return Ok(ByteCounts{
      .read = tensor_bytes(t, ff, s.dtype_bits) + tensor_bytes(ff, d, s.dtype_bits),
      .written = tensor_bytes(t, d, s.dtype_bits),
  });
}

std::span<const FusionOp> ffn_ops() noexcept {
  static const FusionOp kOps[] = {
      {kFfnUpProj, LayerType::FFN, &ffn_up_proj_flops, &ffn_up_proj_bytes,
       "[T, d] x [d, d_ff]"},
      {kFfnGateProj, LayerType::FFN, &ffn_gate_proj_flops, &ffn_gate_proj_bytes,
       "Only for swiglu/geglu"},
      {kFfnActivation, LayerType::FFN, &ffn_activation_flops, &ffn_activation_bytes,
       "One FLOP per hidden element, two when gated"},
      {kFfnDownProj, LayerType::FFN, &ffn_down_proj_flops, &ffn_down_proj_bytes,
       "[T, d_ff] x [d_ff, d]"},
  };
  return kOps;
}

}  // namespace afdsim::ops
