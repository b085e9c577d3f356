/*
 * Copyright (c) 2025 Lummy
 *
 * This software is released under the MIT License.
 * See the LICENSE file in the project root for full details.
 */

#include "afdsim/ops/moe_ops.hpp"

#include <algorithm>

namespace afdsim::ops {

namespace {

Result<void> check_routing(const OpShape& s) {
  if (s.experts_per_token > s.num_experts) {
    return Err<void>(ErrorCode::FormulaDomain,
                     "cannot route to " + std::to_string(s.experts_per_token) +
                         " experts per token with only " +
                         std::to_string(s.num_experts) + " experts");
  }
  return Ok();
}

bool routes_nothing(const OpShape& s) { return s.experts_per_token == 0; }

f64 tokens_of(const model::RuntimeShape& r) {
  return static_cast<f64>(r.tokens());
}

}  // namespace

f64 moe_active_tokens(const OpShape& s, const model::RuntimeShape& r) {
  if (routes_nothing(s)) {
    return 0.0;
  }
  if (r.tokens_per_expert.has_value()) {
    return *r.tokens_per_expert * static_cast<f64>(s.num_experts);
  }
  return tokens_of(r) * static_cast<f64>(s.experts_per_token);
}

// ============================================================================
// Routing
// ============================================================================

Result<f64> moe_router_gating_flops(const OpShape& s, const model::RuntimeShape& r) {
  auto check = check_routing(s);
  if (!check) return Err<f64>(std::move(check.error()));
  if (routes_nothing(s)) return Ok(0.0);

  return Ok(matmul_flops(tokens_of(r), static_cast<f64>(s.num_experts),
                         static_cast<f64>(s.d_model)));
}

Result<ByteCounts> moe_router_gating_bytes(const OpShape& s,
                                           const model::RuntimeShape& r) {
  auto check = check_routing(s);
  if (!check) return Err<ByteCounts>(std::move(check.error()));
  if (routes_nothing(s)) return Ok(ByteCounts{});

  const f64 t = tokens_of(r);
  const f64 d = static_cast<f64>(s.d_model);
  const f64 e = static_cast<f64>(s.num_experts);
  return Ok(ByteCounts{
      .read = tensor_bytes(t, d, s.dtype_bits) + tensor_bytes(d, e, s.dtype_bits),
      .written = tensor_bytes(t, e, s.dtype_bits),
  });
}

Result<f64> moe_topk_dispatch_flops(const OpShape& s, const model::RuntimeShape& r) {
  auto check = check_routing(s);
  if (!check) return Err<f64>(std::move(check.error()));
  if (routes_nothing(s)) return Ok(0.0);

  // One compare per gating score, one normalize per selected expert
  const f64 t = tokens_of(r);
  return Ok(t * static_cast<f64>(s.num_experts) +
            t * static_cast<f64>(s.experts_per_token));
}

Result<ByteCounts> moe_topk_dispatch_bytes(const OpShape& s,
                                           const model::RuntimeShape& r) {
  auto check = check_routing(s);
  if (!check) return Err<ByteCounts>(std::move(check.error()));
  if (routes_nothing(s)) return Ok(ByteCounts{});

  const f64 t = tokens_of(r);
  // Selected indices plus their combine weights
  return Ok(ByteCounts{
      .read = tensor_bytes(t, static_cast<f64>(s.num_experts), s.dtype_bits),
      .written = 2.0 * tensor_bytes(t, static_cast<f64>(s.experts_per_token),
                                    s.dtype_bits),
  });
}

// ============================================================================
// Experts
// ============================================================================

Result<f64> moe_expert_matmul_flops(const OpShape& s, const model::RuntimeShape& r) {
  auto check = check_routing(s);
  if (!check) return Err<f64>(std::move(check.error()));

  const f64 active = moe_active_tokens(s, r);
  const f64 d = static_cast<f64>(s.d_model);
  const f64 h = static_cast<f64>(s.d_ff);
  return Ok(matmul_flops(active, h, d) + matmul_flops(active, d, h) + active * h);
}

Result<ByteCounts> moe_expert_matmul_bytes(const OpShape& s,
                                           const model::RuntimeShape& r) {
  auto check = check_routing(s);
  if (!check) return Err<ByteCounts>(std::move(check.error()));

  const f64 active = moe_active_tokens(s, r);
  const f64 d = static_cast<f64>(s.d_model);
  const f64 h = static_cast<f64>(s.d_ff);
  const f64 experts_touched = std::min(static_cast<f64>(s.num_experts), active);
  const f64 weights_per_expert = 2.0 * tensor_bytes(d, h, s.dtype_bits);
  return Ok(ByteCounts{
      .read = tensor_bytes(active, d, s.dtype_bits) + experts_touched * weights_per_expert,
      .written = tensor_bytes(active, d, s.dtype_bits),
  });
}

Result<f64> moe_shared_expert_flops(const OpShape& s, const model::RuntimeShape& r) {
  auto check = check_routing(s);
  if (!check) return Err<f64>(std::move(check.error()));
  if (routes_nothing(s) || s.num_shared_experts == 0) return Ok(0.0);

  const f64 t = tokens_of(r);
  const f64 d = static_cast<f64>(s.d_model);
  const f64 h = static_cast<f64>(s.d_ff);
  const f64 per_expert = matmul_flops(t, h, d) + matmul_flops(t, d, h) + t * h;
  return Ok(static_cast<f64>(s.num_shared_experts) * per_expert);
}

Result<ByteCounts> moe_shared_expert_bytes(const OpShape& s,
                                           const model::RuntimeShape& r) {
  auto check = check_routing(s);
  if (!check) return Err<ByteCounts>(std::move(check.error()));
  if (routes_nothing(s) || s.num_shared_experts == 0) return Ok(ByteCounts{});

  const f64 t = tokens_of(r);
  const f64 d = static_cast<f64>(s.d_model);
  const f64 h = static_cast<f64>(s.d_ff);
  const f64 weights = static_cast<f64>(s.num_shared_experts) * 2.0 *
                      tensor_bytes(d, h, s.dtype_bits);
  return Ok(ByteCounts{
      .read = tensor_bytes(t, d, s.dtype_bits) + weights,
      .written = tensor_bytes(t, d, s.dtype_bits),
  });
}

// ============================================================================
// Expert-parallel traffic
// ============================================================================

Result<f64> moe_all_to_all_flops(const OpShape& s, const model::RuntimeShape& r) {
  (void)r;
  auto check = check_routing(s);
  if (!check) return Err<f64>(std::move(check.error()));
  return Ok(0.0);
}

Result<ByteCounts> moe_all_to_all_bytes(const OpShape& s, const model::RuntimeShape& r) {
  auto check = check_routing(s);
  if (!check) return Err<ByteCounts>(std::move(check.error()));

  const f64 groups = static_cast<f64>(std::max<i64>(s.num_groups, 1));
  const f64 per_device =
      tensor_bytes(moe_active_tokens(s, r), static_cast<f64>(s.d_model), s.dtype_bits) /
      groups;
  return Ok(ByteCounts{.read = per_device, .written = per_device});
}

std::span<const FusionOp> moe_ops() noexcept {
  static const FusionOp kOps[] = {
      {kMoeRouterGating, LayerType::MoE, &moe_router_gating_flops,
       &moe_router_gating_bytes, "[T, d] x [d, num_experts] gating logits"},
      {kMoeTopkDispatch, LayerType::MoE, &moe_topk_dispatch_flops,
       &moe_topk_dispatch_bytes, "Top-k selection over gating logits"},
      {kMoeDispatch, LayerType::MoE, &moe_all_to_all_flops, &moe_all_to_all_bytes,
       "All-to-all to experts, divided by num_groups", true},
      {kMoeExpertMatmul, LayerType::MoE, &moe_expert_matmul_flops,
       &moe_expert_matmul_bytes, "Routed experts: up, activation, down"},
      {kMoeSharedExpert, LayerType::MoE, &moe_shared_expert_flops,
       &moe_shared_expert_bytes, "Always-on experts over every token"},
      {kMoeCombine, LayerType::MoE, &moe_all_to_all_flops, &moe_all_to_all_bytes,
       "All-to-all back to token owners", true},
  };
  return kOps;
}

}  // namespace afdsim::ops
