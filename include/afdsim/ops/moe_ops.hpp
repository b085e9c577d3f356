/*
 * Copyright (c) 2025 Lummy
 *
 * This software is released under the MIT License.
 * See the LICENSE file in the project root for full details.
 */
#pragma once

/**
 * @file moe_ops.hpp
 * @brief Mixture-of-experts fused ops
 * @version 0.1.0
 *
 * Routed load is tokens x experts_per_token, or tokens_per_expert x
 * num_experts when the runtime shape pins the per-expert load. Every op
 * yields zero work when experts_per_token is zero, and a FormulaDomain
 * error when experts_per_token exceeds num_experts.
 */

#include <span>

#include "afdsim/ops/fused_op.hpp"

namespace afdsim::ops {

inline constexpr std::string_view kMoeRouterGating = "moe_router_gating";
inline constexpr std::string_view kMoeTopkDispatch = "moe_topk_dispatch";
inline constexpr std::string_view kMoeExpertMatmul = "moe_expert_matmul";
inline constexpr std::string_view kMoeSharedExpert = "moe_shared_expert";
inline constexpr std::string_view kMoeDispatch = "moe_dispatch";
inline constexpr std::string_view kMoeCombine = "moe_combine";

/**
 * @brief Token-expert assignments processed by the routed experts
 */
[[nodiscard]] f64 moe_active_tokens(const OpShape& s, const model::RuntimeShape& r);

Result<f64> moe_router_gating_flops(const OpShape& s, const model::RuntimeShape& r);
Result<ByteCounts> moe_router_gating_bytes(const OpShape& s, const model::RuntimeShape& r);

Result<f64> moe_topk_dispatch_flops(const OpShape& s, const model::RuntimeShape& r);
Result<ByteCounts> moe_topk_dispatch_bytes(const OpShape& s, const model::RuntimeShape& r);

/**
 * @brief Up + activation + down over the routed load
 *
 * Weight traffic covers min(num_experts, active_tokens) experts, the most
 * that can be touched.
 */
Result<f64> moe_expert_matmul_flops(const OpShape& s, const model::RuntimeShape& r);
Result<ByteCounts> moe_expert_matmul_bytes(const OpShape& s, const model::RuntimeShape& r);

Result<f64> moe_shared_expert_flops(const OpShape& s, const model::RuntimeShape& r);
Result<ByteCounts> moe_shared_expert_bytes(const OpShape& s, const model::RuntimeShape& r);

/**
 * @brief All-to-all of routed activations to their experts, per routing group
 *
 * Dispatch and combine move the same volume in opposite directions.
 */
Result<f64> moe_all_to_all_flops(const OpShape& s, const model::RuntimeShape& r);
Result<ByteCounts> moe_all_to_all_bytes(const OpShape& s, const model::RuntimeShape& r);

std::span<const FusionOp> moe_ops() noexcept;

}  // namespace afdsim::ops
