/**
 * @file test_moe_ops.cpp
 * @brief Unit tests for the MoE fused op formulas
 */

#include <gtest/gtest.h>

#include "afdsim/ops/moe_ops.hpp"

using namespace afdsim;
using namespace afdsim::ops;

namespace {

// d_model 512, expert intermediate 1024, 8 experts, top-2, 2 groups, 1 shared
OpShape moe_shape() {
  return OpShape::from_layer(model::LayerConfig::moe_layer(
      "moe0", 0,
      model::MoEConfig{.d_model = 512,
                       .expert_intermediate = 1024,
                       .num_experts = 8,
                       .experts_per_token = 2,
                       .num_groups = 2,
                       .num_shared_experts = 1}));
}

const model::RuntimeShape kRuntime{.batch_size = 4, .seq_len = 8};  // 32 tokens

}  // namespace

// ============================================================================
// Routing
// ============================================================================

TEST(MoEOpsTest, RouterAndTopk) {
  const OpShape s = moe_shape();
  EXPECT_DOUBLE_EQ(moe_router_gating_flops(s, kRuntime).value(), 2.0 * 32.0 * 8.0 * 512.0);
  EXPECT_DOUBLE_EQ(moe_topk_dispatch_flops(s, kRuntime).value(), 32.0 * 8.0 + 32.0 * 2.0);

  auto router = moe_router_gating_bytes(s, kRuntime).value();
  EXPECT_DOUBLE_EQ(router.read, (32.0 * 512.0 + 512.0 * 8.0) * 2.0);
  EXPECT_DOUBLE_EQ(router.written, 32.0 * 8.0 * 2.0);
}

TEST(MoEOpsTest, ActiveTokens) {
  const OpShape s = moe_shape();
  EXPECT_DOUBLE_EQ(moe_active_tokens(s, kRuntime), 64.0);  // tokens * k

  model::RuntimeShape skewed = kRuntime;
  skewed.tokens_per_expert = 3.0;
  EXPECT_DOUBLE_EQ(moe_active_tokens(s, skewed), 24.0);  // per-expert load * E
}

// ============================================================================
// Experts
// ============================================================================

TEST(MoEOpsTest, ExpertMatmul) {
  const OpShape s = moe_shape();
  const f64 active = 64.0;

  EXPECT_DOUBLE_EQ(moe_expert_matmul_flops(s, kRuntime).value(),
                   2.0 * 2.0 * active * 1024.0 * 512.0 + active * 1024.0);

  auto bytes = moe_expert_matmul_bytes(s, kRuntime).value();
  const f64 weights = 8.0 * 2.0 * 512.0 * 1024.0 * 2.0;  // every expert touched
  EXPECT_DOUBLE_EQ(bytes.read, active * 512.0 * 2.0 + weights);
  EXPECT_DOUBLE_EQ(bytes.written, active * 512.0 * 2.0);
}

TEST(MoEOpsTest, ExpertWeightsLimitedByActiveTokens) {
  const OpShape s = moe_shape();
  const model::RuntimeShape single{.batch_size = 1, .seq_len = 1};  // 2 active rows

  auto bytes = moe_expert_matmul_bytes(s, single).value();
  EXPECT_DOUBLE_EQ(bytes.read, 2.0 * 512.0 * 2.0 + 2.0 * (2.0 * 512.0 * 1024.0 * 2.0));
}

TEST(MoEOpsTest, SharedExpertsSeeEveryToken) {
  const OpShape s = moe_shape();
  const f64 per_expert = 2.0 * 2.0 * 32.0 * 1024.0 * 512.0 + 32.0 * 1024.0;
  EXPECT_DOUBLE_EQ(moe_shared_expert_flops(s, kRuntime).value(), per_expert);

  OpShape none = s;
  none.num_shared_experts = 0;
  EXPECT_DOUBLE_EQ(moe_shared_expert_flops(none, kRuntime).value(), 0.0);
}

// ============================================================================
// Dispatch / combine
// ============================================================================

TEST(MoEOpsTest, DispatchDividedByGroups) {
  OpShape s = moe_shape();
  auto grouped = moe_all_to_all_bytes(s, kRuntime).value();
  EXPECT_DOUBLE_EQ(grouped.read, 64.0 * 512.0 * 2.0 / 2.0);
  EXPECT_DOUBLE_EQ(grouped.written, grouped.read);
  EXPECT_DOUBLE_EQ(moe_all_to_all_flops(s, kRuntime).value(), 0.0);

  s.num_groups = 1;
  EXPECT_DOUBLE_EQ(moe_all_to_all_bytes(s, kRuntime).value().read, 2.0 * grouped.read);
}

TEST(MoEOpsTest, DispatchOpsUseInterconnect) {
  for (const FusionOp& op : moe_ops()) {
    const bool expected = op.name == kMoeDispatch || op.name == kMoeCombine;
    EXPECT_EQ(op.over_interconnect, expected) << op.name;
  }
}

// ============================================================================
// Edge cases
// ============================================================================

TEST(MoEOpsTest, ZeroExpertsRoutedYieldsZero) {
  OpShape s = moe_shape();
  s.experts_per_token = 0;

  for (const FusionOp& op : moe_ops()) {
    auto cost = op.evaluate(s, kRuntime);
    ASSERT_TRUE(cost) << op.name;
    EXPECT_DOUBLE_EQ(cost.value().flops, 0.0) << op.name;
    EXPECT_DOUBLE_EQ(cost.value().bytes_moved(), 0.0) << op.name;
  }
}

TEST(MoEOpsTest, NoExpertsAtAllYieldsZero) {
  OpShape s = moe_shape();
  s.num_experts = 0;
  s.experts_per_token = 0;

  for (const FusionOp& op : moe_ops()) {
    auto cost = op.evaluate(s, kRuntime);
    ASSERT_TRUE(cost) << op.name;
    EXPECT_DOUBLE_EQ(cost.value().flops, 0.0) << op.name;
  }
}

TEST(MoEOpsTest, MoreExpertsPerTokenThanExpertsIsDomainError) {
  OpShape s = moe_shape();
  s.experts_per_token = 9;

  for (const FusionOp& op : moe_ops()) {
    auto cost = op.evaluate(s, kRuntime);
    ASSERT_FALSE(cost) << op.name;
    EXPECT_EQ(cost.error().code(), ErrorCode::FormulaDomain) << op.name;
  }
}
