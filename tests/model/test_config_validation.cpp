/**
 * @file test_config_validation.cpp
 * @brief Unit tests for hardware, runtime and layer config validation
 */

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <variant>

#include "afdsim/model/hardware_spec.hpp"
#include "afdsim/model/layer_config.hpp"
#include "afdsim/model/runtime_shape.hpp"

using namespace afdsim;
using namespace afdsim::model;

namespace {

HardwareSpec valid_hardware() {
  return HardwareSpec{
      .name = "h800",
      .peak_tflops = 989.0,
      .memory_bandwidth_gbps = 3350.0,
      .hbm_gb = 80.0,
      .interconnect_gbps = 400.0,
  };
}

AttentionConfig valid_attention() {
  return AttentionConfig{.d_model = 4096, .num_heads = 32};
}

}  // namespace

// ============================================================================
// HardwareSpec
// ============================================================================

TEST(HardwareSpecTest, ValidSpec) {
  auto hw = valid_hardware();
  EXPECT_TRUE(hw.validate());
  EXPECT_DOUBLE_EQ(hw.peak_flops_per_second(), 989e12);
  EXPECT_DOUBLE_EQ(hw.memory_bytes_per_second(), 3350e9);
}

TEST(HardwareSpecTest, RejectsNonPositiveThroughput) {
  auto hw = valid_hardware();
  hw.peak_tflops = 0.0;
  auto result = hw.validate();
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::ConfigValidation);

  hw = valid_hardware();
  hw.memory_bandwidth_gbps = -1.0;
  EXPECT_FALSE(hw.validate());

  hw = valid_hardware();
  hw.hbm_gb = std::numeric_limits<f64>::quiet_NaN();
  EXPECT_FALSE(hw.validate());
}

TEST(HardwareSpecTest, InterconnectMayBeZero) {
  auto hw = valid_hardware();
  hw.interconnect_gbps = 0.0;
  EXPECT_TRUE(hw.validate());

  hw.interconnect_gbps = -5.0;
  EXPECT_FALSE(hw.validate());
}

TEST(HardwareSpecTest, RejectsOutOfRangeKnobs) {
  auto hw = valid_hardware();
  hw.max_concurrency = 0;
  EXPECT_FALSE(hw.validate());

  hw = valid_hardware();
  hw.overlap_efficiency = 1.5;
  EXPECT_FALSE(hw.validate());

  hw = valid_hardware();
  hw.name.clear();
  EXPECT_FALSE(hw.validate());
}

// ============================================================================
// RuntimeShape
// ============================================================================

TEST(RuntimeShapeTest, TokensAndConcurrency) {
  RuntimeShape runtime{.batch_size = 8, .seq_len = 128};
  EXPECT_TRUE(runtime.validate());
  EXPECT_EQ(runtime.tokens(), 1024);
  EXPECT_EQ(runtime.concurrency_hint(), 1);

  runtime.micro_batch = 3;
  EXPECT_EQ(runtime.concurrency_hint(), 3);  // ceil(8 / 3)

  runtime.micro_batch = 4;
  EXPECT_EQ(runtime.concurrency_hint(), 2);
}

TEST(RuntimeShapeTest, ConcurrencyAtLargestBatch) {
  constexpr i32 kMax = std::numeric_limits<i32>::max();
  RuntimeShape runtime{.batch_size = kMax, .seq_len = 1, .micro_batch = 2};
  ASSERT_TRUE(runtime.validate());
  EXPECT_EQ(runtime.concurrency_hint(), kMax / 2 + 1);

  runtime.micro_batch = kMax;
  EXPECT_EQ(runtime.concurrency_hint(), 1);

  runtime.micro_batch = 1;
  EXPECT_EQ(runtime.concurrency_hint(), kMax);
}

TEST(RuntimeShapeTest, RejectsInvalidShape) {
  EXPECT_FALSE((RuntimeShape{.batch_size = 0, .seq_len = 1}).validate());
  EXPECT_FALSE((RuntimeShape{.batch_size = 1, .seq_len = 0}).validate());
  EXPECT_FALSE((RuntimeShape{.batch_size = 2, .seq_len = 1, .micro_batch = 4}).validate());
  EXPECT_FALSE(
      (RuntimeShape{.batch_size = 2, .seq_len = 1, .tokens_per_expert = -1.0}).validate());
}

// ============================================================================
// Layer configs
// ============================================================================

TEST(AttentionConfigTest, DerivedDims) {
  AttentionConfig attn{.d_model = 4096, .num_heads = 32, .num_kv_heads = 8};
  EXPECT_TRUE(attn.validate());
  EXPECT_EQ(attn.resolved_head_dim(), 128);
  EXPECT_EQ(attn.resolved_kv_heads(), 8);
  EXPECT_EQ(attn.q_dim(), 4096);
  EXPECT_EQ(attn.kv_dim(), 1024);

  attn.num_kv_heads = 0;
  EXPECT_EQ(attn.resolved_kv_heads(), 32);
}

TEST(AttentionConfigTest, RejectsBadGeometry) {
  EXPECT_FALSE((AttentionConfig{.d_model = 0, .num_heads = 8}).validate());
  EXPECT_FALSE((AttentionConfig{.d_model = 4096, .num_heads = 0}).validate());
  EXPECT_FALSE((AttentionConfig{.d_model = 100, .num_heads = 3}).validate());
  EXPECT_FALSE((AttentionConfig{.d_model = 4096, .num_heads = 32, .num_kv_heads = 5})
                   .validate());

  // Explicit head_dim lifts the divisibility requirement
  EXPECT_TRUE((AttentionConfig{.d_model = 100, .num_heads = 3, .head_dim = 64}).validate());
}

TEST(LayerConfigTest, TypeFollowsPayload) {
  auto attn = LayerConfig::attention_layer("attn0", 0, valid_attention());
  auto ffn = LayerConfig::ffn_layer("ffn0", 1, FFNConfig{.d_model = 4096, .d_ff = 11008});
  auto moe = LayerConfig::moe_layer("moe0", 2, MoEConfig{.expert_intermediate = 1408},
                                    valid_attention());
  auto comm = LayerConfig::communication_layer("a2a", 3, CommunicationConfig{});

  EXPECT_EQ(attn.type(), LayerType::Attention);
  EXPECT_EQ(ffn.type(), LayerType::FFN);
  EXPECT_EQ(moe.type(), LayerType::MoE);
  EXPECT_EQ(comm.type(), LayerType::Communication);
  EXPECT_EQ(ffn.as<FFNConfig>().d_ff, 11008);
}

TEST(LayerConfigTest, WrongPayloadAccessThrows) {
  auto ffn = LayerConfig::ffn_layer("ffn0", 0, FFNConfig{.d_model = 64, .d_ff = 256});
  EXPECT_THROW((void)ffn.as<MoEConfig>(), std::bad_variant_access);
}

TEST(LayerConfigTest, ValidationNamesLayer) {
  auto moe = LayerConfig::moe_layer(
      "moe7", 7, MoEConfig{.expert_intermediate = 1408, .num_experts = 4, .experts_per_token = 8});
  auto result = moe.validate();
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::ConfigValidation);
  EXPECT_NE(result.error().message().find("moe7"), std::string::npos);
}

TEST(LayerConfigTest, ZeroExpertsRoutedIsValid) {
  auto moe = LayerConfig::moe_layer(
      "moe0", 0, MoEConfig{.expert_intermediate = 1408, .num_experts = 0, .experts_per_token = 0});
  EXPECT_TRUE(moe.validate());
}

TEST(LayerConfigTest, AttentionKvCacheMustBeNonNegative) {
  auto attn = LayerConfig::attention_layer("attn0", 0, valid_attention(),
                                           AttentionPayload{.kv_cache_len = -1});
  EXPECT_FALSE(attn.validate());
}

TEST(LayerConfigTest, CommunicationPayloadChecks) {
  auto comm = LayerConfig::communication_layer(
      "ar", 0, CommunicationConfig{.pattern = CommPattern::AllReduce, .payload_mb = -1.0});
  EXPECT_FALSE(comm.validate());
}

// ============================================================================
// Enum parsing
// ============================================================================

TEST(EnumParseTest, Activation) {
  EXPECT_EQ(parse_activation("swiglu").value(), Activation::SwiGLU);
  EXPECT_EQ(parse_activation("swish").value(), Activation::Silu);
  EXPECT_TRUE(is_gated(Activation::GeGLU));
  EXPECT_FALSE(is_gated(Activation::Gelu));

  auto bad = parse_activation("tanh");
  ASSERT_FALSE(bad);
  EXPECT_EQ(bad.error().code(), ErrorCode::ConfigValidation);
}

TEST(EnumParseTest, CommPattern) {
  EXPECT_EQ(parse_comm_pattern("all_reduce").value(), CommPattern::AllReduce);
  EXPECT_EQ(comm_pattern_str(CommPattern::ReduceScatter), "reduce_scatter");
  EXPECT_FALSE(parse_comm_pattern("broadcast"));
}
