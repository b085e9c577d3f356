/**
 * @file test_backend.cpp
 * @brief Unit tests for the estimator backends and analytic fallback
 */

#include <gtest/gtest.h>

#include <memory>

#include "afdsim/estimation/backend.hpp"

using namespace afdsim;
using namespace afdsim::estimation;

namespace {

model::HardwareSpec test_hardware() {
  return model::HardwareSpec{
      .name = "h100",
      .peak_tflops = 989.0,
      .memory_bandwidth_gbps = 3350.0,
      .hbm_gb = 80.0,
      .interconnect_gbps = 450.0,
  };
}

model::LayerConfig ffn_layer() {
  return model::LayerConfig::ffn_layer(
      "ffn0", 0,
      model::FFNConfig{.d_model = 4096, .d_ff = 14336, .activation = model::Activation::SwiGLU});
}

const model::RuntimeShape kRuntime{.batch_size = 4, .seq_len = 512};

/**
 * @brief Regressor for FFN layers: compute = c, memory = m (constant)
 */
std::shared_ptr<const LatencyRegressor> constant_regressor(f64 compute_ms, f64 memory_ms) {
  auto regressor = std::make_shared<LatencyRegressor>();
  LinearLatencyModel model;
  model.feature_names = {"flops"};
  model.weights.setZero(2, 1);
  model.bias << compute_ms, memory_ms;
  EXPECT_TRUE(regressor->set_model(LayerType::FFN, std::move(model)));
  return regressor;
}

class FailingBackend final : public EstimatorBackend {
 public:
  explicit FailingBackend(ErrorCode code) : code_(code) {}

  std::string_view name() const noexcept override { return "failing"; }

  Result<LayerExecution> estimate(const model::LayerConfig&, const model::RuntimeShape&,
                                  const model::HardwareSpec&) const override {
    return Err<LayerExecution>(code_, "primary failed");
  }

 private:
  ErrorCode code_;
};

class BackendTest : public ::testing::Test {
 protected:
  ops::FusedOpLibrary library_ = ops::FusedOpLibrary::standard();
  AnalyticBackend analytic_{library_};
};

}  // namespace

// ============================================================================
// Analytic
// ============================================================================

TEST_F(BackendTest, AnalyticTagsMetadata) {
  auto exec = analytic_.estimate(ffn_layer(), kRuntime, test_hardware());
  ASSERT_TRUE(exec) << exec.error().to_string();
  EXPECT_EQ(exec.value().metadata.at(kMetaBackend), "analytic");
  EXPECT_EQ(exec.value().metadata.count(kMetaFallbackReason), 0u);
}

TEST_F(BackendTest, AnalyticPropagatesValidationErrors) {
  auto layer = model::LayerConfig::moe_layer(
      "moe", 0,
      model::MoEConfig{.d_model = 1024, .expert_intermediate = 512, .num_experts = 2,
                       .experts_per_token = 3});
  auto exec = analytic_.estimate(layer, kRuntime, test_hardware());
  ASSERT_FALSE(exec);
  EXPECT_EQ(exec.error().code(), ErrorCode::ConfigValidation);
}

// ============================================================================
// Machine-learned
// ============================================================================

TEST_F(BackendTest, LearnedWithoutModelIsUnavailable) {
  MachineLearnedBackend learned(library_, nullptr);
  EXPECT_FALSE(learned.is_loaded());

  auto exec = learned.estimate(ffn_layer(), kRuntime, test_hardware());
  ASSERT_FALSE(exec);
  EXPECT_EQ(exec.error().code(), ErrorCode::BackendUnavailable);
}

TEST_F(BackendTest, LearnedOverridesTimesOnly) {
  auto reference = analytic_.estimate(ffn_layer(), kRuntime, test_hardware());
  ASSERT_TRUE(reference);
  const f64 analytic_ms = reference.value().dominant_latency_ms;

  MachineLearnedBackend learned(library_,
                                constant_regressor(analytic_ms * 1.5, analytic_ms * 0.5));
  auto exec = learned.estimate(ffn_layer(), kRuntime, test_hardware());
  ASSERT_TRUE(exec) << exec.error().to_string();
  const auto& e = exec.value();

  EXPECT_DOUBLE_EQ(e.compute_time_ms, analytic_ms * 1.5);
  EXPECT_DOUBLE_EQ(e.memory_time_ms, analytic_ms * 0.5);
  EXPECT_DOUBLE_EQ(e.dominant_latency_ms, analytic_ms * 1.5);
  EXPECT_EQ(e.estimated_execution_time_ms, e.dominant_latency_ms);
  EXPECT_EQ(e.metadata.at(kMetaBackend), "ml");

  // Work counts still come from the fused ops
  EXPECT_EQ(e.flops, reference.value().flops);
  EXPECT_EQ(e.bytes_read, reference.value().bytes_read);
  EXPECT_EQ(e.breakdown.size(), reference.value().breakdown.size());
}

TEST_F(BackendTest, LearnedWithoutLayerModelIsUnavailable) {
  MachineLearnedBackend learned(library_, constant_regressor(1.0, 1.0));
  auto layer = model::LayerConfig::communication_layer("a2a", 1,
                                                       model::CommunicationConfig{});
  auto exec = learned.estimate(layer, kRuntime, test_hardware());
  ASSERT_FALSE(exec);
  EXPECT_EQ(exec.error().code(), ErrorCode::BackendUnavailable);
}

// ============================================================================
// Plausibility envelope
// ============================================================================

TEST(PlausibilityEnvelopeTest, Bounds) {
  const PlausibilityEnvelope envelope{.min_ms = 0.0, .max_ms = 100.0, .max_ratio = 10.0};

  EXPECT_TRUE(envelope.check(LatencyPrediction{.compute_ms = 5.0, .memory_ms = 3.0}, 4.0));
  EXPECT_FALSE(envelope.check(LatencyPrediction{.compute_ms = -1.0, .memory_ms = 3.0}, 4.0));
  EXPECT_FALSE(envelope.check(LatencyPrediction{.compute_ms = 150.0, .memory_ms = 3.0}, 100.0));

  auto far = envelope.check(LatencyPrediction{.compute_ms = 50.0, .memory_ms = 1.0}, 2.0);
  ASSERT_FALSE(far);
  EXPECT_EQ(far.error().code(), ErrorCode::BackendUnavailable);

  auto low = envelope.check(LatencyPrediction{.compute_ms = 0.1, .memory_ms = 0.1}, 2.0);
  EXPECT_FALSE(low);
}

TEST(PlausibilityEnvelopeTest, ZeroAnalyticSkipsRatio) {
  const PlausibilityEnvelope envelope;
  EXPECT_TRUE(envelope.check(LatencyPrediction{.compute_ms = 7.0, .memory_ms = 0.0}, 0.0));
}

TEST_F(BackendTest, ImplausiblePredictionIsUnavailable) {
  auto reference = analytic_.estimate(ffn_layer(), kRuntime, test_hardware());
  ASSERT_TRUE(reference);

  MachineLearnedBackend learned(
      library_, constant_regressor(reference.value().dominant_latency_ms * 1000.0, 0.0));
  auto exec = learned.estimate(ffn_layer(), kRuntime, test_hardware());
  ASSERT_FALSE(exec);
  EXPECT_EQ(exec.error().code(), ErrorCode::BackendUnavailable);
}

// ============================================================================
// Fallback
// ============================================================================

TEST_F(BackendTest, FallbackMatchesAnalyticExactly) {
  MachineLearnedBackend learned(library_, nullptr);
  FallbackBackend backend(learned, analytic_);
  EXPECT_EQ(backend.name(), "ml");

  auto fallback = backend.estimate(ffn_layer(), kRuntime, test_hardware());
  auto direct = analytic_.estimate(ffn_layer(), kRuntime, test_hardware());
  ASSERT_TRUE(fallback) << fallback.error().to_string();
  ASSERT_TRUE(direct);

  EXPECT_EQ(fallback.value().compute_time_ms, direct.value().compute_time_ms);
  EXPECT_EQ(fallback.value().memory_time_ms, direct.value().memory_time_ms);
  EXPECT_EQ(fallback.value().dominant_latency_ms, direct.value().dominant_latency_ms);
  EXPECT_EQ(fallback.value().overlapped_latency_ms, direct.value().overlapped_latency_ms);
  EXPECT_EQ(fallback.value().flops, direct.value().flops);

  EXPECT_EQ(fallback.value().metadata.at(kMetaBackend), "analytic");
  EXPECT_EQ(fallback.value().metadata.at(kMetaFallbackReason), "no latency model loaded");
}

TEST_F(BackendTest, FallbackKeepsPrimaryResult) {
  auto reference = analytic_.estimate(ffn_layer(), kRuntime, test_hardware());
  ASSERT_TRUE(reference);
  const f64 ms = reference.value().dominant_latency_ms;

  MachineLearnedBackend learned(library_, constant_regressor(ms, ms / 2.0));
  FallbackBackend backend(learned, analytic_);
  auto exec = backend.estimate(ffn_layer(), kRuntime, test_hardware());
  ASSERT_TRUE(exec);
  EXPECT_EQ(exec.value().metadata.at(kMetaBackend), "ml");
  EXPECT_EQ(exec.value().metadata.count(kMetaFallbackReason), 0u);
}

TEST_F(BackendTest, FallbackOnlyCoversUnavailability) {
  FailingBackend domain(ErrorCode::FormulaDomain);
  FallbackBackend backend(domain, analytic_);

  auto exec = backend.estimate(ffn_layer(), kRuntime, test_hardware());
  ASSERT_FALSE(exec);
  EXPECT_EQ(exec.error().code(), ErrorCode::FormulaDomain);

  FailingBackend unavailable(ErrorCode::BackendUnavailable);
  FallbackBackend recovering(unavailable, analytic_);
  auto recovered = recovering.estimate(ffn_layer(), kRuntime, test_hardware());
  ASSERT_TRUE(recovered);
  EXPECT_EQ(recovered.value().metadata.at(kMetaFallbackReason), "primary failed");
}
