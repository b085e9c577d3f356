/**
 * @file example_basic.cpp
 * @brief Basic usage examples for the afdsim estimation API
 *
 * This file walks through the core pieces without any scenario file:
 * - Result<T> error handling
 * - Fused op evaluation
 * - Layer estimates on a hardware profile
 * - Whole-stack simulation and the text report
 */

#include <iostream>
#include <vector>

#include <glog/logging.h>

#include "afdsim/core/error.hpp"
#include "afdsim/core/types.hpp"
#include "afdsim/estimation/backend.hpp"
#include "afdsim/io/report.hpp"
#include "afdsim/ops/ffn_ops.hpp"
#include "afdsim/ops/fused_op.hpp"
#include "afdsim/runtime/simulator.hpp"

using namespace afdsim;

namespace {

model::HardwareSpec make_hardware() {
  return model::HardwareSpec{
      .name = "a100-80g",
      .peak_tflops = 312.0,
      .memory_bandwidth_gbps = 2039.0,
      .hbm_gb = 80.0,
      .interconnect_gbps = 600.0,
      .max_concurrency = 2,
      .overlap_efficiency = 0.8,
  };
}

model::AttentionConfig make_attention() {
  return model::AttentionConfig{
      .d_model = 4096,
      .num_heads = 32,
      .num_kv_heads = 8,
  };
}

}  // namespace

// ============================================================================
// Example 1: Error Handling with Result<T>
// ============================================================================

void example_error_handling() {
  std::cout << "\n=== Example 1: Error Handling ===\n";

  model::HardwareSpec hw = make_hardware();
  hw.peak_tflops = 0.0;

  auto valid = hw.validate();
  if (!valid) {
    std::cout << "Rejected hardware: " << valid.error().to_string() << "\n";
  }

  model::RuntimeShape runtime{.batch_size = 4, .seq_len = 128};
  std::cout << "Runtime shape ok: " << (runtime.validate().is_ok() ? "yes" : "no") << "\n";
}

// ============================================================================
// Example 2: Fused Ops
// ============================================================================

void example_fused_ops() {
  std::cout << "\n=== Example 2: Fused Ops ===\n";

  const auto library = ops::FusedOpLibrary::standard();
  std::cout << "Registered ops: " << library.size() << "\n";

  const auto layer = model::LayerConfig::ffn_layer(
      "ffn0", 0, model::FFNConfig{.d_model = 4096, .d_ff = 11008});
  const auto shape = ops::OpShape::from_layer(layer);
  const model::RuntimeShape runtime{.batch_size = 1, .seq_len = 512};

  auto cost = library.evaluate(ops::kFfnUpProj, shape, runtime);
  if (!cost) {
    std::cerr << "Evaluation failed: " << cost.error().to_string() << "\n";
    return;
  }
  std::cout << ops::kFfnUpProj << ": " << cost.value().flops / kGiga << " GFLOPs, "
            << cost.value().bytes_moved() / kMega << " MB moved\n";
}

// ============================================================================
// Example 3: Layer Estimates
// ============================================================================

void example_layer_estimate() {
  std::cout << "\n=== Example 3: Layer Estimates ===\n";

  const auto library = ops::FusedOpLibrary::standard();
  estimation::AnalyticBackend backend(library);

  const auto layer = model::LayerConfig::attention_layer("attn0", 0, make_attention(),
                                                         model::AttentionPayload{.kv_cache_len = 2048});
  const model::RuntimeShape runtime{.batch_size = 8, .seq_len = 1};

  auto exec = backend.estimate(layer, runtime, make_hardware());
  if (!exec) {
    std::cerr << "Estimate failed: " << exec.error().to_string() << "\n";
    return;
  }

  const auto& e = exec.value();
  std::cout << e.layer_name << ": compute " << e.compute_time_ms << " ms, memory "
            << e.memory_time_ms << " ms, dominant " << e.dominant_latency_ms
            << " ms, overlapped " << e.overlapped_latency_ms << " ms\n";
  for (const auto& [op, part] : e.breakdown) {
    std::cout << "  " << op << ": " << part.flops / kGiga << " GFLOPs\n";
  }
}

// ============================================================================
// Example 4: Simulation
// ============================================================================

void example_simulation() {
  std::cout << "\n=== Example 4: Simulation ===\n";

  const auto library = ops::FusedOpLibrary::standard();
  estimation::AnalyticBackend backend(library);
  runtime::Simulator simulator(backend);

  const model::AttentionConfig attn = make_attention();
  const std::vector<model::LayerConfig> layers = {
      model::LayerConfig::attention_layer("attn0", 0, attn),
      model::LayerConfig::moe_layer("moe0", 1,
                                    model::MoEConfig{.expert_intermediate = 1408,
                                                     .num_experts = 64,
                                                     .experts_per_token = 6,
                                                     .num_shared_experts = 2},
                                    attn),
      model::LayerConfig::communication_layer(
          "a2a0", 2,
          model::CommunicationConfig{.pattern = model::CommPattern::AllToAll,
                                     .payload_mb = 32.0,
                                     .num_devices = 8}),
  };

  const model::HardwareSpec hw = make_hardware();
  auto result = simulator.run(layers, hw, model::RuntimeShape{.batch_size = 4, .seq_len = 256});
  if (!result) {
    std::cerr << "Simulation failed: " << result.error().to_string() << "\n";
    return;
  }

  io::print_report(std::cout, "example", hw.name, result.value(), io::TableLayout::LargeEp);
}

int main(int /*argc*/, char* argv[]) {
  google::InitGoogleLogging(argv[0]);

  std::cout << "afdsim - Basic Examples\n";
  std::cout << "=======================\n";

  example_error_handling();
  example_fused_ops();
  example_layer_estimate();
  example_simulation();

  std::cout << "\n=== All examples completed ===\n";
  return 0;
}
