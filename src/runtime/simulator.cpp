/*
 * Copyright (c) 2025 Lummy
 *
 * This software is released under the MIT License.
 * See the LICENSE file in the project root for full details.
 */

#include "afdsim/runtime/simulator.hpp"

#include <glog/logging.h>

namespace afdsim::runtime {

estimation::SimulationResult aggregate(std::vector<estimation::LayerExecution> executions) {
  estimation::SimulationResult result;
  f64 worst_latency = 0.0;

  for (const auto& exec : executions) {
    result.total_latency_ms += exec.dominant_latency_ms;
    result.total_overlapped_latency_ms += exec.overlapped_latency_ms;
    result.total_flops += exec.flops;
    if (exec.bytes_moved() > result.peak_memory_bytes) {
      result.peak_memory_bytes = exec.bytes_moved();
    }
    // Strict comparison keeps the earliest layer on ties
    if (!result.bottleneck_layer.has_value() || exec.dominant_latency_ms > worst_latency) {
      worst_latency = exec.dominant_latency_ms;
      result.bottleneck_layer = exec.layer_name;
    }
  }

  result.layers = std::move(executions);
  return result;
}

Result<estimation::SimulationResult> Simulator::run(
    std::span<const model::LayerConfig> layers, const model::HardwareSpec& hw,
    const model::RuntimeShape& runtime) const {
  auto hw_ok = hw.validate();
  if (!hw_ok) {
    return Err<estimation::SimulationResult>(std::move(hw_ok.error()));
  }
  auto runtime_ok = runtime.validate();
  if (!runtime_ok) {
    return Err<estimation::SimulationResult>(std::move(runtime_ok.error()));
  }

  std::vector<estimation::LayerExecution> executions;
  executions.reserve(layers.size());

  for (usize i = 0; i < layers.size(); ++i) {
    const model::LayerConfig& layer = layers[i];
    auto exec = backend_.estimate(layer, runtime, hw);
    if (!exec) {
      LOG(ERROR) << "Simulation aborted at layer #" << i << " '" << layer.name
                 << "': " << exec.error().to_string();
      return Err<estimation::SimulationResult>(
          Error(ErrorCode::AggregationAborted,
                "layer #" + std::to_string(i) + " '" + layer.name + "' (" +
                    std::string(layer_type_str(layer.type())) + ") failed",
                std::move(exec.error())));
    }
    executions.push_back(std::move(exec.value()));
  }

  auto result = aggregate(std::move(executions));
  LOG(INFO) << "Simulated " << result.layers.size() << " layers on " << hw.name
            << " (batch=" << runtime.batch_size << ", seq=" << runtime.seq_len
            << ", backend=" << backend_.name() << "): " << result.total_latency_ms
            << " ms, bottleneck " << result.bottleneck_layer.value_or("<none>");
  return Ok(std::move(result));
}

}  // namespace afdsim::runtime
