/*
 * Copyright (c) 2025 Lummy
 *
 * This software is released under the MIT License.
 * See the LICENSE file in the project root for full details.
 */
#pragma once

/**
 * @file simulator.hpp
 * @brief Ordered walk over a layer stack into one SimulationResult
 * @version 0.1.0
 *
 * Layers are modeled as executing one after another on a single device
 * timeline, so total latency is the plain sum of per-layer dominant
 * latencies. No inter-layer pipelining is assumed.
 */

#include <span>
#include <vector>

#include "afdsim/core/error.hpp"
#include "afdsim/estimation/backend.hpp"
#include "afdsim/estimation/layer_execution.hpp"
#include "afdsim/model/hardware_spec.hpp"
#include "afdsim/model/layer_config.hpp"
#include "afdsim/model/runtime_shape.hpp"

namespace afdsim::runtime {

/**
 * @brief Roll per-layer executions up into a run profile
 *
 * total_latency_ms and total_flops are running sums in input order;
 * peak_memory_bytes is the largest bytes_read + bytes_written of any layer,
 * communication layers included; bottleneck_layer names the first layer
 * reaching the largest dominant latency.
 */
[[nodiscard]] estimation::SimulationResult aggregate(
    std::vector<estimation::LayerExecution> executions);

/**
 * @brief Runs a layer stack through one backend
 *
 * The simulator owns no state besides the backend reference, so one
 * instance can serve concurrent runs.
 */
class Simulator {
 public:
  explicit Simulator(const estimation::EstimatorBackend& backend) : backend_(backend) {}

  /**
   * @brief Estimate every layer in order and aggregate
   *
   * @return ConfigValidation if the hardware or runtime shape is invalid;
   *         AggregationAborted naming the first failing layer, with the
   *         layer's error attached as cause(). No partial result is
   *         returned.
   */
  [[nodiscard]] Result<estimation::SimulationResult> run(
      std::span<const model::LayerConfig> layers, const model::HardwareSpec& hw,
      const model::RuntimeShape& runtime) const;

  [[nodiscard]] const estimation::EstimatorBackend& backend() const noexcept {
    return backend_;
  }

 private:
  const estimation::EstimatorBackend& backend_;
};

}  // namespace afdsim::runtime
