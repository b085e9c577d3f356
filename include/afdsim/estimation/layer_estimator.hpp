/*
 * Copyright (c) 2025 Lummy
 *
 * This software is released under the MIT License.
 * See the LICENSE file in the project root for full details.
 */
#pragma once

/**
 * @file layer_estimator.hpp
 * @brief Analytic per-layer estimation by fused-op composition
 * @version 0.1.0
 */

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "afdsim/core/error.hpp"
#include "afdsim/estimation/layer_execution.hpp"
#include "afdsim/model/hardware_spec.hpp"
#include "afdsim/model/layer_config.hpp"
#include "afdsim/model/runtime_shape.hpp"
#include "afdsim/ops/fused_op.hpp"

namespace afdsim::estimation {

/**
 * @brief Composes fused ops for a layer and maps their work onto hardware
 *
 * Dispatch is on the layer's tag:
 *   - attention:     qkv_proj, scores, softmax, weighted_sum, output_proj
 *   - ffn:           up_proj, [gate_proj], activation, down_proj
 *   - moe:           router_gating, topk_dispatch, [dispatch], expert_matmul,
 *                    [shared_expert], [combine]
 *   - communication: the collective matching the configured pattern
 *
 * Per-op compute and memory times are summed first and the dominant latency
 * is taken over the sums. The estimator holds only a reference to the op
 * library and is safe to share between threads.
 */
class LayerEstimator {
 public:
  explicit LayerEstimator(const ops::FusedOpLibrary& library) : library_(library) {}

  /**
   * @brief Estimate one layer
   *
   * @return ConfigValidation for an invalid layer config (before any op is
   *         evaluated), FormulaDomain for a shape no formula accepts
   */
  [[nodiscard]] Result<LayerExecution> estimate(const model::LayerConfig& config,
                                                const model::RuntimeShape& runtime,
                                                const model::HardwareSpec& hw) const;

  /**
   * @brief Names of the fused ops a layer is composed of, in execution order
   */
  [[nodiscard]] static std::vector<std::string_view> composed_ops(
      const model::LayerConfig& config);

  /**
   * @brief Flattened shape and runtime scalars for offline training
   *
   * The key set depends only on the layer type.
   */
  [[nodiscard]] static std::map<std::string, f64> extract_features(
      const model::LayerConfig& config, const model::RuntimeShape& runtime,
      const model::HardwareSpec& hw);

  [[nodiscard]] const ops::FusedOpLibrary& library() const noexcept { return library_; }

 private:
  const ops::FusedOpLibrary& library_;
};

}  // namespace afdsim::estimation
