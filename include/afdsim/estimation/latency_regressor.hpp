/*
 * Copyright (c) 2025 Lummy
 *
 * This software is released under the MIT License.
 * See the LICENSE file in the project root for full details.
 */
#pragma once

/**
 * @file latency_regressor.hpp
 * @brief Pre-trained linear latency model over LayerExecution features
 * @version 0.1.0
 *
 * One linear model per layer type maps a named feature vector x to
 *
 *   [compute_ms, memory_ms]^T = W x + b
 *
 * Models are read from JSON:
 * @code
 *   {
 *     "models": {
 *       "ffn": {
 *         "features": ["flops", "bytes_read", "bytes_written"],
 *         "compute_ms": {"weights": [3.2e-12, 0, 0], "bias": 0.0},
 *         "memory_ms":  {"weights": [0, 4.9e-10, 4.9e-10], "bias": 0.01}
 *       }
 *     }
 *   }
 * @endcode
 *
 * A loaded regressor is immutable and is shared between concurrent
 * simulation runs through std::shared_ptr<const LatencyRegressor>.
 */

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <Eigen/Core>
#include <nlohmann/json_fwd.hpp>

#include "afdsim/core/error.hpp"
#include "afdsim/core/types.hpp"

namespace afdsim::estimation {

struct LatencyPrediction {
  f64 compute_ms = 0.0;
  f64 memory_ms = 0.0;
};

/**
 * @brief Linear model for one layer type
 */
struct LinearLatencyModel {
  std::vector<std::string> feature_names;
  Eigen::Matrix<f64, 2, Eigen::Dynamic> weights;  // Row 0 compute, row 1 memory
  Eigen::Vector2d bias = Eigen::Vector2d::Zero();
};

class LatencyRegressor {
 public:
  LatencyRegressor() = default;

  /**
   * @brief Load a model file
   *
   * @return FileNotFound, ParseError for malformed JSON or an inconsistent
   *         model (weight count differs from feature count, unknown layer type)
   */
  static Result<std::shared_ptr<const LatencyRegressor>> load(
      const std::filesystem::path& path);

  static Result<std::shared_ptr<const LatencyRegressor>> from_json(
      const nlohmann::json& doc);

  /**
   * @brief Install the model for a layer type (replaces any existing one)
   *
   * @return InvalidArgument if the weight matrix width differs from the
   *         number of feature names
   */
  Result<void> set_model(LayerType type, LinearLatencyModel model);

  [[nodiscard]] bool has_model(LayerType type) const noexcept {
    return models_.find(type) != models_.end();
  }

  /**
   * @brief Predict compute and memory time from a feature map
   *
   * @return BackendUnavailable if no model covers the layer type or a
   *         required feature is absent
   */
  [[nodiscard]] Result<LatencyPrediction> predict(
      LayerType type, const std::map<std::string, f64>& features) const;

 private:
  std::map<LayerType, LinearLatencyModel> models_;
};

}  // namespace afdsim::estimation
