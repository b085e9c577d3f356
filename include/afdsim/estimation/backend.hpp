/*
 * Copyright (c) 2025 Lummy
 *
 * This software is released under the MIT License.
 * See the LICENSE file in the project root for full details.
 */
#pragma once

/**
 * @file backend.hpp
 * @brief Estimator backends: analytic, machine-learned, and analytic fallback
 * @version 0.1.0
 */

#include <limits>
#include <memory>
#include <string_view>

#include "afdsim/core/error.hpp"
#include "afdsim/estimation/latency_regressor.hpp"
#include "afdsim/estimation/layer_estimator.hpp"
#include "afdsim/estimation/layer_execution.hpp"
#include "afdsim/model/hardware_spec.hpp"
#include "afdsim/model/layer_config.hpp"
#include "afdsim/model/runtime_shape.hpp"

namespace afdsim::estimation {

/**
 * @brief Capability every backend provides
 *
 * Implementations are stateless after construction and may be called from
 * several threads at once.
 */
class EstimatorBackend {
 public:
  virtual ~EstimatorBackend() = default;

  [[nodiscard]] virtual std::string_view name() const noexcept = 0;

  [[nodiscard]] virtual Result<LayerExecution> estimate(
      const model::LayerConfig& config, const model::RuntimeShape& runtime,
      const model::HardwareSpec& hw) const = 0;

 protected:
  EstimatorBackend() = default;
  EstimatorBackend(const EstimatorBackend&) = default;
  EstimatorBackend& operator=(const EstimatorBackend&) = default;
};

// ============================================================================
// Analytic
// ============================================================================

class AnalyticBackend final : public EstimatorBackend {
 public:
  explicit AnalyticBackend(const ops::FusedOpLibrary& library) : estimator_(library) {}

  [[nodiscard]] std::string_view name() const noexcept override { return "analytic"; }

  [[nodiscard]] Result<LayerExecution> estimate(
      const model::LayerConfig& config, const model::RuntimeShape& runtime,
      const model::HardwareSpec& hw) const override;

 private:
  LayerEstimator estimator_;
};

// ============================================================================
// Machine-learned
// ============================================================================

/**
 * @brief Bounds a learned prediction must satisfy to be trusted
 *
 * A prediction fails when any predicted time is negative or non-finite,
 * when the predicted dominant latency falls outside [min_ms, max_ms], or
 * when it differs from the analytic dominant latency by more than
 * max_ratio in either direction (ratio check skipped when the analytic
 * latency is zero).
 */
struct PlausibilityEnvelope {
  f64 min_ms = 0.0;
  f64 max_ms = std::numeric_limits<f64>::infinity();
  f64 max_ratio = 10.0;

  /**
   * @return BackendUnavailable describing the violated bound
   */
  [[nodiscard]] Result<void> check(const LatencyPrediction& prediction,
                                   f64 analytic_dominant_ms) const;
};

/**
 * @brief Learned hardware mapping on top of analytic FLOPs and bytes
 *
 * FLOPs, bytes, breakdown and features come from the analytic estimate;
 * only the time fields are replaced with the regressor's prediction.
 * Analytic errors (ConfigValidation, FormulaDomain) are returned as is;
 * every failure of the learned step is reported as BackendUnavailable.
 */
class MachineLearnedBackend final : public EstimatorBackend {
 public:
  MachineLearnedBackend(const ops::FusedOpLibrary& library,
                        std::shared_ptr<const LatencyRegressor> regressor,
                        PlausibilityEnvelope envelope = {})
      : estimator_(library), regressor_(std::move(regressor)), envelope_(envelope) {}

  [[nodiscard]] std::string_view name() const noexcept override { return "ml"; }

  [[nodiscard]] Result<LayerExecution> estimate(
      const model::LayerConfig& config, const model::RuntimeShape& runtime,
      const model::HardwareSpec& hw) const override;

  [[nodiscard]] bool is_loaded() const noexcept { return regressor_ != nullptr; }

 private:
  LayerEstimator estimator_;
  std::shared_ptr<const LatencyRegressor> regressor_;
  PlausibilityEnvelope envelope_;
};

// ============================================================================
// Fallback decorator
// ============================================================================

/**
 * @brief Tries the primary backend and recovers BackendUnavailable errors
 *        through the fallback
 *
 * The recovered execution carries the fallback's backend name and the
 * primary's error message in its metadata. Any other error code is
 * returned unchanged. Both backends must outlive the decorator.
 */
class FallbackBackend final : public EstimatorBackend {
 public:
  FallbackBackend(const EstimatorBackend& primary, const EstimatorBackend& fallback)
      : primary_(primary), fallback_(fallback) {}

  [[nodiscard]] std::string_view name() const noexcept override {
    return primary_.name();
  }

  [[nodiscard]] Result<LayerExecution> estimate(
      const model::LayerConfig& config, const model::RuntimeShape& runtime,
      const model::HardwareSpec& hw) const override;

 private:
  const EstimatorBackend& primary_;
  const EstimatorBackend& fallback_;
};

}  // namespace afdsim::estimation
