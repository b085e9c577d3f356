/*
 * Copyright (c) 2025 Lummy
 *
 * This software is released under the MIT License.
 * See the LICENSE file in the project root for full details.
 */

#include "afdsim/estimation/backend.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include <glog/logging.h>

#include "afdsim/arch/hardware_model.hpp"

namespace afdsim::estimation {

namespace {

std::string format_ms(f64 v) {
  std::ostringstream os;
  os << v << " ms";
  return os.str();
}

}  // namespace

// ============================================================================
// AnalyticBackend
// ============================================================================

Result<LayerExecution> AnalyticBackend::estimate(const model::LayerConfig& config,
                                                 const model::RuntimeShape& runtime,
                                                 const model::HardwareSpec& hw) const {
  auto exec = estimator_.estimate(config, runtime, hw);
  if (exec) {
    exec.value().metadata[kMetaBackend] = std::string(name());
  }
  return exec;
}

// ============================================================================
// PlausibilityEnvelope
// ============================================================================

Result<void> PlausibilityEnvelope::check(const LatencyPrediction& prediction,
                                         f64 analytic_dominant_ms) const {
  if (!std::isfinite(prediction.compute_ms) || !std::isfinite(prediction.memory_ms) ||
      prediction.compute_ms < 0.0 || prediction.memory_ms < 0.0) {
    return Err<void>(ErrorCode::BackendUnavailable,
                     "prediction is negative or non-finite");
  }

  const f64 predicted = std::max(prediction.compute_ms, prediction.memory_ms);
  if (predicted < min_ms || predicted > max_ms) {
    return Err<void>(ErrorCode::BackendUnavailable,
                     "prediction " + format_ms(predicted) + " outside [" +
                         format_ms(min_ms) + ", " + format_ms(max_ms) + "]");
  }

  if (analytic_dominant_ms > 0.0 && max_ratio > 0.0) {
    const f64 ratio = predicted > analytic_dominant_ms ? predicted / analytic_dominant_ms
                                                       : analytic_dominant_ms / predicted;
    if (!(ratio <= max_ratio)) {
      return Err<void>(ErrorCode::BackendUnavailable,
                       "prediction " + format_ms(predicted) + " is more than " +
                           std::to_string(max_ratio) + "x away from analytic " +
                           format_ms(analytic_dominant_ms));
    }
  }
  return Ok();
}

// ============================================================================
// MachineLearnedBackend
// ============================================================================

Result<LayerExecution> MachineLearnedBackend::estimate(
    const model::LayerConfig& config, const model::RuntimeShape& runtime,
    const model::HardwareSpec& hw) const {
  if (regressor_ == nullptr) {
    return Err<LayerExecution>(ErrorCode::BackendUnavailable,
                               "no latency model loaded");
  }

  auto analytic = estimator_.estimate(config, runtime, hw);
  if (!analytic) {
    return analytic;
  }
  LayerExecution exec = std::move(analytic.value());

  auto prediction = regressor_->predict(exec.layer_type, exec.features);
  if (!prediction) {
    return Err<LayerExecution>(std::move(prediction.error()));
  }

  auto plausible = envelope_.check(prediction.value(), exec.dominant_latency_ms);
  if (!plausible) {
    return Err<LayerExecution>(
        Error(ErrorCode::BackendUnavailable,
              "layer '" + config.name + "': " + plausible.error().message()));
  }

  const arch::PhaseTimes times{
      .compute_ms = prediction.value().compute_ms,
      .memory_ms = prediction.value().memory_ms,
  };
  exec.compute_time_ms = times.compute_ms;
  exec.memory_time_ms = times.memory_ms;
  exec.dominant_latency_ms = arch::dominant_latency_ms(times);
  exec.estimated_execution_time_ms = exec.dominant_latency_ms;
  exec.overlapped_latency_ms = arch::overlapped_latency_ms(times, hw);
  exec.metadata[kMetaBackend] = std::string(name());

  return Ok(std::move(exec));
}

// ============================================================================
// FallbackBackend
// ============================================================================

Result<LayerExecution> FallbackBackend::estimate(const model::LayerConfig& config,
                                                 const model::RuntimeShape& runtime,
                                                 const model::HardwareSpec& hw) const {
  auto primary = primary_.estimate(config, runtime, hw);
  if (primary || primary.error().code() != ErrorCode::BackendUnavailable) {
    return primary;
  }

  LOG(WARNING) << "Backend '" << primary_.name() << "' unavailable for layer '"
               << config.name << "', falling back to '" << fallback_.name()
               << "': " << primary.error().message();

  auto recovered = fallback_.estimate(config, runtime, hw);
  if (recovered) {
    recovered.value().metadata[kMetaBackend] = std::string(fallback_.name());
    recovered.value().metadata[kMetaFallbackReason] = primary.error().message();
  }
  return recovered;
}

}  // namespace afdsim::estimation
