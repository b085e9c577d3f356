/*
 * Copyright (c) 2025 Lummy
 *
 * This software is released under the MIT License.
 * See the LICENSE file in the project root for full details.
 */

#include "afdsim/model/hardware_spec.hpp"
#include "afdsim/model/runtime_shape.hpp"

#include <cmath>

namespace afdsim::model {

namespace {

Result<void> require_positive(f64 value, const char* field,
                              const std::string& owner) {
  if (!std::isfinite(value) || value <= 0.0) {
    return Err<void>(ErrorCode::ConfigValidation,
                     "Hardware '" + owner + "': " + field +
                         " must be a positive finite number, got " +
                         std::to_string(value));
  }
  return Ok();
}

}  // namespace

Result<void> HardwareSpec::validate() const {
  if (name.empty()) {
    return Err<void>(ErrorCode::ConfigValidation, "Hardware name is empty");
  }

  auto r = require_positive(peak_tflops, "peak_tflops", name);
  if (!r) return r;
  r = require_positive(memory_bandwidth_gbps, "memory_bandwidth_gbps", name);
  if (!r) return r;
  r = require_positive(hbm_gb, "hbm_gb", name);
  if (!r) return r;

  if (!std::isfinite(interconnect_gbps) || interconnect_gbps < 0.0) {
    return Err<void>(ErrorCode::ConfigValidation,
                     "Hardware '" + name + "': interconnect_gbps must be >= 0");
  }
  if (max_concurrency < 1) {
    return Err<void>(ErrorCode::ConfigValidation,
                     "Hardware '" + name + "': max_concurrency must be >= 1, got " +
                         std::to_string(max_concurrency));
  }
  if (!std::isfinite(overlap_efficiency) || overlap_efficiency < 0.0 ||
      overlap_efficiency > 1.0) {
    return Err<void>(ErrorCode::ConfigValidation,
                     "Hardware '" + name + "': overlap_efficiency must be in [0, 1]");
  }
  return Ok();
}

Result<void> RuntimeShape::validate() const {
  if (batch_size < 1) {
    return Err<void>(ErrorCode::ConfigValidation,
                     "batch_size must be >= 1, got " + std::to_string(batch_size));
  }
  if (seq_len < 1) {
    return Err<void>(ErrorCode::ConfigValidation,
                     "seq_len must be >= 1, got " + std::to_string(seq_len));
  }
  if (micro_batch.has_value() && (*micro_batch < 1 || *micro_batch > batch_size)) {
    return Err<void>(ErrorCode::ConfigValidation,
                     "micro_batch must be in [1, batch_size], got " +
                         std::to_string(*micro_batch));
  }
  if (tokens_per_expert.has_value() &&
      (!std::isfinite(*tokens_per_expert) || *tokens_per_expert < 0.0)) {
    return Err<void>(ErrorCode::ConfigValidation,
                     "tokens_per_expert must be a non-negative finite number");
  }
  return Ok();
}

}  // namespace afdsim::model
