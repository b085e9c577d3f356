/*
 * Copyright (c) 2025 Lummy
 *
 * This software is released under the MIT License.
 * See the LICENSE file in the project root for full details.
 */

#include "afdsim/arch/hardware_model.hpp"

#include <algorithm>
#include <cmath>

namespace afdsim::arch {

i32 effective_concurrency(i32 concurrency_hint, const model::HardwareSpec& hw) noexcept {
  return std::max(1, std::min(concurrency_hint, hw.max_concurrency));
}

Result<PhaseTimes> time_for(f64 flops, f64 bytes_read, f64 bytes_written,
                            const model::HardwareSpec& hw, i32 concurrency_hint,
                            Channel channel) {
  for (f64 v : {flops, bytes_read, bytes_written}) {
    if (!std::isfinite(v) || v < 0.0) {
      return Err<PhaseTimes>(ErrorCode::FormulaDomain,
                             "work counts must be finite and non-negative");
    }
  }
  if (hw.peak_tflops <= 0.0) {
    return Err<PhaseTimes>(ErrorCode::ConfigValidation,
                           "Hardware '" + hw.name + "' has no compute throughput");
  }

  PhaseTimes times;
  times.compute_ms = flops / hw.peak_flops_per_second() * kMsPerSecond /
                     static_cast<f64>(effective_concurrency(concurrency_hint, hw));

  const f64 bytes = bytes_read + bytes_written;
  if (bytes == 0.0) {
    return Ok(times);
  }

  if (channel == Channel::Interconnect) {
    // A single-device target has no links; its traffic costs no time.
    const f64 link = hw.interconnect_bytes_per_second();
    if (link > 0.0) {
      times.memory_ms = bytes / link * kMsPerSecond;
    }
    return Ok(times);
  }

  const f64 bandwidth = hw.memory_bytes_per_second();
  if (bandwidth <= 0.0) {
    return Err<PhaseTimes>(ErrorCode::FormulaDomain,
                           "Hardware '" + hw.name + "' has no memory bandwidth to move " +
                               std::to_string(bytes) + " bytes");
  }
  times.memory_ms = bytes / bandwidth * kMsPerSecond;
  return Ok(times);
}

f64 overlapped_latency_ms(const PhaseTimes& t, const model::HardwareSpec& hw) noexcept {
  const f64 shorter = std::min(t.compute_ms, t.memory_ms);
  const f64 efficiency = std::clamp(hw.overlap_efficiency, 0.0, 1.0);
  return dominant_latency_ms(t) + (1.0 - efficiency) * shorter;
}

}  // namespace afdsim::arch
