/*
 * Copyright (c) 2025 Lummy
 *
 * This software is released under the MIT License.
 * See the LICENSE file in the project root for full details.
 */
#pragma once

/**
 * @file hardware_model.hpp
 * @brief Roofline conversion of FLOP/byte counts into compute and memory time
 * @version 0.1.0
 *
 * Raw compute and memory times are always reported un-discounted. The
 * overlap-aware latency is derived from them afterwards:
 *
 *   dominant   = max(compute, memory)
 *   overlapped = dominant + (1 - overlap_efficiency) * min(compute, memory)
 *
 * so overlap_efficiency = 1 hides the shorter phase entirely and 0 runs the
 * two phases back to back.
 */

#include "afdsim/core/error.hpp"
#include "afdsim/core/types.hpp"
#include "afdsim/model/hardware_spec.hpp"

namespace afdsim::arch {

/**
 * @brief Which bandwidth moves a given byte count
 */
enum class Channel : u8 {
  Memory = 0,        // HBM, memory_bandwidth_gbps
  Interconnect = 1,  // Device links, interconnect_gbps
};

struct PhaseTimes {
  f64 compute_ms = 0.0;
  f64 memory_ms = 0.0;

  PhaseTimes& operator+=(const PhaseTimes& other) noexcept {
    compute_ms += other.compute_ms;
    memory_ms += other.memory_ms;
    return *this;
  }
};

/**
 * @brief Concurrency actually usable: min(hint, max_concurrency), at least 1
 */
[[nodiscard]] i32 effective_concurrency(i32 concurrency_hint,
                                        const model::HardwareSpec& hw) noexcept;

/**
 * @brief Convert work into phase times on one accelerator
 *
 * compute_ms = flops / (peak_tflops * 1e12) * 1000 / effective_concurrency
 * memory_ms  = (bytes_read + bytes_written) / (bandwidth * 1e9) * 1000
 *
 * Interconnect traffic takes 0 ms when interconnect_gbps is 0.
 *
 * @param channel Selects memory_bandwidth_gbps or interconnect_gbps
 * @return FormulaDomain for negative or non-finite inputs, or for bytes
 *         through a memory system with no bandwidth
 */
[[nodiscard]] Result<PhaseTimes> time_for(f64 flops, f64 bytes_read, f64 bytes_written,
                                          const model::HardwareSpec& hw,
                                          i32 concurrency_hint = 1,
                                          Channel channel = Channel::Memory);

[[nodiscard]] inline f64 dominant_latency_ms(const PhaseTimes& t) noexcept {
  return t.compute_ms > t.memory_ms ? t.compute_ms : t.memory_ms;
}

/**
 * @brief Dominant latency plus the part of the shorter phase that the
 *        hardware fails to overlap
 */
[[nodiscard]] f64 overlapped_latency_ms(const PhaseTimes& t,
                                        const model::HardwareSpec& hw) noexcept;

}  // namespace afdsim::arch
