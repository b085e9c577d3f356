/*
 * Copyright (c) 2025 Lummy
 *
 * This software is released under the MIT License.
 * See the LICENSE file in the project root for full details.
 */
#pragma once

/**
 * @file layer_execution.hpp
 * @brief Per-layer estimate records and the aggregated run profile
 * @version 0.1.0
 */

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "afdsim/core/types.hpp"

namespace afdsim::estimation {

/**
 * @brief One fused op's share of a layer estimate
 */
struct OpBreakdown {
  f64 flops = 0.0;
  f64 bytes_read = 0.0;
  f64 bytes_written = 0.0;
  f64 compute_time_ms = 0.0;
  f64 memory_time_ms = 0.0;
};

// Metadata keys
inline constexpr const char* kMetaBackend = "backend";
inline constexpr const char* kMetaFallbackReason = "fallback_reason";

/**
 * @brief Estimate for a single layer
 *
 * Built once per layer per run and not modified after the backend returns
 * it. dominant_latency_ms is max(compute_time_ms, memory_time_ms) and
 * estimated_execution_time_ms always equals it.
 */
struct LayerExecution {
  std::string layer_name;
  LayerType layer_type = LayerType::Attention;

  f64 flops = 0.0;
  f64 bytes_read = 0.0;
  f64 bytes_written = 0.0;
  f64 compute_time_ms = 0.0;
  f64 memory_time_ms = 0.0;
  f64 dominant_latency_ms = 0.0;
  f64 estimated_execution_time_ms = 0.0;
  f64 overlapped_latency_ms = 0.0;

  std::map<std::string, OpBreakdown> breakdown;    // Keyed by fused op name
  std::map<std::string, f64> features;             // Stable keys per layer type
  std::map<std::string, std::string> metadata;     // backend, fallback_reason

  [[nodiscard]] f64 bytes_moved() const noexcept { return bytes_read + bytes_written; }
};

/**
 * @brief Whole-run profile in executed pipeline order
 */
struct SimulationResult {
  std::vector<LayerExecution> layers;
  f64 total_latency_ms = 0.0;
  f64 total_overlapped_latency_ms = 0.0;
  f64 total_flops = 0.0;
  f64 peak_memory_bytes = 0.0;
  std::optional<std::string> bottleneck_layer;  // Empty only for an empty run
};

}  // namespace afdsim::estimation
