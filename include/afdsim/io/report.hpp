/*
 * Copyright (c) 2025 Lummy
 *
 * This software is released under the MIT License.
 * See the LICENSE file in the project root for full details.
 */
#pragma once

/**
 * @file report.hpp
 * @brief Text tables, CSV and JSON rendering of simulation results
 * @version 0.1.0
 */

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "afdsim/core/error.hpp"
#include "afdsim/estimation/layer_execution.hpp"

namespace afdsim::io {

/**
 * @brief Column set of the printed layer table
 *
 * Afd:     layer, type, gflops, compute_ms, memory_ms, latency_ms
 * LargeEp: layer, type, gflops, bytes_gb, latency_ms
 */
enum class TableLayout : u8 {
  Afd = 0,
  LargeEp = 1,
};

/**
 * @brief One layer in display units (GFLOPs, GB, ms)
 */
struct LayerRow {
  std::string layer;
  std::string type;
  f64 gflops = 0.0;
  f64 compute_ms = 0.0;
  f64 memory_ms = 0.0;
  f64 latency_ms = 0.0;
  f64 overlapped_ms = 0.0;
  f64 bytes_gb = 0.0;
  std::string backend;
};

struct SummaryRow {
  f64 total_latency_ms = 0.0;
  f64 total_overlapped_latency_ms = 0.0;
  f64 total_flops_g = 0.0;
  f64 peak_memory_gb = 0.0;
  std::optional<std::string> bottleneck_layer;
};

[[nodiscard]] std::vector<LayerRow> layer_table(const estimation::SimulationResult& result);

[[nodiscard]] SummaryRow summary_row(const estimation::SimulationResult& result);

// ============================================================================
// Text output
// ============================================================================

void print_layer_table(std::ostream& os, std::span<const estimation::LayerExecution> layers,
                       TableLayout layout);

/**
 * @brief Print the "Totals:" block (latency, GFLOPs, peak GB, bottleneck)
 */
void print_totals(std::ostream& os, const estimation::SimulationResult& result);

/**
 * @brief Scenario/hardware header, layer table and totals
 */
void print_report(std::ostream& os, std::string_view scenario_name,
                  std::string_view hardware_name, const estimation::SimulationResult& result,
                  TableLayout layout);

// ============================================================================
// Machine-readable output
// ============================================================================

/**
 * @brief CSV with a header line and one row per layer
 */
void write_csv(std::ostream& os, const estimation::SimulationResult& result);

[[nodiscard]] nlohmann::json to_json(const estimation::LayerExecution& exec);

/**
 * @brief Full result, including per-layer features, breakdown and metadata
 */
[[nodiscard]] nlohmann::json to_json(const estimation::SimulationResult& result);

/**
 * @return IOError if the file cannot be opened or written
 */
[[nodiscard]] Result<void> write_json_file(const std::filesystem::path& path,
                                           const estimation::SimulationResult& result);

[[nodiscard]] Result<void> write_csv_file(const std::filesystem::path& path,
                                          const estimation::SimulationResult& result);

}  // namespace afdsim::io
