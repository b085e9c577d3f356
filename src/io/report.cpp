/*
 * Copyright (c) 2025 Lummy
 *
 * This software is released under the MIT License.
 * See the LICENSE file in the project root for full details.
 */

#include "afdsim/io/report.hpp"

#include <fstream>
#include <initializer_list>
#include <iomanip>
#include <ostream>

#include <glog/logging.h>
#include <nlohmann/json.hpp>

namespace afdsim::io {

using json = nlohmann::json;

namespace {

constexpr int kHeaderPad = 12;

std::string csv_field(const std::string& value) {
  if (value.find_first_of(",\"\n") == std::string::npos) {
    return value;
  }
  std::string quoted = "\"";
  for (char c : value) {
    if (c == '"') quoted += '"';
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

void print_headers(std::ostream& os, std::initializer_list<const char*> headers) {
  bool first = true;
  for (const char* header : headers) {
    if (!first) os << ' ';
    os << std::setw(kHeaderPad) << header;
    first = false;
  }
  os << '\n';
}

}  // namespace

std::vector<LayerRow> layer_table(const estimation::SimulationResult& result) {
  std::vector<LayerRow> rows;
  rows.reserve(result.layers.size());
  for (const auto& exec : result.layers) {
    auto backend = exec.metadata.find(estimation::kMetaBackend);
    rows.push_back(LayerRow{
        .layer = exec.layer_name,
        .type = std::string(layer_type_str(exec.layer_type)),
        .gflops = exec.flops / kGiga,
        .compute_ms = exec.compute_time_ms,
        .memory_ms = exec.memory_time_ms,
        .latency_ms = exec.dominant_latency_ms,
        .overlapped_ms = exec.overlapped_latency_ms,
        .bytes_gb = exec.bytes_moved() / kGiga,
        .backend = backend != exec.metadata.end() ? backend->second : std::string(),
    });
  }
  return rows;
}

SummaryRow summary_row(const estimation::SimulationResult& result) {
  return SummaryRow{
      .total_latency_ms = result.total_latency_ms,
      .total_overlapped_latency_ms = result.total_overlapped_latency_ms,
      .total_flops_g = result.total_flops / kGiga,
      .peak_memory_gb = result.peak_memory_bytes / kGiga,
      .bottleneck_layer = result.bottleneck_layer,
  };
}

// ============================================================================
// Text output
// ============================================================================

void print_layer_table(std::ostream& os, std::span<const estimation::LayerExecution> layers,
                       TableLayout layout) {
  const auto flags = os.flags();
  const auto precision = os.precision();

  if (layout == TableLayout::Afd) {
    print_headers(os, {"layer", "type", "gflops", "compute_ms", "memory_ms", "latency_ms"});
  } else {
    print_headers(os, {"layer", "type", "gflops", "bytes_gb", "latency_ms"});
  }

  os << std::right << std::fixed << std::setprecision(3);
  for (const auto& exec : layers) {
    const std::string_view type = layer_type_str(exec.layer_type);
    if (layout == TableLayout::Afd) {
      os << std::setw(12) << exec.layer_name << ' ' << std::setw(10) << type << ' '
         << std::setw(10) << exec.flops / kGiga << ' ' << std::setw(12)
         << exec.compute_time_ms << ' ' << std::setw(12) << exec.memory_time_ms << ' '
         << std::setw(12) << exec.dominant_latency_ms << '\n';
    } else {
      os << std::setw(12) << exec.layer_name << ' ' << std::setw(12) << type << ' '
         << std::setw(10) << exec.flops / kGiga << ' ' << std::setw(10)
         << exec.bytes_moved() / kGiga << ' ' << std::setw(12) << exec.dominant_latency_ms
         << '\n';
    }
  }

  os.flags(flags);
  os.precision(precision);
}

void print_totals(std::ostream& os, const estimation::SimulationResult& result) {
  const auto flags = os.flags();
  const auto precision = os.precision();
  const SummaryRow summary = summary_row(result);

  os << std::fixed << std::setprecision(3);
  os << "\nTotals:\n";
  os << "  Total latency (ms): " << summary.total_latency_ms << '\n';
  os << "  Total FLOPs (GFLOPs): " << summary.total_flops_g << '\n';
  os << "  Peak memory (GB): " << summary.peak_memory_gb << '\n';
  os << "  Bottleneck layer: " << summary.bottleneck_layer.value_or("None") << '\n';

  os.flags(flags);
  os.precision(precision);
}

void print_report(std::ostream& os, std::string_view scenario_name,
                  std::string_view hardware_name, const estimation::SimulationResult& result,
                  TableLayout layout) {
  os << "Scenario: " << scenario_name << '\n';
  os << "Hardware: " << hardware_name << '\n';
  print_layer_table(os, result.layers, layout);
  print_totals(os, result);
}

// ============================================================================
// Machine-readable output
// ============================================================================

void write_csv(std::ostream& os, const estimation::SimulationResult& result) {
  const auto flags = os.flags();
  const auto precision = os.precision();

  os << "layer,type,gflops,compute_ms,memory_ms,latency_ms,overlapped_ms,bytes_gb,backend\n";
  os << std::setprecision(9);
  for (const LayerRow& row : layer_table(result)) {
    os << csv_field(row.layer) << ',' << row.type << ',' << row.gflops << ','
       << row.compute_ms << ',' << row.memory_ms << ',' << row.latency_ms << ','
       << row.overlapped_ms << ',' << row.bytes_gb << ',' << csv_field(row.backend) << '\n';
  }

  os.flags(flags);
  os.precision(precision);
}

json to_json(const estimation::LayerExecution& exec) {
  json breakdown = json::object();
  for (const auto& [op, cost] : exec.breakdown) {
    breakdown[op] = {
        {"flops", cost.flops},
        {"bytes_read", cost.bytes_read},
        {"bytes_written", cost.bytes_written},
        {"compute_time_ms", cost.compute_time_ms},
        {"memory_time_ms", cost.memory_time_ms},
    };
  }

  return json{
      {"layer_name", exec.layer_name},
      {"layer_type", std::string(layer_type_str(exec.layer_type))},
      {"flops", exec.flops},
      {"bytes_read", exec.bytes_read},
      {"bytes_written", exec.bytes_written},
      {"compute_time_ms", exec.compute_time_ms},
      {"memory_time_ms", exec.memory_time_ms},
      {"dominant_latency_ms", exec.dominant_latency_ms},
      {"estimated_execution_time_ms", exec.estimated_execution_time_ms},
      {"overlapped_latency_ms", exec.overlapped_latency_ms},
      {"features", exec.features},
      {"breakdown", std::move(breakdown)},
      {"metadata", exec.metadata},
  };
}

json to_json(const estimation::SimulationResult& result) {
  json layers = json::array();
  for (const auto& exec : result.layers) {
    layers.push_back(to_json(exec));
  }

  json out{
      {"layers", std::move(layers)},
      {"total_flops", result.total_flops},
      {"total_latency_ms", result.total_latency_ms},
      {"total_overlapped_latency_ms", result.total_overlapped_latency_ms},
      {"peak_memory_bytes", result.peak_memory_bytes},
  };
  if (result.bottleneck_layer.has_value()) {
    out["bottleneck_layer"] = *result.bottleneck_layer;
  } else {
    out["bottleneck_layer"] = nullptr;
  }
  return out;
}

Result<void> write_json_file(const std::filesystem::path& path,
                             const estimation::SimulationResult& result) {
  std::ofstream file(path);
  if (!file.is_open()) {
    return Err<void>(ErrorCode::IOError, "Failed to open file for writing: " + path.string());
  }
  file << to_json(result).dump(2) << '\n';
  if (!file) {
    return Err<void>(ErrorCode::IOError, "Failed to write file: " + path.string());
  }
  LOG(INFO) << "Saved raw result to " << path.string();
  return Ok();
}

Result<void> write_csv_file(const std::filesystem::path& path,
                            const estimation::SimulationResult& result) {
  std::ofstream file(path);
  if (!file.is_open()) {
    return Err<void>(ErrorCode::IOError, "Failed to open file for writing: " + path.string());
  }
  write_csv(file, result);
  if (!file) {
    return Err<void>(ErrorCode::IOError, "Failed to write file: " + path.string());
  }
  LOG(INFO) << "Saved layer table to " << path.string();
  return Ok();
}

}  // namespace afdsim::io
