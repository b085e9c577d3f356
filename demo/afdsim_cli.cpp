/*
 * Copyright (c) 2025 Lummy
 *
 * This software is released under the MIT License.
 * See the LICENSE file in the project root for full details.
 */

/**
 * @file afdsim_cli.cpp
 * @brief Command-line front end: load a scenario, simulate it, print tables
 */

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <glog/logging.h>
#include <nlohmann/json.hpp>

#include "afdsim/estimation/backend.hpp"
#include "afdsim/estimation/latency_regressor.hpp"
#include "afdsim/io/report.hpp"
#include "afdsim/io/scenario_loader.hpp"
#include "afdsim/ops/fused_op.hpp"
#include "afdsim/runtime/simulator.hpp"
#include "afdsim/runtime/sweep.hpp"

using namespace afdsim;

namespace {

struct Workflow {
  std::string_view name;
  std::string_view command;
  std::string_view help;
  io::TableLayout layout;
};

constexpr Workflow kWorkflows[] = {
    {"afd", "simulate", "Attention-FFN disaggregation workflow", io::TableLayout::Afd},
    {"large-ep", "evaluate", "Large expert-parallel workflow", io::TableLayout::LargeEp},
};

struct CliOptions {
  const Workflow* workflow = nullptr;
  std::string scenario_path;
  std::optional<i32> batch;
  std::optional<i32> seq;
  std::optional<i32> micro_batch;
  std::optional<f64> tokens_per_expert;
  std::string output_path;
  std::string csv_path;
  std::string ml_model_path;
  std::vector<i32> sweep_batches;
  usize threads = 0;
};

void print_usage(const char* prog) {
  std::cerr << "Usage: " << prog << " <workflow> <command> <scenario.yaml> --batch N --seq N [options]\n";
  std::cerr << "       " << prog << " --list-ops\n\n";
  std::cerr << "Workflows:\n";
  for (const Workflow& wf : kWorkflows) {
    std::cerr << "  " << wf.name << " " << wf.command << "    " << wf.help << "\n";
  }
  std::cerr << "\nOptions:\n";
  std::cerr << "  --micro-batch N          Sequences per micro-batch\n";
  std::cerr << "  --tokens-per-expert X    Routed tokens per expert (MoE)\n";
  std::cerr << "  --output PATH            Write the raw result as JSON\n";
  std::cerr << "  --csv PATH               Write the layer table as CSV\n";
  std::cerr << "  --ml-model PATH          Learned latency model (falls back to analytic)\n";
  std::cerr << "  --sweep-batch 1,2,4      Simulate several batch sizes in parallel\n";
  std::cerr << "  --threads N              Sweep worker threads (default: all cores)\n";
}

std::optional<i32> parse_int(std::string_view text) {
  i32 value = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::optional<f64> parse_double(const std::string& text) {
  char* end = nullptr;
  const f64 value = std::strtod(text.c_str(), &end);
  if (text.empty() || end != text.c_str() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::optional<std::vector<i32>> parse_int_list(std::string_view text) {
  std::vector<i32> values;
  while (!text.empty()) {
    const usize comma = text.find(',');
    auto value = parse_int(text.substr(0, comma));
    if (!value) {
      return std::nullopt;
    }
    values.push_back(*value);
    if (comma == std::string_view::npos) break;
    text.remove_prefix(comma + 1);
  }
  if (values.empty()) {
    return std::nullopt;
  }
  return values;
}

const Workflow* find_workflow(std::string_view name, std::string_view command) {
  for (const Workflow& wf : kWorkflows) {
    if (wf.name == name && wf.command == command) {
      return &wf;
    }
  }
  return nullptr;
}

std::optional<CliOptions> parse_args(int argc, char* argv[]) {
  if (argc < 4) {
    return std::nullopt;
  }

  CliOptions opts;
  opts.workflow = find_workflow(argv[1], argv[2]);
  if (opts.workflow == nullptr) {
    std::cerr << "Unknown workflow: " << argv[1] << " " << argv[2] << "\n";
    return std::nullopt;
  }
  opts.scenario_path = argv[3];

  for (int i = 4; i < argc; ++i) {
    const std::string arg = argv[i];
    if (i + 1 >= argc) {
      std::cerr << "Missing value for " << arg << "\n";
      return std::nullopt;
    }
    const std::string value = argv[++i];

    bool ok = true;
    if (arg == "--batch") {
      opts.batch = parse_int(value);
      ok = opts.batch.has_value();
    } else if (arg == "--seq") {
      opts.seq = parse_int(value);
      ok = opts.seq.has_value();
    } else if (arg == "--micro-batch") {
      opts.micro_batch = parse_int(value);
      ok = opts.micro_batch.has_value();
    } else if (arg == "--tokens-per-expert") {
      opts.tokens_per_expert = parse_double(value);
      ok = opts.tokens_per_expert.has_value();
    } else if (arg == "--output") {
      opts.output_path = value;
    } else if (arg == "--csv") {
      opts.csv_path = value;
    } else if (arg == "--ml-model") {
      opts.ml_model_path = value;
    } else if (arg == "--sweep-batch") {
      auto batches = parse_int_list(value);
      ok = batches.has_value();
      if (ok) opts.sweep_batches = std::move(*batches);
    } else if (arg == "--threads") {
      auto threads = parse_int(value);
      ok = threads.has_value() && *threads >= 0;
      if (ok) opts.threads = static_cast<usize>(*threads);
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      return std::nullopt;
    }

    if (!ok) {
      std::cerr << "Invalid value for " << arg << ": " << value << "\n";
      return std::nullopt;
    }
  }

  if (!opts.seq.has_value() || (!opts.batch.has_value() && opts.sweep_batches.empty())) {
    std::cerr << "--batch and --seq are required\n";
    return std::nullopt;
  }
  return opts;
}

int list_ops() {
  const auto library = ops::FusedOpLibrary::standard();
  std::cout << std::left;
  for (const ops::FusionOp& op : library.ops()) {
    std::cout << std::setw(28) << op.name << std::setw(15) << layer_type_str(op.family)
              << op.notes << "\n";
  }
  std::cout << library.size() << " fused ops registered\n";
  return 0;
}

model::RuntimeShape make_runtime(const CliOptions& opts, i32 batch) {
  model::RuntimeShape runtime;
  runtime.batch_size = batch;
  runtime.seq_len = *opts.seq;
  runtime.micro_batch = opts.micro_batch;
  runtime.tokens_per_expert = opts.tokens_per_expert;
  return runtime;
}

int run_single(const CliOptions& opts, const io::Scenario& scenario,
               const runtime::Simulator& simulator) {
  const model::RuntimeShape runtime = make_runtime(opts, *opts.batch);
  auto result = simulator.run(scenario.layers, scenario.hardware, runtime);
  if (!result) {
    std::cerr << "Simulation failed: " << result.error().to_string() << "\n";
    return 1;
  }

  io::print_report(std::cout, scenario.name, scenario.hardware.name, result.value(),
                   opts.workflow->layout);

  if (!opts.output_path.empty()) {
    auto written = io::write_json_file(opts.output_path, result.value());
    if (!written) {
      std::cerr << "Error: " << written.error().to_string() << "\n";
      return 1;
    }
    std::cout << "\nSaved raw result to " << opts.output_path << "\n";
  }
  if (!opts.csv_path.empty()) {
    auto written = io::write_csv_file(opts.csv_path, result.value());
    if (!written) {
      std::cerr << "Error: " << written.error().to_string() << "\n";
      return 1;
    }
    std::cout << "Saved layer table to " << opts.csv_path << "\n";
  }
  return 0;
}

int run_batch_sweep(const CliOptions& opts, const io::Scenario& scenario,
                    const runtime::Simulator& simulator) {
  std::vector<model::RuntimeShape> shapes;
  shapes.reserve(opts.sweep_batches.size());
  for (i32 batch : opts.sweep_batches) {
    shapes.push_back(make_runtime(opts, batch));
  }

  auto results = runtime::run_sweep(simulator, scenario.layers, scenario.hardware, shapes,
                                    {.num_threads = opts.threads});
  if (!results) {
    std::cerr << "Sweep failed: " << results.error().to_string() << "\n";
    return 1;
  }

  std::cout << "Scenario: " << scenario.name << "\n";
  std::cout << "Hardware: " << scenario.hardware.name << "\n";
  std::cout << std::setw(12) << "batch" << " " << std::setw(12) << "latency_ms" << " "
            << std::setw(12) << "gflops" << " " << std::setw(12) << "peak_gb" << " "
            << std::setw(12) << "bottleneck" << "\n";
  std::cout << std::fixed << std::setprecision(3);
  for (usize i = 0; i < shapes.size(); ++i) {
    const io::SummaryRow summary = io::summary_row(results.value()[i]);
    std::cout << std::setw(12) << shapes[i].batch_size << " " << std::setw(12)
              << summary.total_latency_ms << " " << std::setw(12) << summary.total_flops_g
              << " " << std::setw(12) << summary.peak_memory_gb << " " << std::setw(12)
              << summary.bottleneck_layer.value_or("None") << "\n";
  }

  if (!opts.output_path.empty()) {
    nlohmann::json doc = nlohmann::json::array();
    for (usize i = 0; i < shapes.size(); ++i) {
      doc.push_back({{"batch_size", shapes[i].batch_size},
                     {"result", io::to_json(results.value()[i])}});
    }
    std::ofstream file(opts.output_path);
    file << doc.dump(2) << "\n";
    if (!file) {
      std::cerr << "Error: failed to write " << opts.output_path << "\n";
      return 1;
    }
    std::cout << "\nSaved sweep results to " << opts.output_path << "\n";
  }
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  google::InitGoogleLogging(argv[0]);

  if (argc == 2 && std::string_view(argv[1]) == "--list-ops") {
    return list_ops();
  }

  auto opts = parse_args(argc, argv);
  if (!opts) {
    print_usage(argv[0]);
    return 2;
  }
  if (!opts->sweep_batches.empty() && !opts->csv_path.empty()) {
    std::cerr << "--csv is not supported together with --sweep-batch\n";
    return 2;
  }

  auto scenario = io::load_scenario(opts->scenario_path);
  if (!scenario) {
    std::cerr << "Error loading scenario: " << scenario.error().to_string() << "\n";
    return 1;
  }

  const auto library = ops::FusedOpLibrary::standard();
  estimation::AnalyticBackend analytic(library);

  std::unique_ptr<estimation::MachineLearnedBackend> learned;
  std::unique_ptr<estimation::FallbackBackend> fallback;
  const estimation::EstimatorBackend* backend = &analytic;

  if (!opts->ml_model_path.empty()) {
    std::shared_ptr<const estimation::LatencyRegressor> regressor;
    auto loaded = estimation::LatencyRegressor::load(opts->ml_model_path);
    if (loaded) {
      regressor = std::move(loaded.value());
    } else {
      LOG(WARNING) << "Learned latency model unavailable, using analytic estimates: "
                   << loaded.error().to_string();
    }
    learned = std::make_unique<estimation::MachineLearnedBackend>(library, regressor);
    fallback = std::make_unique<estimation::FallbackBackend>(*learned, analytic);
    backend = fallback.get();
  }

  runtime::Simulator simulator(*backend);
  if (!opts->sweep_batches.empty()) {
    return run_batch_sweep(*opts, scenario.value(), simulator);
  }
  return run_single(*opts, scenario.value(), simulator);
}
