/*
 * Copyright (c) 2025 Lummy
 *
 * This software is released under the MIT License.
 * See the LICENSE file in the project root for full details.
 */

#include "afdsim/runtime/sweep.hpp"

#include <algorithm>
#include <atomic>
#include <optional>
#include <thread>

#include <glog/logging.h>

namespace afdsim::runtime {

Result<std::vector<estimation::SimulationResult>> run_sweep(
    const Simulator& simulator, std::span<const model::LayerConfig> layers,
    const model::HardwareSpec& hw, std::span<const model::RuntimeShape> shapes,
    const SweepOptions& options) {
  using Results = std::vector<estimation::SimulationResult>;

  if (shapes.empty()) {
    return Ok(Results{});
  }

  usize num_threads = options.num_threads;
  if (num_threads == 0) {
    num_threads = std::max<usize>(1, std::thread::hardware_concurrency());
  }
  num_threads = std::min(num_threads, shapes.size());

  VLOG(1) << "Sweep: " << shapes.size() << " runtime shapes on " << num_threads
          << " threads";

  // One slot per shape; each slot is written by exactly one worker.
  std::vector<std::optional<Result<estimation::SimulationResult>>> slots(shapes.size());
  std::atomic<usize> next{0};

  auto worker = [&]() {
    for (usize i = next.fetch_add(1); i < shapes.size(); i = next.fetch_add(1)) {
      slots[i].emplace(simulator.run(layers, hw, shapes[i]));
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(num_threads);
  for (usize t = 0; t < num_threads; ++t) {
    threads.emplace_back(worker);
  }
  for (auto& thread : threads) {
    thread.join();
  }

  Results results;
  results.reserve(shapes.size());
  for (usize i = 0; i < slots.size(); ++i) {
    auto& slot = *slots[i];
    if (!slot) {
      return Err<Results>(std::move(slot.error()));
    }
    results.push_back(std::move(slot.value()));
  }
  return Ok(std::move(results));
}

}  // namespace afdsim::runtime
