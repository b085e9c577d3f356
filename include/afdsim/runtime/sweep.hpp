/*
 * Copyright (c) 2025 Lummy
 *
 * This software is released under the MIT License.
 * See the LICENSE file in the project root for full details.
 */
#pragma once

/**
 * @file sweep.hpp
 * @brief Parallel evaluation of one scenario across several runtime shapes
 * @version 0.1.0
 */

#include <span>
#include <vector>

#include "afdsim/core/error.hpp"
#include "afdsim/estimation/layer_execution.hpp"
#include "afdsim/runtime/simulator.hpp"

namespace afdsim::runtime {

struct SweepOptions {
  usize num_threads = 0;  // 0 = std::thread::hardware_concurrency()
};

/**
 * @brief Run the simulator once per runtime shape on a pool of worker threads
 *
 * Each run is independent; workers share only read-only inputs. Results
 * come back in the order of `shapes`. If any run fails, the error of the
 * earliest failing shape is returned and no results are.
 */
[[nodiscard]] Result<std::vector<estimation::SimulationResult>> run_sweep(
    const Simulator& simulator, std::span<const model::LayerConfig> layers,
    const model::HardwareSpec& hw, std::span<const model::RuntimeShape> shapes,
    const SweepOptions& options = {});

}  // namespace afdsim::runtime
