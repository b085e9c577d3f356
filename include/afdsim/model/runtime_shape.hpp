/*
 * Copyright (c) 2025 Lummy
 *
 * This software is released under the MIT License.
 * See the LICENSE file in the project root for full details.
 */
#pragma once

/**
 * @file runtime_shape.hpp
 * @brief Runtime knobs supplied independently of layer and hardware configs
 * @version 0.1.0
 */

#include <optional>

#include "afdsim/core/error.hpp"
#include "afdsim/core/types.hpp"

namespace afdsim::model {

/**
 * @brief Batch/sequence shape a scenario is evaluated under
 *
 * Kept apart from LayerConfig so one layer template can be swept across
 * shapes without re-reading the scenario.
 */
struct RuntimeShape {
  i32 batch_size = 1;
  i32 seq_len = 1;
  std::optional<i32> micro_batch;        // Sequences per micro-batch
  std::optional<f64> tokens_per_expert;  // Overrides routed load per expert

  [[nodiscard]] Result<void> validate() const;

  /**
   * @brief Total tokens processed by one layer invocation
   */
  [[nodiscard]] i64 tokens() const noexcept {
    return static_cast<i64>(batch_size) * static_cast<i64>(seq_len);
  }

  /**
   * @brief Number of micro-batches that can be in flight concurrently
   *
   * ceil(batch_size / micro_batch) when micro_batch is set, 1 otherwise.
   */
  [[nodiscard]] i32 concurrency_hint() const noexcept {
    if (!micro_batch.has_value() || *micro_batch <= 0) {
      return 1;
    }
    return batch_size / *micro_batch + (batch_size % *micro_batch != 0 ? 1 : 0);
  }
};

}  // namespace afdsim::model
