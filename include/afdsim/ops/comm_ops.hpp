/*
 * Copyright (c) 2025 Lummy
 *
 * This software is released under the MIT License.
 * See the LICENSE file in the project root for full details.
 */
#pragma once

/**
 * @file comm_ops.hpp
 * @brief Collective communication ops
 * @version 0.1.0
 *
 * Collectives are bandwidth bound and carry no FLOPs. Wire bytes per device
 * are payload x pattern factor x (n - 1) / n for n participating devices;
 * with num_devices left at 0 the ring factor is not applied.
 */

#include <span>

#include "afdsim/model/layer_config.hpp"
#include "afdsim/ops/fused_op.hpp"

namespace afdsim::ops {

inline constexpr std::string_view kCommAllToAll = "comm_all_to_all";
inline constexpr std::string_view kCommAllReduce = "comm_all_reduce";
inline constexpr std::string_view kCommAllGather = "comm_all_gather";
inline constexpr std::string_view kCommReduceScatter = "comm_reduce_scatter";

/**
 * @brief Registered op name for a collective pattern
 */
[[nodiscard]] std::string_view comm_op_name(model::CommPattern pattern) noexcept;

/**
 * @brief Payload multiples a pattern puts on the wire (all-reduce is a
 *        reduce-scatter followed by an all-gather)
 */
[[nodiscard]] f64 comm_pattern_factor(model::CommPattern pattern) noexcept;

/**
 * @brief (n - 1) / n for n >= 1, 1 when n is 0 (unmodeled)
 */
[[nodiscard]] f64 comm_ring_factor(i64 num_devices) noexcept;

Result<f64> comm_flops(const OpShape& s, const model::RuntimeShape& r);
Result<ByteCounts> comm_all_to_all_bytes(const OpShape& s, const model::RuntimeShape& r);
Result<ByteCounts> comm_all_reduce_bytes(const OpShape& s, const model::RuntimeShape& r);
Result<ByteCounts> comm_all_gather_bytes(const OpShape& s, const model::RuntimeShape& r);
Result<ByteCounts> comm_reduce_scatter_bytes(const OpShape& s,
                                             const model::RuntimeShape& r);

std::span<const FusionOp> comm_ops() noexcept;

}  // namespace afdsim::ops
