/*
 * Copyright (c) 2025 Lummy
 *
 * This software is released under the MIT License.
 * See the LICENSE file in the project root for full details.
 */

#include "afdsim/ops/comm_ops.hpp"

namespace afdsim::ops {

namespace {

ByteCounts wire_bytes(const OpShape& s, model::CommPattern pattern) {
  const f64 bytes =
      s.payload_bytes * comm_pattern_factor(pattern) * comm_ring_factor(s.num_devices);
  return ByteCounts{.read = bytes, .written = bytes};
}

}  // namespace

std::string_view comm_op_name(model::CommPattern pattern) noexcept {
  switch (pattern) {
    case model::CommPattern::AllToAll: return kCommAllToAll;
    case model::CommPattern::AllReduce: return kCommAllReduce;
    case model::CommPattern::AllGather: return kCommAllGather;
    case model::CommPattern::ReduceScatter: return kCommReduceScatter;
    default: return kCommAllToAll;
  }
}

f64 comm_pattern_factor(model::CommPattern pattern) noexcept {
  return pattern == model::CommPattern::AllReduce ? 2.0 : 1.0;
}

f64 comm_ring_factor(i64 num_devices) noexcept {
  if (num_devices <= 0) {
    return 1.0;
  }
  const f64 n = static_cast<f64>(num_devices);
  return (n - 1.0) / n;
}

Result<f64> comm_flops(const OpShape& s, const model::RuntimeShape& r) {
  (void)s;
  (void)r;
  return Ok(0.0);
}

Result<ByteCounts> comm_all_to_all_bytes(const OpShape& s, const model::RuntimeShape& r) {
  (void)r;
  return Ok(wire_bytes(s, model::CommPattern::AllToAll));
}

Result<ByteCounts> comm_all_reduce_bytes(const OpShape& s, const model::RuntimeShape& r) {
  (void)r;
  return Ok(wire_bytes(s, model::CommPattern::AllReduce));
}

Result<ByteCounts> comm_all_gather_bytes(const OpShape& s, const model::RuntimeShape& r) {
  (void)r;
  return Ok(wire_bytes(s, model::CommPattern::AllGather));
}

Result<ByteCounts> comm_reduce_scatter_bytes(const OpShape& s,
                                             const model::RuntimeShape& r) {
  (void)r;
  return Ok(wire_bytes(s, model::CommPattern::ReduceScatter));
}

std::span<const FusionOp> comm_ops() noexcept {
  static const FusionOp kOps[] = {
      {kCommAllToAll, LayerType::Communication, &comm_flops, &comm_all_to_all_bytes,
       "Payload x 1", true},
      {kCommAllReduce, LayerType::Communication, &comm_flops, &comm_all_reduce_bytes,
       "Payload x 2 (reduce-scatter + all-gather)", true},
      {kCommAllGather, LayerType::Communication, &comm_flops, &comm_all_gather_bytes,
       "Payload x 1", true},
      {kCommReduceScatter, LayerType::Communication, &comm_flops,
       &comm_reduce_scatter_bytes, "Payload x 1", true},
  };
  return kOps;
}

}  // namespace afdsim::ops
