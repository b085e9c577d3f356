/*
 * Copyright (c) 2025 Lummy
 *
 * This software is released under the MIT License.
 * See the LICENSE file in the project root for full details.
 */
#pragma once

/**
 * @file fused_op.hpp
 * @brief Fused-op descriptors and the registry that owns them
 * @version 0.1.0
 *
 * A fused op is a named pair of pure functions, one for FLOPs and one for
 * bytes, over a shape derived from a LayerConfig and the RuntimeShape. The
 * functions hold no state, so a FusedOpLibrary may be shared by any number
 * of concurrent simulation runs once it is built.
 */

#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "afdsim/core/error.hpp"
#include "afdsim/core/types.hpp"
#include "afdsim/model/layer_config.hpp"
#include "afdsim/model/runtime_shape.hpp"
#include "afdsim/ops/metrics.hpp"

namespace afdsim::ops {

// ============================================================================
// OpShape
// ============================================================================

/**
 * @brief Flattened, layer-derived shape every fused op formula reads from
 *
 * Fields that do not apply to a layer kind stay at their zero defaults.
 */
struct OpShape {
  i32 dtype_bits = kDefaultDtypeBits;

  // Attention
  i64 d_model = 0;
  i64 num_heads = 0;
  i64 num_kv_heads = 0;
  i64 head_dim = 0;
  i64 kv_cache_len = 0;

  // FFN / MoE
  i64 d_ff = 0;  // FFN intermediate size, or per-expert intermediate size
  bool gated = false;
  i64 num_experts = 0;
  i64 experts_per_token = 0;
  i64 num_groups = 1;
  i64 num_shared_experts = 0;

  // Communication
  f64 payload_bytes = 0.0;
  i64 num_devices = 0;

  [[nodiscard]] i64 q_dim() const noexcept { return num_heads * head_dim; }
  [[nodiscard]] i64 kv_dim() const noexcept { return num_kv_heads * head_dim; }

  /**
   * @brief Derive the op shape of a layer
   *
   * FFN and MoE layers without their own d_model inherit the attention
   * sub-config's d_model.
   */
  static OpShape from_layer(const model::LayerConfig& layer);

  /**
   * @brief Reject negative dimensions, non-positive dtype widths and
   *        non-finite payloads
   *
   * @return FormulaDomain error naming the op and the offending field
   */
  [[nodiscard]] Result<void> check_domain(std::string_view op_name) const;
};

// ============================================================================
// FusionOp
// ============================================================================

using FlopsFn = Result<f64> (*)(const OpShape&, const model::RuntimeShape&);
using BytesFn = Result<ByteCounts> (*)(const OpShape&, const model::RuntimeShape&);

/**
 * @brief Named kernel descriptor
 */
struct FusionOp {
  std::string_view name;
  LayerType family;  // Layer kind the op belongs to
  FlopsFn flops_fn;
  BytesFn bytes_fn;
  std::string_view notes;
  bool over_interconnect = false;  // Bytes cross device links, not HBM

  /**
   * @brief Evaluate both formulas into one OpCost
   *
   * @return FormulaDomain error if either formula rejects the shape
   */
  [[nodiscard]] Result<OpCost> evaluate(const OpShape& shape,
                                        const model::RuntimeShape& runtime) const;
};

// ============================================================================
// FusedOpLibrary
// ============================================================================

/**
 * @brief Registry of fused ops keyed by name
 *
 * Constructed explicitly and passed to the estimators that need it; there is
 * no process-wide instance. Listing order is registration order.
 *
 * Usage:
 * @code
 *   auto library = FusedOpLibrary::standard();
 *   auto cost = library.evaluate("ffn_up_proj", shape, runtime);
 * @endcode
 */
class FusedOpLibrary {
 public:
  FusedOpLibrary() = default;

  /**
   * @brief Library with every built-in attention, FFN, MoE and
   *        communication op registered
   */
  static FusedOpLibrary standard();

  /**
   * @brief Add an op to the registry
   *
   * @return InvalidArgument if the name is empty, already registered, or
   *         either formula is missing
   */
  Result<void> register_op(const FusionOp& op);

  /**
   * @brief Register a batch of ops, stopping at the first failure
   */
  Result<void> register_ops(std::span<const FusionOp> ops);

  /**
   * @brief Look up an op by name, nullptr if unknown
   */
  [[nodiscard]] const FusionOp* find(std::string_view name) const noexcept;

  [[nodiscard]] bool contains(std::string_view name) const noexcept {
    return find(name) != nullptr;
  }

  /**
   * @brief Evaluate a registered op
   *
   * @return InvalidArgument for an unknown name, otherwise the op's result
   */
  [[nodiscard]] Result<OpCost> evaluate(std::string_view name, const OpShape& shape,
                                        const model::RuntimeShape& runtime) const;

  [[nodiscard]] const std::vector<FusionOp>& ops() const noexcept { return ops_; }

  [[nodiscard]] usize size() const noexcept { return ops_.size(); }

 private:
  std::vector<FusionOp> ops_;
  std::map<std::string, usize, std::less<>> index_;
};

}  // namespace afdsim::ops
