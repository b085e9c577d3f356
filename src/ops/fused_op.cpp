/*
 * Copyright (c) 2025 Lummy
 *
 * This software is released under the MIT License.
 * See the LICENSE file in the project root for full details.
 */

#include "afdsim/ops/fused_op.hpp"

#include <cmath>
#include <utility>

#include <glog/logging.h>

#include "afdsim/ops/attention_ops.hpp"
#include "afdsim/ops/comm_ops.hpp"
#include "afdsim/ops/ffn_ops.hpp"
#include "afdsim/ops/moe_ops.hpp"

namespace afdsim::ops {

namespace {

Result<void> domain_error(std::string_view op_name, const std::string& what) {
  return Err<void>(ErrorCode::FormulaDomain, std::string(op_name) + ": " + what);
}

bool finite_non_negative(f64 v) { return std::isfinite(v) && v >= 0.0; }

}  // namespace

// ============================================================================
// OpShape
// ============================================================================

OpShape OpShape::from_layer(const model::LayerConfig& layer) {
  OpShape shape;
  const model::AttentionConfig& attn = layer.attention;

  switch (layer.type()) {
    case LayerType::Attention: {
      shape.dtype_bits = attn.dtype_bits;
      shape.d_model = attn.d_model;
      shape.num_heads = attn.num_heads;
      shape.num_kv_heads = attn.resolved_kv_heads();
      shape.head_dim = attn.resolved_head_dim();
      shape.kv_cache_len = layer.as<model::AttentionPayload>().kv_cache_len;
      break;
    }
    case LayerType::FFN: {
      const auto& ffn = layer.as<model::FFNConfig>();
      shape.dtype_bits = ffn.dtype_bits;
      shape.d_model = ffn.d_model > 0 ? ffn.d_model : attn.d_model;
      shape.d_ff = ffn.d_ff;
      shape.gated = model::is_gated(ffn.activation);
      break;
    }
    case LayerType::MoE: {
      const auto& moe = layer.as<model::MoEConfig>();
      shape.dtype_bits = moe.dtype_bits;
      shape.d_model = moe.d_model > 0 ? moe.d_model : attn.d_model;
      shape.d_ff = moe.expert_intermediate;
      shape.num_experts = moe.num_experts;
      shape.experts_per_token = moe.experts_per_token;
      shape.num_groups = moe.num_groups;
      shape.num_shared_experts = moe.num_shared_experts;
      break;
    }
    case LayerType::Communication: {
      const auto& comm = layer.as<model::CommunicationConfig>();
      shape.payload_bytes = comm.payload_mb * kMega;
      shape.num_devices = comm.num_devices;
      break;
    }
  }
  return shape;
}

Result<void> OpShape::check_domain(std::string_view op_name) const {
  if (dtype_bits <= 0) {
    return domain_error(op_name, "dtype_bits must be positive");
  }
  const std::pair<const char*, i64> dims[] = {
      {"d_model", d_model},
      {"num_heads", num_heads},
      {"num_kv_heads", num_kv_heads},
      {"head_dim", head_dim},
      {"kv_cache_len", kv_cache_len},
      {"d_ff", d_ff},
      {"num_experts", num_experts},
      {"experts_per_token", experts_per_token},
      {"num_shared_experts", num_shared_experts},
      {"num_devices", num_devices},
  };
  for (const auto& [field, value] : dims) {
    if (value < 0) {
      return domain_error(op_name, std::string(field) + " is negative (" +
                                       std::to_string(value) + ")");
    }
  }
  if (num_groups < 1) {
    return domain_error(op_name, "num_groups must be >= 1");
  }
  if (!finite_non_negative(payload_bytes)) {
    return domain_error(op_name, "payload must be finite and non-negative");
  }
  return Ok();
}

// ============================================================================
// FusionOp
// ============================================================================

Result<OpCost> FusionOp::evaluate(const OpShape& shape,
                                  const model::RuntimeShape& runtime) const {
  auto domain = shape.check_domain(name);
  if (!domain) {
    return Err<OpCost>(std::move(domain.error()));
  }

  auto flops = flops_fn(shape, runtime);
  if (!flops) {
    return Err<OpCost>(ErrorCode::FormulaDomain,
                       std::string(name) + ": " + flops.error().message());
  }
  auto bytes = bytes_fn(shape, runtime);
  if (!bytes) {
    return Err<OpCost>(ErrorCode::FormulaDomain,
                       std::string(name) + ": " + bytes.error().message());
  }

  OpCost cost{
      .flops = flops.value(),
      .bytes_read = bytes.value().read,
      .bytes_written = bytes.value().written,
  };
  if (!finite_non_negative(cost.flops) || !finite_non_negative(cost.bytes_read) ||
      !finite_non_negative(cost.bytes_written)) {
    return Err<OpCost>(ErrorCode::FormulaDomain,
                       std::string(name) + ": formula produced a negative or "
                                           "non-finite count");
  }
  return Ok(cost);
}

// ============================================================================
// FusedOpLibrary
// ============================================================================

FusedOpLibrary FusedOpLibrary::standard() {
  FusedOpLibrary library;
  for (auto family : {attention_ops(), ffn_ops(), moe_ops(), comm_ops()}) {
    auto result = library.register_ops(family);
    if (!result) {
      LOG(ERROR) << "Built-in fused op rejected: " << result.error().to_string();
    }
  }
  VLOG(1) << "FusedOpLibrary: registered " << library.size() << " built-in ops";
  return library;
}

Result<void> FusedOpLibrary::register_op(const FusionOp& op) {
  if (op.name.empty()) {
    return Err<void>(ErrorCode::InvalidArgument, "Fused op name is empty");
  }
  if (op.flops_fn == nullptr || op.bytes_fn == nullptr) {
    return Err<void>(ErrorCode::InvalidArgument,
                     "Fused op '" + std::string(op.name) + "' is missing a formula");
  }
  if (index_.find(op.name) != index_.end()) {
    return Err<void>(ErrorCode::InvalidArgument,
                     "Fused op '" + std::string(op.name) + "' already registered");
  }
  index_.emplace(std::string(op.name), ops_.size());
  ops_.push_back(op);
  return Ok();
}

Result<void> FusedOpLibrary::register_ops(std::span<const FusionOp> ops) {
  for (const auto& op : ops) {
    auto result = register_op(op);
    if (!result) {
      return result;
    }
  }
  return Ok();
}

const FusionOp* FusedOpLibrary::find(std::string_view name) const noexcept {
  auto it = index_.find(name);
  if (it == index_.end()) {
    return nullptr;
  }
  return &ops_[it->second];
}

Result<OpCost> FusedOpLibrary::evaluate(std::string_view name, const OpShape& shape,
                                        const model::RuntimeShape& runtime) const {
  const FusionOp* op = find(name);
  if (op == nullptr) {
    return Err<OpCost>(ErrorCode::InvalidArgument,
                       "Unknown fused op: " + std::string(name));
  }
  return op->evaluate(shape, runtime);
}

}  // namespace afdsim::ops
