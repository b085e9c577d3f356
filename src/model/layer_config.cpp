/*
 * Copyright (c) 2025 Lummy
 *
 * This software is released under the MIT License.
 * See the LICENSE file in the project root for full details.
 */

#include "afdsim/model/layer_config.hpp"

#include <cmath>

namespace afdsim::model {

namespace {

Result<void> require_non_negative(i64 value, const char* field) {
  if (value < 0) {
    return Err<void>(ErrorCode::ConfigValidation,
                     std::string(field) + " must be >= 0, got " +
                         std::to_string(value));
  }
  return Ok();
}

Result<void> validate_dtype_bits(i32 dtype_bits) {
  if (dtype_bits <= 0 || dtype_bits > 64) {
    return Err<void>(ErrorCode::ConfigValidation,
                     "dtype_bits must be in [1, 64], got " +
                         std::to_string(dtype_bits));
  }
  return Ok();
}

}  // namespace

// ============================================================================
// Enum parsing
// ============================================================================

Result<Activation> parse_activation(std::string_view name) {
  if (name == "gelu") return Ok(Activation::Gelu);
  if (name == "relu") return Ok(Activation::Relu);
  if (name == "silu" || name == "swish") return Ok(Activation::Silu);
  if (name == "swiglu") return Ok(Activation::SwiGLU);
  if (name == "geglu") return Ok(Activation::GeGLU);
  return Err<Activation>(ErrorCode::ConfigValidation,
                         "Unknown activation: " + std::string(name));
}

Result<CommPattern> parse_comm_pattern(std::string_view name) {
  if (name == "all_to_all") return Ok(CommPattern::AllToAll);
  if (name == "all_reduce") return Ok(CommPattern::AllReduce);
  if (name == "all_gather") return Ok(CommPattern::AllGather);
  if (name == "reduce_scatter") return Ok(CommPattern::ReduceScatter);
  return Err<CommPattern>(ErrorCode::ConfigValidation,
                          "Unknown communication pattern: " + std::string(name));
}

// ============================================================================
// Validation
// ============================================================================

Result<void> AttentionConfig::validate() const {
  if (d_model <= 0) {
    return Err<void>(ErrorCode::ConfigValidation,
                     "attention d_model must be > 0, got " + std::to_string(d_model));
  }
  if (num_heads <= 0) {
    return Err<void>(ErrorCode::ConfigValidation,
                     "attention num_heads is required and must be > 0");
  }
  if (head_dim.has_value()) {
    if (*head_dim <= 0) {
      return Err<void>(ErrorCode::ConfigValidation,
                       "attention head_dim must be > 0, got " +
                           std::to_string(*head_dim));
    }
  } else if (d_model % num_heads != 0) {
    return Err<void>(ErrorCode::ConfigValidation,
                     "attention head_dim missing and d_model (" +
                         std::to_string(d_model) +
                         ") is not divisible by num_heads (" +
                         std::to_string(num_heads) + ")");
  }
  if (num_kv_heads < 0 || num_kv_heads > num_heads ||
      (num_kv_heads > 0 && num_heads % num_kv_heads != 0)) {
    return Err<void>(ErrorCode::ConfigValidation,
                     "attention num_kv_heads (" + std::to_string(num_kv_heads) +
                         ") must divide num_heads (" + std::to_string(num_heads) + ")");
  }
  return validate_dtype_bits(dtype_bits);
}

Result<void> FFNConfig::validate() const {
  auto r = require_non_negative(d_model, "ffn d_model");
  if (!r) return r;
  r = require_non_negative(d_ff, "ffn d_ff");
  if (!r) return r;
  return validate_dtype_bits(dtype_bits);
}

Result<void> MoEConfig::validate() const {
  auto r = require_non_negative(d_model, "moe d_model");
  if (!r) return r;
  r = require_non_negative(expert_intermediate, "moe expert_intermediate");
  if (!r) return r;
  r = require_non_negative(num_experts, "moe num_experts");
  if (!r) return r;
  r = require_non_negative(experts_per_token, "moe experts_per_token");
  if (!r) return r;
  r = require_non_negative(num_shared_experts, "moe num_shared_experts");
  if (!r) return r;

  if (experts_per_token > num_experts) {
    return Err<void>(ErrorCode::ConfigValidation,
                     "moe experts_per_token (" + std::to_string(experts_per_token) +
                         ") exceeds num_experts (" + std::to_string(num_experts) + ")");
  }
  if (num_groups < 1) {
    return Err<void>(ErrorCode::ConfigValidation,
                     "moe num_groups must be >= 1, got " + std::to_string(num_groups));
  }
  return validate_dtype_bits(dtype_bits);
}

Result<void> CommunicationConfig::validate() const {
  if (!std::isfinite(payload_mb) || payload_mb < 0.0) {
    return Err<void>(ErrorCode::ConfigValidation,
                     "communication payload_mb must be a non-negative finite number");
  }
  return require_non_negative(num_devices, "communication num_devices");
}

Result<void> LayerConfig::validate() const {
  Result<void> payload_result = std::visit(
      [this](const auto& p) -> Result<void> {
        using P = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<P, AttentionPayload>) {
          if (p.kv_cache_len < 0) {
            return Err<void>(ErrorCode::ConfigValidation,
                             "attention kv_cache_len must be >= 0");
          }
          return attention.validate();
        } else {
          return p.validate();
        }
      },
      payload);

  if (!payload_result) {
    const Error& e = payload_result.error();
    return Err<void>(e.code(), "layer '" + name + "': " + e.message());
  }
  return Ok();
}

// ============================================================================
// Factories
// ============================================================================

LayerConfig LayerConfig::attention_layer(std::string name, i32 layer_id,
                                         AttentionConfig attn,
                                         AttentionPayload payload) {
  return LayerConfig{.name = std::move(name),
                     .layer_id = layer_id,
                     .attention = attn,
                     .payload = payload};
}

LayerConfig LayerConfig::ffn_layer(std::string name, i32 layer_id, FFNConfig ffn,
                                   AttentionConfig attn) {
  return LayerConfig{.name = std::move(name),
                     .layer_id = layer_id,
                     .attention = attn,
                     .payload = ffn};
}

LayerConfig LayerConfig::moe_layer(std::string name, i32 layer_id, MoEConfig moe,
                                   AttentionConfig attn) {
  return LayerConfig{.name = std::move(name),
                     .layer_id = layer_id,
                     .attention = attn,
                     .payload = moe};
}

LayerConfig LayerConfig::communication_layer(std::string name, i32 layer_id,
                                             CommunicationConfig comm) {
  return LayerConfig{.name = std::move(name),
                     .layer_id = layer_id,
                     .attention = {},
                     .payload = comm};
}

}  // namespace afdsim::model
