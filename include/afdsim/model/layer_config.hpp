/*
 * Copyright (c) 2025 Lummy
 *
 * This software is released under the MIT License.
 * See the LICENSE file in the project root for full details.
 */

/**
 * @file layer_config.hpp
 * @brief Declarative layer shapes: a tagged union over the four layer kinds
 * @version 0.1.0
 */

#ifndef AFDSIM_MODEL_LAYER_CONFIG_HPP
#define AFDSIM_MODEL_LAYER_CONFIG_HPP

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "afdsim/core/error.hpp"
#include "afdsim/core/types.hpp"

namespace afdsim::model {

// ============================================================================
// Shared attention sub-config
// ============================================================================

/**
 * @brief Attention geometry shared by every layer kind
 *
 * Attention layers estimate from it directly; FFN and MoE layers use it to
 * fill in d_model when their own block leaves it out.
 */
struct AttentionConfig {
  i32 d_model = 0;
  i32 num_heads = 0;
  i32 num_kv_heads = 0;          // 0 means "same as num_heads" (plain MHA)
  std::optional<i32> head_dim;   // Defaults to d_model / num_heads
  i32 dtype_bits = kDefaultDtypeBits;

  [[nodiscard]] Result<void> validate() const;

  [[nodiscard]] i32 resolved_head_dim() const noexcept {
    if (head_dim.has_value()) {
      return *head_dim;
    }
    return num_heads > 0 ? d_model / num_heads : 0;
  }

  [[nodiscard]] i32 resolved_kv_heads() const noexcept {
    return num_kv_heads > 0 ? num_kv_heads : num_heads;
  }

  [[nodiscard]] i64 q_dim() const noexcept {
    return static_cast<i64>(num_heads) * resolved_head_dim();
  }

  [[nodiscard]] i64 kv_dim() const noexcept {
    return static_cast<i64>(resolved_kv_heads()) * resolved_head_dim();
  }
};

// ============================================================================
// Type-specific payloads
// ============================================================================

/**
 * @brief Attention layer payload
 *
 * kv_cache_len counts tokens already resident in the KV cache; keys and
 * values span kv_cache_len + seq_len positions.
 */
struct AttentionPayload {
  i64 kv_cache_len = 0;
};

enum class Activation : u8 {
  Gelu = 0,
  Relu = 1,
  Silu = 2,
  SwiGLU = 3,
  GeGLU = 4,
};

constexpr std::string_view activation_str(Activation act) noexcept {
  switch (act) {
    case Activation::Gelu: return "gelu";
    case Activation::Relu: return "relu";
    case Activation::Silu: return "silu";
    case Activation::SwiGLU: return "swiglu";
    case Activation::GeGLU: return "geglu";
    default: return "unknown";
  }
}

/// Gated activations multiply act(x W_gate) with x W_up.
constexpr bool is_gated(Activation act) noexcept {
  return act == Activation::SwiGLU || act == Activation::GeGLU;
}

Result<Activation> parse_activation(std::string_view name);

struct FFNConfig {
  i32 d_model = 0;
  i32 d_ff = 0;
  Activation activation = Activation::Silu;
  i32 dtype_bits = kDefaultDtypeBits;

  [[nodiscard]] Result<void> validate() const;
};

/**
 * @brief Mixture-of-experts payload
 *
 * num_groups is the routing group count (group-limited routing); dispatch
 * traffic per device is divided by it.
 */
struct MoEConfig {
  i32 d_model = 0;
  i32 expert_intermediate = 0;
  i32 num_experts = 1;
  i32 experts_per_token = 1;
  i32 num_groups = 1;
  i32 num_shared_experts = 0;
  bool include_dispatch = true;
  i32 dtype_bits = kDefaultDtypeBits;

  [[nodiscard]] Result<void> validate() const;
};

enum class CommPattern : u8 {
  AllToAll = 0,
  AllReduce = 1,
  AllGather = 2,
  ReduceScatter = 3,
};

constexpr std::string_view comm_pattern_str(CommPattern pattern) noexcept {
  switch (pattern) {
    case CommPattern::AllToAll: return "all_to_all";
    case CommPattern::AllReduce: return "all_reduce";
    case CommPattern::AllGather: return "all_gather";
    case CommPattern::ReduceScatter: return "reduce_scatter";
    default: return "unknown";
  }
}

Result<CommPattern> parse_comm_pattern(std::string_view name);

struct CommunicationConfig {
  CommPattern pattern = CommPattern::AllToAll;
  f64 payload_mb = 1.0;
  i32 num_devices = 0;  // 0 = ring factor not modeled

  [[nodiscard]] Result<void> validate() const;
};

// ============================================================================
// LayerConfig
// ============================================================================

/// Alternative order must match LayerType.
using LayerPayload =
    std::variant<AttentionPayload, FFNConfig, MoEConfig, CommunicationConfig>;

/**
 * @brief One layer of a scenario
 *
 * Exactly one payload alternative is populated. as<T>() with the wrong T
 * throws std::bad_variant_access: that is a programming error, estimators
 * dispatch on type() first.
 */
struct LayerConfig {
  std::string name;
  i32 layer_id = 0;
  AttentionConfig attention;
  LayerPayload payload;

  [[nodiscard]] LayerType type() const noexcept {
    return static_cast<LayerType>(payload.index());
  }

  template <typename T>
  [[nodiscard]] const T& as() const {
    return std::get<T>(payload);
  }

  /**
   * @brief Validate the populated payload (and the attention block for
   *        attention layers)
   */
  [[nodiscard]] Result<void> validate() const;

  static LayerConfig attention_layer(std::string name, i32 layer_id,
                                     AttentionConfig attn,
                                     AttentionPayload payload = {});
  static LayerConfig ffn_layer(std::string name, i32 layer_id, FFNConfig ffn,
                               AttentionConfig attn = {});
  static LayerConfig moe_layer(std::string name, i32 layer_id, MoEConfig moe,
                               AttentionConfig attn = {});
  static LayerConfig communication_layer(std::string name, i32 layer_id,
                                         CommunicationConfig comm);
};

}  // namespace afdsim::model

#endif  // AFDSIM_MODEL_LAYER_CONFIG_HPP
