/*
 * Copyright (c) 2025 Lummy
 *
 * This software is released under the MIT License.
 * See the LICENSE file in the project root for full details.
 */
#pragma once

/**
 * @file ffn_ops.hpp
 * @brief Feed-forward fused ops (up, gate, activation, down)
 * @version 0.1.0
 */

#include <span>

#include "afdsim/ops/fused_op.hpp"

namespace afdsim::ops {

inline constexpr std::string_view kFfnUpProj = "ffn_up_proj";
inline constexpr std::string_view kFfnGateProj = "ffn_gate_proj";
inline constexpr std::string_view kFfnActivation = "ffn_activation";
inline constexpr std::string_view kFfnDownProj = "ffn_down_proj";

Result<f64> ffn_up_proj_flops(const OpShape& s, const model::RuntimeShape& r);
Result<ByteCounts> ffn_up_proj_bytes(const OpShape& s, const model::RuntimeShape& r);

/**
 * @brief Gate projection of a gated activation; zero for ungated FFNs
 */
Result<f64> ffn_gate_proj_flops(const OpShape& s, const model::RuntimeShape& r);
Result<ByteCounts> ffn_gate_proj_bytes(const OpShape& s, const model::RuntimeShape& r);

/**
 * @brief Elementwise activation, plus the gate multiply when gated
 */
Result<f64> ffn_activation_flops(const OpShape& s, const model::RuntimeShape& r);
Result<ByteCounts> ffn_activation_bytes(const OpShape& s, const model::RuntimeShape& r);

Result<f64> ffn_down_proj_flops(const OpShape& s, const model::RuntimeShape& r);
Result<ByteCounts> ffn_down_proj_bytes(const OpShape& s, const model::RuntimeShape& r);

std::span<const FusionOp> ffn_ops() noexcept;

}  // namespace afdsim::ops
