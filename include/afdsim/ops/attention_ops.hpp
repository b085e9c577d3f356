/*
 * Copyright (c) 2025 Lummy
 *
 * This software is released under the MIT License.
 * See the LICENSE file in the project root for full details.
 */
#pragma once

/**
 * @file attention_ops.hpp
 * @brief Attention-family fused ops (QKV, scores, softmax, weighted sum, output)
 * @version 0.1.0
 *
 * Shapes follow grouped-query attention: queries use num_heads heads, keys
 * and values num_kv_heads heads, all of width head_dim. Keys and values span
 * kv_cache_len + seq_len positions.
 */

#include <span>

#include "afdsim/ops/fused_op.hpp"

namespace afdsim::ops {

inline constexpr std::string_view kAttentionQkvProj = "attention_qkv_proj";
inline constexpr std::string_view kAttentionScores = "attention_scores";
inline constexpr std::string_view kAttentionSoftmax = "attention_softmax";
inline constexpr std::string_view kAttentionWeightedSum = "attention_weighted_sum";
inline constexpr std::string_view kAttentionOutputProj = "attention_output_proj";

/**
 * @brief Q, K and V projections fused into one [T, d] x [d, q + 2kv] GEMM
 */
Result<f64> attention_qkv_proj_flops(const OpShape& s, const model::RuntimeShape& r);
Result<ByteCounts> attention_qkv_proj_bytes(const OpShape& s, const model::RuntimeShape& r);

/**
 * @brief Q x K^T per head over kv_len key positions
 */
Result<f64> attention_scores_flops(const OpShape& s, const model::RuntimeShape& r);
Result<ByteCounts> attention_scores_bytes(const OpShape& s, const model::RuntimeShape& r);

/**
 * @brief Row softmax over the score matrix (one FLOP per score)
 */
Result<f64> attention_softmax_flops(const OpShape& s, const model::RuntimeShape& r);
Result<ByteCounts> attention_softmax_bytes(const OpShape& s, const model::RuntimeShape& r);

/**
 * @brief Probabilities x V per head
 */
Result<f64> attention_weighted_sum_flops(const OpShape& s, const model::RuntimeShape& r);
Result<ByteCounts> attention_weighted_sum_bytes(const OpShape& s,
                                                const model::RuntimeShape& r);

/**
 * @brief [T, q] x [q, d] output projection
 */
Result<f64> attention_output_proj_flops(const OpShape& s, const model::RuntimeShape& r);
Result<ByteCounts> attention_output_proj_bytes(const OpShape& s,
                                               const model::RuntimeShape& r);

/**
 * @brief Descriptors for every attention-family op, in execution order
 */
std::span<const FusionOp> attention_ops() noexcept;

}  // namespace afdsim::ops
