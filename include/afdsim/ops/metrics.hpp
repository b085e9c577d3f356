/*
 * Copyright (c) 2025 Lummy
 *
 * This software is released under the MIT License.
 * See the LICENSE file in the project root for full details.
 */
#pragma once

/**
 * @file metrics.hpp
 * @brief FLOP and byte counting primitives shared by every fused op
 * @version 0.1.0
 */

#include "afdsim/core/types.hpp"

namespace afdsim::ops {

/**
 * @brief Work performed by one fused op invocation
 */
struct OpCost {
  f64 flops = 0.0;
  f64 bytes_read = 0.0;     // Weights + activations in
  f64 bytes_written = 0.0;  // Activations out

  [[nodiscard]] f64 bytes_moved() const noexcept {
    return bytes_read + bytes_written;
  }

  OpCost& operator+=(const OpCost& other) noexcept {
    flops += other.flops;
    bytes_read += other.bytes_read;
    bytes_written += other.bytes_written;
    return *this;
  }
};

/**
 * @brief Byte traffic split into the read and write directions
 */
struct ByteCounts {
  f64 read = 0.0;
  f64 written = 0.0;
};

/**
 * @brief FLOPs of a dense [m, k] x [k, n] matmul (one multiply-add = 2 FLOPs)
 */
template <Numeric T>
constexpr f64 matmul_flops(T m, T n, T k) noexcept {
  return 2.0 * static_cast<f64>(m) * static_cast<f64>(n) * static_cast<f64>(k);
}

/**
 * @brief Bytes of a tensor with `elements` values of `dtype_bits` width
 */
template <Numeric T>
constexpr f64 tensor_bytes(T elements, i32 dtype_bits) noexcept {
  return bits_to_bytes(elements, dtype_bits);
}

/// Bytes of a row-major [rows, cols] tensor.
template <Numeric T>
constexpr f64 tensor_bytes(T rows, T cols, i32 dtype_bits) noexcept {
  return bits_to_bytes(static_cast<f64>(rows) * static_cast<f64>(cols), dtype_bits);
}

}  // namespace afdsim::ops
