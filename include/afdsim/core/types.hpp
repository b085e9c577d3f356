/*
 * Copyright (c) 2025 Lummy
 *
 * This software is released under the MIT License.
 * See the LICENSE file in the project root for full details.
 */

/**
 * @file types.hpp
 * @brief Fundamental type definitions and concepts for afdsim
 * @version 0.1.0
 *
 * Scalar aliases, the layer-kind tag and the small set of C++20 concepts
 * shared by the estimation engine.
 */

#ifndef AFDSIM_CORE_TYPES_HPP
#define AFDSIM_CORE_TYPES_HPP

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <type_traits>

namespace afdsim {

// ============================================================================
// Integer Types
// ============================================================================

using i8 = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using usize = std::size_t;
using isize = std::ptrdiff_t;

// ============================================================================
// Floating Point Types
// ============================================================================

using f32 = float;
using f64 = double;

// ============================================================================
// Unit conversions
// ============================================================================

inline constexpr f64 kTera = 1e12;
inline constexpr f64 kGiga = 1e9;
inline constexpr f64 kMega = 1e6;
inline constexpr f64 kMsPerSecond = 1e3;

/// Element width used when a layer config does not name one (bf16/fp16).
inline constexpr i32 kDefaultDtypeBits = 16;

// ============================================================================
// Layer Types
// ============================================================================

/**
 * @enum LayerType
 * @brief Kind of a layer in a scenario
 *
 * The numeric value matches the alternative index of LayerConfig::payload.
 */
enum class LayerType : u8 {
  Attention = 0,
  FFN = 1,
  MoE = 2,
  Communication = 3,
};

/**
 * @brief Convert LayerType to its canonical lowercase name
 */
constexpr std::string_view layer_type_str(LayerType type) noexcept {
  switch (type) {
    case LayerType::Attention:
      return "attention";
    case LayerType::FFN:
      return "ffn";
    case LayerType::MoE:
      return "moe";
    case LayerType::Communication:
      return "communication";
    default:
      return "unknown";
  }
}

// ============================================================================
// Concepts
// ============================================================================

/**
 * @brief Concept that constrains T to be a floating-point type
 */
template <typename T>
concept FloatingPoint = std::floating_point<T>;

/**
 * @brief Concept that constrains T to be an integral type
 */
template <typename T>
concept Integral = std::integral<T>;

/**
 * @brief Concept that constrains T to be a numeric type (integer or float)
 */
template <typename T>
concept Numeric = FloatingPoint<T> || Integral<T>;

/**
 * @brief Bytes occupied by `elements` values of `dtype_bits` width
 */
template <Numeric T>
constexpr f64 bits_to_bytes(T elements, i32 dtype_bits) noexcept {
  return static_cast<f64>(elements) * static_cast<f64>(dtype_bits) / 8.0;
}

}  // namespace afdsim

#endif  // AFDSIM_CORE_TYPES_HPP
