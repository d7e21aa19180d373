// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <limits>

namespace devmem {
namespace core {

[[nodiscard]] inline bool checked_add_u64(std::uint64_t a, std::uint64_t b, std::uint64_t& out) noexcept {
  if (a > std::numeric_limits<std::uint64_t>::max() - b) return false;
  out = a + b;
  return true;
}

[[nodiscard]] inline bool checked_mul_u64(std::uint64_t a, std::uint64_t b, std::uint64_t& out) noexcept {
  if (a == 0 || b == 0) { out = 0; return true; }
  if (a > std::numeric_limits<std::uint64_t>::max() / b) return false;
  out = a * b;
  return true;
}

inline std::uint64_t saturating_add_u64(std::uint64_t a, std::uint64_t b) noexcept {
  std::uint64_t out = 0;
  if (!checked_add_u64(a, b, out)) return std::numeric_limits<std::uint64_t>::max();
  return out;
}

inline constexpr bool is_pow2(std::uint64_t v) noexcept { return v != 0 && (v & (v - 1)) == 0; }

// align must be a power of two.
inline constexpr std::uint64_t align_up(std::uint64_t v, std::uint64_t align) noexcept {
  return (v + align - 1) & ~(align - 1);
}

inline constexpr std::uint64_t align_down(std::uint64_t v, std::uint64_t align) noexcept {
  return v & ~(align - 1);
}

// Overflow-checked align_up.
[[nodiscard]] inline bool checked_align_up(std::uint64_t v, std::uint64_t align, std::uint64_t& out) noexcept {
  std::uint64_t tmp = 0;
  if (!checked_add_u64(v, align - 1, tmp)) return false;
  out = tmp & ~(align - 1);
  return true;
}

// Smallest power of two >= v (v > 0, v <= 2^63).
inline std::uint64_t next_pow2(std::uint64_t v) noexcept {
  if (v <= 1) return 1;
  v -= 1;
  v |= v >> 1; v |= v >> 2; v |= v >> 4; v |= v >> 8; v |= v >> 16; v |= v >> 32;
  return v + 1;
}

// Largest power of two <= v (v > 0).
inline std::uint64_t prev_pow2(std::uint64_t v) noexcept {
  v |= v >> 1; v |= v >> 2; v |= v >> 4; v |= v >> 8; v |= v >> 16; v |= v >> 32;
  return v - (v >> 1);
}

} // namespace core
} // namespace devmem
