// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <span>

#include "devmem/alloc/types.h"

namespace devmem { namespace alloc {

// Pure functions over immutable inputs; no allocator state involved.

struct CategoryPreferences {
  MemoryPropertyFlags required{0};
  MemoryPropertyFlags preferred{0};
  MemoryPropertyFlags not_preferred{0};
};

// Folds usage and host-access flags into property preferences. Throws
// InvalidArgument for contradictory flags.
CategoryPreferences resolve_preferences(const AllocationCreateInfo& info);

// Among categories allowed by acceptable_bits (0 = all) that carry every
// required flag, picks the one with the highest score (matched preferred
// flags minus matched not-preferred flags); ties go to the lowest index.
std::optional<std::uint32_t> rank_categories(std::span<const MemoryCategory> categories,
                                             std::uint32_t acceptable_bits,
                                             const CategoryPreferences& prefs) noexcept;

// rank_categories, throwing FeatureNotPresent when nothing qualifies.
std::uint32_t find_memory_category(std::span<const MemoryCategory> categories,
                                   std::uint32_t acceptable_bits,
                                   const CategoryPreferences& prefs);

// Intersection of two category masks where 0 means "any". Throws
// FeatureNotPresent when both are non-zero and disjoint.
std::uint32_t combine_category_bits(std::uint32_t a, std::uint32_t b);

enum class PlacementKind : std::uint8_t { Pooled, Dedicated };

struct PlacementInput {
  AllocationCreateFlags flags{0};
  MemoryUsage usage{MemoryUsage::Unknown};
  DeviceSize size{0};
  DeviceSize preferred_block_size{0};
  bool prefers_dedicated{false};
  bool requires_dedicated{false};
  bool custom_pool{false};
  bool debug_always_dedicated{false};
};

// Dedicated vs pooled. Throws InvalidArgument for Dedicated|NeverAllocate,
// for a required dedicated allocation under NeverAllocate, and for dedicated
// requests against a custom pool.
PlacementKind decide_placement(const PlacementInput& in);

}} // namespace devmem::alloc
