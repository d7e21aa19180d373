// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "devmem/alloc/category.h"

#include <bit>

#include "devmem/core/error.h"

namespace devmem { namespace alloc {

using core::ErrorCode;

CategoryPreferences resolve_preferences(const AllocationCreateInfo& info) {
  CategoryPreferences p{info.required_flags, info.preferred_flags, info.not_preferred_flags};
  const bool seq_write = (info.flags & kAllocationCreateHostAccessSequentialWrite) != 0;
  const bool random = (info.flags & kAllocationCreateHostAccessRandom) != 0;
  if (seq_write && random) {
    core::throw_error(ErrorCode::InvalidArgument, "resolve_preferences",
                      "sequential-write and random host access are mutually exclusive");
  }

  switch (info.usage) {
    case MemoryUsage::Unknown:
      break;
    case MemoryUsage::GpuLazilyAllocated:
      p.required |= kMemoryPropertyLazilyAllocated;
      break;
    case MemoryUsage::Auto:
    case MemoryUsage::AutoPreferDevice:
    case MemoryUsage::AutoPreferHost: {
      const bool prefer_host = info.usage == MemoryUsage::AutoPreferHost;
      const bool prefer_device = info.usage == MemoryUsage::AutoPreferDevice;
      if ((info.flags & kAllocationCreateMapped) && !seq_write && !random) {
        core::throw_error(ErrorCode::InvalidArgument, "resolve_preferences",
                          "mapped allocation with automatic usage needs a host access flag");
      }
      if (random) {
        p.required |= kMemoryPropertyHostVisible;
        p.preferred |= kMemoryPropertyHostCached;
      } else if (seq_write) {
        p.required |= kMemoryPropertyHostVisible;
        p.not_preferred |= kMemoryPropertyHostCached;
        if (prefer_device) p.preferred |= kMemoryPropertyDeviceLocal;
        else p.not_preferred |= kMemoryPropertyDeviceLocal;
      } else {
        if (prefer_host) p.not_preferred |= kMemoryPropertyDeviceLocal;
        else p.preferred |= kMemoryPropertyDeviceLocal;
      }
      p.not_preferred |= kMemoryPropertyLazilyAllocated;
      break;
    }
  }
  p.not_preferred &= ~p.required;
  return p;
}

std::optional<std::uint32_t> rank_categories(std::span<const MemoryCategory> categories,
                                             std::uint32_t acceptable_bits,
                                             const CategoryPreferences& prefs) noexcept {
  std::optional<std::uint32_t> best;
  int best_score = 0;
  const std::size_t n = categories.size() < kMaxMemoryCategories ? categories.size() : kMaxMemoryCategories;
  for (std::uint32_t i = 0; i < n; ++i) {
    if (acceptable_bits != 0 && (acceptable_bits & (1u << i)) == 0) continue;
    const MemoryPropertyFlags flags = categories[i].property_flags;
    if ((flags & prefs.required) != prefs.required) continue;
    const int score = std::popcount(flags & prefs.preferred) - std::popcount(flags & prefs.not_preferred);
    if (!best || score > best_score) {
      best = i;
      best_score = score;
    }
  }
  return best;
}

std::uint32_t find_memory_category(std::span<const MemoryCategory> categories,
                                   std::uint32_t acceptable_bits,
                                   const CategoryPreferences& prefs) {
  auto best = rank_categories(categories, acceptable_bits, prefs);
  if (!best) {
    core::throw_error(ErrorCode::FeatureNotPresent, "find_memory_category",
                      "no memory category satisfies the required property flags");
  }
  return *best;
}

std::uint32_t combine_category_bits(std::uint32_t a, std::uint32_t b) {
  if (a == 0) return b;
  if (b == 0) return a;
  if ((a & b) == 0) {
    core::throw_error(ErrorCode::FeatureNotPresent, "combine_category_bits",
                      "acceptable category masks are disjoint");
  }
  return a & b;
}

PlacementKind decide_placement(const PlacementInput& in) {
  const bool never = (in.flags & kAllocationCreateNeverAllocate) != 0;
  const bool dedicated = (in.flags & kAllocationCreateDedicated) != 0;
  if (dedicated && never) {
    core::throw_error(ErrorCode::InvalidArgument, "decide_placement",
                      "dedicated and never-allocate are mutually exclusive");
  }
  if (in.custom_pool) {
    if (dedicated || in.requires_dedicated) {
      core::throw_error(ErrorCode::InvalidArgument, "decide_placement",
                        "custom pools do not hold dedicated allocations");
    }
    return PlacementKind::Pooled;
  }
  if (dedicated) return PlacementKind::Dedicated;
  if (in.requires_dedicated || in.usage == MemoryUsage::GpuLazilyAllocated) {
    if (never) {
      core::throw_error(ErrorCode::InvalidArgument, "decide_placement",
                        "request needs dedicated memory but never-allocate is set");
    }
    return PlacementKind::Dedicated;
  }
  if (never) return PlacementKind::Pooled;
  if (in.prefers_dedicated || in.debug_always_dedicated) return PlacementKind::Dedicated;
  if (in.preferred_block_size != 0 && in.size > in.preferred_block_size / 2) return PlacementKind::Dedicated;
  return PlacementKind::Pooled;
}

}} // namespace devmem::alloc
