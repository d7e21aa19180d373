// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "devmem/alloc/types.h"

#include <bit>
#include <utility>

#include "devmem/core/error.h"

namespace devmem { namespace alloc {

bool kinds_conflict(SuballocationKind a, SuballocationKind b) noexcept {
  if (a > b) std::swap(a, b);
  switch (a) {
    case SuballocationKind::Free:
      return false;
    case SuballocationKind::Unknown:
      return true;
    case SuballocationKind::Buffer:
      return b == SuballocationKind::ImageUnknown || b == SuballocationKind::ImageOptimal;
    case SuballocationKind::ImageUnknown:
      return b == SuballocationKind::ImageUnknown || b == SuballocationKind::ImageLinear ||
             b == SuballocationKind::ImageOptimal;
    case SuballocationKind::ImageLinear:
      return b == SuballocationKind::ImageOptimal;
    case SuballocationKind::ImageOptimal:
      return false;
  }
  return true;
}

bool blocks_on_same_page(DeviceSize a_offset, DeviceSize a_size, DeviceSize b_offset,
                         DeviceSize page_size) noexcept {
  const DeviceSize a_end = a_offset + a_size - 1;
  const DeviceSize a_end_page = a_end & ~(page_size - 1);
  const DeviceSize b_start_page = b_offset & ~(page_size - 1);
  return a_end_page == b_start_page;
}

std::string_view kind_name(SuballocationKind k) noexcept {
  switch (k) {
    case SuballocationKind::Free: return "FREE";
    case SuballocationKind::Unknown: return "UNKNOWN";
    case SuballocationKind::Buffer: return "BUFFER";
    case SuballocationKind::ImageUnknown: return "IMAGE_UNKNOWN";
    case SuballocationKind::ImageLinear: return "IMAGE_LINEAR";
    case SuballocationKind::ImageOptimal: return "IMAGE_OPTIMAL";
  }
  return "?";
}

std::string_view algorithm_name(PoolAlgorithm a) noexcept {
  switch (a) {
    case PoolAlgorithm::FreeList: return "FreeList";
    case PoolAlgorithm::Linear: return "Linear";
    case PoolAlgorithm::Buddy: return "Buddy";
  }
  return "?";
}

AllocationStrategy strategy_from_flags(AllocationCreateFlags flags) {
  const AllocationCreateFlags s = flags & kAllocationCreateStrategyMask;
  if (std::popcount(s) > 1) {
    core::throw_error(core::ErrorCode::InvalidArgument, "devmem",
                      "at most one allocation strategy flag may be set");
  }
  if (s & kAllocationCreateStrategyMinTime) return AllocationStrategy::MinTime;
  if (s & kAllocationCreateStrategyMinOffset) return AllocationStrategy::MinOffset;
  return AllocationStrategy::MinMemory;
}

}} // namespace devmem::alloc
