// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "devmem/alloc/metadata.h"

#include "devmem/alloc/metadata_buddy.h"
#include "devmem/alloc/metadata_free_list.h"
#include "devmem/alloc/metadata_linear.h"

namespace devmem { namespace alloc {

BlockMetadata::BlockMetadata(DeviceSize size, DeviceSize granularity, DeviceSize debug_margin,
                             bool is_virtual)
  : size_(size),
    granularity_(granularity == 0 ? 1 : granularity),
    debug_margin_(is_virtual ? 0 : debug_margin),
    is_virtual_(is_virtual) {}

void BlockMetadata::for_each_allocation(const std::function<void(const RangeInfo&)>& fn) const {
  for_each_range([&](const RangeInfo& r) {
    if (!r.free) fn(r);
  });
}

std::size_t BlockMetadata::free_region_count() const {
  std::size_t n = 0;
  for_each_range([&](const RangeInfo& r) {
    if (r.free) ++n;
  });
  return n;
}

DeviceSize BlockMetadata::next_free_region_size(AllocHandle handle) const {
  const DeviceSize off = offset_from_handle(handle);
  bool after = false;
  bool done = false;
  DeviceSize result = 0;
  for_each_range([&](const RangeInfo& r) {
    if (done) return;
    if (after) {
      if (r.free) result = r.size;
      done = true;
      return;
    }
    if (!r.free && r.offset == off) after = true;
  });
  return result;
}

void BlockMetadata::add_statistics(Statistics& inout) const {
  ++inout.block_count;
  inout.block_bytes += size_;
  inout.allocation_count += static_cast<std::uint32_t>(allocation_count());
  inout.allocation_bytes += size_ - sum_free_size();
}

void BlockMetadata::add_detailed_statistics(DetailedStatistics& inout) const {
  ++inout.statistics.block_count;
  inout.statistics.block_bytes += size_;
  for_each_range([&](const RangeInfo& r) {
    if (r.free) inout.add_unused_range(r.size);
    else inout.add_allocation(r.size);
  });
}

std::unique_ptr<BlockMetadata> make_block_metadata(PoolAlgorithm algorithm,
                                                   DeviceSize size,
                                                   DeviceSize granularity,
                                                   DeviceSize debug_margin,
                                                   bool is_virtual) {
  switch (algorithm) {
    case PoolAlgorithm::Linear:
      return std::make_unique<LinearMetadata>(size, granularity, debug_margin, is_virtual);
    case PoolAlgorithm::Buddy:
      return std::make_unique<BuddyMetadata>(size, granularity, debug_margin, is_virtual);
    case PoolAlgorithm::FreeList:
      break;
  }
  return std::make_unique<FreeListMetadata>(size, granularity, debug_margin, is_virtual);
}

}} // namespace devmem::alloc
