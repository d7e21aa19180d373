// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "devmem/alloc/metadata_free_list.h"

#include <iterator>

#include "devmem/core/checked_math.h"
#include "devmem/core/error.h"

namespace devmem { namespace alloc {

using core::ErrorCode;

FreeListMetadata::FreeListMetadata(DeviceSize size, DeviceSize granularity,
                                   DeviceSize debug_margin, bool is_virtual)
  : BlockMetadata(size, granularity, debug_margin, is_virtual) {
  clear();
}

void FreeListMetadata::insert_free_(DeviceSize offset, DeviceSize size) {
  free_by_size_.emplace(size, offset);
}

void FreeListMetadata::erase_free_(DeviceSize offset, DeviceSize size) noexcept {
  free_by_size_.erase({size, offset});
}

std::optional<DeviceSize> FreeListMetadata::fit_in_range_(RangeMap::const_iterator it,
                                                          DeviceSize size,
                                                          DeviceSize alignment,
                                                          SuballocationKind kind) const {
  const DeviceSize range_off = it->first;
  const DeviceSize range_end = it->first + it->second.size;

  // A free range that does not start the block follows a used range.
  DeviceSize begin = range_off;
  if (it != ranges_.begin() && !core::checked_add_u64(begin, debug_margin_, begin)) return std::nullopt;
  DeviceSize off = 0;
  if (!core::checked_align_up(begin, alignment, off)) return std::nullopt;

  if (granularity_ > 1 && it != ranges_.begin()) {
    auto prev = std::prev(it);
    if (!prev->second.free() &&
        blocks_on_same_page(prev->first, prev->second.size, off, granularity_) &&
        kinds_conflict(prev->second.kind, kind)) {
      if (!core::checked_align_up(off, granularity_, off)) return std::nullopt;
    }
  }

  DeviceSize end = 0;
  if (!core::checked_add_u64(off, size, end)) return std::nullopt;
  DeviceSize end_with_margin = 0;
  if (!core::checked_add_u64(end, debug_margin_, end_with_margin)) return std::nullopt;
  if (end_with_margin > range_end) return std::nullopt;

  if (granularity_ > 1) {
    auto next = std::next(it);
    if (next != ranges_.end() && !next->second.free() &&
        blocks_on_same_page(off, size, next->first, granularity_) &&
        kinds_conflict(kind, next->second.kind)) {
      return std::nullopt;
    }
  }
  return off;
}

AllocationRequest FreeListMetadata::make_request_(RangeMap::const_iterator it, DeviceSize offset,
                                                  DeviceSize size) const noexcept {
  AllocationRequest r;
  r.handle = handle_from_offset(offset);
  r.offset = offset;
  r.size = size;
  r.item = it->first;
  return r;
}

std::optional<AllocationRequest> FreeListMetadata::create_request(DeviceSize size,
                                                                  DeviceSize alignment,
                                                                  bool upper,
                                                                  SuballocationKind kind,
                                                                  AllocationStrategy strategy) const {
  (void)upper;  // no upper region in this algorithm
  if (size == 0 || size > sum_free_ || free_by_size_.empty()) return std::nullopt;

  switch (strategy) {
    case AllocationStrategy::MinOffset:
      for (auto it = ranges_.cbegin(); it != ranges_.cend(); ++it) {
        if (!it->second.free() || it->second.size < size) continue;
        if (auto off = fit_in_range_(it, size, alignment, kind)) return make_request_(it, *off, size);
      }
      return std::nullopt;
    case AllocationStrategy::MinTime: {
      // Largest range first: one attempt succeeds for anything that fits at all
      // unless alignment or granularity padding gets in the way.
      const auto& largest = *free_by_size_.rbegin();
      if (largest.first < size) return std::nullopt;
      auto it = ranges_.find(largest.second);
      if (auto off = fit_in_range_(it, size, alignment, kind)) return make_request_(it, *off, size);
      break;
    }
    case AllocationStrategy::MinMemory:
      break;
  }

  // Best fit: smallest sufficient range, lowest offset among equal sizes.
  for (auto f = free_by_size_.lower_bound({size, 0}); f != free_by_size_.end(); ++f) {
    auto it = ranges_.find(f->second);
    if (auto off = fit_in_range_(it, size, alignment, kind)) return make_request_(it, *off, size);
  }
  return std::nullopt;
}

void FreeListMetadata::alloc(const AllocationRequest& request, SuballocationKind kind, void* user_data) {
  auto it = ranges_.find(request.item);
  if (it == ranges_.end() || !it->second.free()) {
    core::throw_error(ErrorCode::InvalidArgument, "FreeListMetadata::alloc", "stale allocation request");
  }
  const DeviceSize range_off = it->first;
  const DeviceSize range_size = it->second.size;
  const DeviceSize range_end = range_off + range_size;
  const DeviceSize end = request.offset + request.size;
  if (request.offset < range_off || end > range_end) {
    core::throw_error(ErrorCode::InvalidArgument, "FreeListMetadata::alloc", "request outside free range");
  }

  erase_free_(range_off, range_size);
  ranges_.erase(it);
  if (request.offset > range_off) {
    ranges_.emplace(range_off, Range{request.offset - range_off, SuballocationKind::Free, nullptr});
    insert_free_(range_off, request.offset - range_off);
  }
  if (kind == SuballocationKind::Free) kind = SuballocationKind::Unknown;
  ranges_.emplace(request.offset, Range{request.size, kind, user_data});
  if (range_end > end) {
    ranges_.emplace(end, Range{range_end - end, SuballocationKind::Free, nullptr});
    insert_free_(end, range_end - end);
  }
  sum_free_ -= request.size;
  ++alloc_count_;
}

FreeListMetadata::RangeMap::const_iterator FreeListMetadata::find_used_(AllocHandle handle,
                                                                       const char* ctx) const {
  auto it = handle == kNullAllocHandle ? ranges_.end() : ranges_.find(offset_from_handle(handle));
  if (it == ranges_.end() || it->second.free()) {
    core::throw_error(ErrorCode::InvalidArgument, ctx, "not a live allocation");
  }
  return it;
}

void FreeListMetadata::free(AllocHandle handle) {
  auto cit = find_used_(handle, "FreeListMetadata::free");
  DeviceSize start = cit->first;
  DeviceSize len = cit->second.size;
  sum_free_ += len;
  --alloc_count_;

  auto next = std::next(cit);
  if (next != ranges_.end() && next->second.free()) {
    len += next->second.size;
    erase_free_(next->first, next->second.size);
    ranges_.erase(next);
  }
  if (cit != ranges_.begin()) {
    auto prev = std::prev(cit);
    if (prev->second.free()) {
      start = prev->first;
      len += prev->second.size;
      erase_free_(prev->first, prev->second.size);
      ranges_.erase(prev);
    }
  }
  ranges_.erase(cit);
  ranges_[start] = Range{len, SuballocationKind::Free, nullptr};
  insert_free_(start, len);
}

void FreeListMetadata::clear() {
  ranges_.clear();
  free_by_size_.clear();
  ranges_.emplace(0, Range{size_, SuballocationKind::Free, nullptr});
  insert_free_(0, size_);
  sum_free_ = size_;
  alloc_count_ = 0;
}

RangeInfo FreeListMetadata::allocation_info(AllocHandle handle) const {
  auto it = find_used_(handle, "FreeListMetadata::allocation_info");
  return RangeInfo{it->first, it->second.size, false, it->second.kind, it->second.user_data};
}

void FreeListMetadata::set_allocation_user_data(AllocHandle handle, void* user_data) {
  auto it = find_used_(handle, "FreeListMetadata::set_allocation_user_data");
  ranges_.find(it->first)->second.user_data = user_data;
}

void FreeListMetadata::for_each_range(const std::function<void(const RangeInfo&)>& fn) const {
  for (const auto& [off, r] : ranges_) {
    fn(RangeInfo{off, r.size, r.free(), r.kind, r.user_data});
  }
}

DeviceSize FreeListMetadata::next_free_region_size(AllocHandle handle) const {
  auto it = find_used_(handle, "FreeListMetadata::next_free_region_size");
  auto next = std::next(it);
  return (next != ranges_.end() && next->second.free()) ? next->second.size : 0;
}

bool FreeListMetadata::validate() const {
  DeviceSize expect = 0;
  DeviceSize free_sum = 0;
  std::size_t allocs = 0;
  std::size_t frees = 0;
  bool prev_free = false;
  for (const auto& [off, r] : ranges_) {
    if (off != expect || r.size == 0) return false;
    if (r.free()) {
      if (prev_free) return false;
      if (free_by_size_.count({r.size, off}) == 0) return false;
      free_sum += r.size;
      ++frees;
      prev_free = true;
    } else {
      ++allocs;
      prev_free = false;
    }
    expect = off + r.size;
  }
  return expect == size_ && free_sum == sum_free_ && allocs == alloc_count_ &&
         frees == free_by_size_.size();
}

}} // namespace devmem::alloc
