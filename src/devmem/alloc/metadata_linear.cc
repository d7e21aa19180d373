// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "devmem/alloc/metadata_linear.h"

#include <algorithm>

#include "devmem/core/checked_math.h"
#include "devmem/core/error.h"

namespace devmem { namespace alloc {

using core::ErrorCode;

namespace {
constexpr std::size_t kCompactMinItems = 32;
}

LinearMetadata::LinearMetadata(DeviceSize size, DeviceSize granularity, DeviceSize debug_margin,
                               bool is_virtual)
  : BlockMetadata(size, granularity, debug_margin, is_virtual),
    sum_free_(size) {}

DeviceSize LinearMetadata::bottom_cursor() const noexcept {
  if (bottom_.empty()) return 0;
  return bottom_.back().offset + bottom_.back().size;
}

DeviceSize LinearMetadata::top_cursor() const noexcept {
  return top_.empty() ? size_ : top_.back().offset;
}

std::optional<AllocationRequest> LinearMetadata::create_request(DeviceSize size,
                                                                DeviceSize alignment,
                                                                bool upper,
                                                                SuballocationKind kind,
                                                                AllocationStrategy strategy) const {
  (void)strategy;  // placement is fully determined by the cursors
  if (size == 0 || size > sum_free_) return std::nullopt;
  return upper ? create_upper_(size, alignment, kind) : create_lower_(size, alignment, kind);
}

std::optional<AllocationRequest> LinearMetadata::create_lower_(DeviceSize size, DeviceSize alignment,
                                                               SuballocationKind kind) const {
  DeviceSize base = 0;
  if (!bottom_.empty() && !core::checked_add_u64(bottom_cursor(), debug_margin_, base)) return std::nullopt;
  DeviceSize off = 0;
  if (!core::checked_align_up(base, alignment, off)) return std::nullopt;

  if (granularity_ > 1) {
    for (auto it = bottom_.rbegin(); it != bottom_.rend(); ++it) {
      if (it->null()) continue;
      if (!blocks_on_same_page(it->offset, it->size, off, granularity_)) break;
      if (kinds_conflict(it->kind, kind)) {
        if (!core::checked_align_up(off, granularity_, off)) return std::nullopt;
        break;
      }
    }
  }

  DeviceSize end = 0;
  if (!core::checked_add_u64(off, size, end)) return std::nullopt;
  DeviceSize end_with_margin = 0;
  if (!core::checked_add_u64(end, debug_margin_, end_with_margin)) return std::nullopt;
  if (end_with_margin > top_cursor()) return std::nullopt;

  if (granularity_ > 1) {
    for (auto it = top_.rbegin(); it != top_.rend(); ++it) {
      if (it->null()) continue;
      if (!blocks_on_same_page(off, size, it->offset, granularity_)) break;
      if (kinds_conflict(kind, it->kind)) return std::nullopt;
    }
  }

  AllocationRequest r;
  r.handle = handle_from_offset(off);
  r.offset = off;
  r.size = size;
  r.upper = false;
  return r;
}

std::optional<AllocationRequest> LinearMetadata::create_upper_(DeviceSize size, DeviceSize alignment,
                                                               SuballocationKind kind) const {
  const DeviceSize limit = top_cursor();
  DeviceSize need = 0;
  if (!core::checked_add_u64(size, debug_margin_, need) || need > limit) return std::nullopt;
  DeviceSize off = core::align_down(limit - need, alignment);

  if (granularity_ > 1) {
    for (auto it = top_.rbegin(); it != top_.rend(); ++it) {
      if (it->null()) continue;
      if (!blocks_on_same_page(off, size, it->offset, granularity_)) break;
      if (kinds_conflict(kind, it->kind)) {
        off = core::align_down(off, granularity_);
        break;
      }
    }
  }

  DeviceSize bottom_end = 0;
  if (!bottom_.empty() && !core::checked_add_u64(bottom_cursor(), debug_margin_, bottom_end)) return std::nullopt;
  if (off < bottom_end) return std::nullopt;

  if (granularity_ > 1) {
    for (auto it = bottom_.rbegin(); it != bottom_.rend(); ++it) {
      if (it->null()) continue;
      if (!blocks_on_same_page(it->offset, it->size, off, granularity_)) break;
      if (kinds_conflict(it->kind, kind)) return std::nullopt;
    }
  }

  AllocationRequest r;
  r.handle = handle_from_offset(off);
  r.offset = off;
  r.size = size;
  r.upper = true;
  return r;
}

void LinearMetadata::alloc(const AllocationRequest& request, SuballocationKind kind, void* user_data) {
  if (kind == SuballocationKind::Free) kind = SuballocationKind::Unknown;
  const Item item{request.offset, request.size, kind, user_data};
  if (request.upper) {
    if (request.offset + request.size > top_cursor()) {
      core::throw_error(ErrorCode::InvalidArgument, "LinearMetadata::alloc", "stale upper request");
    }
    top_.push_back(item);
  } else {
    if (request.offset < bottom_cursor() || request.offset + request.size > top_cursor()) {
      core::throw_error(ErrorCode::InvalidArgument, "LinearMetadata::alloc", "stale request");
    }
    bottom_.push_back(item);
  }
  sum_free_ -= request.size;
  ++alloc_count_;
}

bool LinearMetadata::locate_live_(AllocHandle handle, bool& in_top, std::size_t& index) const {
  if (handle == kNullAllocHandle) return false;
  const DeviceSize off = offset_from_handle(handle);
  auto b = std::lower_bound(bottom_.begin(), bottom_.end(), off,
                            [](const Item& it, DeviceSize o) { return it.offset < o; });
  if (b != bottom_.end() && b->offset == off && !b->null()) {
    in_top = false;
    index = static_cast<std::size_t>(b - bottom_.begin());
    return true;
  }
  // top_ is ordered by descending offset.
  auto t = std::lower_bound(top_.begin(), top_.end(), off,
                            [](const Item& it, DeviceSize o) { return it.offset > o; });
  if (t != top_.end() && t->offset == off && !t->null()) {
    in_top = true;
    index = static_cast<std::size_t>(t - top_.begin());
    return true;
  }
  return false;
}

LinearMetadata::Item* LinearMetadata::find_live_(AllocHandle handle, bool& in_top, std::size_t& index) {
  if (!locate_live_(handle, in_top, index)) return nullptr;
  return in_top ? &top_[index] : &bottom_[index];
}

const LinearMetadata::Item* LinearMetadata::find_live_(AllocHandle handle) const {
  bool in_top = false;
  std::size_t index = 0;
  if (!locate_live_(handle, in_top, index)) return nullptr;
  return in_top ? &top_[index] : &bottom_[index];
}

void LinearMetadata::pop_trailing_nulls_(std::vector<Item>& v, std::size_t& nulls) noexcept {
  while (!v.empty() && v.back().null()) {
    v.pop_back();
    --nulls;
  }
}

void LinearMetadata::maybe_compact_(std::vector<Item>& v, std::size_t& nulls) {
  if (v.size() <= kCompactMinItems) return;
  if (nulls * 2 < (v.size() - nulls) * 3) return;
  v.erase(std::remove_if(v.begin(), v.end(), [](const Item& it) { return it.null(); }), v.end());
  nulls = 0;
}

void LinearMetadata::free(AllocHandle handle) {
  bool in_top = false;
  std::size_t index = 0;
  Item* item = find_live_(handle, in_top, index);
  if (item == nullptr) {
    core::throw_error(ErrorCode::InvalidArgument, "LinearMetadata::free", "not a live allocation");
  }
  sum_free_ += item->size;
  --alloc_count_;

  std::vector<Item>& v = in_top ? top_ : bottom_;
  std::size_t& nulls = in_top ? top_nulls_ : bottom_nulls_;
  if (index + 1 == v.size()) {
    v.pop_back();
    pop_trailing_nulls_(v, nulls);
  } else {
    item->kind = SuballocationKind::Free;
    item->user_data = nullptr;
    ++nulls;
  }

  if (alloc_count_ == 0) {
    clear();
    return;
  }
  maybe_compact_(v, nulls);
}

void LinearMetadata::clear() {
  bottom_.clear();
  top_.clear();
  bottom_nulls_ = 0;
  top_nulls_ = 0;
  sum_free_ = size_;
  alloc_count_ = 0;
}

RangeInfo LinearMetadata::allocation_info(AllocHandle handle) const {
  const Item* item = find_live_(handle);
  if (item == nullptr) {
    core::throw_error(ErrorCode::InvalidArgument, "LinearMetadata::allocation_info", "not a live allocation");
  }
  return RangeInfo{item->offset, item->size, false, item->kind, item->user_data};
}

void LinearMetadata::set_allocation_user_data(AllocHandle handle, void* user_data) {
  bool in_top = false;
  std::size_t index = 0;
  Item* item = find_live_(handle, in_top, index);
  if (item == nullptr) {
    core::throw_error(ErrorCode::InvalidArgument, "LinearMetadata::set_allocation_user_data",
                      "not a live allocation");
  }
  item->user_data = user_data;
}

void LinearMetadata::for_each_range(const std::function<void(const RangeInfo&)>& fn) const {
  DeviceSize cursor = 0;
  auto emit = [&](const Item& it) {
    if (it.null()) return;
    if (it.offset > cursor) fn(RangeInfo{cursor, it.offset - cursor, true, SuballocationKind::Free, nullptr});
    fn(RangeInfo{it.offset, it.size, false, it.kind, it.user_data});
    cursor = it.offset + it.size;
  };
  for (const Item& it : bottom_) emit(it);
  for (auto it = top_.rbegin(); it != top_.rend(); ++it) emit(*it);
  if (cursor < size_) fn(RangeInfo{cursor, size_ - cursor, true, SuballocationKind::Free, nullptr});
}

bool LinearMetadata::validate() const {
  DeviceSize used = 0;
  std::size_t allocs = 0;
  std::size_t nulls = 0;
  DeviceSize prev_end = 0;
  for (const Item& it : bottom_) {
    if (it.offset < prev_end || it.size == 0) return false;
    if (it.null()) ++nulls;
    else { ++allocs; used += it.size; }
    prev_end = it.offset + it.size;
  }
  if (!bottom_.empty() && bottom_.back().null()) return false;
  if (nulls != bottom_nulls_) return false;

  nulls = 0;
  DeviceSize top_limit = size_;
  for (const Item& it : top_) {
    if (it.offset + it.size > top_limit || it.size == 0) return false;
    if (it.null()) ++nulls;
    else { ++allocs; used += it.size; }
    top_limit = it.offset;
  }
  if (!top_.empty() && top_.back().null()) return false;
  if (nulls != top_nulls_) return false;

  // The two cursors never cross.
  if (prev_end > top_limit) return false;
  return allocs == alloc_count_ && size_ - used == sum_free_;
}

}} // namespace devmem::alloc
