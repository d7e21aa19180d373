// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <map>
#include <set>
#include <utility>

#include "devmem/alloc/metadata.h"

namespace devmem { namespace alloc {

// General-purpose placement: every range of the block (free or used) keyed by
// offset, plus a (size, offset) index over the free ranges. Free ranges are
// always coalesced, so two free ranges are never adjacent.
class FreeListMetadata final : public BlockMetadata {
 public:
  FreeListMetadata(DeviceSize size, DeviceSize granularity, DeviceSize debug_margin, bool is_virtual);

  PoolAlgorithm algorithm() const noexcept override { return PoolAlgorithm::FreeList; }
  std::size_t allocation_count() const noexcept override { return alloc_count_; }
  DeviceSize sum_free_size() const noexcept override { return sum_free_; }
  bool is_empty() const noexcept override { return alloc_count_ == 0; }

  std::optional<AllocationRequest> create_request(DeviceSize size,
                                                  DeviceSize alignment,
                                                  bool upper,
                                                  SuballocationKind kind,
                                                  AllocationStrategy strategy) const override;
  void alloc(const AllocationRequest& request, SuballocationKind kind, void* user_data) override;
  void free(AllocHandle handle) override;
  void clear() override;

  RangeInfo allocation_info(AllocHandle handle) const override;
  void set_allocation_user_data(AllocHandle handle, void* user_data) override;
  void for_each_range(const std::function<void(const RangeInfo&)>& fn) const override;
  DeviceSize next_free_region_size(AllocHandle handle) const override;
  bool validate() const override;

 private:
  struct Range {
    DeviceSize        size{0};
    SuballocationKind kind{SuballocationKind::Free};
    void*             user_data{nullptr};
    bool free() const noexcept { return kind == SuballocationKind::Free; }
  };
  using RangeMap = std::map<DeviceSize, Range>;

  // Offset at which [size] fits into the free range at it, honoring margin,
  // alignment and granularity against the used neighbors.
  std::optional<DeviceSize> fit_in_range_(RangeMap::const_iterator it, DeviceSize size,
                                          DeviceSize alignment, SuballocationKind kind) const;
  AllocationRequest make_request_(RangeMap::const_iterator it, DeviceSize offset,
                                  DeviceSize size) const noexcept;
  void insert_free_(DeviceSize offset, DeviceSize size);
  void erase_free_(DeviceSize offset, DeviceSize size) noexcept;
  RangeMap::const_iterator find_used_(AllocHandle handle, const char* ctx) const;

  RangeMap ranges_{};
  std::set<std::pair<DeviceSize, DeviceSize>> free_by_size_{};  // (size, offset)
  DeviceSize sum_free_{0};
  std::size_t alloc_count_{0};
};

}} // namespace devmem::alloc
