// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include "devmem/alloc/metadata.h"

namespace devmem { namespace alloc {

// Stack / double-stack placement. Bottom allocations append after the last
// bottom item; upper allocations append below the lowest top item. Freeing
// the newest item of either stack retreats its cursor (past any freed items
// beneath it); freeing an interior item leaves a null item until then.
class LinearMetadata final : public BlockMetadata {
 public:
  LinearMetadata(DeviceSize size, DeviceSize granularity, DeviceSize debug_margin, bool is_virtual);

  PoolAlgorithm algorithm() const noexcept override { return PoolAlgorithm::Linear; }
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
  bool validate() const override;

  // End of the bottom stack and start of the top stack.
  DeviceSize bottom_cursor() const noexcept;
  DeviceSize top_cursor() const noexcept;

 private:
  struct Item {
    DeviceSize        offset{0};
    DeviceSize        size{0};
    SuballocationKind kind{SuballocationKind::Free};  // Free marks a null item
    void*             user_data{nullptr};
    bool null() const noexcept { return kind == SuballocationKind::Free; }
  };

  std::optional<AllocationRequest> create_lower_(DeviceSize size, DeviceSize alignment,
                                                 SuballocationKind kind) const;
  std::optional<AllocationRequest> create_upper_(DeviceSize size, DeviceSize alignment,
                                                 SuballocationKind kind) const;
  bool locate_live_(AllocHandle handle, bool& in_top, std::size_t& index) const;
  Item* find_live_(AllocHandle handle, bool& in_top, std::size_t& index);
  const Item* find_live_(AllocHandle handle) const;
  static void pop_trailing_nulls_(std::vector<Item>& v, std::size_t& nulls) noexcept;
  static void maybe_compact_(std::vector<Item>& v, std::size_t& nulls);

  std::vector<Item> bottom_{};  // ascending offsets
  std::vector<Item> top_{};     // descending offsets; back() is the lowest
  std::size_t bottom_nulls_{0};
  std::size_t top_nulls_{0};
  DeviceSize sum_free_{0};
  std::size_t alloc_count_{0};
};

}} // namespace devmem::alloc
