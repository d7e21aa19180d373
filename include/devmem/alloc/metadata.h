// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

#include "devmem/alloc/stats.h"
#include "devmem/alloc/types.h"

namespace devmem { namespace alloc {

// Identity of a placed range inside one block: offset + 1, so 0 is null.
using AllocHandle = std::uint64_t;
inline constexpr AllocHandle kNullAllocHandle = 0;

inline constexpr AllocHandle handle_from_offset(DeviceSize offset) noexcept { return offset + 1; }
inline constexpr DeviceSize offset_from_handle(AllocHandle h) noexcept { return h - 1; }

// Result of a successful placement search; consumed by BlockMetadata::alloc.
struct AllocationRequest {
  AllocHandle handle{kNullAllocHandle};
  DeviceSize  offset{0};
  DeviceSize  size{0};   // bytes the range occupies in the block
  DeviceSize  item{0};   // algorithm-private (free range offset, buddy level)
  bool        upper{false};
};

struct RangeInfo {
  DeviceSize        offset{0};
  DeviceSize        size{0};
  bool              free{true};
  SuballocationKind kind{SuballocationKind::Free};
  void*             user_data{nullptr};
};

// Placement state of one block. Not thread-safe; the owner serializes access.
class BlockMetadata {
 public:
  BlockMetadata(DeviceSize size, DeviceSize granularity, DeviceSize debug_margin, bool is_virtual);
  virtual ~BlockMetadata() = default;

  BlockMetadata(const BlockMetadata&) = delete;
  BlockMetadata& operator=(const BlockMetadata&) = delete;

  DeviceSize size() const noexcept { return size_; }
  DeviceSize granularity() const noexcept { return granularity_; }
  DeviceSize debug_margin() const noexcept { return debug_margin_; }
  bool is_virtual() const noexcept { return is_virtual_; }

  virtual PoolAlgorithm algorithm() const noexcept = 0;
  virtual std::size_t allocation_count() const noexcept = 0;
  virtual DeviceSize sum_free_size() const noexcept = 0;
  virtual bool is_empty() const noexcept = 0;

  // Searches for a placement; std::nullopt when nothing fits. size > 0 and
  // alignment is a power of two.
  virtual std::optional<AllocationRequest> create_request(DeviceSize size,
                                                          DeviceSize alignment,
                                                          bool upper,
                                                          SuballocationKind kind,
                                                          AllocationStrategy strategy) const = 0;
  // Commits a request returned by create_request with no mutation in between.
  virtual void alloc(const AllocationRequest& request, SuballocationKind kind, void* user_data) = 0;
  // Throws InvalidArgument for a handle that is not a live allocation.
  virtual void free(AllocHandle handle) = 0;
  virtual void clear() = 0;

  virtual RangeInfo allocation_info(AllocHandle handle) const = 0;
  virtual void set_allocation_user_data(AllocHandle handle, void* user_data) = 0;

  // Visits every range, free and used, in ascending offset order. Adjacent
  // free space is reported as one range.
  virtual void for_each_range(const std::function<void(const RangeInfo&)>& fn) const = 0;

  virtual bool validate() const = 0;

  void for_each_allocation(const std::function<void(const RangeInfo&)>& fn) const;
  std::size_t free_region_count() const;
  // Size of the free range directly after the allocation (0 if none).
  virtual DeviceSize next_free_region_size(AllocHandle handle) const;

  void add_statistics(Statistics& inout) const;
  void add_detailed_statistics(DetailedStatistics& inout) const;

 protected:
  DeviceSize size_;
  DeviceSize granularity_;
  DeviceSize debug_margin_;
  bool is_virtual_;
};

std::unique_ptr<BlockMetadata> make_block_metadata(PoolAlgorithm algorithm,
                                                   DeviceSize size,
                                                   DeviceSize granularity,
                                                   DeviceSize debug_margin,
                                                   bool is_virtual);

}} // namespace devmem::alloc
