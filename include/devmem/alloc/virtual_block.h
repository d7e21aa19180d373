// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <string>

#include "devmem/alloc/metadata.h"
#include "devmem/alloc/stats.h"
#include "devmem/alloc/types.h"

namespace devmem { namespace alloc {

struct VirtualBlockCreateInfo {
  DeviceSize    size{0};
  PoolAlgorithm algorithm{PoolAlgorithm::FreeList};  // FreeList or Linear
};

struct VirtualAllocationCreateInfo {
  DeviceSize            size{0};
  DeviceSize            alignment{1};
  AllocationCreateFlags flags{0};  // UpperAddress and strategy bits
  void*                 user_data{nullptr};
};

struct VirtualAllocationInfo {
  DeviceSize offset{0};
  DeviceSize size{0};
  void*      user_data{nullptr};
};

using VirtualAllocation = AllocHandle;

// Placement bookkeeping over an address range no device memory backs.
// Not internally synchronized.
class VirtualBlock {
 public:
  // Throws InvalidArgument for size 0 or the buddy algorithm.
  explicit VirtualBlock(const VirtualBlockCreateInfo& info);
  ~VirtualBlock();

  VirtualBlock(const VirtualBlock&) = delete;
  VirtualBlock& operator=(const VirtualBlock&) = delete;

  // Throws OutOfDeviceMemory when nothing fits.
  VirtualAllocation allocate(const VirtualAllocationCreateInfo& info, DeviceSize* offset = nullptr);
  void free(VirtualAllocation allocation);
  void clear();
  bool is_empty() const noexcept { return md_->is_empty(); }
  DeviceSize size() const noexcept { return md_->size(); }

  VirtualAllocationInfo get_allocation_info(VirtualAllocation allocation) const;
  void set_user_data(VirtualAllocation allocation, void* user_data);

  Statistics statistics() const;
  DetailedStatistics detailed_statistics() const;
  std::string build_stats_string(bool detailed) const;

 private:
  std::unique_ptr<BlockMetadata> md_;
};

}} // namespace devmem::alloc
