// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <vector>

#include "devmem/alloc/types.h"
#include "devmem/core/error.h"

namespace devmem { namespace alloc {

using DeviceMemoryHandle = std::uint64_t;
inline constexpr DeviceMemoryHandle kNullDeviceMemory = 0;

// Driver-style result of a provider call.
enum class DeviceStatus : std::uint8_t {
  Ok = 0,
  OutOfDeviceMemory = 1,
  OutOfHostMemory = 2,
  FeatureNotPresent = 3,
  MemoryMapFailed = 4,
};

core::ErrorCode to_error_code(DeviceStatus s) noexcept;

// Device memory capability surface consumed by the allocator. Implementations
// must be thread-safe unless the allocator is externally synchronized.
class DeviceMemoryProvider {
 public:
  virtual ~DeviceMemoryProvider() = default;

  virtual DeviceStatus alloc_block(std::uint32_t category, DeviceSize size,
                                   DeviceMemoryHandle& out) = 0;
  virtual void free_block(DeviceMemoryHandle handle) noexcept = 0;
  virtual DeviceStatus map(DeviceMemoryHandle handle, void*& out) = 0;
  virtual void unmap(DeviceMemoryHandle handle) noexcept = 0;
  virtual DeviceStatus flush(DeviceMemoryHandle handle, DeviceSize offset, DeviceSize size) = 0;
  virtual DeviceStatus invalidate(DeviceMemoryHandle handle, DeviceSize offset, DeviceSize size) = 0;
};

struct HeapBudgetSample {
  DeviceSize usage{0};
  DeviceSize limit{0};
};

// Optional external view of per-heap usage and limit.
class BudgetSource {
 public:
  virtual ~BudgetSource() = default;
  // One sample per heap.
  virtual std::vector<HeapBudgetSample> refresh() = 0;
};

}} // namespace devmem::alloc
