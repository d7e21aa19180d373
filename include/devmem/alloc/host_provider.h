// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "devmem/alloc/device_provider.h"

namespace devmem { namespace alloc {

struct HostProviderStats {
  std::uint64_t alloc_calls{0};
  std::uint64_t alloc_failures{0};
  std::uint64_t free_calls{0};
  std::uint64_t map_calls{0};
  std::uint64_t unmap_calls{0};
  std::uint64_t flush_calls{0};
  std::uint64_t invalidate_calls{0};
  std::uint64_t live_blocks{0};
  DeviceSize    last_flush_offset{0};
  DeviceSize    last_flush_size{0};
};

// Simulated device backed by host memory. Capacity is enforced per heap;
// storage is materialized on first map.
class HostMemoryProvider final : public DeviceMemoryProvider {
 public:
  HostMemoryProvider(std::vector<MemoryHeap> heaps, std::vector<MemoryCategory> categories);
  ~HostMemoryProvider() override;

  DeviceStatus alloc_block(std::uint32_t category, DeviceSize size,
                           DeviceMemoryHandle& out) override;
  void free_block(DeviceMemoryHandle handle) noexcept override;
  DeviceStatus map(DeviceMemoryHandle handle, void*& out) override;
  void unmap(DeviceMemoryHandle handle) noexcept override;
  DeviceStatus flush(DeviceMemoryHandle handle, DeviceSize offset, DeviceSize size) override;
  DeviceStatus invalidate(DeviceMemoryHandle handle, DeviceSize offset, DeviceSize size) override;

  // Failure injection: the next n alloc_block calls fail with status.
  void fail_next_allocs(std::size_t n, DeviceStatus status = DeviceStatus::OutOfDeviceMemory);
  // Every alloc_block of more than max_bytes fails (0 disables).
  void fail_allocs_larger_than(DeviceSize max_bytes);
  void set_map_fails(bool fails);

  HostProviderStats stats() const;
  DeviceSize heap_used(std::uint32_t heap) const;
  std::size_t map_refs(DeviceMemoryHandle handle) const;
  std::uint32_t block_category(DeviceMemoryHandle handle) const;

 private:
  struct HostBlock {
    DeviceSize size{0};
    std::uint32_t category{0};
    std::unique_ptr<std::byte[]> storage{};
    std::size_t map_refs{0};
  };

  std::vector<MemoryHeap> heaps_;
  std::vector<MemoryCategory> categories_;

  mutable std::mutex mu_{};
  std::unordered_map<DeviceMemoryHandle, HostBlock> blocks_{};
  std::vector<DeviceSize> heap_used_{};
  DeviceMemoryHandle next_handle_{1};
  std::size_t fail_next_{0};
  DeviceStatus fail_status_{DeviceStatus::OutOfDeviceMemory};
  DeviceSize fail_larger_than_{0};
  bool map_fails_{false};
  HostProviderStats stats_{};
};

}} // namespace devmem::alloc
