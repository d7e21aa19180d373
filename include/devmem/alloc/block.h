// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <memory>
#include <mutex>

#include "devmem/alloc/device_provider.h"
#include "devmem/alloc/metadata.h"

namespace devmem { namespace alloc {

inline constexpr std::uint32_t kCorruptionMagic = 0x7F84E666u;

// One device memory object. Pooled blocks carry placement metadata; dedicated
// blocks do not. Owns the device memory: the destructor unmaps and frees it.
class DeviceMemoryBlock {
 public:
  DeviceMemoryBlock(DeviceMemoryProvider& provider, std::uint32_t category, std::uint32_t id,
                    DeviceMemoryHandle memory, DeviceSize size,
                    std::unique_ptr<BlockMetadata> metadata, bool use_mutex);
  ~DeviceMemoryBlock();

  DeviceMemoryBlock(const DeviceMemoryBlock&) = delete;
  DeviceMemoryBlock& operator=(const DeviceMemoryBlock&) = delete;

  std::uint32_t id() const noexcept { return id_; }
  std::uint32_t category() const noexcept { return category_; }
  DeviceMemoryHandle memory() const noexcept { return memory_; }
  DeviceSize size() const noexcept { return size_; }
  BlockMetadata* metadata() noexcept { return metadata_.get(); }
  const BlockMetadata* metadata() const noexcept { return metadata_.get(); }

  // Adds count map references; the first reference maps the device memory.
  // Returns the block base pointer. Throws MemoryMapFailed.
  void* map(std::uint32_t count);
  // Drops count references; the last one unmaps.
  void unmap(std::uint32_t count) noexcept;
  void* mapped_data() const noexcept;
  std::uint32_t map_count() const noexcept;

  // Fill / check the margin [offset + size, offset + size + margin) with kCorruptionMagic.
  void write_magic_after(DeviceSize alloc_offset, DeviceSize alloc_size, DeviceSize margin);
  bool validate_magic_after(DeviceSize alloc_offset, DeviceSize alloc_size, DeviceSize margin);

 private:
  DeviceMemoryProvider& provider_;
  const std::uint32_t category_;
  const std::uint32_t id_;
  const DeviceMemoryHandle memory_;
  const DeviceSize size_;
  std::unique_ptr<BlockMetadata> metadata_;
  const bool use_mutex_;

  mutable std::mutex map_mu_{};
  std::uint32_t map_count_{0};
  void* mapped_{nullptr};
};

}} // namespace devmem::alloc
