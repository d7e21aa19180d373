// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <cstdint>
#include <string>

#include "devmem/alloc/device_provider.h"
#include "devmem/alloc/metadata.h"
#include "devmem/alloc/types.h"

namespace devmem { namespace alloc {

class DeviceMemoryBlock;
class Pool;

// A placed region: a range inside a pooled block, or a whole dedicated block.
// Created and destroyed only by the Allocator; valid until freed.
class Allocation {
 public:
  enum class Type : std::uint8_t { Block, Dedicated };

  Allocation(const Allocation&) = delete;
  Allocation& operator=(const Allocation&) = delete;

  Type type() const noexcept { return type_; }
  DeviceMemoryBlock* block() const noexcept { return block_; }
  AllocHandle handle() const noexcept { return handle_; }
  DeviceSize offset() const noexcept { return offset_; }
  DeviceSize size() const noexcept { return size_; }
  DeviceSize alignment() const noexcept { return alignment_; }
  std::uint32_t category() const noexcept { return category_; }
  SuballocationKind kind() const noexcept { return kind_; }
  // Owning pool of a Block allocation; nullptr for dedicated.
  Pool* pool() const noexcept { return pool_; }
  DeviceMemoryHandle memory() const noexcept;
  // Block base + offset while mapped (explicitly or persistently), else nullptr.
  void* mapped_data() const noexcept;
  bool is_persistently_mapped() const noexcept { return persistent_map_; }
  std::uint32_t map_count() const noexcept { return map_count_.load(std::memory_order_relaxed); }
  const UserData& user_data() const noexcept { return user_data_; }
  const std::string& name() const noexcept { return name_; }

 private:
  friend class Allocator;
  friend class Pool;
  friend class DefragmentationContext;

  Allocation() = default;
  ~Allocation() = default;

  Type type_{Type::Block};
  DeviceMemoryBlock* block_{nullptr};
  AllocHandle handle_{kNullAllocHandle};
  DeviceSize offset_{0};
  DeviceSize size_{0};
  DeviceSize alignment_{1};
  std::uint32_t category_{0};
  SuballocationKind kind_{SuballocationKind::Unknown};
  Pool* pool_{nullptr};
  std::atomic<std::uint32_t> map_count_{0};  // explicit map() references
  bool persistent_map_{false};
  UserData user_data_{};
  std::string name_{};
  const void* defrag_owner_{nullptr};  // non-null on defragmentation destinations
};

}} // namespace devmem::alloc
