// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "devmem/alloc/allocation.h"

#include "devmem/alloc/block.h"

namespace devmem { namespace alloc {

DeviceMemoryHandle Allocation::memory() const noexcept {
  return block_ ? block_->memory() : kNullDeviceMemory;
}

void* Allocation::mapped_data() const noexcept {
  if (block_ == nullptr || (map_count() == 0 && !persistent_map_)) return nullptr;
  void* base = block_->mapped_data();
  return base ? static_cast<unsigned char*>(base) + offset_ : nullptr;
}

}} // namespace devmem::alloc
