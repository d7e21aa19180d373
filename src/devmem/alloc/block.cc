// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "devmem/alloc/block.h"

#include <cstring>
#include <utility>

#include "devmem/alloc/sync.h"
#include "devmem/core/error.h"
#include "devmem/logging/logging.h"

namespace devmem { namespace alloc {

DeviceMemoryBlock::DeviceMemoryBlock(DeviceMemoryProvider& provider, std::uint32_t category,
                                     std::uint32_t id, DeviceMemoryHandle memory, DeviceSize size,
                                     std::unique_ptr<BlockMetadata> metadata, bool use_mutex)
  : provider_(provider),
    category_(category),
    id_(id),
    memory_(memory),
    size_(size),
    metadata_(std::move(metadata)),
    use_mutex_(use_mutex) {}

DeviceMemoryBlock::~DeviceMemoryBlock() {
  if (map_count_ != 0) {
    DEVMEM_LOG(WARNING) << "block " << id_ << " destroyed while mapped (" << map_count_ << " refs)";
    provider_.unmap(memory_);
  }
  if (metadata_ && !metadata_->is_empty()) {
    DEVMEM_LOG(ERROR) << "block " << id_ << " destroyed with " << metadata_->allocation_count()
                      << " live allocations";
  }
  provider_.free_block(memory_);
}

void* DeviceMemoryBlock::map(std::uint32_t count) {
  if (count == 0) return mapped_data();
  MaybeLockGuard lk(map_mu_, use_mutex_);
  if (map_count_ != 0) {
    map_count_ += count;
    return mapped_;
  }
  void* p = nullptr;
  const DeviceStatus st = provider_.map(memory_, p);
  if (st != DeviceStatus::Ok) {
    core::throw_error(to_error_code(st), "DeviceMemoryBlock::map");
  }
  mapped_ = p;
  map_count_ = count;
  return mapped_;
}

void DeviceMemoryBlock::unmap(std::uint32_t count) noexcept {
  if (count == 0) return;
  MaybeLockGuard lk(map_mu_, use_mutex_);
  if (map_count_ < count) {
    DEVMEM_LOG(ERROR) << "block " << id_ << " unmapped more times than mapped";
    return;
  }
  map_count_ -= count;
  if (map_count_ == 0) {
    mapped_ = nullptr;
    provider_.unmap(memory_);
  }
}

void* DeviceMemoryBlock::mapped_data() const noexcept {
  MaybeLockGuard lk(map_mu_, use_mutex_);
  return mapped_;
}

std::uint32_t DeviceMemoryBlock::map_count() const noexcept {
  MaybeLockGuard lk(map_mu_, use_mutex_);
  return map_count_;
}

void DeviceMemoryBlock::write_magic_after(DeviceSize alloc_offset, DeviceSize alloc_size,
                                          DeviceSize margin) {
  auto* base = static_cast<unsigned char*>(map(1));
  unsigned char* p = base + alloc_offset + alloc_size;
  for (DeviceSize i = 0; i + sizeof(kCorruptionMagic) <= margin; i += sizeof(kCorruptionMagic)) {
    std::memcpy(p + i, &kCorruptionMagic, sizeof(kCorruptionMagic));
  }
  unmap(1);
}

bool DeviceMemoryBlock::validate_magic_after(DeviceSize alloc_offset, DeviceSize alloc_size,
                                             DeviceSize margin) {
  auto* base = static_cast<const unsigned char*>(map(1));
  const unsigned char* p = base + alloc_offset + alloc_size;
  bool ok = true;
  for (DeviceSize i = 0; i + sizeof(kCorruptionMagic) <= margin; i += sizeof(kCorruptionMagic)) {
    std::uint32_t v = 0;
    std::memcpy(&v, p + i, sizeof(v));
    if (v != kCorruptionMagic) {
      ok = false;
      break;
    }
  }
  unmap(1);
  return ok;
}

}} // namespace devmem::alloc
