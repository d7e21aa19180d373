// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "devmem/alloc/host_provider.h"

#include <cstring>
#include <new>
#include <utility>

#include "devmem/logging/logging.h"

namespace devmem { namespace alloc {

using MuLockGuard = std::lock_guard<std::mutex>;

HostMemoryProvider::HostMemoryProvider(std::vector<MemoryHeap> heaps,
                                       std::vector<MemoryCategory> categories)
  : heaps_(std::move(heaps)),
    categories_(std::move(categories)),
    heap_used_(heaps_.size(), 0) {}

HostMemoryProvider::~HostMemoryProvider() {
  if (!blocks_.empty()) {
    DEVMEM_LOG(WARNING) << "HostMemoryProvider destroyed with " << blocks_.size()
                        << " live device blocks";
  }
}

DeviceStatus HostMemoryProvider::alloc_block(std::uint32_t category, DeviceSize size,
                                             DeviceMemoryHandle& out) {
  MuLockGuard lk(mu_);
  ++stats_.alloc_calls;
  out = kNullDeviceMemory;
  if (category >= categories_.size() || size == 0) {
    ++stats_.alloc_failures;
    return DeviceStatus::FeatureNotPresent;
  }
  if (fail_next_ > 0) {
    --fail_next_;
    ++stats_.alloc_failures;
    return fail_status_;
  }
  if (fail_larger_than_ != 0 && size > fail_larger_than_) {
    ++stats_.alloc_failures;
    return DeviceStatus::OutOfDeviceMemory;
  }
  const std::uint32_t heap = categories_[category].heap_index;
  if (heap >= heaps_.size() || size > heaps_[heap].size - heap_used_[heap]) {
    ++stats_.alloc_failures;
    return DeviceStatus::OutOfDeviceMemory;
  }
  heap_used_[heap] += size;
  HostBlock b;
  b.size = size;
  b.category = category;
  const DeviceMemoryHandle h = next_handle_++;
  blocks_.emplace(h, std::move(b));
  ++stats_.live_blocks;
  out = h;
  return DeviceStatus::Ok;
}

void HostMemoryProvider::free_block(DeviceMemoryHandle handle) noexcept {
  MuLockGuard lk(mu_);
  auto it = blocks_.find(handle);
  if (it == blocks_.end()) {
    DEVMEM_LOG(ERROR) << "HostMemoryProvider: free of unknown handle " << handle;
    return;
  }
  ++stats_.free_calls;
  --stats_.live_blocks;
  heap_used_[categories_[it->second.category].heap_index] -= it->second.size;
  blocks_.erase(it);
}

DeviceStatus HostMemoryProvider::map(DeviceMemoryHandle handle, void*& out) {
  MuLockGuard lk(mu_);
  ++stats_.map_calls;
  out = nullptr;
  auto it = blocks_.find(handle);
  if (it == blocks_.end() || map_fails_) return DeviceStatus::MemoryMapFailed;
  const MemoryCategory& cat = categories_[it->second.category];
  if ((cat.property_flags & kMemoryPropertyHostVisible) == 0) return DeviceStatus::MemoryMapFailed;
  HostBlock& b = it->second;
  if (!b.storage) {
    b.storage.reset(new (std::nothrow) std::byte[b.size]);
    if (!b.storage) return DeviceStatus::OutOfHostMemory;
    std::memset(b.storage.get(), 0, b.size);
  }
  ++b.map_refs;
  out = b.storage.get();
  return DeviceStatus::Ok;
}

void HostMemoryProvider::unmap(DeviceMemoryHandle handle) noexcept {
  MuLockGuard lk(mu_);
  ++stats_.unmap_calls;
  auto it = blocks_.find(handle);
  if (it != blocks_.end() && it->second.map_refs > 0) --it->second.map_refs;
}

DeviceStatus HostMemoryProvider::flush(DeviceMemoryHandle handle, DeviceSize offset, DeviceSize size) {
  MuLockGuard lk(mu_);
  ++stats_.flush_calls;
  stats_.last_flush_offset = offset;
  stats_.last_flush_size = size;
  return blocks_.count(handle) ? DeviceStatus::Ok : DeviceStatus::MemoryMapFailed;
}

DeviceStatus HostMemoryProvider::invalidate(DeviceMemoryHandle handle, DeviceSize offset, DeviceSize size) {
  MuLockGuard lk(mu_);
  ++stats_.invalidate_calls;
  stats_.last_flush_offset = offset;
  stats_.last_flush_size = size;
  return blocks_.count(handle) ? DeviceStatus::Ok : DeviceStatus::MemoryMapFailed;
}

void HostMemoryProvider::fail_next_allocs(std::size_t n, DeviceStatus status) {
  MuLockGuard lk(mu_);
  fail_next_ = n;
  fail_status_ = status;
}

void HostMemoryProvider::fail_allocs_larger_than(DeviceSize max_bytes) {
  MuLockGuard lk(mu_);
  fail_larger_than_ = max_bytes;
}

void HostMemoryProvider::set_map_fails(bool fails) {
  MuLockGuard lk(mu_);
  map_fails_ = fails;
}

HostProviderStats HostMemoryProvider::stats() const {
  MuLockGuard lk(mu_);
  return stats_;
}

DeviceSize HostMemoryProvider::heap_used(std::uint32_t heap) const {
  MuLockGuard lk(mu_);
  return heap < heap_used_.size() ? heap_used_[heap] : 0;
}

std::size_t HostMemoryProvider::map_refs(DeviceMemoryHandle handle) const {
  MuLockGuard lk(mu_);
  auto it = blocks_.find(handle);
  return it == blocks_.end() ? 0 : it->second.map_refs;
}

std::uint32_t HostMemoryProvider::block_category(DeviceMemoryHandle handle) const {
  MuLockGuard lk(mu_);
  auto it = blocks_.find(handle);
  return it == blocks_.end() ? kMaxMemoryCategories : it->second.category;
}

}} // namespace devmem::alloc
