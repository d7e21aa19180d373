// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "devmem/alloc/pool.h"

#include <algorithm>
#include <optional>
#include <string>
#include <utility>

#include "devmem/alloc/allocation.h"
#include "devmem/alloc/allocator.h"
#include "devmem/alloc/sync.h"
#include "devmem/core/checked_math.h"
#include "devmem/core/error.h"
#include "devmem/logging/logging.h"

namespace devmem { namespace alloc {

using core::ErrorCode;

namespace {

// New blocks start at 1/8 of the preferred size and double as the pool grows.
constexpr std::uint32_t kNewBlockSizeShiftMax = 3;

bool is_retryable(ErrorCode c) noexcept {
  return c == ErrorCode::OutOfDeviceMemory || c == ErrorCode::OutOfHostMemory ||
         c == ErrorCode::OutOfBudget;
}

} // namespace

Pool::Pool(Allocator& owner, PoolCreateInfo info, DeviceSize preferred_block_size,
           bool explicit_block_size, bool is_default)
  : owner_(owner),
    info_(std::move(info)),
    preferred_block_size_(preferred_block_size),
    explicit_block_size_(explicit_block_size),
    is_default_(is_default),
    granularity_(info_.ignore_buffer_image_granularity ? 1 : owner.buffer_image_granularity()),
    debug_margin_(owner.config().debug_margin),
    use_mutex_(owner.use_mutex()) {}

Pool::~Pool() {
  for (DeviceMemoryBlock* b : blocks_) {
    std::vector<Allocation*> leaked;
    b->metadata()->for_each_allocation([&](const RangeInfo& r) {
      leaked.push_back(static_cast<Allocation*>(r.user_data));
    });
    if (!leaked.empty()) {
      DEVMEM_LOG(ERROR) << "pool '" << info_.name << "' destroyed with " << leaked.size()
                        << " live allocations in block " << b->id();
      for (Allocation* a : leaked) {
        const std::uint32_t refs = a->map_count() + (a->persistent_map_ ? 1u : 0u);
        b->unmap(refs);
        owner_.note_free_(info_.category, a->size_);
        delete a;
      }
      b->metadata()->clear();
    }
    owner_.destroy_device_block_(b);
  }
  blocks_.clear();
}

std::size_t Pool::block_count() const {
  MaybeLockGuard lk(mu_, use_mutex_);
  return blocks_.size();
}

Statistics Pool::statistics() const {
  MaybeLockGuard lk(mu_, use_mutex_);
  Statistics s;
  for (const DeviceMemoryBlock* b : blocks_) b->metadata()->add_statistics(s);
  return s;
}

DetailedStatistics Pool::detailed_statistics() const {
  MaybeLockGuard lk(mu_, use_mutex_);
  DetailedStatistics s;
  for (const DeviceMemoryBlock* b : blocks_) b->metadata()->add_detailed_statistics(s);
  return s;
}

void Pool::check_corruption() {
  if (!corruption_detection_enabled_()) {
    core::throw_error(ErrorCode::FeatureNotPresent, "Pool::check_corruption",
                      "corruption detection is not enabled for category " +
                      std::to_string(info_.category));
  }
  std::size_t damaged = 0;
  {
    MaybeLockGuard lk(mu_, use_mutex_);
    for (DeviceMemoryBlock* b : blocks_) {
      std::vector<const Allocation*> live;
      b->metadata()->for_each_allocation([&](const RangeInfo& r) {
        live.push_back(static_cast<const Allocation*>(r.user_data));
      });
      for (const Allocation* a : live) {
        if (!b->validate_magic_after(a->offset_, a->size_, debug_margin_)) {
          DEVMEM_LOG(ERROR) << "corrupted margin after allocation at offset " << a->offset_
                            << " (size " << a->size_ << ") in block " << b->id();
          owner_.note_corruption_();
          ++damaged;
        }
      }
    }
  }
  if (damaged != 0) {
    core::throw_error(ErrorCode::Corruption, "Pool::check_corruption",
                      std::to_string(damaged) + " damaged margins");
  }
}

void Pool::set_name(std::string name) {
  MaybeLockGuard lk(mu_, use_mutex_);
  info_.name = std::move(name);
}

std::string Pool::name() const {
  MaybeLockGuard lk(mu_, use_mutex_);
  return info_.name;
}

void Pool::create_min_blocks_() {
  MaybeLockGuard lk(mu_, use_mutex_);
  while (blocks_.size() < info_.min_block_count) {
    create_block_(preferred_block_size_, false);
  }
}

Allocation* Pool::acquire_(const AcquireRequest& in) {
  AcquireRequest req = in;
  if (req.size == 0) {
    core::throw_error(ErrorCode::InvalidArgument, "Pool::acquire", "size must be > 0");
  }
  req.alignment = std::max({req.alignment, info_.min_allocation_alignment,
                            owner_.config().debug_min_alignment, DeviceSize{1}});
  if (!core::is_pow2(req.alignment)) {
    core::throw_error(ErrorCode::InvalidArgument, "Pool::acquire",
                      "alignment " + std::to_string(req.alignment) + " is not a power of two");
  }
  if (req.upper && info_.algorithm != PoolAlgorithm::Linear) {
    core::throw_error(ErrorCode::InvalidArgument, "Pool::acquire",
                      "upper address allocations need a linear pool");
  }
  const DeviceSize needed = core::saturating_add_u64(req.size, debug_margin_);
  if (needed > preferred_block_size_) {
    core::throw_error(ErrorCode::OutOfDeviceMemory, "Pool::acquire",
                      "request of " + std::to_string(req.size) + " bytes exceeds block size " +
                      std::to_string(preferred_block_size_));
  }

  MaybeLockGuard lk(mu_, use_mutex_);

  // Fullest blocks first, except MinTime which starts from the emptiest.
  if (req.strategy == AllocationStrategy::MinTime) {
    for (auto it = blocks_.rbegin(); it != blocks_.rend(); ++it) {
      if (Allocation* a = place_in_block_(*it, req)) return a;
    }
  } else {
    for (DeviceMemoryBlock* b : blocks_) {
      if (Allocation* a = place_in_block_(b, req)) return a;
    }
  }

  if (req.never_allocate) {
    core::throw_error(ErrorCode::OutOfDeviceMemory, "Pool::acquire",
                      "no room in existing blocks and growth is not allowed");
  }
  if (info_.max_block_count != 0 && blocks_.size() >= info_.max_block_count) {
    core::throw_error(ErrorCode::OutOfDeviceMemory, "Pool::acquire",
                      "pool reached max_block_count " + std::to_string(info_.max_block_count));
  }

  DeviceSize new_size = preferred_block_size_;
  std::uint32_t shift = 0;
  if (!explicit_block_size_) {
    const DeviceSize max_existing = max_existing_block_size_();
    for (std::uint32_t i = 0; i < kNewBlockSizeShiftMax; ++i) {
      const DeviceSize smaller = new_size / 2;
      if (smaller > max_existing && smaller >= core::saturating_add_u64(needed, needed)) {
        new_size = smaller;
        ++shift;
      } else {
        break;
      }
    }
  }

  DeviceMemoryBlock* b = nullptr;
  for (;;) {
    try {
      b = create_block_(new_size, req.within_budget);
      break;
    } catch (const core::Error& e) {
      const DeviceSize smaller = new_size / 2;
      if (explicit_block_size_ || !is_retryable(e.code()) || shift >= kNewBlockSizeShiftMax ||
          smaller < needed) {
        throw;
      }
      new_size = smaller;
      ++shift;
    }
  }

  if (Allocation* a = place_in_block_(b, req)) return a;

  // Only reachable when the algorithm cannot use the whole block (buddy tail).
  if (blocks_.size() > info_.min_block_count) {
    remove_block_(b);
    owner_.destroy_device_block_(b);
  }
  core::throw_error(ErrorCode::OutOfDeviceMemory, "Pool::acquire",
                    "request does not fit in a fresh block of " + std::to_string(new_size) + " bytes");
}

void Pool::release_(Allocation* a) {
  DeviceMemoryBlock* to_destroy = nullptr;
  {
    MaybeLockGuard lk(mu_, use_mutex_);
    DeviceMemoryBlock* b = a->block_;
    if (corruption_detection_enabled_() &&
        !b->validate_magic_after(a->offset_, a->size_, debug_margin_)) {
      DEVMEM_LOG(ERROR) << "corrupted margin after allocation at offset " << a->offset_
                        << " (size " << a->size_ << ") in block " << b->id() << " detected on free";
      owner_.note_corruption_();
    }
    b->metadata()->free(a->handle_);
    owner_.note_free_(info_.category, a->size_);
    if (b->metadata()->is_empty() && blocks_.size() > info_.min_block_count) {
      remove_block_(b);
      to_destroy = b;
    } else {
      incrementally_sort_();
    }
  }
  if (to_destroy != nullptr) owner_.destroy_device_block_(to_destroy);
  delete a;
}

Allocation* Pool::place_in_block_(DeviceMemoryBlock* b, const AcquireRequest& req) {
  const std::optional<AllocationRequest> r =
      b->metadata()->create_request(req.size, req.alignment, req.upper, req.kind, req.strategy);
  if (!r) return nullptr;
  return commit_(b, *r, req);
}

Allocation* Pool::commit_(DeviceMemoryBlock* b, const AllocationRequest& r, const AcquireRequest& req) {
  auto* a = new Allocation();
  a->type_ = Allocation::Type::Block;
  a->block_ = b;
  a->handle_ = r.handle;
  a->offset_ = r.offset;
  a->size_ = req.size;
  a->alignment_ = req.alignment;
  a->category_ = info_.category;
  a->kind_ = req.kind;
  a->pool_ = this;
  try {
    b->metadata()->alloc(r, req.kind, a);
  } catch (...) {
    delete a;
    throw;
  }
  if (corruption_detection_enabled_()) {
    try {
      b->write_magic_after(a->offset_, a->size_, debug_margin_);
    } catch (...) {
      b->metadata()->free(a->handle_);
      delete a;
      throw;
    }
  }
  owner_.note_allocation_(info_.category, a->size_);
  incrementally_sort_();
  return a;
}

DeviceMemoryBlock* Pool::create_block_(DeviceSize size, bool within_budget) {
  std::unique_ptr<BlockMetadata> md =
      make_block_metadata(info_.algorithm, size, granularity_, debug_margin_, false);
  DeviceMemoryBlock* b =
      owner_.create_device_block_(info_.category, size, within_budget, std::move(md), next_block_id_);
  ++next_block_id_;
  try {
    blocks_.push_back(b);
  } catch (...) {
    owner_.destroy_device_block_(b);
    throw;
  }
  return b;
}

void Pool::remove_block_(DeviceMemoryBlock* b) noexcept {
  auto it = std::find(blocks_.begin(), blocks_.end(), b);
  DEVMEM_ASSERT(it != blocks_.end());
  if (it != blocks_.end()) blocks_.erase(it);
}

DeviceSize Pool::max_existing_block_size_() const noexcept {
  DeviceSize m = 0;
  for (const DeviceMemoryBlock* b : blocks_) m = std::max(m, b->size());
  return m;
}

void Pool::incrementally_sort_() noexcept {
  if (!incremental_sort_) return;
  // One bubble step per call keeps blocks roughly ordered by free space.
  for (std::size_t i = 1; i < blocks_.size(); ++i) {
    if (blocks_[i - 1]->metadata()->sum_free_size() > blocks_[i]->metadata()->sum_free_size()) {
      std::swap(blocks_[i - 1], blocks_[i]);
      return;
    }
  }
}

void Pool::sort_by_free_size_() {
  std::stable_sort(blocks_.begin(), blocks_.end(),
                   [](const DeviceMemoryBlock* a, const DeviceMemoryBlock* b) {
                     return a->metadata()->sum_free_size() < b->metadata()->sum_free_size();
                   });
}

bool Pool::corruption_detection_enabled_() const noexcept {
  return owner_.corruption_detection_enabled_(info_.category);
}

}} // namespace devmem::alloc
