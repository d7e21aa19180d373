// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "devmem/alloc/budget.h"

#include <algorithm>
#include <string>
#include <utility>

#include "devmem/alloc/sync.h"
#include "devmem/core/checked_math.h"
#include "devmem/core/error.h"
#include "devmem/logging/logging.h"

namespace devmem { namespace alloc {

using core::ErrorCode;

BudgetTracker::BudgetTracker(std::vector<MemoryHeap> heaps, std::vector<DeviceSize> heap_size_limits,
                             BudgetSource* source, std::size_t refresh_ops, bool use_mutex)
  : heaps_(std::move(heaps)),
    limits_(std::move(heap_size_limits)),
    source_(source),
    refresh_ops_(refresh_ops == 0 ? 1 : refresh_ops),
    use_mutex_(use_mutex),
    state_(std::make_unique<HeapState[]>(heaps_.size())) {
  limits_.resize(heaps_.size(), 0);
}

void BudgetTracker::reserve_block(std::uint32_t heap, DeviceSize size, bool within_budget) {
  HeapState& h = state_[heap];
  // Check and commit under one lock so concurrent reservations cannot both
  // pass against the same usage. Releases only lower block_bytes.
  MaybeLockGuard lk(refresh_mu_, use_mutex_);
  if (within_budget) {
    maybe_refresh_locked_();
    const Budget b = compute_locked_(heap);
    if (core::saturating_add_u64(b.usage, size) > b.budget) {
      core::throw_error(ErrorCode::OutOfBudget, "BudgetTracker::reserve_block",
                        "heap " + std::to_string(heap) + ": usage " + std::to_string(b.usage) +
                        " + block " + std::to_string(size) + " exceeds budget " +
                        std::to_string(b.budget));
    }
  }

  const DeviceSize limit = limits_[heap];
  if (limit != 0 &&
      core::saturating_add_u64(h.block_bytes.load(std::memory_order_relaxed), size) > limit) {
    core::throw_error(ErrorCode::OutOfDeviceMemory, "BudgetTracker::reserve_block",
                      "heap " + std::to_string(heap) + " size limit " + std::to_string(limit) +
                      " reached");
  }
  h.block_bytes.fetch_add(size, std::memory_order_relaxed);
  h.block_count.fetch_add(1, std::memory_order_relaxed);
  ops_since_refresh_.fetch_add(1, std::memory_order_relaxed);
}

void BudgetTracker::release_block(std::uint32_t heap, DeviceSize size) noexcept {
  HeapState& h = state_[heap];
  const std::uint64_t prev = h.block_bytes.fetch_sub(size, std::memory_order_relaxed);
  DEVMEM_ASSERT(prev >= size);
  (void)prev;
  h.block_count.fetch_sub(1, std::memory_order_relaxed);
  ops_since_refresh_.fetch_add(1, std::memory_order_relaxed);
}

void BudgetTracker::add_allocation(std::uint32_t heap, DeviceSize size) noexcept {
  HeapState& h = state_[heap];
  h.allocation_bytes.fetch_add(size, std::memory_order_relaxed);
  h.allocation_count.fetch_add(1, std::memory_order_relaxed);
}

void BudgetTracker::remove_allocation(std::uint32_t heap, DeviceSize size) noexcept {
  HeapState& h = state_[heap];
  h.allocation_bytes.fetch_sub(size, std::memory_order_relaxed);
  h.allocation_count.fetch_sub(1, std::memory_order_relaxed);
}

void BudgetTracker::maybe_refresh_locked_() {
  if (source_ == nullptr) return;
  if (!have_samples_ || ops_since_refresh_.load(std::memory_order_relaxed) >= refresh_ops_) {
    refresh_locked_();
  }
}

void BudgetTracker::refresh_locked_() {
  if (source_ == nullptr) return;
  std::vector<HeapBudgetSample> fresh = source_->refresh();
  if (fresh.size() != heaps_.size()) {
    DEVMEM_LOG(WARNING) << "budget source returned " << fresh.size() << " heaps, expected "
                        << heaps_.size() << "; falling back to internal accounting";
    have_samples_ = false;
    samples_.clear();
    return;
  }
  samples_.resize(heaps_.size());
  for (std::size_t i = 0; i < heaps_.size(); ++i) {
    samples_[i].usage = fresh[i].usage;
    samples_[i].budget = fresh[i].limit;
    samples_[i].block_bytes_at_fetch = state_[i].block_bytes.load(std::memory_order_relaxed);
  }
  have_samples_ = true;
  ops_since_refresh_.store(0, std::memory_order_relaxed);
}

Budget BudgetTracker::compute_locked_(std::uint32_t heap) const {
  const HeapState& h = state_[heap];
  Budget b;
  b.statistics.block_count = static_cast<std::uint32_t>(h.block_count.load(std::memory_order_relaxed));
  b.statistics.block_bytes = h.block_bytes.load(std::memory_order_relaxed);
  b.statistics.allocation_count = static_cast<std::uint32_t>(h.allocation_count.load(std::memory_order_relaxed));
  b.statistics.allocation_bytes = h.allocation_bytes.load(std::memory_order_relaxed);

  DeviceSize capacity = heaps_[heap].size;
  if (limits_[heap] != 0) capacity = std::min(capacity, limits_[heap]);

  if (have_samples_) {
    const SourceSample& s = samples_[heap];
    const DeviceSize now = b.statistics.block_bytes;
    if (now >= s.block_bytes_at_fetch) {
      b.usage = core::saturating_add_u64(s.usage, now - s.block_bytes_at_fetch);
    } else {
      const DeviceSize dropped = s.block_bytes_at_fetch - now;
      b.usage = s.usage > dropped ? s.usage - dropped : 0;
    }
    b.budget = std::min(s.budget, capacity);
  } else {
    // No external view: usage is our own block bytes, budget 80% of the heap.
    b.usage = b.statistics.block_bytes;
    b.budget = heaps_[heap].size / 10 * 8;
    if (limits_[heap] != 0) b.budget = std::min(b.budget, limits_[heap]);
  }
  return b;
}

Budget BudgetTracker::get(std::uint32_t heap) {
  MaybeLockGuard lk(refresh_mu_, use_mutex_);
  maybe_refresh_locked_();
  return compute_locked_(heap);
}

std::vector<Budget> BudgetTracker::get_all() {
  MaybeLockGuard lk(refresh_mu_, use_mutex_);
  maybe_refresh_locked_();
  std::vector<Budget> out;
  out.reserve(heaps_.size());
  for (std::uint32_t i = 0; i < heaps_.size(); ++i) out.push_back(compute_locked_(i));
  return out;
}

void BudgetTracker::refresh() {
  MaybeLockGuard lk(refresh_mu_, use_mutex_);
  refresh_locked_();
}

}} // namespace devmem::alloc
