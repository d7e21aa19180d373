// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

#include "devmem/alloc/device_provider.h"
#include "devmem/alloc/stats.h"
#include "devmem/alloc/types.h"

namespace devmem { namespace alloc {

// Per-heap usage/limit accounting. Block and allocation totals are atomics;
// the external budget sample and every block reservation are serialized by
// refresh_mu_.
class BudgetTracker {
 public:
  BudgetTracker(std::vector<MemoryHeap> heaps, std::vector<DeviceSize> heap_size_limits,
                BudgetSource* source, std::size_t refresh_ops, bool use_mutex);

  std::uint32_t heap_count() const noexcept { return static_cast<std::uint32_t>(heaps_.size()); }
  // User-imposed hard limit for the heap; 0 = none.
  DeviceSize heap_size_limit(std::uint32_t heap) const noexcept { return limits_[heap]; }

  // Accounts a new device block of size bytes. Throws OutOfDeviceMemory when
  // the heap size limit would be exceeded, and OutOfBudget when within_budget
  // is set and usage + size > budget.
  void reserve_block(std::uint32_t heap, DeviceSize size, bool within_budget);
  void release_block(std::uint32_t heap, DeviceSize size) noexcept;
  void add_allocation(std::uint32_t heap, DeviceSize size) noexcept;
  void remove_allocation(std::uint32_t heap, DeviceSize size) noexcept;

  Budget get(std::uint32_t heap);
  std::vector<Budget> get_all();
  // Pulls a fresh sample from the budget source, if any.
  void refresh();

 private:
  struct HeapState {
    std::atomic<std::uint64_t> block_count{0};
    std::atomic<std::uint64_t> block_bytes{0};
    std::atomic<std::uint64_t> allocation_count{0};
    std::atomic<std::uint64_t> allocation_bytes{0};
  };
  struct SourceSample {
    DeviceSize usage{0};
    DeviceSize budget{0};
    DeviceSize block_bytes_at_fetch{0};
  };

  // refresh_mu_ held.
  void maybe_refresh_locked_();
  void refresh_locked_();
  Budget compute_locked_(std::uint32_t heap) const;

  std::vector<MemoryHeap> heaps_;
  std::vector<DeviceSize> limits_;
  BudgetSource* source_;
  const std::size_t refresh_ops_;
  const bool use_mutex_;
  std::unique_ptr<HeapState[]> state_;

  std::mutex refresh_mu_{};
  std::vector<SourceSample> samples_{};
  bool have_samples_{false};
  std::atomic<std::uint64_t> ops_since_refresh_{0};
};

}} // namespace devmem::alloc
