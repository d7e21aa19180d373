// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "devmem/alloc/block.h"
#include "devmem/alloc/stats.h"
#include "devmem/alloc/types.h"

namespace devmem { namespace alloc {

class Allocation;
class Allocator;

struct PoolCreateInfo {
  std::uint32_t category{0};
  PoolAlgorithm algorithm{PoolAlgorithm::FreeList};
  DeviceSize    block_size{0};           // 0 = allocator preferred size for the heap
  std::size_t   min_block_count{0};
  std::size_t   max_block_count{0};      // 0 = unlimited
  float         priority{0.5f};
  DeviceSize    min_allocation_alignment{0};
  bool          ignore_buffer_image_granularity{false};
  std::string   name{};
};

// A set of blocks sharing one category, block-size policy and placement
// algorithm. Blocks are kept ordered by ascending free space so placement
// tries the fullest block first.
class Pool {
 public:
  ~Pool();

  Pool(const Pool&) = delete;
  Pool& operator=(const Pool&) = delete;

  std::uint32_t category() const noexcept { return info_.category; }
  PoolAlgorithm algorithm() const noexcept { return info_.algorithm; }
  DeviceSize preferred_block_size() const noexcept { return preferred_block_size_; }
  std::size_t min_block_count() const noexcept { return info_.min_block_count; }
  std::size_t max_block_count() const noexcept { return info_.max_block_count; }
  float priority() const noexcept { return info_.priority; }
  bool is_default() const noexcept { return is_default_; }

  std::size_t block_count() const;
  Statistics statistics() const;
  // Walks every range of every block.
  DetailedStatistics detailed_statistics() const;
  // Verifies the margin after every live allocation. Throws Corruption on the
  // first damaged margin, FeatureNotPresent when detection is not enabled.
  void check_corruption();

  void set_name(std::string name);
  std::string name() const;

 private:
  friend class Allocator;
  friend class DefragmentationContext;

  struct AcquireRequest {
    DeviceSize size{0};
    DeviceSize alignment{1};
    SuballocationKind kind{SuballocationKind::Unknown};
    AllocationStrategy strategy{AllocationStrategy::MinMemory};
    bool upper{false};
    bool never_allocate{false};
    bool within_budget{false};
  };

  Pool(Allocator& owner, PoolCreateInfo info, DeviceSize preferred_block_size,
       bool explicit_block_size, bool is_default);

  void create_min_blocks_();
  Allocation* acquire_(const AcquireRequest& req);
  void release_(Allocation* a);

  // mu_ held for all of the below.
  Allocation* place_in_block_(DeviceMemoryBlock* b, const AcquireRequest& req);
  Allocation* commit_(DeviceMemoryBlock* b, const AllocationRequest& r, const AcquireRequest& req);
  DeviceMemoryBlock* create_block_(DeviceSize size, bool within_budget);
  void remove_block_(DeviceMemoryBlock* b) noexcept;
  DeviceSize max_existing_block_size_() const noexcept;
  void incrementally_sort_() noexcept;
  void sort_by_free_size_();
  bool corruption_detection_enabled_() const noexcept;

  Allocator& owner_;
  PoolCreateInfo info_;
  const DeviceSize preferred_block_size_;
  const bool explicit_block_size_;
  const bool is_default_;
  const DeviceSize granularity_;
  const DeviceSize debug_margin_;
  const bool use_mutex_;

  mutable std::mutex mu_{};
  std::vector<DeviceMemoryBlock*> blocks_{};
  std::uint32_t next_block_id_{0};
  bool incremental_sort_{true};
};

}} // namespace devmem::alloc
