// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <unordered_set>
#include <vector>

#include "devmem/alloc/allocation.h"
#include "devmem/alloc/budget.h"
#include "devmem/alloc/config.h"
#include "devmem/alloc/defragmentation.h"
#include "devmem/alloc/device_provider.h"
#include "devmem/alloc/pool.h"
#include "devmem/alloc/stats.h"
#include "devmem/alloc/types.h"

namespace devmem { namespace alloc {

struct AllocatorCreateInfo {
  AllocatorCreateFlags        flags{0};
  DeviceMemoryProvider*       provider{nullptr};       // required; not owned
  BudgetSource*               budget_source{nullptr};  // optional; not owned
  std::vector<MemoryHeap>     heaps{};
  std::vector<MemoryCategory> categories{};
  std::vector<DeviceSize>     heap_size_limits{};      // empty or one per heap; 0 = none
  DeviceSize                  preferred_large_heap_block_size{0};  // 0 = config default
  DeviceSize                  buffer_image_granularity{1};
  DeviceSize                  non_coherent_atom_size{1};
  std::optional<Config>       config{};                // unset = parse DEVMEM_ALLOC_CONF
};

struct AllocationInfo {
  std::uint32_t      category{0};
  DeviceMemoryHandle memory{kNullDeviceMemory};
  DeviceSize         offset{0};
  DeviceSize         size{0};
  void*              mapped_data{nullptr};
  UserData           user_data{};
  std::string        name{};
};

// Top-level orchestrator: default pool per category (created lazily), custom
// pool registry, dedicated allocations, budget tracking.
class Allocator final {
 public:
  // Throws InvalidArgument for a missing provider, empty or inconsistent heap
  // and category tables, or a non power-of-two granularity / atom size.
  explicit Allocator(const AllocatorCreateInfo& info);
  ~Allocator();

  Allocator(const Allocator&) = delete;
  Allocator& operator=(const Allocator&) = delete;

  Allocation* allocate(const MemoryRequirements& reqs, const AllocationCreateInfo& info);
  // Forces a private block sized to the request.
  Allocation* allocate_dedicated(const MemoryRequirements& reqs, const AllocationCreateInfo& info);
  // count allocations with identical parameters; all or nothing.
  std::vector<Allocation*> allocate_pages(const MemoryRequirements& reqs,
                                          const AllocationCreateInfo& info, std::size_t count);
  // nullptr is a no-op.
  void free(Allocation* a);
  void free_pages(std::span<Allocation* const> allocations);

  std::uint32_t find_memory_category(std::uint32_t category_bits, const AllocationCreateInfo& info) const;

  std::vector<Budget> get_budget();
  Budget get_category_budget(std::uint32_t category);
  TotalStatistics calculate_statistics() const;

  // Throws InvalidArgument for an unknown category, a linear pool with
  // max_block_count != 1, or min_block_count > max_block_count.
  Pool* create_pool(const PoolCreateInfo& info);
  // Pool must be empty of allocations.
  void destroy_pool(Pool* pool);

  void* map(Allocation* a);
  void unmap(Allocation* a);
  // Ranges are expanded to the non-coherent atom size and clamped to the
  // allocation; no-ops on coherent memory. size == kWholeSize means to the end.
  void flush(Allocation* a, DeviceSize offset, DeviceSize size);
  void invalidate(Allocation* a, DeviceSize offset, DeviceSize size);

  void set_user_data(Allocation* a, UserData user_data);
  void set_name(Allocation* a, std::string name);
  AllocationInfo get_allocation_info(const Allocation* a) const;
  MemoryPropertyFlags get_memory_properties(const Allocation* a) const;

  // Scans every pool of the selected categories (0 = all). Throws Corruption
  // on damage, FeatureNotPresent when no scanned category has detection on.
  void check_corruption(std::uint32_t category_bits);

  // JSON report; detailed adds every block's ranges.
  std::string build_stats_string(bool detailed);

  AllocatorCounters get_counters() const;
  void reset_peak_counters() noexcept;

  std::unique_ptr<DefragmentationContext> begin_defragmentation(const DefragmentationInfo& info);

  const Config& config() const noexcept { return cfg_; }
  std::span<const MemoryCategory> categories() const noexcept { return categories_; }
  std::span<const MemoryHeap> heaps() const noexcept { return heaps_; }
  DeviceSize buffer_image_granularity() const noexcept { return granularity_; }
  DeviceSize non_coherent_atom_size() const noexcept { return atom_size_; }
  bool use_mutex() const noexcept { return use_mutex_; }
  // Default block size for pools of the category's heap.
  DeviceSize preferred_block_size(std::uint32_t category) const noexcept;

#ifdef DEVMEM_INTERNAL_TESTS
  // Validates every block's metadata; false on the first inconsistency.
  bool debug_validate_for_testing() const;
  Pool* debug_default_pool_for_testing(std::uint32_t category);
  BudgetTracker& debug_budget_for_testing() noexcept { return budget_; }
#endif

 private:
  friend class Pool;
  friend class DefragmentationContext;

  Pool* default_pool_(std::uint32_t category);
  std::vector<Pool*> default_pools_snapshot_() const;
  std::vector<Pool*> all_pools_snapshot_() const;
  Allocation* allocate_in_category_(std::uint32_t category, const MemoryRequirements& reqs,
                                    const AllocationCreateInfo& info, bool force_dedicated);
  Allocation* allocate_dedicated_(std::uint32_t category, const MemoryRequirements& reqs,
                                  const AllocationCreateInfo& info);
  void free_dedicated_(Allocation* a);
  void finish_allocation_(Allocation* a, const AllocationCreateInfo& info);
  void flush_or_invalidate_(Allocation* a, DeviceSize offset, DeviceSize size, bool flush);
  void validate_request_(const MemoryRequirements& reqs, const AllocationCreateInfo& info) const;

  // Device block lifecycle, shared by pools and dedicated allocations.
  DeviceMemoryBlock* create_device_block_(std::uint32_t category, DeviceSize size, bool within_budget,
                                          std::unique_ptr<BlockMetadata> metadata, std::uint32_t id);
  void destroy_device_block_(DeviceMemoryBlock* b) noexcept;
  void note_allocation_(std::uint32_t category, DeviceSize size) noexcept;
  void note_free_(std::uint32_t category, DeviceSize size) noexcept;
  void note_corruption_() noexcept;
  std::uint32_t heap_of_(std::uint32_t category) const noexcept { return categories_[category].heap_index; }
  bool corruption_detection_enabled_(std::uint32_t category) const noexcept;

  DeviceMemoryProvider& provider_;
  const Config cfg_;
  const std::vector<MemoryHeap> heaps_;
  const std::vector<MemoryCategory> categories_;
  const DeviceSize granularity_;
  const DeviceSize atom_size_;
  const DeviceSize large_heap_block_size_;
  const bool use_mutex_;
  BudgetTracker budget_;

  // Pool registry; guards default_pools_ creation and pools_.
  mutable std::mutex registry_mu_{};
  std::array<std::unique_ptr<Pool>, kMaxMemoryCategories> default_pools_{};
  std::vector<std::unique_ptr<Pool>> pools_{};

  // Dedicated allocations, per category.
  mutable std::mutex dedicated_mu_{};
  std::vector<std::unordered_set<Allocation*>> dedicated_{};
  std::uint32_t next_dedicated_id_{0};

  mutable std::mutex counters_mu_{};
  AllocatorCounters counters_{};
};

}} // namespace devmem::alloc
