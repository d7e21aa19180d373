// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <vector>

#include "devmem/alloc/allocator.h"
#include "devmem/core/error.h"
#include "devmem_test_helpers.h"

using namespace devmem::alloc;
using devmem::core::Error;
using devmem::core::ErrorCode;
namespace dt = devmem::test;
using dt::kKiB;
using dt::kMiB;

namespace {

ErrorCode alloc_code(Allocator& a, const MemoryRequirements& r, const AllocationCreateInfo& info) {
  try {
    Allocation* x = a.allocate(r, info);
    a.free(x);
  } catch (const Error& e) {
    return e.code();
  }
  ADD_FAILURE() << "allocate did not throw";
  return ErrorCode::InvalidState;
}

AllocationCreateInfo in_pool(Pool* p, AllocationCreateFlags flags = 0) {
  AllocationCreateInfo info;
  info.pool = p;
  info.flags = flags;
  return info;
}

} // namespace

TEST(PoolTest, FreeListBestFitReusesHole) {
  dt::TestDevice dev;
  auto alloc = dev.make_allocator();
  PoolCreateInfo pci;
  pci.category = dt::kDeviceLocal;
  pci.block_size = 1 * kMiB;
  pci.max_block_count = 1;
  Pool* pool = alloc->create_pool(pci);

  const AllocationCreateInfo info = in_pool(pool);
  Allocation* a = alloc->allocate(dt::reqs(300 * kKiB), info);
  Allocation* b = alloc->allocate(dt::reqs(300 * kKiB), info);
  Allocation* c = alloc->allocate(dt::reqs(300 * kKiB), info);
  EXPECT_EQ(a->offset(), 0u);
  EXPECT_EQ(b->offset(), 300 * kKiB);
  EXPECT_EQ(c->offset(), 600 * kKiB);
  EXPECT_EQ(a->memory(), c->memory());
  EXPECT_EQ(a->pool(), pool);

  alloc->free(b);
  Allocation* d = alloc->allocate(dt::reqs(200 * kKiB),
                                  in_pool(pool, kAllocationCreateStrategyMinMemory));
  EXPECT_EQ(d->offset(), 300 * kKiB);
  EXPECT_TRUE(alloc->debug_validate_for_testing());

  // One block only: the tail is 124 KiB and the hole 100 KiB.
  EXPECT_EQ(alloc_code(*alloc, dt::reqs(200 * kKiB), info), ErrorCode::OutOfDeviceMemory);
  alloc->free(a);
  alloc->free(c);
  alloc->free(d);
  alloc->destroy_pool(pool);
}

TEST(PoolTest, LinearPoolStackAndUpperAddress) {
  dt::TestDevice dev;
  auto alloc = dev.make_allocator();
  PoolCreateInfo pci;
  pci.category = dt::kDeviceLocal;
  pci.algorithm = PoolAlgorithm::Linear;
  pci.block_size = 1 * kKiB;
  pci.max_block_count = 1;
  Pool* pool = alloc->create_pool(pci);

  const AllocationCreateInfo info = in_pool(pool);
  Allocation* a = alloc->allocate(dt::reqs(100), info);
  Allocation* b = alloc->allocate(dt::reqs(100), info);
  Allocation* c = alloc->allocate(dt::reqs(100), info);
  EXPECT_EQ(a->offset(), 0u);
  EXPECT_EQ(b->offset(), 100u);
  EXPECT_EQ(c->offset(), 200u);
  alloc->free(c);
  Allocation* d = alloc->allocate(dt::reqs(100), info);
  EXPECT_EQ(d->offset(), 200u);

  const AllocationCreateInfo upper = in_pool(pool, kAllocationCreateUpperAddress);
  Allocation* u1 = alloc->allocate(dt::reqs(100), upper);
  Allocation* u2 = alloc->allocate(dt::reqs(100), upper);
  EXPECT_EQ(u1->offset() + u1->size(), 1 * kKiB);
  EXPECT_LT(u2->offset() + u2->size(), u1->offset() + u1->size());
  EXPECT_GE(u2->offset(), d->offset() + d->size());

  for (Allocation* x : {a, b, d, u1, u2}) alloc->free(x);
  alloc->destroy_pool(pool);
}

TEST(PoolTest, CreatePoolValidation) {
  dt::TestDevice dev;
  auto alloc = dev.make_allocator();
  auto create_code = [&](const PoolCreateInfo& pci) {
    try {
      alloc->create_pool(pci);
    } catch (const Error& e) {
      return e.code();
    }
    ADD_FAILURE() << "create_pool did not throw";
    return ErrorCode::InvalidState;
  };

  PoolCreateInfo pci;
  pci.algorithm = PoolAlgorithm::Linear;
  pci.max_block_count = 2;
  EXPECT_EQ(create_code(pci), ErrorCode::InvalidArgument);
  pci.max_block_count = 0;
  EXPECT_EQ(create_code(pci), ErrorCode::InvalidArgument);

  pci = PoolCreateInfo{};
  pci.category = 17;
  EXPECT_EQ(create_code(pci), ErrorCode::InvalidArgument);

  pci = PoolCreateInfo{};
  pci.min_block_count = 3;
  pci.max_block_count = 2;
  EXPECT_EQ(create_code(pci), ErrorCode::InvalidArgument);

  pci = PoolCreateInfo{};
  pci.min_allocation_alignment = 48;
  EXPECT_EQ(create_code(pci), ErrorCode::InvalidArgument);
}

TEST(PoolTest, UpperAddressNeedsLinearPool) {
  dt::TestDevice dev;
  auto alloc = dev.make_allocator();
  PoolCreateInfo pci;
  pci.block_size = 1 * kMiB;
  Pool* pool = alloc->create_pool(pci);
  EXPECT_EQ(alloc_code(*alloc, dt::reqs(64), in_pool(pool, kAllocationCreateUpperAddress)),
            ErrorCode::InvalidArgument);
  AllocationCreateInfo no_pool;
  no_pool.flags = kAllocationCreateUpperAddress;
  EXPECT_EQ(alloc_code(*alloc, dt::reqs(64), no_pool), ErrorCode::InvalidArgument);
  alloc->destroy_pool(pool);
}

TEST(PoolTest, MinBlocksArePreallocatedAndKept) {
  dt::TestDevice dev;
  auto alloc = dev.make_allocator();
  PoolCreateInfo pci;
  pci.category = dt::kDeviceLocal;
  pci.block_size = 1 * kMiB;
  pci.min_block_count = 2;
  pci.max_block_count = 3;
  pci.name = "staging";
  Pool* pool = alloc->create_pool(pci);
  EXPECT_EQ(pool->block_count(), 2u);
  EXPECT_EQ(pool->name(), "staging");
  EXPECT_EQ(dev.provider.stats().live_blocks, 2u);

  std::vector<Allocation*> live;
  for (int i = 0; i < 3; ++i) live.push_back(alloc->allocate(dt::reqs(1 * kMiB), in_pool(pool)));
  EXPECT_EQ(pool->block_count(), 3u);
  EXPECT_EQ(alloc_code(*alloc, dt::reqs(1 * kMiB), in_pool(pool)), ErrorCode::OutOfDeviceMemory);

  for (Allocation* a : live) alloc->free(a);
  // Empty blocks above the minimum are released.
  EXPECT_EQ(pool->block_count(), 2u);
  const Statistics s = pool->statistics();
  EXPECT_EQ(s.block_count, 2u);
  EXPECT_EQ(s.allocation_count, 0u);
  alloc->destroy_pool(pool);
  EXPECT_EQ(dev.provider.stats().live_blocks, 0u);
}

TEST(PoolTest, NeverAllocateAndOversizedRequests) {
  dt::TestDevice dev;
  auto alloc = dev.make_allocator();
  PoolCreateInfo pci;
  pci.block_size = 64 * kKiB;
  Pool* pool = alloc->create_pool(pci);

  EXPECT_EQ(alloc_code(*alloc, dt::reqs(1 * kKiB), in_pool(pool, kAllocationCreateNeverAllocate)),
            ErrorCode::OutOfDeviceMemory);
  EXPECT_EQ(pool->block_count(), 0u);
  EXPECT_EQ(alloc_code(*alloc, dt::reqs(64 * kKiB + 1), in_pool(pool)), ErrorCode::OutOfDeviceMemory);

  Allocation* a = alloc->allocate(dt::reqs(1 * kKiB), in_pool(pool));
  Allocation* b = alloc->allocate(dt::reqs(1 * kKiB), in_pool(pool, kAllocationCreateNeverAllocate));
  EXPECT_EQ(a->memory(), b->memory());
  alloc->free(a);
  alloc->free(b);
  alloc->destroy_pool(pool);
}

TEST(PoolTest, DefaultPoolGrowsWithIncreasingBlockSizes) {
  dt::TestDevice dev;
  auto alloc = dev.make_allocator();
  // 256 MiB heap: preferred block size is heap / 8.
  ASSERT_EQ(alloc->preferred_block_size(dt::kDeviceLocal), 32 * kMiB);
  ASSERT_EQ(alloc->preferred_block_size(dt::kHostCoherent), 8 * kMiB);

  AllocationCreateInfo info;
  info.category_bits = dt::bit(dt::kDeviceLocal);
  Allocation* a = alloc->allocate(dt::reqs(1 * kMiB), info);
  TotalStatistics t = alloc->calculate_statistics();
  EXPECT_EQ(t.categories[dt::kDeviceLocal].statistics.block_count, 1u);
  EXPECT_EQ(t.categories[dt::kDeviceLocal].statistics.block_bytes, 4 * kMiB);

  Allocation* b = alloc->allocate(dt::reqs(3 * kMiB + 512 * kKiB), info);
  EXPECT_NE(a->memory(), b->memory());
  t = alloc->calculate_statistics();
  EXPECT_EQ(t.categories[dt::kDeviceLocal].statistics.block_count, 2u);
  EXPECT_EQ(t.categories[dt::kDeviceLocal].statistics.block_bytes, 12 * kMiB);

  alloc->free(a);
  alloc->free(b);
  t = alloc->calculate_statistics();
  EXPECT_EQ(t.categories[dt::kDeviceLocal].statistics.block_count, 0u);
  EXPECT_EQ(dev.provider.stats().live_blocks, 0u);
}

TEST(PoolTest, GrowthRetriesSmallerBlocksOnDeviceFailure) {
  dt::TestDevice dev;
  auto alloc = dev.make_allocator();
  AllocationCreateInfo info;
  info.category_bits = dt::bit(dt::kDeviceLocal);
  Allocation* a = alloc->allocate(dt::reqs(1 * kMiB), info);

  // The next block would be 8 MiB; the device only grants 4 MiB.
  dev.provider.fail_allocs_larger_than(4 * kMiB);
  Allocation* b = alloc->allocate(dt::reqs(3 * kMiB + 512 * kKiB), info);
  const TotalStatistics t = alloc->calculate_statistics();
  EXPECT_EQ(t.categories[dt::kDeviceLocal].statistics.block_bytes, 8 * kMiB);
  EXPECT_GE(alloc->get_counters().device_oom, 1u);

  alloc->free(a);
  alloc->free(b);
}

TEST(PoolTest, ExplicitBlockSizeDoesNotRetry) {
  dt::TestDevice dev;
  auto alloc = dev.make_allocator();
  PoolCreateInfo pci;
  pci.block_size = 4 * kMiB;
  Pool* pool = alloc->create_pool(pci);
  dev.provider.fail_next_allocs(1);
  EXPECT_EQ(alloc_code(*alloc, dt::reqs(1 * kKiB), in_pool(pool)), ErrorCode::OutOfDeviceMemory);
  EXPECT_EQ(pool->block_count(), 0u);
  EXPECT_EQ(alloc->get_counters().device_oom, 1u);

  dev.provider.fail_next_allocs(1, DeviceStatus::OutOfHostMemory);
  EXPECT_EQ(alloc_code(*alloc, dt::reqs(1 * kKiB), in_pool(pool)), ErrorCode::OutOfHostMemory);
  alloc->destroy_pool(pool);
}

TEST(PoolTest, WithinBudgetStopsGrowthBeforeDeviceLimit) {
  dt::TestDevice dev;
  auto alloc = dev.make_allocator();
  PoolCreateInfo pci;
  pci.category = dt::kHostCoherent;  // 64 MiB heap, budget 80%
  pci.block_size = 16 * kMiB;
  Pool* pool = alloc->create_pool(pci);

  std::vector<Allocation*> live;
  const AllocationCreateInfo within = in_pool(pool, kAllocationCreateWithinBudget);
  for (int i = 0; i < 3; ++i) live.push_back(alloc->allocate(dt::reqs(10 * kMiB), within));
  EXPECT_EQ(pool->block_count(), 3u);
  const Budget before = alloc->get_category_budget(dt::kHostCoherent);
  EXPECT_EQ(before.usage, 48 * kMiB);
  EXPECT_GT(before.usage + 16 * kMiB, before.budget);

  EXPECT_EQ(alloc_code(*alloc, dt::reqs(10 * kMiB), within), ErrorCode::OutOfBudget);
  EXPECT_EQ(alloc->get_counters().budget_rejections, 1u);

  // Without the flag the last 16 MiB of the heap is still usable.
  live.push_back(alloc->allocate(dt::reqs(10 * kMiB), in_pool(pool)));
  EXPECT_EQ(alloc_code(*alloc, dt::reqs(10 * kMiB), in_pool(pool)), ErrorCode::OutOfDeviceMemory);

  for (Allocation* a : live) alloc->free(a);
  alloc->destroy_pool(pool);
}

TEST(PoolTest, WithinBudgetGrowthMayReachBudgetExactly) {
  dt::TestDevice dev;
  AllocatorCreateInfo ci = dev.create_info();
  ci.heap_size_limits = {0, 48 * kMiB};  // budget min(80%, 48 MiB) = 48 MiB
  Allocator alloc(ci);
  ASSERT_EQ(alloc.get_category_budget(dt::kHostCoherent).budget, 48 * kMiB);
  PoolCreateInfo pci;
  pci.category = dt::kHostCoherent;
  pci.block_size = 16 * kMiB;
  Pool* pool = alloc.create_pool(pci);

  std::vector<Allocation*> live;
  const AllocationCreateInfo within = in_pool(pool, kAllocationCreateWithinBudget);
  for (int i = 0; i < 3; ++i) live.push_back(alloc.allocate(dt::reqs(16 * kMiB), within));
  const Budget full = alloc.get_category_budget(dt::kHostCoherent);
  EXPECT_EQ(full.usage, full.budget);
  EXPECT_EQ(alloc.get_counters().budget_rejections, 0u);

  EXPECT_EQ(alloc_code(alloc, dt::reqs(1 * kKiB), within), ErrorCode::OutOfBudget);
  EXPECT_EQ(alloc.get_counters().budget_rejections, 1u);
  EXPECT_EQ(pool->block_count(), 3u);

  for (Allocation* a : live) alloc.free(a);
  alloc.destroy_pool(pool);
}

TEST(PoolTest, HeapSizeLimitIsEnforced) {
  dt::TestDevice dev;
  AllocatorCreateInfo ci = dev.create_info();
  ci.heap_size_limits = {0, 20 * kMiB};
  Allocator alloc(ci);
  PoolCreateInfo pci;
  pci.category = dt::kHostCached;
  pci.block_size = 16 * kMiB;
  Pool* pool = alloc.create_pool(pci);
  Allocation* a = alloc.allocate(dt::reqs(16 * kMiB), in_pool(pool));
  EXPECT_EQ(alloc_code(alloc, dt::reqs(16 * kMiB), in_pool(pool)), ErrorCode::OutOfDeviceMemory);
  EXPECT_EQ(dev.provider.stats().alloc_calls, 1u);
  EXPECT_EQ(alloc.get_budget()[1].budget, 20 * kMiB);
  alloc.free(a);
  alloc.destroy_pool(pool);
}

TEST(PoolTest, BuddyPoolRoundsToPowersOfTwo) {
  dt::TestDevice dev;
  auto alloc = dev.make_allocator();
  PoolCreateInfo pci;
  pci.algorithm = PoolAlgorithm::Buddy;
  pci.block_size = 1 * kMiB;
  pci.max_block_count = 1;
  Pool* pool = alloc->create_pool(pci);
  Allocation* a = alloc->allocate(dt::reqs(100 * kKiB), in_pool(pool));
  Allocation* b = alloc->allocate(dt::reqs(100 * kKiB), in_pool(pool));
  EXPECT_EQ(a->offset(), 0u);
  EXPECT_EQ(b->offset(), 128 * kKiB);
  EXPECT_EQ(a->size(), 100 * kKiB);
  const DetailedStatistics s = pool->detailed_statistics();
  EXPECT_EQ(s.statistics.allocation_count, 2u);
  alloc->free(a);
  // Free nodes: [0,128K), [256K,512K), [512K,1M).
  EXPECT_EQ(pool->detailed_statistics().unused_range_count, 3u);
  alloc->free(b);
  EXPECT_EQ(pool->block_count(), 0u);
  alloc->destroy_pool(pool);
}

TEST(PoolTest, MinAllocationAlignmentAndDebugAlignment) {
  dt::TestDevice dev;
  Config cfg;
  cfg.debug_min_alignment = 256;
  auto alloc = dev.make_allocator(cfg);
  PoolCreateInfo pci;
  pci.block_size = 1 * kMiB;
  pci.min_allocation_alignment = 4096;
  Pool* pool = alloc->create_pool(pci);
  Allocation* a = alloc->allocate(dt::reqs(10), in_pool(pool));
  Allocation* b = alloc->allocate(dt::reqs(10), in_pool(pool));
  EXPECT_EQ(b->offset() % 4096, 0u);
  EXPECT_EQ(b->offset(), 4096u);

  AllocationCreateInfo info;
  info.category_bits = dt::bit(dt::kDeviceLocal);
  Allocation* c = alloc->allocate(dt::reqs(10), info);
  Allocation* d = alloc->allocate(dt::reqs(10), info);
  EXPECT_EQ(d->offset() % 256, 0u);
  EXPECT_EQ(d->alignment(), 256u);
  for (Allocation* x : {a, b, c, d}) alloc->free(x);
  alloc->destroy_pool(pool);
}
