// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <cstring>

#include "devmem/alloc/block.h"
#include "devmem/alloc/host_provider.h"
#include "devmem_test_helpers.h"

using namespace devmem::alloc;
namespace dt = devmem::test;

TEST(HostProviderTest, HeapCapacityIsEnforced) {
  HostMemoryProvider p(dt::default_heaps(), dt::default_categories());
  DeviceMemoryHandle a = kNullDeviceMemory;
  DeviceMemoryHandle b = kNullDeviceMemory;
  ASSERT_EQ(p.alloc_block(dt::kHostCoherent, 48 * dt::kMiB, a), DeviceStatus::Ok);
  EXPECT_EQ(p.heap_used(1), 48 * dt::kMiB);
  EXPECT_EQ(p.alloc_block(dt::kHostCached, 32 * dt::kMiB, b), DeviceStatus::OutOfDeviceMemory);
  EXPECT_EQ(b, kNullDeviceMemory);
  ASSERT_EQ(p.alloc_block(dt::kHostCached, 16 * dt::kMiB, b), DeviceStatus::Ok);
  EXPECT_EQ(p.block_category(b), dt::kHostCached);
  p.free_block(a);
  p.free_block(b);
  EXPECT_EQ(p.heap_used(1), 0u);
  const HostProviderStats s = p.stats();
  EXPECT_EQ(s.alloc_calls, 3u);
  EXPECT_EQ(s.alloc_failures, 1u);
  EXPECT_EQ(s.free_calls, 2u);
  EXPECT_EQ(s.live_blocks, 0u);
}

TEST(HostProviderTest, FailureInjection) {
  HostMemoryProvider p(dt::default_heaps(), dt::default_categories());
  DeviceMemoryHandle h = kNullDeviceMemory;
  p.fail_next_allocs(2, DeviceStatus::OutOfHostMemory);
  EXPECT_EQ(p.alloc_block(0, 1024, h), DeviceStatus::OutOfHostMemory);
  EXPECT_EQ(p.alloc_block(0, 1024, h), DeviceStatus::OutOfHostMemory);
  ASSERT_EQ(p.alloc_block(0, 1024, h), DeviceStatus::Ok);
  p.free_block(h);

  p.fail_allocs_larger_than(4096);
  EXPECT_EQ(p.alloc_block(0, 8192, h), DeviceStatus::OutOfDeviceMemory);
  ASSERT_EQ(p.alloc_block(0, 4096, h), DeviceStatus::Ok);
  p.free_block(h);
}

TEST(HostProviderTest, MapRequiresHostVisible) {
  HostMemoryProvider p(dt::default_heaps(), dt::default_categories());
  DeviceMemoryHandle dev = kNullDeviceMemory;
  DeviceMemoryHandle host = kNullDeviceMemory;
  ASSERT_EQ(p.alloc_block(dt::kDeviceLocal, 4096, dev), DeviceStatus::Ok);
  ASSERT_EQ(p.alloc_block(dt::kHostCoherent, 4096, host), DeviceStatus::Ok);
  void* ptr = nullptr;
  EXPECT_EQ(p.map(dev, ptr), DeviceStatus::MemoryMapFailed);
  EXPECT_EQ(ptr, nullptr);
  ASSERT_EQ(p.map(host, ptr), DeviceStatus::Ok);
  ASSERT_NE(ptr, nullptr);
  std::memset(ptr, 0xAB, 4096);
  EXPECT_EQ(p.map_refs(host), 1u);
  p.unmap(host);
  EXPECT_EQ(p.map_refs(host), 0u);

  // Contents survive an unmap.
  void* again = nullptr;
  ASSERT_EQ(p.map(host, again), DeviceStatus::Ok);
  EXPECT_EQ(static_cast<unsigned char*>(again)[100], 0xAB);
  p.unmap(host);

  p.set_map_fails(true);
  EXPECT_EQ(p.map(host, again), DeviceStatus::MemoryMapFailed);
  p.free_block(dev);
  p.free_block(host);
}

TEST(DeviceMemoryBlockTest, MapReferencesAreCounted) {
  HostMemoryProvider p(dt::default_heaps(), dt::default_categories());
  DeviceMemoryHandle h = kNullDeviceMemory;
  ASSERT_EQ(p.alloc_block(dt::kHostCoherent, 4096, h), DeviceStatus::Ok);
  {
    DeviceMemoryBlock b(p, dt::kHostCoherent, 7, h, 4096, nullptr, true);
    void* first = b.map(1);
    void* second = b.map(2);
    EXPECT_EQ(first, second);
    EXPECT_EQ(b.map_count(), 3u);
    EXPECT_EQ(p.map_refs(h), 1u);
    b.unmap(2);
    EXPECT_EQ(b.mapped_data(), first);
    b.unmap(1);
    EXPECT_EQ(b.mapped_data(), nullptr);
    EXPECT_EQ(p.map_refs(h), 0u);

    b.write_magic_after(100, 28, 16);
    EXPECT_TRUE(b.validate_magic_after(100, 28, 16));
    auto* base = static_cast<unsigned char*>(b.map(1));
    base[130] ^= 0xFF;
    b.unmap(1);
    EXPECT_FALSE(b.validate_magic_after(100, 28, 16));
  }
  // The block destructor returns the memory.
  EXPECT_EQ(p.stats().live_blocks, 0u);
}
