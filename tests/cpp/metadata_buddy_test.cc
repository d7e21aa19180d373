// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <random>
#include <vector>

#include "devmem/alloc/metadata_buddy.h"
#include "devmem/core/error.h"

using namespace devmem::alloc;

namespace {

AllocHandle place(BuddyMetadata& md, DeviceSize size, DeviceSize alignment = 1) {
  auto r = md.create_request(size, alignment, false, SuballocationKind::Buffer,
                             AllocationStrategy::MinMemory);
  if (!r) return kNullAllocHandle;
  md.alloc(*r, SuballocationKind::Buffer, nullptr);
  return r->handle;
}

} // namespace

TEST(BuddyMetadataTest, LevelsStopAtMinNodeSize) {
  BuddyMetadata md(1024, 1, 0, false);
  EXPECT_EQ(md.usable_size(), 1024u);
  EXPECT_EQ(md.unusable_size(), 0u);
  EXPECT_EQ(md.level_count(), 6u);  // 1024 .. 32
  EXPECT_EQ(md.free_node_count(), 1u);
}

TEST(BuddyMetadataTest, AllocationsTakePowerOfTwoNodes) {
  BuddyMetadata md(1024, 1, 0, false);
  const AllocHandle a = place(md, 100);
  const AllocHandle b = place(md, 100);
  const AllocHandle c = place(md, 300);
  ASSERT_NE(c, kNullAllocHandle);
  EXPECT_EQ(md.allocation_info(a).offset, 0u);
  EXPECT_EQ(md.allocation_info(a).size, 128u);
  EXPECT_EQ(md.allocation_info(b).offset, 128u);
  EXPECT_EQ(md.allocation_info(c).offset, 512u);
  EXPECT_EQ(md.allocation_info(c).size, 512u);
  EXPECT_EQ(md.sum_free_size(), 256u);
  EXPECT_EQ(md.free_node_count(), 1u);
  EXPECT_TRUE(md.validate());
}

TEST(BuddyMetadataTest, FreeMergesBuddies) {
  BuddyMetadata md(1024, 1, 0, false);
  const AllocHandle a = place(md, 32);
  const AllocHandle b = place(md, 32);
  EXPECT_GT(md.free_node_count(), 1u);
  md.free(a);
  md.free(b);
  EXPECT_TRUE(md.is_empty());
  EXPECT_EQ(md.free_node_count(), 1u);
  EXPECT_EQ(md.sum_free_size(), 1024u);
  EXPECT_TRUE(md.validate());
}

TEST(BuddyMetadataTest, NonPowerOfTwoBlockHasUnusableTail) {
  BuddyMetadata md(1000, 1, 0, false);
  EXPECT_EQ(md.usable_size(), 512u);
  EXPECT_EQ(md.unusable_size(), 488u);
  EXPECT_EQ(md.sum_free_size(), 1000u);
  EXPECT_EQ(place(md, 600), kNullAllocHandle);
  const AllocHandle a = place(md, 512);
  ASSERT_NE(a, kNullAllocHandle);
  EXPECT_EQ(place(md, 32), kNullAllocHandle);

  std::vector<RangeInfo> ranges;
  md.for_each_range([&](const RangeInfo& r) { ranges.push_back(r); });
  ASSERT_EQ(ranges.size(), 2u);
  EXPECT_FALSE(ranges[0].free);
  EXPECT_TRUE(ranges[1].free);
  EXPECT_EQ(ranges[1].offset, 512u);
  EXPECT_EQ(ranges[1].size, 488u);
}

TEST(BuddyMetadataTest, UpperAddressIsRejected) {
  BuddyMetadata md(1024, 1, 0, false);
  EXPECT_FALSE(md.create_request(64, 1, true, SuballocationKind::Buffer, AllocationStrategy::MinMemory));
}

TEST(BuddyMetadataTest, MarginCountsTowardNodeSize) {
  BuddyMetadata md(1024, 1, 8, false);
  const AllocHandle a = place(md, 64);
  EXPECT_EQ(md.allocation_info(a).size, 128u);
}

TEST(BuddyMetadataTest, MinOffsetSplitsLowerLargerNode) {
  BuddyMetadata md(1024, 1, 0, false);
  const AllocHandle a = place(md, 256);
  const AllocHandle b = place(md, 256);
  const AllocHandle c = place(md, 128);
  const AllocHandle d = place(md, 128);
  const AllocHandle e = place(md, 256);
  ASSERT_EQ(md.allocation_info(d).offset, 640u);
  md.free(a);  // free 256 node at 0
  md.free(d);  // free 128 node at 640

  auto best_fit = md.create_request(100, 1, false, SuballocationKind::Buffer,
                                    AllocationStrategy::MinMemory);
  ASSERT_TRUE(best_fit.has_value());
  EXPECT_EQ(best_fit->offset, 640u);

  auto lowest = md.create_request(100, 1, false, SuballocationKind::Buffer,
                                  AllocationStrategy::MinOffset);
  ASSERT_TRUE(lowest.has_value());
  EXPECT_EQ(lowest->offset, 0u);
  md.alloc(*lowest, SuballocationKind::Buffer, nullptr);
  EXPECT_EQ(md.allocation_info(lowest->handle).size, 128u);
  EXPECT_TRUE(md.validate());

  md.free(lowest->handle);
  md.free(b);
  md.free(c);
  md.free(e);
  EXPECT_TRUE(md.is_empty());
  EXPECT_TRUE(md.validate());
}

TEST(BuddyMetadataTest, RandomizedValidate) {
  BuddyMetadata md(1 << 16, 1, 0, false);
  std::mt19937 rng(42);
  std::vector<AllocHandle> live;
  for (int step = 0; step < 2000; ++step) {
    if (live.empty() || rng() % 2 == 0) {
      const AllocHandle h = place(md, 1 + rng() % 2048);
      if (h != kNullAllocHandle) live.push_back(h);
    } else {
      const std::size_t i = rng() % live.size();
      md.free(live[i]);
      live[i] = live.back();
      live.pop_back();
    }
    if (step % 128 == 0) ASSERT_TRUE(md.validate()) << "step " << step;
  }
  for (AllocHandle h : live) md.free(h);
  EXPECT_TRUE(md.is_empty());
  EXPECT_EQ(md.free_node_count(), 1u);
  EXPECT_THROW(md.free(handle_from_offset(0)), devmem::core::Error);
}
