// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <vector>

#include "devmem/alloc/metadata_linear.h"
#include "devmem/core/error.h"

using namespace devmem::alloc;

namespace {

AllocHandle place(LinearMetadata& md, DeviceSize size, bool upper = false, DeviceSize alignment = 1,
                  SuballocationKind kind = SuballocationKind::Buffer) {
  auto r = md.create_request(size, alignment, upper, kind, AllocationStrategy::MinMemory);
  if (!r) return kNullAllocHandle;
  md.alloc(*r, kind, nullptr);
  return r->handle;
}

DeviceSize offset_of(const LinearMetadata& md, AllocHandle h) {
  return md.allocation_info(h).offset;
}

} // namespace

TEST(LinearMetadataTest, StackAllocationsAreContiguous) {
  LinearMetadata md(1024, 1, 0, false);
  const AllocHandle a = place(md, 100);
  const AllocHandle b = place(md, 100);
  const AllocHandle c = place(md, 100);
  EXPECT_EQ(offset_of(md, a), 0u);
  EXPECT_EQ(offset_of(md, b), 100u);
  EXPECT_EQ(offset_of(md, c), 200u);
  EXPECT_EQ(md.bottom_cursor(), 300u);

  md.free(c);
  EXPECT_EQ(md.bottom_cursor(), 200u);
  const AllocHandle d = place(md, 100);
  EXPECT_EQ(offset_of(md, d), 200u);
  EXPECT_TRUE(md.validate());
}

TEST(LinearMetadataTest, InteriorFreeRetreatsLater) {
  LinearMetadata md(1024, 1, 0, false);
  const AllocHandle a = place(md, 100);
  const AllocHandle b = place(md, 100);
  const AllocHandle c = place(md, 100);
  (void)a;
  md.free(b);
  // The hole is not reused while c is live.
  EXPECT_EQ(md.bottom_cursor(), 300u);
  EXPECT_EQ(md.allocation_count(), 2u);
  EXPECT_THROW(md.allocation_info(b), devmem::core::Error);
  md.free(c);
  // Retreats past the freed b as well.
  EXPECT_EQ(md.bottom_cursor(), 100u);
  EXPECT_TRUE(md.validate());
}

TEST(LinearMetadataTest, UpperStackGrowsDown) {
  LinearMetadata md(1024, 1, 0, false);
  const AllocHandle u1 = place(md, 100, true);
  const AllocHandle u2 = place(md, 100, true);
  EXPECT_EQ(offset_of(md, u1), 924u);
  EXPECT_EQ(offset_of(md, u2), 824u);
  EXPECT_EQ(md.top_cursor(), 824u);
  EXPECT_GT(offset_of(md, u1), offset_of(md, u2));

  const AllocHandle l = place(md, 800);
  EXPECT_EQ(offset_of(md, l), 0u);
  // 24 bytes remain between the stacks.
  EXPECT_EQ(place(md, 25), kNullAllocHandle);
  EXPECT_EQ(place(md, 25, true), kNullAllocHandle);
  const AllocHandle last = place(md, 24, true);
  ASSERT_NE(last, kNullAllocHandle);
  EXPECT_EQ(offset_of(md, last), 800u);
  EXPECT_LE(md.bottom_cursor(), md.top_cursor());
  EXPECT_EQ(md.sum_free_size(), 0u);

  md.free(u2);  // interior in the top stack
  EXPECT_EQ(md.top_cursor(), 800u);
  md.free(last);
  EXPECT_EQ(md.top_cursor(), 924u);
  EXPECT_TRUE(md.validate());
}

TEST(LinearMetadataTest, UpperAlignmentRoundsDown) {
  LinearMetadata md(1000, 1, 0, false);
  const AllocHandle u = place(md, 100, true, 64);
  EXPECT_EQ(offset_of(md, u), 896u);
}

TEST(LinearMetadataTest, MarginSeparatesItems) {
  LinearMetadata md(1024, 1, 8, false);
  const AllocHandle a = place(md, 100);
  const AllocHandle b = place(md, 100);
  EXPECT_EQ(offset_of(md, a), 0u);
  EXPECT_EQ(offset_of(md, b), 108u);
  const AllocHandle u = place(md, 100, true);
  EXPECT_EQ(offset_of(md, u), 1024u - 108u);
}

TEST(LinearMetadataTest, RangesReportGapsAsFree) {
  LinearMetadata md(1024, 1, 0, false);
  const AllocHandle a = place(md, 100);
  const AllocHandle b = place(md, 100);
  place(md, 100, true);
  md.free(a);
  (void)b;
  std::vector<RangeInfo> ranges;
  md.for_each_range([&](const RangeInfo& r) { ranges.push_back(r); });
  ASSERT_EQ(ranges.size(), 4u);
  EXPECT_TRUE(ranges[0].free);
  EXPECT_EQ(ranges[0].size, 100u);
  EXPECT_FALSE(ranges[1].free);
  EXPECT_EQ(ranges[1].offset, 100u);
  EXPECT_TRUE(ranges[2].free);
  EXPECT_EQ(ranges[2].offset, 200u);
  EXPECT_EQ(ranges[2].size, 724u);
  EXPECT_FALSE(ranges[3].free);
  EXPECT_EQ(ranges[3].offset, 924u);
}

TEST(LinearMetadataTest, FreeingEverythingResets) {
  LinearMetadata md(4096, 1, 0, false);
  std::vector<AllocHandle> hs;
  for (int i = 0; i < 40; ++i) hs.push_back(place(md, 64));
  EXPECT_EQ(md.bottom_cursor(), 40u * 64u);
  for (std::size_t i = 0; i < hs.size(); i += 2) md.free(hs[i]);
  EXPECT_TRUE(md.validate());
  for (std::size_t i = 1; i < hs.size(); i += 2) md.free(hs[i]);
  EXPECT_TRUE(md.is_empty());
  EXPECT_EQ(md.bottom_cursor(), 0u);
  EXPECT_EQ(md.sum_free_size(), 4096u);
}

TEST(LinearMetadataTest, DoubleFreeThrows) {
  LinearMetadata md(1024, 1, 0, false);
  const AllocHandle a = place(md, 10);
  place(md, 10);
  md.free(a);
  EXPECT_THROW(md.free(a), devmem::core::Error);
}

TEST(LinearMetadataTest, ConstLookupFindsBothStacks) {
  LinearMetadata md(1024, 1, 0, false);
  const AllocHandle a = place(md, 100);
  const AllocHandle b = place(md, 100);
  const AllocHandle u = place(md, 64, true);
  md.set_allocation_user_data(u, &md);
  md.free(a);  // interior: stays as a hole until the cursor retreats

  const LinearMetadata& view = md;
  EXPECT_EQ(view.allocation_info(b).offset, 100u);
  EXPECT_EQ(view.allocation_info(b).size, 100u);
  EXPECT_EQ(view.allocation_info(u).offset, 960u);
  EXPECT_EQ(view.allocation_info(u).user_data, &md);
  try {
    (void)view.allocation_info(a);
    ADD_FAILURE() << "freed item still reported";
  } catch (const devmem::core::Error& e) {
    EXPECT_EQ(e.code(), devmem::core::ErrorCode::InvalidArgument);
  }
  md.free(b);
  md.free(u);
  EXPECT_TRUE(md.is_empty());
}
