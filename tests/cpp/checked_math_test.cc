// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>
#include <limits>

#include "devmem/core/checked_math.h"

using namespace devmem::core;

TEST(CheckedMathTest, AddOverflow) {
  std::uint64_t out = 0;
  EXPECT_FALSE(checked_add_u64(std::numeric_limits<std::uint64_t>::max(), 1, out));
  EXPECT_TRUE(checked_add_u64(10, 20, out));
  EXPECT_EQ(out, 30u);
  EXPECT_EQ(saturating_add_u64(std::numeric_limits<std::uint64_t>::max() - 1, 5),
            std::numeric_limits<std::uint64_t>::max());
}

TEST(CheckedMathTest, MulOverflow) {
  std::uint64_t out = 0;
  EXPECT_FALSE(checked_mul_u64(std::numeric_limits<std::uint64_t>::max(), 2, out));
  EXPECT_TRUE(checked_mul_u64(0, 123, out));
  EXPECT_EQ(out, 0u);
  EXPECT_TRUE(checked_mul_u64(7, 1024, out));
  EXPECT_EQ(out, 7168u);
}

TEST(CheckedMathTest, Alignment) {
  EXPECT_TRUE(is_pow2(1));
  EXPECT_TRUE(is_pow2(4096));
  EXPECT_FALSE(is_pow2(0));
  EXPECT_FALSE(is_pow2(96));
  EXPECT_EQ(align_up(0, 64), 0u);
  EXPECT_EQ(align_up(1, 64), 64u);
  EXPECT_EQ(align_up(128, 64), 128u);
  EXPECT_EQ(align_down(127, 64), 64u);
  std::uint64_t out = 0;
  EXPECT_FALSE(checked_align_up(std::numeric_limits<std::uint64_t>::max(), 64, out));
  ASSERT_TRUE(checked_align_up(65, 32, out));
  EXPECT_EQ(out, 96u);
}

TEST(CheckedMathTest, PowersOfTwo) {
  EXPECT_EQ(next_pow2(1), 1u);
  EXPECT_EQ(next_pow2(3), 4u);
  EXPECT_EQ(next_pow2(1024), 1024u);
  EXPECT_EQ(prev_pow2(1000), 512u);
  EXPECT_EQ(prev_pow2(1024), 1024u);
}
