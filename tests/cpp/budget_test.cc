// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <atomic>
#include <gtest/gtest.h>
#include <thread>

#include <vector>

#include "devmem/alloc/budget.h"
#include "devmem/core/error.h"

using namespace devmem::alloc;
using devmem::core::Error;
using devmem::core::ErrorCode;

namespace {

constexpr DeviceSize kMiB = 1ull << 20;

class FakeBudgetSource final : public BudgetSource {
 public:
  std::vector<HeapBudgetSample> refresh() override {
    ++calls;
    return samples;
  }
  std::vector<HeapBudgetSample> samples{};
  int calls{0};
};

ErrorCode reserve_code(BudgetTracker& t, std::uint32_t heap, DeviceSize size, bool within) {
  try {
    t.reserve_block(heap, size, within);
  } catch (const Error& e) {
    return e.code();
  }
  ADD_FAILURE() << "reserve_block did not throw";
  return ErrorCode::InvalidState;
}

} // namespace

TEST(BudgetTest, InternalAccountingUsesEightyPercent) {
  BudgetTracker t({MemoryHeap{100 * kMiB, true}}, {}, nullptr, 30, true);
  Budget b = t.get(0);
  EXPECT_EQ(b.usage, 0u);
  EXPECT_EQ(b.budget, 80 * kMiB);

  t.reserve_block(0, 10 * kMiB, true);
  t.add_allocation(0, 4 * kMiB);
  b = t.get(0);
  EXPECT_EQ(b.usage, 10 * kMiB);
  EXPECT_EQ(b.statistics.block_count, 1u);
  EXPECT_EQ(b.statistics.allocation_count, 1u);
  EXPECT_EQ(b.statistics.allocation_bytes, 4 * kMiB);

  t.remove_allocation(0, 4 * kMiB);
  t.release_block(0, 10 * kMiB);
  b = t.get(0);
  EXPECT_EQ(b.usage, 0u);
  EXPECT_EQ(b.statistics.block_count, 0u);
}

TEST(BudgetTest, WithinBudgetRejectsOverBudget) {
  BudgetTracker t({MemoryHeap{100 * kMiB, true}}, {}, nullptr, 30, true);
  t.reserve_block(0, 70 * kMiB, true);
  EXPECT_EQ(reserve_code(t, 0, 20 * kMiB, true), ErrorCode::OutOfBudget);
  // Without the flag only the hard limit applies.
  t.reserve_block(0, 20 * kMiB, false);
  EXPECT_EQ(t.get(0).usage, 90 * kMiB);
}

TEST(BudgetTest, WithinBudgetBoundaryIsInclusive) {
  // 80 MiB budget: landing exactly on it is admitted, one byte more is not.
  BudgetTracker exact({MemoryHeap{100 * kMiB, true}}, {}, nullptr, 30, true);
  exact.reserve_block(0, 60 * kMiB, true);
  exact.reserve_block(0, 20 * kMiB, true);
  EXPECT_EQ(exact.get(0).usage, exact.get(0).budget);
  EXPECT_EQ(reserve_code(exact, 0, 1, true), ErrorCode::OutOfBudget);

  BudgetTracker over({MemoryHeap{100 * kMiB, true}}, {}, nullptr, 30, true);
  over.reserve_block(0, 60 * kMiB, true);
  EXPECT_EQ(reserve_code(over, 0, 20 * kMiB + 1, true), ErrorCode::OutOfBudget);
  EXPECT_EQ(over.get(0).usage, 60 * kMiB);
  EXPECT_EQ(over.get(0).statistics.block_count, 1u);
}

TEST(BudgetTest, ConcurrentWithinBudgetReservationsAdmitOne) {
  // Two 50 MiB blocks never fit an 80 MiB budget together.
  BudgetTracker t({MemoryHeap{100 * kMiB, true}}, {}, nullptr, 30, true);
  constexpr int kRounds = 200;
  for (int round = 0; round < kRounds; ++round) {
    std::atomic<int> ready{0};
    std::atomic<bool> start{false};
    std::atomic<int> admitted{0};
    std::atomic<int> rejected{0};
    auto worker = [&]() {
      ready.fetch_add(1, std::memory_order_acq_rel);
      while (!start.load(std::memory_order_acquire)) std::this_thread::yield();
      try {
        t.reserve_block(0, 50 * kMiB, true);
        admitted.fetch_add(1);
      } catch (const Error& e) {
        if (e.code() == ErrorCode::OutOfBudget) rejected.fetch_add(1);
      }
    };
    std::thread a(worker);
    std::thread b(worker);
    while (ready.load(std::memory_order_acquire) < 2) std::this_thread::yield();
    start.store(true, std::memory_order_release);
    a.join();
    b.join();

    ASSERT_EQ(admitted.load(), 1) << "round " << round;
    ASSERT_EQ(rejected.load(), 1) << "round " << round;
    const Budget after = t.get(0);
    ASSERT_LE(after.usage, after.budget) << "round " << round;
    t.release_block(0, 50 * kMiB);
  }
  EXPECT_EQ(t.get(0).usage, 0u);
}

TEST(BudgetTest, HeapSizeLimitIsHard) {
  BudgetTracker t({MemoryHeap{100 * kMiB, true}}, {32 * kMiB}, nullptr, 30, true);
  EXPECT_EQ(t.heap_size_limit(0), 32 * kMiB);
  EXPECT_EQ(t.get(0).budget, 32 * kMiB);
  t.reserve_block(0, 24 * kMiB, false);
  EXPECT_EQ(reserve_code(t, 0, 16 * kMiB, false), ErrorCode::OutOfDeviceMemory);
  t.reserve_block(0, 8 * kMiB, false);
  EXPECT_EQ(t.get(0).statistics.block_bytes, 32 * kMiB);
}

TEST(BudgetTest, SourceSamplesAreExtrapolated) {
  FakeBudgetSource src;
  src.samples = {HeapBudgetSample{50 * kMiB, 60 * kMiB}, HeapBudgetSample{0, 10 * kMiB}};
  BudgetTracker t({MemoryHeap{100 * kMiB, true}, MemoryHeap{16 * kMiB, false}}, {}, &src, 100, true);

  Budget b = t.get(0);
  EXPECT_EQ(src.calls, 1);
  EXPECT_EQ(b.usage, 50 * kMiB);
  EXPECT_EQ(b.budget, 60 * kMiB);

  // Blocks created since the sample are added on top of it.
  t.reserve_block(0, 5 * kMiB, true);
  b = t.get(0);
  EXPECT_EQ(src.calls, 1);
  EXPECT_EQ(b.usage, 55 * kMiB);

  EXPECT_EQ(reserve_code(t, 0, 6 * kMiB, true), ErrorCode::OutOfBudget);
  t.release_block(0, 5 * kMiB);
  EXPECT_EQ(t.get(0).usage, 50 * kMiB);
}

TEST(BudgetTest, RefreshHappensAfterEnoughOperations) {
  FakeBudgetSource src;
  src.samples = {HeapBudgetSample{0, 64 * kMiB}};
  BudgetTracker t({MemoryHeap{100 * kMiB, true}}, {}, &src, 2, true);
  t.get(0);
  EXPECT_EQ(src.calls, 1);
  t.reserve_block(0, kMiB, false);
  t.get(0);
  EXPECT_EQ(src.calls, 1);
  t.reserve_block(0, kMiB, false);
  src.samples = {HeapBudgetSample{2 * kMiB, 32 * kMiB}};
  const Budget b = t.get(0);
  EXPECT_EQ(src.calls, 2);
  EXPECT_EQ(b.usage, 2 * kMiB);
  EXPECT_EQ(b.budget, 32 * kMiB);

  src.samples = {HeapBudgetSample{7 * kMiB, 32 * kMiB}};
  t.refresh();
  EXPECT_EQ(t.get(0).usage, 7 * kMiB);
}

TEST(BudgetTest, MalformedSourceFallsBackToInternalAccounting) {
  FakeBudgetSource src;  // returns no heaps
  BudgetTracker t({MemoryHeap{100 * kMiB, true}}, {}, &src, 30, true);
  t.reserve_block(0, 3 * kMiB, false);
  const Budget b = t.get(0);
  EXPECT_EQ(b.usage, 3 * kMiB);
  EXPECT_EQ(b.budget, 80 * kMiB);
}
