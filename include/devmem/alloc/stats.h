// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <vector>

#include "devmem/alloc/types.h"

namespace devmem { namespace alloc {

struct Statistics {
  std::uint32_t block_count{0};
  std::uint32_t allocation_count{0};
  DeviceSize    block_bytes{0};
  DeviceSize    allocation_bytes{0};

  void add(const Statistics& o) noexcept {
    block_count += o.block_count;
    allocation_count += o.allocation_count;
    block_bytes += o.block_bytes;
    allocation_bytes += o.allocation_bytes;
  }
};

// Slow-path statistics: also walks every free/used range.
struct DetailedStatistics {
  Statistics    statistics{};
  std::uint32_t unused_range_count{0};
  DeviceSize    allocation_size_min{kWholeSize};
  DeviceSize    allocation_size_max{0};
  DeviceSize    unused_range_size_min{kWholeSize};
  DeviceSize    unused_range_size_max{0};

  void add_allocation(DeviceSize size) noexcept {
    ++statistics.allocation_count;
    statistics.allocation_bytes += size;
    if (size < allocation_size_min) allocation_size_min = size;
    if (size > allocation_size_max) allocation_size_max = size;
  }
  void add_unused_range(DeviceSize size) noexcept {
    ++unused_range_count;
    if (size < unused_range_size_min) unused_range_size_min = size;
    if (size > unused_range_size_max) unused_range_size_max = size;
  }
  void add(const DetailedStatistics& o) noexcept {
    statistics.add(o.statistics);
    unused_range_count += o.unused_range_count;
    if (o.allocation_size_min < allocation_size_min) allocation_size_min = o.allocation_size_min;
    if (o.allocation_size_max > allocation_size_max) allocation_size_max = o.allocation_size_max;
    if (o.unused_range_size_min < unused_range_size_min) unused_range_size_min = o.unused_range_size_min;
    if (o.unused_range_size_max > unused_range_size_max) unused_range_size_max = o.unused_range_size_max;
  }
};

struct TotalStatistics {
  std::vector<DetailedStatistics> categories{};
  std::vector<DetailedStatistics> heaps{};
  DetailedStatistics              total{};
};

struct Budget {
  Statistics statistics{};  // block and allocation totals in the heap
  DeviceSize usage{0};
  DeviceSize budget{0};
};

// Allocator event counters. *_current are gauges; max_* are peaks since the
// last reset_peak_counters().
struct AllocatorCounters {
  std::uint64_t device_block_allocs{0};
  std::uint64_t device_block_frees{0};
  std::uint64_t dedicated_allocs{0};
  std::uint64_t device_oom{0};
  std::uint64_t budget_rejections{0};
  std::uint64_t corruption_detected{0};
  std::uint64_t defrag_passes{0};
  DeviceSize    block_bytes_current{0};
  DeviceSize    max_block_bytes{0};
  DeviceSize    allocation_bytes_current{0};
  DeviceSize    max_allocation_bytes{0};
};

}} // namespace devmem::alloc
