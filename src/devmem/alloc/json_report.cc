// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "json_report.h"

#include <cstdint>
#include <cstdio>
#include <string>
#include <utility>
#include <variant>

namespace devmem { namespace alloc { namespace report {

ordered_json statistics_json(const Statistics& s) {
  ordered_json j = ordered_json::object();
  j["BlockCount"] = s.block_count;
  j["BlockBytes"] = s.block_bytes;
  j["AllocationCount"] = s.allocation_count;
  j["AllocationBytes"] = s.allocation_bytes;
  return j;
}

ordered_json detailed_statistics_json(const DetailedStatistics& s) {
  ordered_json j = statistics_json(s.statistics);
  j["UnusedRangeCount"] = s.unused_range_count;
  if (s.statistics.allocation_count > 0) {
    j["AllocationSizeMin"] = s.allocation_size_min;
    j["AllocationSizeMax"] = s.allocation_size_max;
  }
  if (s.unused_range_count > 0) {
    j["UnusedRangeSizeMin"] = s.unused_range_size_min;
    j["UnusedRangeSizeMax"] = s.unused_range_size_max;
  }
  return j;
}

ordered_json budget_json(const Budget& b) {
  ordered_json j = statistics_json(b.statistics);
  j["Usage"] = b.usage;
  j["Budget"] = b.budget;
  return j;
}

ordered_json property_flags_json(MemoryPropertyFlags flags) {
  static constexpr std::pair<MemoryPropertyFlags, const char*> kNames[] = {
      {kMemoryPropertyDeviceLocal, "DEVICE_LOCAL"},
      {kMemoryPropertyHostVisible, "HOST_VISIBLE"},
      {kMemoryPropertyHostCoherent, "HOST_COHERENT"},
      {kMemoryPropertyHostCached, "HOST_CACHED"},
      {kMemoryPropertyLazilyAllocated, "LAZILY_ALLOCATED"},
      {kMemoryPropertyProtected, "PROTECTED"},
  };
  ordered_json j = ordered_json::array();
  for (const auto& kv : kNames) {
    if (flags & kv.first) j.push_back(kv.second);
  }
  return j;
}

ordered_json user_data_json(const UserData& u) {
  if (const auto* s = std::get_if<std::string>(&u)) return *s;
  if (const auto* p = std::get_if<void*>(&u)) {
    char buf[2 + 16 + 1];
    std::snprintf(buf, sizeof(buf), "0x%llx",
                  static_cast<unsigned long long>(reinterpret_cast<std::uintptr_t>(*p)));
    return std::string(buf);
  }
  return nullptr;
}

ordered_json block_metadata_json(const BlockMetadata& md, const RangeDescriber& describe) {
  ordered_json j = ordered_json::object();
  j["TotalBytes"] = md.size();
  j["UnusedBytes"] = md.sum_free_size();
  j["Allocations"] = md.allocation_count();
  j["UnusedRanges"] = md.free_region_count();
  ordered_json ranges = ordered_json::array();
  md.for_each_range([&](const RangeInfo& r) {
    ordered_json e = ordered_json::object();
    e["Offset"] = r.offset;
    e["Size"] = r.size;
    e["Type"] = r.free ? std::string("FREE") : std::string(kind_name(r.kind));
    if (!r.free && describe) describe(r, e);
    ranges.push_back(std::move(e));
  });
  j["Ranges"] = std::move(ranges);
  return j;
}

}}} // namespace devmem::alloc::report
