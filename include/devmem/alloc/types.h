// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace devmem { namespace alloc {

using DeviceSize = std::uint64_t;
inline constexpr DeviceSize kWholeSize = ~DeviceSize{0};
inline constexpr std::uint32_t kMaxMemoryCategories = 32;

using MemoryPropertyFlags = std::uint32_t;
enum MemoryPropertyFlagBits : MemoryPropertyFlags {
  kMemoryPropertyDeviceLocal     = 1u << 0,
  kMemoryPropertyHostVisible     = 1u << 1,
  kMemoryPropertyHostCoherent    = 1u << 2,
  kMemoryPropertyHostCached      = 1u << 3,
  kMemoryPropertyLazilyAllocated = 1u << 4,
  kMemoryPropertyProtected       = 1u << 5,
};

struct MemoryHeap {
  DeviceSize size{0};
  bool       device_local{false};
};

// One device memory type: property flags plus the heap it draws from.
struct MemoryCategory {
  MemoryPropertyFlags property_flags{0};
  std::uint32_t       heap_index{0};
};

// Resource kind of a placed range. Linear and non-linear kinds that share a
// granularity page conflict and must be padded apart.
enum class SuballocationKind : std::uint8_t {
  Free = 0,
  Unknown = 1,
  Buffer = 2,
  ImageUnknown = 3,
  ImageLinear = 4,
  ImageOptimal = 5,
};

bool kinds_conflict(SuballocationKind a, SuballocationKind b) noexcept;
// True when the last byte of range A and the first byte of B fall on the same page.
bool blocks_on_same_page(DeviceSize a_offset, DeviceSize a_size, DeviceSize b_offset,
                         DeviceSize page_size) noexcept;
std::string_view kind_name(SuballocationKind k) noexcept;

enum class AllocationStrategy : std::uint8_t { MinMemory, MinTime, MinOffset };

enum class PoolAlgorithm : std::uint8_t { FreeList, Linear, Buddy };
std::string_view algorithm_name(PoolAlgorithm a) noexcept;

using AllocationCreateFlags = std::uint32_t;
enum AllocationCreateFlagBits : AllocationCreateFlags {
  kAllocationCreateDedicated                 = 1u << 0,
  kAllocationCreateNeverAllocate             = 1u << 1,
  kAllocationCreateMapped                    = 1u << 2,
  kAllocationCreateUpperAddress              = 1u << 3,
  kAllocationCreateWithinBudget              = 1u << 4,
  kAllocationCreateCanAlias                  = 1u << 5,
  kAllocationCreateHostAccessSequentialWrite = 1u << 6,
  kAllocationCreateHostAccessRandom          = 1u << 7,
  kAllocationCreateStrategyMinMemory         = 1u << 8,
  kAllocationCreateStrategyMinTime           = 1u << 9,
  kAllocationCreateStrategyMinOffset         = 1u << 10,
  kAllocationCreateStrategyMask = kAllocationCreateStrategyMinMemory |
                                  kAllocationCreateStrategyMinTime |
                                  kAllocationCreateStrategyMinOffset,
};

// Throws InvalidArgument when more than one strategy bit is set.
AllocationStrategy strategy_from_flags(AllocationCreateFlags flags);

using AllocatorCreateFlags = std::uint32_t;
enum AllocatorCreateFlagBits : AllocatorCreateFlags {
  // Caller serializes every call; internal mutexes are skipped.
  kAllocatorCreateExternallySynchronized = 1u << 0,
};

enum class MemoryUsage : std::uint8_t {
  Unknown = 0,
  GpuLazilyAllocated = 1,
  Auto = 2,
  AutoPreferDevice = 3,
  AutoPreferHost = 4,
};

// Caller tag on an allocation: nothing, an opaque pointer, or an owned string.
using UserData = std::variant<std::monostate, void*, std::string>;

struct MemoryRequirements {
  DeviceSize    size{0};
  DeviceSize    alignment{1};
  std::uint32_t category_bits{0};  // acceptable categories; 0 = any
  bool          prefers_dedicated{false};
  bool          requires_dedicated{false};
};

class Pool;

struct AllocationCreateInfo {
  AllocationCreateFlags flags{0};
  MemoryUsage           usage{MemoryUsage::Unknown};
  MemoryPropertyFlags   required_flags{0};
  MemoryPropertyFlags   preferred_flags{0};
  MemoryPropertyFlags   not_preferred_flags{0};
  std::uint32_t         category_bits{0};  // 0 = any
  Pool*                 pool{nullptr};
  SuballocationKind     kind{SuballocationKind::Unknown};
  UserData              user_data{};
  float                 priority{0.5f};
};

}} // namespace devmem::alloc
