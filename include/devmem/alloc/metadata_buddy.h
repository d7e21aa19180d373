// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstdint>

#include "devmem/alloc/metadata.h"

namespace devmem { namespace alloc {

// Binary buddy placement over the largest power-of-two prefix of the block.
// The remainder past the usable size is never allocated and is reported as a
// free range. Free nodes are reported one range per node.
class BuddyMetadata final : public BlockMetadata {
 public:
  static constexpr DeviceSize kMinNodeSize = 32;
  static constexpr std::uint32_t kMaxLevels = 48;

  BuddyMetadata(DeviceSize size, DeviceSize granularity, DeviceSize debug_margin, bool is_virtual);
  ~BuddyMetadata() override;

  PoolAlgorithm algorithm() const noexcept override { return PoolAlgorithm::Buddy; }
  std::size_t allocation_count() const noexcept override { return alloc_count_; }
  DeviceSize sum_free_size() const noexcept override { return sum_free_ + unusable_size(); }
  bool is_empty() const noexcept override { return alloc_count_ == 0; }

  std::optional<AllocationRequest> create_request(DeviceSize size,
                                                  DeviceSize alignment,
                                                  bool upper,
                                                  SuballocationKind kind,
                                                  AllocationStrategy strategy) const override;
  void alloc(const AllocationRequest& request, SuballocationKind kind, void* user_data) override;
  void free(AllocHandle handle) override;
  void clear() override;

  RangeInfo allocation_info(AllocHandle handle) const override;
  void set_allocation_user_data(AllocHandle handle, void* user_data) override;
  void for_each_range(const std::function<void(const RangeInfo&)>& fn) const override;
  bool validate() const override;

  DeviceSize usable_size() const noexcept { return usable_size_; }
  DeviceSize unusable_size() const noexcept { return size_ - usable_size_; }
  std::uint32_t level_count() const noexcept { return level_count_; }
  std::size_t free_node_count() const noexcept { return free_count_; }

 private:
  enum class NodeType : std::uint8_t { Free, Allocation, Split };

  struct Node {
    DeviceSize offset{0};
    NodeType   type{NodeType::Free};
    Node*      parent{nullptr};
    Node*      buddy{nullptr};
    // Free
    Node*      prev_free{nullptr};
    Node*      next_free{nullptr};
    // Split
    Node*      left_child{nullptr};
    // Allocation
    SuballocationKind kind{SuballocationKind::Free};
    void*      user_data{nullptr};
  };

  struct FreeList {
    Node* front{nullptr};
    Node* back{nullptr};
  };

  DeviceSize level_to_node_size_(std::uint32_t level) const noexcept { return usable_size_ >> level; }
  std::uint32_t alloc_size_to_level_(DeviceSize size) const noexcept;
  void add_to_free_list_front_(std::uint32_t level, Node* n) noexcept;
  void remove_from_free_list_(std::uint32_t level, Node* n) noexcept;
  Node* find_allocation_node_(AllocHandle handle, std::uint32_t& level) const;
  static void delete_subtree_(Node* n) noexcept;
  void visit_(const Node* n, std::uint32_t level, const std::function<void(const RangeInfo&)>& fn) const;
  bool validate_node_(const Node* parent, const Node* curr, std::uint32_t level,
                      std::size_t& allocs, std::size_t& frees, DeviceSize& free_bytes) const;

  DeviceSize usable_size_{0};
  std::uint32_t level_count_{1};
  Node* root_{nullptr};
  std::array<FreeList, kMaxLevels> free_lists_{};
  std::size_t alloc_count_{0};
  std::size_t free_count_{0};
  DeviceSize sum_free_{0};  // within the usable size
};

}} // namespace devmem::alloc
