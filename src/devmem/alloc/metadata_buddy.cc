// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "devmem/alloc/metadata_buddy.h"

#include <algorithm>
#include <memory>

#include "devmem/core/checked_math.h"
#include "devmem/core/error.h"

namespace devmem { namespace alloc {

using core::ErrorCode;

BuddyMetadata::BuddyMetadata(DeviceSize size, DeviceSize granularity, DeviceSize debug_margin,
                             bool is_virtual)
  : BlockMetadata(size, granularity, debug_margin, is_virtual),
    usable_size_(size == 0 ? 0 : core::prev_pow2(size)) {
  while (level_count_ < kMaxLevels && level_to_node_size_(level_count_) >= kMinNodeSize) {
    ++level_count_;
  }
  clear();
}

BuddyMetadata::~BuddyMetadata() {
  delete_subtree_(root_);
}

void BuddyMetadata::delete_subtree_(Node* n) noexcept {
  if (n == nullptr) return;
  if (n->type == NodeType::Split) {
    Node* right = n->left_child->buddy;
    delete_subtree_(n->left_child);
    delete_subtree_(right);
  }
  delete n;
}

void BuddyMetadata::clear() {
  delete_subtree_(root_);
  free_lists_ = {};
  root_ = new Node();
  free_count_ = 1;
  alloc_count_ = 0;
  sum_free_ = usable_size_;
  add_to_free_list_front_(0, root_);
}

std::uint32_t BuddyMetadata::alloc_size_to_level_(DeviceSize size) const noexcept {
  std::uint32_t level = 0;
  DeviceSize next = usable_size_ >> 1;
  while (size <= next && level + 1 < level_count_) {
    ++level;
    next >>= 1;
  }
  return level;
}

void BuddyMetadata::add_to_free_list_front_(std::uint32_t level, Node* n) noexcept {
  FreeList& list = free_lists_[level];
  n->prev_free = nullptr;
  n->next_free = list.front;
  if (list.front) list.front->prev_free = n;
  else list.back = n;
  list.front = n;
}

void BuddyMetadata::remove_from_free_list_(std::uint32_t level, Node* n) noexcept {
  FreeList& list = free_lists_[level];
  if (n->prev_free) n->prev_free->next_free = n->next_free;
  else list.front = n->next_free;
  if (n->next_free) n->next_free->prev_free = n->prev_free;
  else list.back = n->prev_free;
  n->prev_free = nullptr;
  n->next_free = nullptr;
}

std::optional<AllocationRequest> BuddyMetadata::create_request(DeviceSize size,
                                                               DeviceSize alignment,
                                                               bool upper,
                                                               SuballocationKind kind,
                                                               AllocationStrategy strategy) const {
  if (upper || size == 0) return std::nullopt;

  // Non-buffer resources may share a page with anything; give them whole pages.
  if (granularity_ > 1 &&
      (kind == SuballocationKind::Unknown || kind == SuballocationKind::ImageUnknown ||
       kind == SuballocationKind::ImageOptimal)) {
    alignment = std::max(alignment, granularity_);
    if (!core::checked_align_up(size, granularity_, size)) return std::nullopt;
  }
  DeviceSize alloc_size = 0;
  if (!core::checked_add_u64(size, debug_margin_, alloc_size)) return std::nullopt;
  if (alloc_size > usable_size_ || alloc_size > sum_free_) return std::nullopt;

  const std::uint32_t target = alloc_size_to_level_(alloc_size);
  const Node* best = nullptr;
  std::uint32_t best_level = 0;
  // Smallest fitting level first. MinOffset keeps scanning for the lowest
  // address; a deeper node wins ties since it splits less.
  for (std::uint32_t level = target + 1; level-- > 0;) {
    for (const Node* n = free_lists_[level].front; n != nullptr; n = n->next_free) {
      if (n->offset % alignment != 0) continue;
      if (best == nullptr || n->offset < best->offset) {
        best = n;
        best_level = level;
      }
      if (strategy != AllocationStrategy::MinOffset) break;
    }
    if (best != nullptr && strategy != AllocationStrategy::MinOffset) break;
  }
  if (best == nullptr) return std::nullopt;
  AllocationRequest r;
  r.handle = handle_from_offset(best->offset);
  r.offset = best->offset;
  r.size = level_to_node_size_(target);
  r.item = best_level;
  return r;
}

void BuddyMetadata::alloc(const AllocationRequest& request, SuballocationKind kind, void* user_data) {
  const std::uint32_t target = alloc_size_to_level_(request.size);
  std::uint32_t level = static_cast<std::uint32_t>(request.item);
  if (level > target || level_to_node_size_(target) != request.size) {
    core::throw_error(ErrorCode::InvalidArgument, "BuddyMetadata::alloc", "stale allocation request");
  }
  Node* node = free_lists_[level].front;
  while (node != nullptr && node->offset != request.offset) node = node->next_free;
  if (node == nullptr) {
    core::throw_error(ErrorCode::InvalidArgument, "BuddyMetadata::alloc", "stale allocation request");
  }

  // Split down to the target level; the left child is always taken.
  while (level < target) {
    auto left = std::make_unique<Node>();
    auto right = std::make_unique<Node>();
    const DeviceSize child_size = level_to_node_size_(level + 1);
    remove_from_free_list_(level, node);

    left->offset = node->offset;
    left->parent = node;
    left->buddy = right.get();
    right->offset = node->offset + child_size;
    right->parent = node;
    right->buddy = left.get();

    node->type = NodeType::Split;
    node->left_child = left.get();

    ++level;
    add_to_free_list_front_(level, right.release());
    node = left.release();
    add_to_free_list_front_(level, node);
    ++free_count_;
  }

  remove_from_free_list_(level, node);
  node->type = NodeType::Allocation;
  node->kind = kind == SuballocationKind::Free ? SuballocationKind::Unknown : kind;
  node->user_data = user_data;
  --free_count_;
  ++alloc_count_;
  sum_free_ -= request.size;
}

BuddyMetadata::Node* BuddyMetadata::find_allocation_node_(AllocHandle handle, std::uint32_t& level) const {
  const DeviceSize off = offset_from_handle(handle);
  if (handle == kNullAllocHandle || off >= usable_size_) return nullptr;
  Node* node = root_;
  DeviceSize node_size = usable_size_;
  level = 0;
  while (node->type == NodeType::Split) {
    const DeviceSize half = node_size >> 1;
    node = off < node->offset + half ? node->left_child : node->left_child->buddy;
    node_size = half;
    ++level;
  }
  if (node->type != NodeType::Allocation || node->offset != off) return nullptr;
  return node;
}

void BuddyMetadata::free(AllocHandle handle) {
  std::uint32_t level = 0;
  Node* node = find_allocation_node_(handle, level);
  if (node == nullptr) {
    core::throw_error(ErrorCode::InvalidArgument, "BuddyMetadata::free", "not a live allocation");
  }
  sum_free_ += level_to_node_size_(level);
  --alloc_count_;
  ++free_count_;
  node->type = NodeType::Free;
  node->user_data = nullptr;
  node->kind = SuballocationKind::Free;

  // Merge with free buddies upwards.
  while (level > 0 && node->buddy->type == NodeType::Free) {
    remove_from_free_list_(level, node->buddy);
    Node* parent = node->parent;
    delete node->buddy;
    delete node;
    parent->type = NodeType::Free;
    parent->left_child = nullptr;
    node = parent;
    --level;
    --free_count_;
  }
  add_to_free_list_front_(level, node);
}

RangeInfo BuddyMetadata::allocation_info(AllocHandle handle) const {
  std::uint32_t level = 0;
  const Node* node = find_allocation_node_(handle, level);
  if (node == nullptr) {
    core::throw_error(ErrorCode::InvalidArgument, "BuddyMetadata::allocation_info", "not a live allocation");
  }
  return RangeInfo{node->offset, level_to_node_size_(level), false, node->kind, node->user_data};
}

void BuddyMetadata::set_allocation_user_data(AllocHandle handle, void* user_data) {
  std::uint32_t level = 0;
  Node* node = find_allocation_node_(handle, level);
  if (node == nullptr) {
    core::throw_error(ErrorCode::InvalidArgument, "BuddyMetadata::set_allocation_user_data",
                      "not a live allocation");
  }
  node->user_data = user_data;
}

void BuddyMetadata::visit_(const Node* n, std::uint32_t level,
                           const std::function<void(const RangeInfo&)>& fn) const {
  const DeviceSize node_size = level_to_node_size_(level);
  switch (n->type) {
    case NodeType::Free:
      fn(RangeInfo{n->offset, node_size, true, SuballocationKind::Free, nullptr});
      break;
    case NodeType::Allocation:
      fn(RangeInfo{n->offset, node_size, false, n->kind, n->user_data});
      break;
    case NodeType::Split:
      visit_(n->left_child, level + 1, fn);
      visit_(n->left_child->buddy, level + 1, fn);
      break;
  }
}

void BuddyMetadata::for_each_range(const std::function<void(const RangeInfo&)>& fn) const {
  if (usable_size_ > 0) visit_(root_, 0, fn);
  if (unusable_size() > 0) {
    fn(RangeInfo{usable_size_, unusable_size(), true, SuballocationKind::Free, nullptr});
  }
}

bool BuddyMetadata::validate_node_(const Node* parent, const Node* curr, std::uint32_t level,
                                   std::size_t& allocs, std::size_t& frees,
                                   DeviceSize& free_bytes) const {
  if (curr->parent != parent) return false;
  if ((parent == nullptr) != (curr->buddy == nullptr)) return false;
  if (curr->buddy != nullptr && curr->buddy->buddy != curr) return false;
  const DeviceSize node_size = level_to_node_size_(level);
  switch (curr->type) {
    case NodeType::Free:
      ++frees;
      free_bytes += node_size;
      return true;
    case NodeType::Allocation:
      ++allocs;
      return true;
    case NodeType::Split: {
      const Node* left = curr->left_child;
      if (left == nullptr || level + 1 >= level_count_) return false;
      if (left->offset != curr->offset) return false;
      if (left->buddy->offset != curr->offset + (node_size >> 1)) return false;
      return validate_node_(curr, left, level + 1, allocs, frees, free_bytes) &&
             validate_node_(curr, left->buddy, level + 1, allocs, frees, free_bytes);
    }
  }
  return false;
}

bool BuddyMetadata::validate() const {
  std::size_t allocs = 0;
  std::size_t frees = 0;
  DeviceSize free_bytes = 0;
  if (!validate_node_(nullptr, root_, 0, allocs, frees, free_bytes)) return false;
  if (allocs != alloc_count_ || frees != free_count_ || free_bytes != sum_free_) return false;

  std::size_t listed = 0;
  for (std::uint32_t level = 0; level < level_count_; ++level) {
    const FreeList& list = free_lists_[level];
    if ((list.front == nullptr) != (list.back == nullptr)) return false;
    for (const Node* n = list.front; n != nullptr; n = n->next_free) {
      if (n->type != NodeType::Free) return false;
      if (n->offset % level_to_node_size_(level) != 0) return false;
      if (n->next_free == nullptr && list.back != n) return false;
      ++listed;
    }
  }
  return listed == free_count_;
}

}} // namespace devmem::alloc
