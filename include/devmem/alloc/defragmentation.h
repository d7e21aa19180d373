// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "devmem/alloc/device_provider.h"
#include "devmem/alloc/types.h"

namespace devmem { namespace alloc {

class Allocation;
class Allocator;
class DeviceMemoryBlock;
class Pool;

enum class DefragmentationAlgorithm : std::uint8_t {
  Fast,       // one pass, moves between blocks only
  Balanced,   // bounded number of passes, heuristic in-block compaction
  Full,       // passes until no move remains
  Extensive,  // Full plus kind-aware ordering when granularity > 1
};
std::string_view defragmentation_algorithm_name(DefragmentationAlgorithm a) noexcept;

struct DefragmentationInfo {
  DefragmentationAlgorithm algorithm{DefragmentationAlgorithm::Balanced};
  std::vector<Pool*> pools{};              // empty = every default pool
  DeviceSize max_bytes_per_pass{0};        // 0 = unlimited
  std::uint32_t max_allocations_per_pass{0};  // 0 = unlimited
};

enum class DefragmentationMoveOperation : std::uint8_t {
  Copy,     // contents copied; src now lives at the destination
  Ignore,   // not moved; destination released, src untouched
  Destroy,  // src abandoned; both ranges released and src freed
};

struct DefragmentationMove {
  DefragmentationMoveOperation operation{DefragmentationMoveOperation::Copy};
  Allocation* src{nullptr};
  // Reserved destination. Bind/copy through it; it is owned by the context.
  Allocation* dst_tmp{nullptr};
};

struct DefragmentationStats {
  DeviceSize bytes_moved{0};
  DeviceSize bytes_freed{0};
  std::uint32_t allocations_moved{0};
  std::uint32_t device_blocks_freed{0};
};

enum class DefragmentationState : std::uint8_t {
  Idle,
  Planning,
  AwaitingExecution,
  Committing,
  Closed,
};
std::string_view defragmentation_state_name(DefragmentationState s) noexcept;

// Incremental, caller-driven relocation session over a set of pools.
// The caller keeps every allocation in scope quiescent while the session is
// open. Out-of-sequence calls throw InvalidState.
class DefragmentationContext {
 public:
  ~DefragmentationContext();

  DefragmentationContext(const DefragmentationContext&) = delete;
  DefragmentationContext& operator=(const DefragmentationContext&) = delete;

  DefragmentationState state() const noexcept { return state_; }
  DefragmentationAlgorithm algorithm() const noexcept { return info_.algorithm; }

  // Proposes the next batch of moves. An empty result means no further
  // improving move exists; the context is then Idle.
  std::span<DefragmentationMove> begin_pass();
  // Commits the batch returned by begin_pass; the caller may have rewritten
  // each move's operation.
  void end_pass(std::span<const DefragmentationMove> results);
  // Releases pending destinations (as Ignore), closes the session and
  // returns the aggregate statistics.
  DefragmentationStats end();

  const DefragmentationStats& stats() const noexcept { return stats_; }
  std::uint32_t pass_count() const noexcept { return passes_; }

 private:
  friend class Allocator;

  enum class CounterStatus : std::uint8_t { Pass, Ignore, End };

  struct PoolState {
    Pool* pool{nullptr};
    DeviceSize avg_free_size{0};
    DeviceSize avg_alloc_size{0};
  };

  DefragmentationContext(Allocator& owner, DefragmentationInfo info, std::vector<Pool*> pools);

  void require_state_(std::initializer_list<DefragmentationState> allowed, const char* op) const;
  bool compute_pool_moves_(PoolState& ps);
  bool compute_fast_(PoolState& ps);
  bool compute_balanced_(PoolState& ps);
  bool compute_full_(PoolState& ps, bool kind_aware);
  void update_pool_statistics_(PoolState& ps) const;
  std::vector<Allocation*> candidates_in_block_(DeviceMemoryBlock* b, bool kind_order) const;

  CounterStatus check_counters_(DeviceSize bytes);
  bool increment_counters_(DeviceSize bytes);
  // Reserves a destination for src in block b using lowest-offset placement;
  // with require_lower, only a placement below src's offset in its own block
  // is taken. Returns true when a move was recorded.
  bool try_move_to_block_(Pool& pool, DeviceMemoryBlock* b, Allocation* src, bool require_lower);
  // Tries blocks [begin, end) of the pool. Returns true when the pass must end.
  bool alloc_in_other_block_(Pool& pool, std::size_t begin, std::size_t end, Allocation* src,
                             bool& moved, bool kind_aware);
  bool block_is_immovable_(const DeviceMemoryBlock* b) const;
  bool block_has_conflicting_kind_(const DeviceMemoryBlock* b, SuballocationKind kind) const;
  void prune_immovable_();

  void release_tmp_(Allocation* tmp);
  void commit_copy_(const DefragmentationMove& m);
  void abandon_pending_();

  Allocator& owner_;
  const DefragmentationInfo info_;
  std::vector<PoolState> pools_{};
  DefragmentationState state_{DefragmentationState::Planning};

  std::vector<DefragmentationMove> moves_{};
  std::unordered_set<const DeviceMemoryBlock*> immovable_{};
  DefragmentationStats stats_{};
  DefragmentationStats pass_stats_{};
  std::uint32_t passes_{0};
  std::uint32_t ignored_candidates_{0};
};

}} // namespace devmem::alloc
