// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "devmem/alloc/defragmentation.h"

#include <algorithm>
#include <optional>
#include <string>
#include <utility>

#include "devmem/alloc/allocation.h"
#include "devmem/alloc/allocator.h"
#include "devmem/alloc/block.h"
#include "devmem/alloc/pool.h"
#include "devmem/alloc/sync.h"
#include "devmem/core/error.h"
#include "devmem/logging/logging.h"

namespace devmem { namespace alloc {

using core::ErrorCode;

namespace {

// Candidates skipped for exceeding the pass budget before the pass ends.
constexpr std::uint32_t kMaxAllocsToIgnore = 16;
constexpr std::uint32_t kMaxBalancedPasses = 16;

} // namespace

std::string_view defragmentation_algorithm_name(DefragmentationAlgorithm a) noexcept {
  switch (a) {
    case DefragmentationAlgorithm::Fast: return "Fast";
    case DefragmentationAlgorithm::Balanced: return "Balanced";
    case DefragmentationAlgorithm::Full: return "Full";
    case DefragmentationAlgorithm::Extensive: return "Extensive";
  }
  return "?";
}

std::string_view defragmentation_state_name(DefragmentationState s) noexcept {
  switch (s) {
    case DefragmentationState::Idle: return "Idle";
    case DefragmentationState::Planning: return "Planning";
    case DefragmentationState::AwaitingExecution: return "AwaitingExecution";
    case DefragmentationState::Committing: return "Committing";
    case DefragmentationState::Closed: return "Closed";
  }
  return "?";
}

DefragmentationContext::DefragmentationContext(Allocator& owner, DefragmentationInfo info,
                                               std::vector<Pool*> pools)
  : owner_(owner), info_(std::move(info)) {
  pools_.reserve(pools.size());
  for (Pool* p : pools) {
    MaybeLockGuard lk(p->mu_, p->use_mutex_);
    // Block order is frozen for the session so block indices stay meaningful.
    p->incremental_sort_ = false;
    p->sort_by_free_size_();
    PoolState ps;
    ps.pool = p;
    pools_.push_back(ps);
  }
}

DefragmentationContext::~DefragmentationContext() {
  if (state_ == DefragmentationState::Closed) return;
  try {
    end();
  } catch (const core::Error& e) {
    DEVMEM_LOG(ERROR) << "defragmentation context destroyed with error: " << e.what();
  }
}

void DefragmentationContext::require_state_(std::initializer_list<DefragmentationState> allowed,
                                            const char* op) const {
  for (DefragmentationState s : allowed) {
    if (s == state_) return;
  }
  DEVMEM_LOG(WARNING) << "defragmentation " << op << " called in state "
                      << defragmentation_state_name(state_);
  core::throw_error(ErrorCode::InvalidState, std::string("DefragmentationContext::") + op,
                    "state " + std::string(defragmentation_state_name(state_)));
}

std::span<DefragmentationMove> DefragmentationContext::begin_pass() {
  require_state_({DefragmentationState::Planning, DefragmentationState::Idle}, "begin_pass");
  moves_.clear();
  pass_stats_ = DefragmentationStats{};
  ignored_candidates_ = 0;

  const bool exhausted =
      (info_.algorithm == DefragmentationAlgorithm::Fast && passes_ >= 1) ||
      (info_.algorithm == DefragmentationAlgorithm::Balanced && passes_ >= kMaxBalancedPasses);
  if (!exhausted) {
    for (PoolState& ps : pools_) {
      MaybeLockGuard lk(ps.pool->mu_, ps.pool->use_mutex_);
      if (compute_pool_moves_(ps)) break;
    }
  }

  if (moves_.empty()) {
    state_ = DefragmentationState::Idle;
    return {};
  }
  state_ = DefragmentationState::AwaitingExecution;
  return std::span<DefragmentationMove>(moves_);
}

void DefragmentationContext::end_pass(std::span<const DefragmentationMove> results) {
  require_state_({DefragmentationState::AwaitingExecution}, "end_pass");
  if (results.size() != moves_.size()) {
    core::throw_error(ErrorCode::InvalidArgument, "DefragmentationContext::end_pass",
                      "expected " + std::to_string(moves_.size()) + " results, got " +
                      std::to_string(results.size()));
  }
  for (std::size_t i = 0; i < results.size(); ++i) {
    if (results[i].src != moves_[i].src || results[i].dst_tmp != moves_[i].dst_tmp) {
      core::throw_error(ErrorCode::InvalidArgument, "DefragmentationContext::end_pass",
                        "result " + std::to_string(i) + " does not match the proposed move");
    }
  }

  state_ = DefragmentationState::Committing;

  // Frees one range and credits the block to the stats if the pool released it.
  auto tracked = [&](Pool& pool, DeviceSize block_size, auto&& fn) {
    const std::size_t before = pool.block_count();
    fn();
    if (pool.block_count() < before) {
      ++stats_.device_blocks_freed;
      stats_.bytes_freed += block_size;
    }
  };

  std::size_t i = 0;
  try {
    for (; i < moves_.size(); ++i) {
      const DefragmentationMove& m = moves_[i];
      Pool& pool = *m.src->pool_;
      const DeviceSize size = m.src->size_;
      switch (results[i].operation) {
        case DefragmentationMoveOperation::Copy: {
          commit_copy_(m);
          // Counted per committed move.
          stats_.bytes_moved += size;
          ++stats_.allocations_moved;
          // dst_tmp now sits on the old source range.
          const DeviceSize old_block_size = m.dst_tmp->block_->size();
          tracked(pool, old_block_size, [&] { release_tmp_(m.dst_tmp); });
          break;
        }
        case DefragmentationMoveOperation::Ignore: {
          immovable_.insert(m.src->block_);
          const DeviceSize dst_block_size = m.dst_tmp->block_->size();
          tracked(pool, dst_block_size, [&] { release_tmp_(m.dst_tmp); });
          break;
        }
        case DefragmentationMoveOperation::Destroy: {
          const DeviceSize dst_block_size = m.dst_tmp->block_->size();
          tracked(pool, dst_block_size, [&] { release_tmp_(m.dst_tmp); });
          const DeviceSize src_block_size = m.src->block_->size();
          tracked(pool, src_block_size, [&] { owner_.free(m.src); });
          break;
        }
      }
    }
  } catch (...) {
    for (std::size_t j = i + 1; j < moves_.size(); ++j) release_tmp_(moves_[j].dst_tmp);
    moves_.clear();
    pass_stats_ = DefragmentationStats{};
    state_ = DefragmentationState::Planning;
    throw;
  }

  pass_stats_ = DefragmentationStats{};
  moves_.clear();
  ++passes_;
  {
    MaybeLockGuard lk(owner_.counters_mu_, owner_.use_mutex_);
    ++owner_.counters_.defrag_passes;
  }
  prune_immovable_();
  state_ = DefragmentationState::Planning;
}

DefragmentationStats DefragmentationContext::end() {
  require_state_({DefragmentationState::Planning, DefragmentationState::Idle,
                  DefragmentationState::AwaitingExecution},
                 "end");
  if (state_ == DefragmentationState::AwaitingExecution) abandon_pending_();
  for (PoolState& ps : pools_) {
    MaybeLockGuard lk(ps.pool->mu_, ps.pool->use_mutex_);
    ps.pool->incremental_sort_ = true;
    ps.pool->sort_by_free_size_();
  }
  state_ = DefragmentationState::Closed;
  return stats_;
}

// ---- Planning ---------------------------------------------------------------

bool DefragmentationContext::compute_pool_moves_(PoolState& ps) {
  switch (info_.algorithm) {
    case DefragmentationAlgorithm::Fast:
      return compute_fast_(ps);
    case DefragmentationAlgorithm::Balanced:
      return compute_balanced_(ps);
    case DefragmentationAlgorithm::Full:
      return compute_full_(ps, false);
    case DefragmentationAlgorithm::Extensive:
      return compute_full_(ps, ps.pool->granularity_ > 1);
  }
  return false;
}

bool DefragmentationContext::compute_fast_(PoolState& ps) {
  Pool& pool = *ps.pool;
  for (std::size_t i = pool.blocks_.size(); i-- > 0;) {
    DeviceMemoryBlock* b = pool.blocks_[i];
    if (block_is_immovable_(b)) continue;
    for (Allocation* src : candidates_in_block_(b, false)) {
      const CounterStatus cs = check_counters_(src->size_);
      if (cs == CounterStatus::Ignore) continue;
      if (cs == CounterStatus::End) return true;
      bool moved = false;
      if (alloc_in_other_block_(pool, 0, i, src, moved, false)) return true;
    }
  }
  return false;
}

bool DefragmentationContext::compute_balanced_(PoolState& ps) {
  Pool& pool = *ps.pool;
  update_pool_statistics_(ps);
  const DeviceSize min_free_region = ps.avg_free_size / 2;
  for (std::size_t i = pool.blocks_.size(); i-- > 0;) {
    DeviceMemoryBlock* b = pool.blocks_[i];
    if (block_is_immovable_(b)) continue;
    BlockMetadata* md = b->metadata();
    DeviceSize prev_free_region = 0;
    for (Allocation* src : candidates_in_block_(b, false)) {
      const CounterStatus cs = check_counters_(src->size_);
      if (cs == CounterStatus::Ignore) continue;
      if (cs == CounterStatus::End) return true;

      bool moved = false;
      if (alloc_in_other_block_(pool, 0, i, src, moved, false)) return true;

      const DeviceSize next_free_region = md->next_free_region_size(src->handle_);
      if (!moved && src->offset_ != 0 && md->sum_free_size() >= src->size_) {
        // Compact in place only where it is likely to open up usable space.
        if (prev_free_region >= min_free_region || next_free_region >= min_free_region ||
            src->size_ <= ps.avg_free_size || src->size_ <= ps.avg_alloc_size) {
          if (try_move_to_block_(pool, b, src, true) && increment_counters_(src->size_)) return true;
        }
      }
      prev_free_region = next_free_region;
    }
  }
  return false;
}

bool DefragmentationContext::compute_full_(PoolState& ps, bool kind_aware) {
  Pool& pool = *ps.pool;
  for (std::size_t i = pool.blocks_.size(); i-- > 0;) {
    DeviceMemoryBlock* b = pool.blocks_[i];
    if (block_is_immovable_(b)) continue;
    for (Allocation* src : candidates_in_block_(b, kind_aware)) {
      const CounterStatus cs = check_counters_(src->size_);
      if (cs == CounterStatus::Ignore) continue;
      if (cs == CounterStatus::End) return true;

      bool moved = false;
      if (alloc_in_other_block_(pool, 0, i, src, moved, kind_aware)) return true;
      if (!moved && src->offset_ != 0 && b->metadata()->sum_free_size() >= src->size_) {
        if (try_move_to_block_(pool, b, src, true) && increment_counters_(src->size_)) return true;
      }
    }
  }
  return false;
}

void DefragmentationContext::update_pool_statistics_(PoolState& ps) const {
  DeviceSize alloc_bytes = 0;
  DeviceSize free_bytes = 0;
  std::size_t alloc_count = 0;
  std::size_t free_count = 0;
  for (const DeviceMemoryBlock* b : ps.pool->blocks_) {
    const BlockMetadata* md = b->metadata();
    alloc_count += md->allocation_count();
    alloc_bytes += md->size() - md->sum_free_size();
    free_bytes += md->sum_free_size();
    free_count += md->free_region_count();
  }
  ps.avg_alloc_size = alloc_count ? alloc_bytes / alloc_count : 0;
  ps.avg_free_size = free_count ? free_bytes / free_count : 0;
}

std::vector<Allocation*> DefragmentationContext::candidates_in_block_(DeviceMemoryBlock* b,
                                                                      bool kind_order) const {
  std::vector<Allocation*> out;
  b->metadata()->for_each_allocation([&](const RangeInfo& r) {
    auto* a = static_cast<Allocation*>(r.user_data);
    if (a != nullptr && a->defrag_owner_ == nullptr) out.push_back(a);
  });
  if (kind_order) {
    std::stable_sort(out.begin(), out.end(), [](const Allocation* x, const Allocation* y) {
      return static_cast<int>(x->kind_) < static_cast<int>(y->kind_);
    });
  }
  return out;
}

DefragmentationContext::CounterStatus DefragmentationContext::check_counters_(DeviceSize bytes) {
  const bool over_bytes = info_.max_bytes_per_pass != 0 &&
                          pass_stats_.bytes_moved + bytes > info_.max_bytes_per_pass;
  const bool over_count = info_.max_allocations_per_pass != 0 &&
                          pass_stats_.allocations_moved >= info_.max_allocations_per_pass;
  if (over_bytes || over_count) {
    if (++ignored_candidates_ < kMaxAllocsToIgnore) return CounterStatus::Ignore;
    return CounterStatus::End;
  }
  ignored_candidates_ = 0;
  return CounterStatus::Pass;
}

bool DefragmentationContext::increment_counters_(DeviceSize bytes) {
  pass_stats_.bytes_moved += bytes;
  ++pass_stats_.allocations_moved;
  const bool full_count = info_.max_allocations_per_pass != 0 &&
                          pass_stats_.allocations_moved >= info_.max_allocations_per_pass;
  const bool full_bytes = info_.max_bytes_per_pass != 0 &&
                          pass_stats_.bytes_moved >= info_.max_bytes_per_pass;
  if (full_count || full_bytes) {
    ignored_candidates_ = 0;
    return true;
  }
  return false;
}

bool DefragmentationContext::try_move_to_block_(Pool& pool, DeviceMemoryBlock* b, Allocation* src,
                                                bool require_lower) {
  const std::optional<AllocationRequest> r = b->metadata()->create_request(
      src->size_, src->alignment_, false, src->kind_, AllocationStrategy::MinOffset);
  if (!r) return false;
  if (require_lower && r->offset >= src->offset_) return false;

  Pool::AcquireRequest req;
  req.size = src->size_;
  req.alignment = src->alignment_;
  req.kind = src->kind_;
  req.strategy = AllocationStrategy::MinOffset;
  Allocation* tmp = pool.commit_(b, *r, req);
  tmp->defrag_owner_ = this;
  try {
    DefragmentationMove m;
    m.src = src;
    m.dst_tmp = tmp;
    moves_.push_back(m);
  } catch (...) {
    b->metadata()->free(tmp->handle_);
    owner_.note_free_(tmp->category_, tmp->size_);
    delete tmp;
    throw;
  }
  return true;
}

bool DefragmentationContext::alloc_in_other_block_(Pool& pool, std::size_t begin, std::size_t end,
                                                   Allocation* src, bool& moved, bool kind_aware) {
  moved = false;
  // With kind_aware, blocks free of conflicting kinds are tried first.
  for (int round = kind_aware ? 0 : 1; round < 2; ++round) {
    for (std::size_t j = begin; j < end; ++j) {
      DeviceMemoryBlock* b = pool.blocks_[j];
      if (b == src->block_ || b->metadata()->sum_free_size() < src->size_) continue;
      if (round == 0 && block_has_conflicting_kind_(b, src->kind_)) continue;
      if (try_move_to_block_(pool, b, src, false)) {
        moved = true;
        return increment_counters_(src->size_);
      }
    }
  }
  return false;
}

bool DefragmentationContext::block_is_immovable_(const DeviceMemoryBlock* b) const {
  return immovable_.count(b) != 0;
}

bool DefragmentationContext::block_has_conflicting_kind_(const DeviceMemoryBlock* b,
                                                         SuballocationKind kind) const {
  bool conflict = false;
  b->metadata()->for_each_allocation([&](const RangeInfo& r) {
    if (kinds_conflict(r.kind, kind)) conflict = true;
  });
  return conflict;
}

void DefragmentationContext::prune_immovable_() {
  std::unordered_set<const DeviceMemoryBlock*> live;
  for (PoolState& ps : pools_) {
    MaybeLockGuard lk(ps.pool->mu_, ps.pool->use_mutex_);
    for (const DeviceMemoryBlock* b : ps.pool->blocks_) {
      if (immovable_.count(b) != 0) live.insert(b);
    }
  }
  immovable_.swap(live);
}

// ---- Commit -----------------------------------------------------------------

void DefragmentationContext::release_tmp_(Allocation* tmp) {
  tmp->defrag_owner_ = nullptr;
  tmp->pool_->release_(tmp);
}

void DefragmentationContext::commit_copy_(const DefragmentationMove& m) {
  Allocation* src = m.src;
  Allocation* tmp = m.dst_tmp;
  Pool& pool = *src->pool_;
  DeviceMemoryBlock* old_block = src->block_;
  DeviceMemoryBlock* new_block = tmp->block_;
  // Swapping ranges of different sizes would corrupt both blocks.
  DEVMEM_CHECK(src->size_ == tmp->size_ && src->pool_ == tmp->pool_);

  // Carry the source's map references over to the destination block.
  const std::uint32_t refs = src->map_count() + (src->persistent_map_ ? 1u : 0u);
  const bool remap = refs != 0 && new_block != old_block;
  if (remap) {
    try {
      new_block->map(refs);
    } catch (...) {
      release_tmp_(tmp);
      throw;
    }
  }
  {
    MaybeLockGuard lk(pool.mu_, pool.use_mutex_);
    std::swap(src->block_, tmp->block_);
    std::swap(src->handle_, tmp->handle_);
    std::swap(src->offset_, tmp->offset_);
    src->block_->metadata()->set_allocation_user_data(src->handle_, src);
    tmp->block_->metadata()->set_allocation_user_data(tmp->handle_, tmp);
  }
  if (remap) old_block->unmap(refs);
}

void DefragmentationContext::abandon_pending_() {
  for (const DefragmentationMove& m : moves_) {
    Pool& pool = *m.dst_tmp->pool_;
    const DeviceSize block_size = m.dst_tmp->block_->size();
    const std::size_t before = pool.block_count();
    release_tmp_(m.dst_tmp);
    if (pool.block_count() < before) {
      ++stats_.device_blocks_freed;
      stats_.bytes_freed += block_size;
    }
  }
  moves_.clear();
  pass_stats_ = DefragmentationStats{};
}

}} // namespace devmem::alloc
