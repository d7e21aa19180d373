// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "devmem/alloc/allocator.h"

#include <algorithm>
#include <memory>
#include <span>
#include <string>
#include <utility>

#include "devmem/alloc/block.h"
#include "devmem/alloc/category.h"
#include "devmem/alloc/sync.h"
#include "devmem/core/checked_math.h"
#include "devmem/core/error.h"
#include "devmem/logging/logging.h"
#include "json_report.h"

namespace devmem { namespace alloc {

using core::ErrorCode;

namespace {

constexpr DeviceSize kMinBlockSizeAlignment = 32;

const AllocatorCreateInfo& validated(const AllocatorCreateInfo& info) {
  const char* ctx = "Allocator::Allocator";
  if (info.provider == nullptr) {
    core::throw_error(ErrorCode::InvalidArgument, ctx, "device memory provider is required");
  }
  if (info.heaps.empty() || info.categories.empty()) {
    core::throw_error(ErrorCode::InvalidArgument, ctx, "heap and category tables must not be empty");
  }
  if (info.categories.size() > kMaxMemoryCategories) {
    core::throw_error(ErrorCode::InvalidArgument, ctx,
                      "at most " + std::to_string(kMaxMemoryCategories) + " categories");
  }
  for (std::size_t i = 0; i < info.categories.size(); ++i) {
    if (info.categories[i].heap_index >= info.heaps.size()) {
      core::throw_error(ErrorCode::InvalidArgument, ctx,
                        "category " + std::to_string(i) + " refers to missing heap " +
                        std::to_string(info.categories[i].heap_index));
    }
  }
  if (!info.heap_size_limits.empty() && info.heap_size_limits.size() != info.heaps.size()) {
    core::throw_error(ErrorCode::InvalidArgument, ctx, "heap_size_limits needs one entry per heap");
  }
  if (info.buffer_image_granularity > 1 && !core::is_pow2(info.buffer_image_granularity)) {
    core::throw_error(ErrorCode::InvalidArgument, ctx, "buffer_image_granularity must be a power of two");
  }
  if (info.non_coherent_atom_size > 1 && !core::is_pow2(info.non_coherent_atom_size)) {
    core::throw_error(ErrorCode::InvalidArgument, ctx, "non_coherent_atom_size must be a power of two");
  }
  return info;
}

bool is_host_visible(MemoryPropertyFlags f) noexcept { return (f & kMemoryPropertyHostVisible) != 0; }

bool needs_flush(MemoryPropertyFlags f) noexcept {
  return is_host_visible(f) && (f & kMemoryPropertyHostCoherent) == 0;
}

void describe_allocation(const RangeInfo& r, report::ordered_json& out) {
  const auto* a = static_cast<const Allocation*>(r.user_data);
  if (a == nullptr) return;
  out["Size"] = a->size();
  if (!a->name().empty()) out["Name"] = a->name();
  report::ordered_json ud = report::user_data_json(a->user_data());
  if (!ud.is_null()) out["UserData"] = std::move(ud);
}

} // namespace

Allocator::Allocator(const AllocatorCreateInfo& info)
  : provider_(*validated(info).provider),
    cfg_(info.config ? *info.config : config_from_env()),
    heaps_(info.heaps),
    categories_(info.categories),
    granularity_(info.buffer_image_granularity == 0 ? 1 : info.buffer_image_granularity),
    atom_size_(info.non_coherent_atom_size == 0 ? 1 : info.non_coherent_atom_size),
    large_heap_block_size_(info.preferred_large_heap_block_size != 0
                               ? info.preferred_large_heap_block_size
                               : cfg_.default_large_heap_block_size),
    use_mutex_((info.flags & kAllocatorCreateExternallySynchronized) == 0),
    budget_(info.heaps, info.heap_size_limits, info.budget_source, cfg_.budget_refresh_ops, use_mutex_) {
  dedicated_.resize(categories_.size());
}

Allocator::~Allocator() {
  for (std::size_t c = 0; c < dedicated_.size(); ++c) {
    if (!dedicated_[c].empty()) {
      DEVMEM_LOG(ERROR) << "allocator destroyed with " << dedicated_[c].size()
                        << " live dedicated allocations in category " << c;
    }
    for (Allocation* a : dedicated_[c]) {
      a->block_->unmap(a->map_count() + (a->persistent_map_ ? 1u : 0u));
      note_free_(a->category_, a->size_);
      destroy_device_block_(a->block_);
      delete a;
    }
    dedicated_[c].clear();
  }
  pools_.clear();
  for (auto& p : default_pools_) p.reset();
}

DeviceSize Allocator::preferred_block_size(std::uint32_t category) const noexcept {
  const DeviceSize heap_size = heaps_[heap_of_(category)].size;
  const DeviceSize size = heap_size <= cfg_.small_heap_max_size ? heap_size / 8 : large_heap_block_size_;
  return std::max(core::align_up(size, kMinBlockSizeAlignment), kMinBlockSizeAlignment);
}

bool Allocator::corruption_detection_enabled_(std::uint32_t category) const noexcept {
  return cfg_.detect_corruption && cfg_.debug_margin > 0 &&
         is_host_visible(categories_[category].property_flags);
}

// ---- Allocation -------------------------------------------------------------

void Allocator::validate_request_(const MemoryRequirements& reqs, const AllocationCreateInfo& info) const {
  const char* ctx = "Allocator::allocate";
  if (reqs.size == 0) {
    core::throw_error(ErrorCode::InvalidArgument, ctx, "size must be > 0");
  }
  if (reqs.alignment > 1 && !core::is_pow2(reqs.alignment)) {
    core::throw_error(ErrorCode::InvalidArgument, ctx,
                      "alignment " + std::to_string(reqs.alignment) + " is not a power of two");
  }
  (void)strategy_from_flags(info.flags);
  if ((info.flags & kAllocationCreateUpperAddress) &&
      (info.pool == nullptr || info.pool->algorithm() != PoolAlgorithm::Linear)) {
    core::throw_error(ErrorCode::InvalidArgument, ctx, "upper address allocations need a linear pool");
  }
}

std::uint32_t Allocator::find_memory_category(std::uint32_t category_bits,
                                              const AllocationCreateInfo& info) const {
  const CategoryPreferences prefs = resolve_preferences(info);
  return alloc::find_memory_category(categories_, combine_category_bits(category_bits, info.category_bits),
                                     prefs);
}

Allocation* Allocator::allocate(const MemoryRequirements& reqs, const AllocationCreateInfo& info) {
  validate_request_(reqs, info);
  std::uint32_t category = 0;
  if (info.pool != nullptr) {
    category = info.pool->category();
    const std::uint32_t bits = combine_category_bits(reqs.category_bits, info.category_bits);
    if (bits != 0 && (bits & (1u << category)) == 0) {
      core::throw_error(ErrorCode::FeatureNotPresent, "Allocator::allocate",
                        "pool category " + std::to_string(category) + " is not acceptable");
    }
  } else {
    category = find_memory_category(reqs.category_bits, info);
  }
  return allocate_in_category_(category, reqs, info, false);
}

Allocation* Allocator::allocate_dedicated(const MemoryRequirements& reqs, const AllocationCreateInfo& info) {
  validate_request_(reqs, info);
  if (info.pool != nullptr) {
    core::throw_error(ErrorCode::InvalidArgument, "Allocator::allocate_dedicated",
                      "custom pools do not hold dedicated allocations");
  }
  const std::uint32_t category = find_memory_category(reqs.category_bits, info);
  return allocate_in_category_(category, reqs, info, true);
}

Allocation* Allocator::allocate_in_category_(std::uint32_t category, const MemoryRequirements& reqs,
                                             const AllocationCreateInfo& info, bool force_dedicated) {
  const MemoryPropertyFlags props = categories_[category].property_flags;
  if ((info.flags & kAllocationCreateMapped) && !is_host_visible(props)) {
    core::throw_error(ErrorCode::InvalidArgument, "Allocator::allocate",
                      "mapped allocation in category " + std::to_string(category) +
                      " which is not host visible");
  }

  PlacementInput in;
  in.flags = info.flags | (force_dedicated ? kAllocationCreateDedicated : 0u);
  in.usage = info.usage;
  in.size = reqs.size;
  in.preferred_block_size = info.pool ? info.pool->preferred_block_size() : preferred_block_size(category);
  in.prefers_dedicated = reqs.prefers_dedicated;
  in.requires_dedicated = reqs.requires_dedicated;
  in.custom_pool = info.pool != nullptr;
  in.debug_always_dedicated = cfg_.debug_always_dedicated;
  const PlacementKind placement = decide_placement(in);

  DeviceSize alignment = reqs.alignment == 0 ? 1 : reqs.alignment;
  if (needs_flush(props)) alignment = std::max(alignment, atom_size_);

  Allocation* a = nullptr;
  if (placement == PlacementKind::Dedicated) {
    MemoryRequirements r = reqs;
    r.alignment = alignment;
    a = allocate_dedicated_(category, r, info);
  } else {
    Pool* pool = info.pool ? info.pool : default_pool_(category);
    Pool::AcquireRequest req;
    req.size = reqs.size;
    req.alignment = alignment;
    req.kind = info.kind;
    req.strategy = strategy_from_flags(info.flags);
    req.upper = (info.flags & kAllocationCreateUpperAddress) != 0;
    req.never_allocate = (info.flags & kAllocationCreateNeverAllocate) != 0;
    req.within_budget = (info.flags & kAllocationCreateWithinBudget) != 0;
    a = pool->acquire_(req);
  }
  finish_allocation_(a, info);
  return a;
}

Allocation* Allocator::allocate_dedicated_(std::uint32_t category, const MemoryRequirements& reqs,
                                           const AllocationCreateInfo& info) {
  std::uint32_t id = 0;
  {
    MaybeLockGuard lk(dedicated_mu_, use_mutex_);
    id = next_dedicated_id_++;
  }
  const bool within_budget = (info.flags & kAllocationCreateWithinBudget) != 0;
  DeviceMemoryBlock* b = create_device_block_(category, reqs.size, within_budget, nullptr, id);
  Allocation* a = nullptr;
  try {
    a = new Allocation();
    a->type_ = Allocation::Type::Dedicated;
    a->block_ = b;
    a->offset_ = 0;
    a->size_ = reqs.size;
    a->alignment_ = reqs.alignment;
    a->category_ = category;
    a->kind_ = info.kind;
    MaybeLockGuard lk(dedicated_mu_, use_mutex_);
    dedicated_[category].insert(a);
  } catch (...) {
    delete a;
    destroy_device_block_(b);
    throw;
  }
  note_allocation_(category, reqs.size);
  {
    MaybeLockGuard lk(counters_mu_, use_mutex_);
    ++counters_.dedicated_allocs;
  }
  return a;
}

void Allocator::finish_allocation_(Allocation* a, const AllocationCreateInfo& info) {
  try {
    a->user_data_ = info.user_data;
    if (info.flags & kAllocationCreateMapped) {
      a->block_->map(1);
      a->persistent_map_ = true;
    }
  } catch (...) {
    free(a);
    throw;
  }
}

std::vector<Allocation*> Allocator::allocate_pages(const MemoryRequirements& reqs,
                                                   const AllocationCreateInfo& info, std::size_t count) {
  std::vector<Allocation*> out;
  out.reserve(count);
  try {
    for (std::size_t i = 0; i < count; ++i) out.push_back(allocate(reqs, info));
  } catch (...) {
    for (auto it = out.rbegin(); it != out.rend(); ++it) free(*it);
    throw;
  }
  return out;
}

void Allocator::free(Allocation* a) {
  if (a == nullptr) return;
  if (a->defrag_owner_ != nullptr) {
    core::throw_error(ErrorCode::InvalidArgument, "Allocator::free",
                      "defragmentation destinations are released by their context");
  }
  const std::uint32_t explicit_refs = a->map_count();
  if (explicit_refs != 0) {
    DEVMEM_LOG(WARNING) << "freeing allocation still mapped " << explicit_refs << " times";
  }
  a->block_->unmap(explicit_refs + (a->persistent_map_ ? 1u : 0u));
  a->map_count_.store(0, std::memory_order_relaxed);
  a->persistent_map_ = false;
  if (a->type_ == Allocation::Type::Dedicated) {
    free_dedicated_(a);
  } else {
    a->pool_->release_(a);
  }
}

void Allocator::free_pages(std::span<Allocation* const> allocations) {
  for (auto it = allocations.rbegin(); it != allocations.rend(); ++it) free(*it);
}

void Allocator::free_dedicated_(Allocation* a) {
  {
    MaybeLockGuard lk(dedicated_mu_, use_mutex_);
    if (dedicated_[a->category_].erase(a) == 0) {
      core::throw_error(ErrorCode::InvalidArgument, "Allocator::free", "unknown dedicated allocation");
    }
  }
  note_free_(a->category_, a->size_);
  destroy_device_block_(a->block_);
  delete a;
}

// ---- Pools ------------------------------------------------------------------

Pool* Allocator::default_pool_(std::uint32_t category) {
  MaybeLockGuard lk(registry_mu_, use_mutex_);
  std::unique_ptr<Pool>& slot = default_pools_[category];
  if (!slot) {
    PoolCreateInfo info;
    info.category = category;
    info.name = "default-" + std::to_string(category);
    slot.reset(new Pool(*this, std::move(info), preferred_block_size(category), false, true));
  }
  return slot.get();
}

std::vector<Pool*> Allocator::default_pools_snapshot_() const {
  MaybeLockGuard lk(registry_mu_, use_mutex_);
  std::vector<Pool*> out;
  for (const auto& p : default_pools_) {
    if (p) out.push_back(p.get());
  }
  return out;
}

std::vector<Pool*> Allocator::all_pools_snapshot_() const {
  std::vector<Pool*> out = default_pools_snapshot_();
  MaybeLockGuard lk(registry_mu_, use_mutex_);
  for (const auto& p : pools_) out.push_back(p.get());
  return out;
}

Pool* Allocator::create_pool(const PoolCreateInfo& info) {
  const char* ctx = "Allocator::create_pool";
  if (info.category >= categories_.size()) {
    core::throw_error(ErrorCode::InvalidArgument, ctx, "unknown category " + std::to_string(info.category));
  }
  if (info.algorithm == PoolAlgorithm::Linear && info.max_block_count != 1) {
    core::throw_error(ErrorCode::InvalidArgument, ctx, "linear pools need max_block_count == 1");
  }
  if (info.max_block_count != 0 && info.min_block_count > info.max_block_count) {
    core::throw_error(ErrorCode::InvalidArgument, ctx, "min_block_count exceeds max_block_count");
  }
  if (info.min_allocation_alignment > 1 && !core::is_pow2(info.min_allocation_alignment)) {
    core::throw_error(ErrorCode::InvalidArgument, ctx, "min_allocation_alignment must be a power of two");
  }
  const bool explicit_size = info.block_size != 0;
  const DeviceSize block_size = explicit_size ? info.block_size : preferred_block_size(info.category);
  std::unique_ptr<Pool> pool(new Pool(*this, info, block_size, explicit_size, false));
  pool->create_min_blocks_();
  Pool* raw = pool.get();
  MaybeLockGuard lk(registry_mu_, use_mutex_);
  pools_.push_back(std::move(pool));
  return raw;
}

void Allocator::destroy_pool(Pool* pool) {
  if (pool == nullptr) return;
  if (pool->is_default()) {
    core::throw_error(ErrorCode::InvalidArgument, "Allocator::destroy_pool", "default pools are not destroyable");
  }
  if (pool->statistics().allocation_count != 0) {
    core::throw_error(ErrorCode::InvalidState, "Allocator::destroy_pool",
                      "pool '" + pool->name() + "' still has live allocations");
  }
  std::unique_ptr<Pool> victim;
  {
    MaybeLockGuard lk(registry_mu_, use_mutex_);
    auto it = std::find_if(pools_.begin(), pools_.end(),
                           [&](const std::unique_ptr<Pool>& p) { return p.get() == pool; });
    if (it == pools_.end()) {
      core::throw_error(ErrorCode::InvalidArgument, "Allocator::destroy_pool", "unknown pool");
    }
    victim = std::move(*it);
    pools_.erase(it);
  }
}

// ---- Budget and statistics --------------------------------------------------

std::vector<Budget> Allocator::get_budget() {
  return budget_.get_all();
}

Budget Allocator::get_category_budget(std::uint32_t category) {
  if (category >= categories_.size()) {
    core::throw_error(ErrorCode::InvalidArgument, "Allocator::get_category_budget",
                      "unknown category " + std::to_string(category));
  }
  return budget_.get(heap_of_(category));
}

TotalStatistics Allocator::calculate_statistics() const {
  TotalStatistics t;
  t.categories.resize(categories_.size());
  t.heaps.resize(heaps_.size());
  for (const Pool* p : all_pools_snapshot_()) {
    t.categories[p->category()].add(p->detailed_statistics());
  }
  {
    MaybeLockGuard lk(dedicated_mu_, use_mutex_);
    for (std::size_t c = 0; c < dedicated_.size(); ++c) {
      for (const Allocation* a : dedicated_[c]) {
        DetailedStatistics& d = t.categories[c];
        ++d.statistics.block_count;
        d.statistics.block_bytes += a->block_->size();
        d.add_allocation(a->size_);
      }
    }
  }
  for (std::size_t c = 0; c < categories_.size(); ++c) {
    t.heaps[categories_[c].heap_index].add(t.categories[c]);
  }
  for (const DetailedStatistics& h : t.heaps) t.total.add(h);
  return t;
}

AllocatorCounters Allocator::get_counters() const {
  MaybeLockGuard lk(counters_mu_, use_mutex_);
  return counters_;
}

void Allocator::reset_peak_counters() noexcept {
  MaybeLockGuard lk(counters_mu_, use_mutex_);
  counters_.max_block_bytes = counters_.block_bytes_current;
  counters_.max_allocation_bytes = counters_.allocation_bytes_current;
}

void Allocator::note_allocation_(std::uint32_t category, DeviceSize size) noexcept {
  budget_.add_allocation(heap_of_(category), size);
  MaybeLockGuard lk(counters_mu_, use_mutex_);
  counters_.allocation_bytes_current += size;
  counters_.max_allocation_bytes = std::max(counters_.max_allocation_bytes, counters_.allocation_bytes_current);
}

void Allocator::note_free_(std::uint32_t category, DeviceSize size) noexcept {
  budget_.remove_allocation(heap_of_(category), size);
  MaybeLockGuard lk(counters_mu_, use_mutex_);
  counters_.allocation_bytes_current -= size;
}

void Allocator::note_corruption_() noexcept {
  MaybeLockGuard lk(counters_mu_, use_mutex_);
  ++counters_.corruption_detected;
}

// ---- Device blocks ----------------------------------------------------------

DeviceMemoryBlock* Allocator::create_device_block_(std::uint32_t category, DeviceSize size,
                                                   bool within_budget,
                                                   std::unique_ptr<BlockMetadata> metadata,
                                                   std::uint32_t id) {
  const std::uint32_t heap = heap_of_(category);
  try {
    budget_.reserve_block(heap, size, within_budget);
  } catch (const core::Error& e) {
    DEVMEM_LOG_EVERY_N(WARNING, 8) << "block of " << size << " bytes rejected on heap " << heap << ": " << e.what();
    MaybeLockGuard lk(counters_mu_, use_mutex_);
    if (e.code() == ErrorCode::OutOfBudget) ++counters_.budget_rejections;
    else ++counters_.device_oom;
    throw;
  }

  DeviceMemoryHandle memory = kNullDeviceMemory;
  const DeviceStatus st = provider_.alloc_block(category, size, memory);
  if (st != DeviceStatus::Ok) {
    budget_.release_block(heap, size);
    DEVMEM_LOG_EVERY_N(WARNING, 8) << "device refused block of " << size << " bytes in category " << category;
    {
      MaybeLockGuard lk(counters_mu_, use_mutex_);
      ++counters_.device_oom;
    }
    core::throw_error(to_error_code(st), "Allocator::create_device_block",
                      std::to_string(size) + " bytes in category " + std::to_string(category));
  }

  DeviceMemoryBlock* b = nullptr;
  try {
    b = new DeviceMemoryBlock(provider_, category, id, memory, size, std::move(metadata), use_mutex_);
  } catch (...) {
    provider_.free_block(memory);
    budget_.release_block(heap, size);
    throw;
  }
  MaybeLockGuard lk(counters_mu_, use_mutex_);
  ++counters_.device_block_allocs;
  counters_.block_bytes_current += size;
  counters_.max_block_bytes = std::max(counters_.max_block_bytes, counters_.block_bytes_current);
  return b;
}

void Allocator::destroy_device_block_(DeviceMemoryBlock* b) noexcept {
  const std::uint32_t heap = heap_of_(b->category());
  const DeviceSize size = b->size();
  delete b;
  budget_.release_block(heap, size);
  MaybeLockGuard lk(counters_mu_, use_mutex_);
  ++counters_.device_block_frees;
  counters_.block_bytes_current -= size;
}

// ---- Allocation records -----------------------------------------------------

void* Allocator::map(Allocation* a) {
  if (!is_host_visible(categories_[a->category_].property_flags)) {
    core::throw_error(ErrorCode::MemoryMapFailed, "Allocator::map",
                      "category " + std::to_string(a->category_) + " is not host visible");
  }
  void* base = a->block_->map(1);
  a->map_count_.fetch_add(1, std::memory_order_relaxed);
  return static_cast<unsigned char*>(base) + a->offset_;
}

void Allocator::unmap(Allocation* a) {
  std::uint32_t cur = a->map_count_.load(std::memory_order_relaxed);
  do {
    if (cur == 0) {
      core::throw_error(ErrorCode::InvalidState, "Allocator::unmap", "allocation is not mapped");
    }
  } while (!a->map_count_.compare_exchange_weak(cur, cur - 1, std::memory_order_relaxed));
  a->block_->unmap(1);
}

void Allocator::flush(Allocation* a, DeviceSize offset, DeviceSize size) {
  flush_or_invalidate_(a, offset, size, true);
}

void Allocator::invalidate(Allocation* a, DeviceSize offset, DeviceSize size) {
  flush_or_invalidate_(a, offset, size, false);
}

void Allocator::flush_or_invalidate_(Allocation* a, DeviceSize offset, DeviceSize size, bool flush) {
  const char* ctx = flush ? "Allocator::flush" : "Allocator::invalidate";
  if (!needs_flush(categories_[a->category_].property_flags) || size == 0) return;
  if (offset > a->size_) {
    core::throw_error(ErrorCode::InvalidArgument, ctx,
                      "offset " + std::to_string(offset) + " beyond allocation size " +
                      std::to_string(a->size_));
  }
  const DeviceSize local_end = size == kWholeSize
                                   ? a->size_
                                   : std::min(core::saturating_add_u64(offset, size), a->size_);
  const DeviceSize begin = core::align_down(a->offset_ + offset, atom_size_);
  const DeviceSize end = std::min(core::align_up(a->offset_ + local_end, atom_size_), a->block_->size());
  if (end <= begin) return;
  const DeviceStatus st = flush ? provider_.flush(a->memory(), begin, end - begin)
                                : provider_.invalidate(a->memory(), begin, end - begin);
  if (st != DeviceStatus::Ok) core::throw_error(to_error_code(st), ctx);
}

void Allocator::set_user_data(Allocation* a, UserData user_data) {
  a->user_data_ = std::move(user_data);
}

void Allocator::set_name(Allocation* a, std::string name) {
  a->name_ = std::move(name);
}

AllocationInfo Allocator::get_allocation_info(const Allocation* a) const {
  AllocationInfo info;
  info.category = a->category_;
  info.memory = a->memory();
  info.offset = a->offset_;
  info.size = a->size_;
  info.mapped_data = a->mapped_data();
  info.user_data = a->user_data_;
  info.name = a->name_;
  return info;
}

MemoryPropertyFlags Allocator::get_memory_properties(const Allocation* a) const {
  return categories_[a->category_].property_flags;
}

// ---- Diagnostics ------------------------------------------------------------

void Allocator::check_corruption(std::uint32_t category_bits) {
  bool scanned = false;
  std::string damaged;
  for (Pool* p : all_pools_snapshot_()) {
    const std::uint32_t c = p->category();
    if (category_bits != 0 && (category_bits & (1u << c)) == 0) continue;
    if (!corruption_detection_enabled_(c)) continue;
    scanned = true;
    try {
      p->check_corruption();
    } catch (const core::Error& e) {
      if (e.code() != ErrorCode::Corruption) throw;
      if (!damaged.empty()) damaged += ", ";
      damaged += p->name();
    }
  }
  if (!scanned) {
    core::throw_error(ErrorCode::FeatureNotPresent, "Allocator::check_corruption",
                      "corruption detection is not enabled for the selected categories");
  }
  if (!damaged.empty()) {
    core::throw_error(ErrorCode::Corruption, "Allocator::check_corruption", "damaged pools: " + damaged);
  }
}

std::string Allocator::build_stats_string(bool detailed) {
  using report::ordered_json;
  const TotalStatistics stats = calculate_statistics();
  const std::vector<Budget> budgets = budget_.get_all();

  ordered_json root = ordered_json::object();

  ordered_json general = ordered_json::object();
  general["HeapCount"] = heaps_.size();
  general["CategoryCount"] = categories_.size();
  general["BufferImageGranularity"] = granularity_;
  general["NonCoherentAtomSize"] = atom_size_;
  general["ExternallySynchronized"] = !use_mutex_;
  root["General"] = std::move(general);
  root["Total"] = report::detailed_statistics_json(stats.total);

  ordered_json heaps = ordered_json::array();
  for (std::uint32_t h = 0; h < heaps_.size(); ++h) {
    ordered_json hj = ordered_json::object();
    hj["Index"] = h;
    hj["Size"] = heaps_[h].size;
    hj["DeviceLocal"] = heaps_[h].device_local;
    hj["Budget"] = report::budget_json(budgets[h]);
    hj["Stats"] = report::detailed_statistics_json(stats.heaps[h]);
    ordered_json cats = ordered_json::array();
    for (std::uint32_t c = 0; c < categories_.size(); ++c) {
      if (categories_[c].heap_index != h) continue;
      ordered_json cj = ordered_json::object();
      cj["Index"] = c;
      cj["Flags"] = report::property_flags_json(categories_[c].property_flags);
      cj["Stats"] = report::detailed_statistics_json(stats.categories[c]);
      cats.push_back(std::move(cj));
    }
    hj["Categories"] = std::move(cats);
    heaps.push_back(std::move(hj));
  }
  root["Heaps"] = std::move(heaps);

  auto pool_json = [&](Pool* p) {
    ordered_json pj = ordered_json::object();
    pj["Name"] = p->name();
    pj["Category"] = p->category();
    pj["Algorithm"] = std::string(algorithm_name(p->algorithm()));
    pj["PreferredBlockSize"] = p->preferred_block_size();
    pj["Stats"] = report::detailed_statistics_json(p->detailed_statistics());
    if (detailed) {
      ordered_json blocks = ordered_json::array();
      MaybeLockGuard lk(p->mu_, use_mutex_);
      for (const DeviceMemoryBlock* b : p->blocks_) {
        ordered_json bj = report::block_metadata_json(*b->metadata(), describe_allocation);
        bj["Id"] = b->id();
        bj["MapCount"] = b->map_count();
        blocks.push_back(std::move(bj));
      }
      pj["Blocks"] = std::move(blocks);
    }
    return pj;
  };

  ordered_json defaults = ordered_json::array();
  for (Pool* p : default_pools_snapshot_()) defaults.push_back(pool_json(p));
  root["DefaultPools"] = std::move(defaults);

  ordered_json custom = ordered_json::array();
  {
    std::vector<Pool*> snapshot;
    {
      MaybeLockGuard lk(registry_mu_, use_mutex_);
      for (const auto& p : pools_) snapshot.push_back(p.get());
    }
    for (Pool* p : snapshot) custom.push_back(pool_json(p));
  }
  root["CustomPools"] = std::move(custom);

  if (detailed) {
    ordered_json dedicated = ordered_json::array();
    MaybeLockGuard lk(dedicated_mu_, use_mutex_);
    for (std::size_t c = 0; c < dedicated_.size(); ++c) {
      for (const Allocation* a : dedicated_[c]) {
        ordered_json aj = ordered_json::object();
        aj["Category"] = c;
        aj["Type"] = std::string(kind_name(a->kind_));
        aj["Size"] = a->size_;
        if (!a->name_.empty()) aj["Name"] = a->name_;
        ordered_json ud = report::user_data_json(a->user_data_);
        if (!ud.is_null()) aj["UserData"] = std::move(ud);
        dedicated.push_back(std::move(aj));
      }
    }
    root["DedicatedAllocations"] = std::move(dedicated);
  }

  return root.dump(2);
}

// ---- Defragmentation --------------------------------------------------------

std::unique_ptr<DefragmentationContext> Allocator::begin_defragmentation(const DefragmentationInfo& info) {
  std::vector<Pool*> pools = info.pools.empty() ? default_pools_snapshot_() : info.pools;
  for (const Pool* p : pools) {
    if (p == nullptr) {
      core::throw_error(ErrorCode::InvalidArgument, "Allocator::begin_defragmentation", "null pool");
    }
    if (p->algorithm() == PoolAlgorithm::Linear) {
      core::throw_error(ErrorCode::InvalidArgument, "Allocator::begin_defragmentation",
                        "linear pool '" + p->name() + "' cannot be defragmented");
    }
  }
  return std::unique_ptr<DefragmentationContext>(new DefragmentationContext(*this, info, std::move(pools)));
}

#ifdef DEVMEM_INTERNAL_TESTS
bool Allocator::debug_validate_for_testing() const {
  for (Pool* p : all_pools_snapshot_()) {
    MaybeLockGuard lk(p->mu_, use_mutex_);
    for (const DeviceMemoryBlock* b : p->blocks_) {
      if (!b->metadata()->validate()) return false;
    }
  }
  return true;
}

Pool* Allocator::debug_default_pool_for_testing(std::uint32_t category) {
  return default_pool_(category);
}
#endif

}} // namespace devmem::alloc
