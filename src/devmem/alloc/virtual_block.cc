// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "devmem/alloc/virtual_block.h"

#include <optional>
#include <string>
#include <utility>

#include "devmem/core/checked_math.h"
#include "devmem/core/error.h"
#include "devmem/logging/logging.h"
#include "json_report.h"

namespace devmem { namespace alloc {

using core::ErrorCode;

namespace {

std::unique_ptr<BlockMetadata> make_virtual_metadata(const VirtualBlockCreateInfo& info) {
  if (info.size == 0) {
    core::throw_error(ErrorCode::InvalidArgument, "VirtualBlock::VirtualBlock", "size must be > 0");
  }
  if (info.algorithm == PoolAlgorithm::Buddy) {
    core::throw_error(ErrorCode::InvalidArgument, "VirtualBlock::VirtualBlock",
                      "virtual blocks support the free-list and linear algorithms only");
  }
  return make_block_metadata(info.algorithm, info.size, 1, 0, true);
}

} // namespace

VirtualBlock::VirtualBlock(const VirtualBlockCreateInfo& info) : md_(make_virtual_metadata(info)) {}

VirtualBlock::~VirtualBlock() {
  if (!md_->is_empty()) {
    DEVMEM_LOG(WARNING) << "virtual block destroyed with " << md_->allocation_count()
                        << " live allocations";
  }
}

VirtualAllocation VirtualBlock::allocate(const VirtualAllocationCreateInfo& info, DeviceSize* offset) {
  const char* ctx = "VirtualBlock::allocate";
  if (info.size == 0) {
    core::throw_error(ErrorCode::InvalidArgument, ctx, "size must be > 0");
  }
  const DeviceSize alignment = info.alignment == 0 ? 1 : info.alignment;
  if (!core::is_pow2(alignment)) {
    core::throw_error(ErrorCode::InvalidArgument, ctx,
                      "alignment " + std::to_string(alignment) + " is not a power of two");
  }
  const bool upper = (info.flags & kAllocationCreateUpperAddress) != 0;
  if (upper && md_->algorithm() != PoolAlgorithm::Linear) {
    core::throw_error(ErrorCode::InvalidArgument, ctx, "upper address allocations need the linear algorithm");
  }
  const AllocationStrategy strategy = strategy_from_flags(info.flags);

  const std::optional<AllocationRequest> r =
      md_->create_request(info.size, alignment, upper, SuballocationKind::Unknown, strategy);
  if (!r) {
    core::throw_error(ErrorCode::OutOfDeviceMemory, ctx,
                      "no free range of " + std::to_string(info.size) + " bytes");
  }
  md_->alloc(*r, SuballocationKind::Unknown, info.user_data);
  if (offset != nullptr) *offset = r->offset;
  return r->handle;
}

void VirtualBlock::free(VirtualAllocation allocation) {
  if (allocation == kNullAllocHandle) return;
  md_->free(allocation);
}

void VirtualBlock::clear() {
  md_->clear();
}

VirtualAllocationInfo VirtualBlock::get_allocation_info(VirtualAllocation allocation) const {
  const RangeInfo r = md_->allocation_info(allocation);
  VirtualAllocationInfo info;
  info.offset = r.offset;
  info.size = r.size;
  info.user_data = r.user_data;
  return info;
}

void VirtualBlock::set_user_data(VirtualAllocation allocation, void* user_data) {
  md_->set_allocation_user_data(allocation, user_data);
}

Statistics VirtualBlock::statistics() const {
  Statistics s;
  md_->add_statistics(s);
  return s;
}

DetailedStatistics VirtualBlock::detailed_statistics() const {
  DetailedStatistics s;
  md_->add_detailed_statistics(s);
  return s;
}

std::string VirtualBlock::build_stats_string(bool detailed) const {
  using report::ordered_json;
  ordered_json root = ordered_json::object();
  root["Algorithm"] = std::string(algorithm_name(md_->algorithm()));
  root["Stats"] = report::detailed_statistics_json(detailed_statistics());
  if (detailed) {
    root["Block"] = report::block_metadata_json(*md_, [](const RangeInfo& r, ordered_json& out) {
      if (r.user_data != nullptr) out["UserData"] = report::user_data_json(UserData{r.user_data});
    });
  }
  return root.dump(2);
}

}} // namespace devmem::alloc
