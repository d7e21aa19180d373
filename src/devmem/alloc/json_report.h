// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <functional>

#include <nlohmann/json.hpp>

#include "devmem/alloc/metadata.h"
#include "devmem/alloc/stats.h"
#include "devmem/alloc/types.h"

namespace devmem { namespace alloc { namespace report {

using ordered_json = nlohmann::ordered_json;

ordered_json statistics_json(const Statistics& s);
// Min/max fields are omitted when nothing was counted.
ordered_json detailed_statistics_json(const DetailedStatistics& s);
ordered_json budget_json(const Budget& b);
ordered_json property_flags_json(MemoryPropertyFlags flags);
ordered_json user_data_json(const UserData& u);

// Adds caller-specific fields for a used range.
using RangeDescriber = std::function<void(const RangeInfo&, ordered_json&)>;

// {"TotalBytes", "UnusedBytes", "Allocations", "UnusedRanges", "Ranges": [...]}.
ordered_json block_metadata_json(const BlockMetadata& md, const RangeDescriber& describe);

}}} // namespace devmem::alloc::report
