// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <string_view>

#include "devmem/alloc/types.h"

namespace devmem { namespace alloc {

// Allocator knobs. Parsed once from DEVMEM_ALLOC_CONF unless passed explicitly;
// immutable after Allocator construction.
struct Config {
  DeviceSize  debug_margin{0};              // bytes kept free after each pooled allocation
  bool        detect_corruption{false};     // fill margins with a magic value and verify
  DeviceSize  debug_min_alignment{1};
  bool        debug_always_dedicated{false};
  DeviceSize  small_heap_max_size{1ull << 30};
  DeviceSize  default_large_heap_block_size{256ull << 20};
  std::size_t budget_refresh_ops{30};       // block ops between budget source refreshes
};

inline constexpr const char* kConfigEnvVar = "DEVMEM_ALLOC_CONF";

// Parses "key=value,key=value". Unknown keys and invalid values warn once and
// are ignored; values are normalized after parsing.
Config parse_config(std::string_view conf);

// parse_config(getenv(DEVMEM_ALLOC_CONF)); defaults when unset.
Config config_from_env();

}} // namespace devmem::alloc
