// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cassert>
#include <optional>
#include <absl/log/log.h>

namespace devmem {

// Minimum Abseil severity for devmem processes: 0=INFO, 1=WARNING, 2=ERROR, 3=FATAL.
inline constexpr const char* kLogLevelEnvVar = "DEVMEM_LOG_LEVEL";

// Initializes Abseil logging once. An explicit min_level wins over
// DEVMEM_LOG_LEVEL; with neither the Abseil default stays in effect.
void InitLogging(std::optional<int> min_level);

// DEVMEM_LOG_LEVEL as a severity, nullopt when unset or outside [0, 3].
std::optional<int> LogLevelFromEnv();

} // namespace devmem

#define DEVMEM_LOG(level) LOG(level)
// Device refusals repeat during growth retries; keep them from flooding.
#define DEVMEM_LOG_EVERY_N(level, n) LOG_EVERY_N(level, n)
#define DEVMEM_CHECK(cond) CHECK(cond)
#define DEVMEM_ASSERT(cond) assert(cond)
