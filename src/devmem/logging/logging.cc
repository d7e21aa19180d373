// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "devmem/logging/logging.h"

#include <cstdlib>
#include <mutex>
#include <string_view>
#include <absl/base/log_severity.h>
#include <absl/log/globals.h>
#include <absl/log/initialize.h>

namespace devmem {
namespace {
std::once_flag g_init_once;
}

std::optional<int> LogLevelFromEnv() {
  const char* env = std::getenv(kLogLevelEnvVar);
  if (env == nullptr) return std::nullopt;
  const std::string_view v(env);
  if (v.size() != 1 || v[0] < '0' || v[0] > '3') return std::nullopt;
  return v[0] - '0';
}

void InitLogging(std::optional<int> min_level) {
  std::call_once(g_init_once, [] { absl::InitializeLog(); });
  const std::optional<int> level = min_level ? min_level : LogLevelFromEnv();
  if (level) {
    absl::SetMinLogLevel(static_cast<absl::LogSeverityAtLeast>(
        absl::NormalizeLogSeverity(*level)));
  }
}

} // namespace devmem
