// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "devmem/core/error.h"

namespace devmem {
namespace core {

std::string_view error_code_name(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::InvalidArgument: return "invalid argument";
    case ErrorCode::OutOfDeviceMemory: return "out of device memory";
    case ErrorCode::OutOfHostMemory: return "out of host memory";
    case ErrorCode::OutOfBudget: return "out of budget";
    case ErrorCode::FeatureNotPresent: return "feature not present";
    case ErrorCode::Corruption: return "corruption detected";
    case ErrorCode::InvalidState: return "invalid state";
    case ErrorCode::MemoryMapFailed: return "memory map failed";
  }
  return "unknown error";
}

void throw_error(ErrorCode code, std::string_view context, std::string_view detail) {
  std::string msg;
  msg.reserve(context.size() + detail.size() + 32);
  msg.append(context);
  msg.append(": ");
  msg.append(error_code_name(code));
  if (!detail.empty()) {
    msg.append(": ");
    msg.append(detail);
  }
  throw Error(code, std::move(msg));
}

} // namespace core
} // namespace devmem
