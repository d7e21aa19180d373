// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "devmem/alloc/device_provider.h"

namespace devmem { namespace alloc {

core::ErrorCode to_error_code(DeviceStatus s) noexcept {
  switch (s) {
    case DeviceStatus::OutOfHostMemory: return core::ErrorCode::OutOfHostMemory;
    case DeviceStatus::FeatureNotPresent: return core::ErrorCode::FeatureNotPresent;
    case DeviceStatus::MemoryMapFailed: return core::ErrorCode::MemoryMapFailed;
    case DeviceStatus::Ok:
    case DeviceStatus::OutOfDeviceMemory:
      break;
  }
  return core::ErrorCode::OutOfDeviceMemory;
}

}} // namespace devmem::alloc
