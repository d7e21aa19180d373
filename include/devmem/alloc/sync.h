// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <mutex>

namespace devmem { namespace alloc {

// lock_guard that is a no-op when the allocator is externally synchronized.
class MaybeLockGuard {
 public:
  MaybeLockGuard(std::mutex& mu, bool enabled) : mu_(enabled ? &mu : nullptr) {
    if (mu_) mu_->lock();
  }
  ~MaybeLockGuard() {
    if (mu_) mu_->unlock();
  }
  MaybeLockGuard(const MaybeLockGuard&) = delete;
  MaybeLockGuard& operator=(const MaybeLockGuard&) = delete;

 private:
  std::mutex* mu_;
};

}} // namespace devmem::alloc
