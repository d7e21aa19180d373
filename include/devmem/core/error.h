// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace devmem {
namespace core {

enum class ErrorCode : std::uint8_t {
  // Explicit numbering; append-only.
  InvalidArgument = 0,
  OutOfDeviceMemory = 1,
  OutOfHostMemory = 2,
  OutOfBudget = 3,
  FeatureNotPresent = 4,
  Corruption = 5,
  InvalidState = 6,
  MemoryMapFailed = 7,
};

std::string_view error_code_name(ErrorCode code) noexcept;

namespace detail {
inline constexpr std::size_t kMaxErrorWhatBytes = 512;

inline std::string truncate_bytes(std::string s, std::size_t max) {
  if (s.size() <= max) return s;
  s.resize(max);
  return s;
}
} // namespace detail

class Error : public std::runtime_error {
 public:
  Error(ErrorCode code, std::string message)
      : std::runtime_error(detail::truncate_bytes(std::move(message), detail::kMaxErrorWhatBytes)),
        code_(code) {}

  ErrorCode code() const noexcept { return code_; }

 private:
  ErrorCode code_;
};

// Throws Error(code, "<context>: <code name>[: detail]").
[[noreturn]] void throw_error(ErrorCode code, std::string_view context, std::string_view detail = {});

} // namespace core
} // namespace devmem
