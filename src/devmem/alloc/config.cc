// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "devmem/alloc/config.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <mutex>
#include <string>
#include <unordered_set>

#include "devmem/core/checked_math.h"
#include "devmem/logging/logging.h"

namespace devmem { namespace alloc {

namespace {

void warn_once(const std::string& key, const std::string& what) {
  static std::mutex s_warned_mu;
  static std::unordered_set<std::string> s_warned;
  std::lock_guard<std::mutex> lk(s_warned_mu);
  if (s_warned.insert(key).second) {
    DEVMEM_LOG(WARNING) << "[" << kConfigEnvVar << "] " << what;
  }
}

} // namespace

Config parse_config(std::string_view conf) {
  Config cfg;
  if (conf.empty()) return cfg;
  auto is_space = [](char c){ return c==' '||c=='\t'||c=='\n'||c=='\r'; };
  std::string s(conf);
  std::size_t i = 0;
  auto trim = [&](std::string& t){ std::size_t a=0; while (a<t.size() && is_space(t[a])) ++a; std::size_t b=t.size(); while (b>a && is_space(t[b-1])) --b; t = t.substr(a, b-a); };
  auto to_uint = [&](const std::string& t, std::uint64_t& out)->bool{
    if (t.empty()) return false;
    for (unsigned char ch : t) {
      if (!std::isdigit(ch)) return false;
    }
    char* end=nullptr; errno=0; unsigned long long x = std::strtoull(t.c_str(), &end, 10);
    if (errno!=0 || (end && *end!='\0')) return false;
    out = static_cast<std::uint64_t>(x); return true; };
  auto to_bytes = [&](const std::string& t, std::uint64_t& out)->bool{
    std::string u=t; for (auto& c: u) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    std::uint64_t mul=1; if (u.size()>=3){ auto suf = u.substr(u.size()-3); if (suf=="kib") { mul=1ull<<10; u.resize(u.size()-3);} else if (suf=="mib") { mul=1ull<<20; u.resize(u.size()-3);} else if (suf=="gib") { mul=1ull<<30; u.resize(u.size()-3);} }
    std::uint64_t base=0; if (!to_uint(u, base)) return false;
    return core::checked_mul_u64(base, mul, out); };
  auto to_bool = [&](const std::string& t, bool& out)->bool{
    std::string u=t; for (auto& c:u) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (u=="1"||u=="true"||u=="yes"||u=="on") { out=true; return true; }
    if (u=="0"||u=="false"||u=="no"||u=="off") { out=false; return true; }
    return false; };
  auto invalid = [&](const std::string& key, const std::string& val) {
    warn_once(key + "=" + val, "invalid value '" + val + "' for key '" + key + "' (ignored)");
  };
  while (i < s.size()) {
    while (i < s.size() && (is_space(s[i]) || s[i]==',')) ++i; if (i>=s.size()) break;
    std::size_t k0=i; while (i<s.size() && s[i] != '=' && s[i] != ',') ++i;
    if (i>=s.size() || s[i] != '=') {
      std::string key = s.substr(k0, i-k0); trim(key);
      warn_once(key, "key '" + key + "' has no value (ignored)");
      continue;
    }
    std::string key = s.substr(k0, i-k0); ++i;
    std::size_t v0=i; while (i<s.size() && s[i] != ',') ++i; std::string val = s.substr(v0, i-v0);
    trim(key); trim(val);
    std::uint64_t v=0; bool b=false;
    if (key == "debug_margin") { if (to_bytes(val, v)) cfg.debug_margin = v; else invalid(key, val); }
    else if (key == "detect_corruption") { if (to_bool(val, b)) cfg.detect_corruption = b; else invalid(key, val); }
    else if (key == "debug_min_alignment") { if (to_bytes(val, v)) cfg.debug_min_alignment = v; else invalid(key, val); }
    else if (key == "debug_always_dedicated") { if (to_bool(val, b)) cfg.debug_always_dedicated = b; else invalid(key, val); }
    else if (key == "small_heap_max_size") { if (to_bytes(val, v)) cfg.small_heap_max_size = v; else invalid(key, val); }
    else if (key == "default_large_heap_block_size") { if (to_bytes(val, v) && v > 0) cfg.default_large_heap_block_size = v; else invalid(key, val); }
    else if (key == "budget_refresh_ops") { if (to_uint(val, v)) cfg.budget_refresh_ops = static_cast<std::size_t>(v); else invalid(key, val); }
    else {
      warn_once(key, "unknown key '" + key + "' (ignored)");
    }
  }
  // Post-parse normalization
  if (cfg.debug_min_alignment == 0) cfg.debug_min_alignment = 1;
  if (!core::is_pow2(cfg.debug_min_alignment)) {
    warn_once("debug_min_alignment", "debug_min_alignment is not a power of two; rounding up");
    cfg.debug_min_alignment = core::next_pow2(cfg.debug_min_alignment);
  }
  // Margins hold whole 32-bit magic words.
  cfg.debug_margin = core::align_up(cfg.debug_margin, 4);
  if (cfg.detect_corruption && cfg.debug_margin == 0) {
    warn_once("detect_corruption", "detect_corruption requires debug_margin > 0; disabled");
    cfg.detect_corruption = false;
  }
  if (cfg.budget_refresh_ops == 0) cfg.budget_refresh_ops = 1;
  return cfg;
}

Config config_from_env() {
  const char* env = std::getenv(kConfigEnvVar);
  if (!env || !*env) return Config{};
  return parse_config(env);
}

}} // namespace devmem::alloc
