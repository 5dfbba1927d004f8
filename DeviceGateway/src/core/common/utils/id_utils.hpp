#pragma once

#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace devgw::core::common::id {

// Random RFC 4122 version-4 identifier, e.g. "3f2b8c1e-9a4d-4f6b-8e21-7c0d5a9b1e34".
inline std::string NewUuid() {
  static std::mutex mu;
  static std::mt19937_64 rng{std::random_device{}()};

  std::uint64_t hi = 0;
  std::uint64_t lo = 0;
  {
    std::lock_guard<std::mutex> lk(mu);
    hi = rng();
    lo = rng();
  }
  hi = (hi & 0xffffffffffff0fffULL) | 0x0000000000004000ULL;
  lo = (lo & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;

  const char hex[] = "0123456789abcdef";
  std::string out;
  out.reserve(36);
  for (int i = 15; i >= 0; --i) {
    out.push_back(hex[(hi >> (i * 4)) & 0x0f]);
    if (i == 8 || i == 4) out.push_back('-');
  }
  out.push_back('-');
  for (int i = 15; i >= 0; --i) {
    out.push_back(hex[(lo >> (i * 4)) & 0x0f]);
    if (i == 12) out.push_back('-');
  }
  return out;
}

}  // namespace devgw::core::common::id
