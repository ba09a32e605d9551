// File: src/core/util/run_id.cpp
#include "runbox/core/util/run_id.hpp"

#include <cstdint>
#include <random>

namespace runbox {

RunId generate_run_id() {
  static const char* kHex = "0123456789abcdef";
  thread_local std::mt19937_64 rng = [] {
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
    return std::mt19937_64(seq);
  }();

  RunId id;
  id.reserve(32);
  for (int half = 0; half < 2; ++half) {
    std::uint64_t v = rng();
    for (int i = 0; i < 16; ++i) {
      id += kHex[v & 0xF];
      v >>= 4;
    }
  }
  return id;
}

bool is_valid_run_id(const std::string& s) {
  if (s.size() != 32) return false;
  for (char c : s) {
    const bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    if (!hex) return false;
  }
  return true;
}

}  // namespace runbox
