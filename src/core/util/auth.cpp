// File: src/core/util/auth.cpp
#include "runbox/core/util/auth.hpp"

namespace runbox {

bool token_matches(const std::string& expected, const std::optional<std::string>& provided) {
  if (expected.empty()) return true;
  if (!provided) return false;

  const std::string& got = *provided;
  unsigned char diff = static_cast<unsigned char>(expected.size() != got.size());
  for (std::size_t i = 0; i < expected.size(); ++i) {
    const char g = i < got.size() ? got[i] : '\0';
    diff |= static_cast<unsigned char>(expected[i] ^ g);
  }
  return diff == 0;
}

}  // namespace runbox
