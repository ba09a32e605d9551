// File: include/runbox/core/util/auth.hpp
#pragma once

#include <optional>
#include <string>

namespace runbox {

// Shared-secret check. An empty `expected` disables it (open access).
// Comparison time does not depend on where the strings differ.
bool token_matches(const std::string& expected, const std::optional<std::string>& provided);

}  // namespace runbox
