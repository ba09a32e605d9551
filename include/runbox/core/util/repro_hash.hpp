// include/runbox/core/util/repro_hash.hpp
#pragma once

#include <string>

#include "runbox/core/config.hpp"

namespace runbox {

// Hash the behaviour-relevant runtime config. Secrets (keys, tokens) are left
// out so the fingerprint can be logged.
// Goal: if two runs were configured differently, their hashes differ.
std::string compute_config_hash(const Config& cfg);

}  // namespace runbox
