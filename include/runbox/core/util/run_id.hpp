// File: include/runbox/core/util/run_id.hpp
#pragma once

#include <string>

#include "runbox/core/types.hpp"

namespace runbox {

// 128 random bits as 32 lowercase hex chars.
RunId generate_run_id();

bool is_valid_run_id(const std::string& s);

}  // namespace runbox
