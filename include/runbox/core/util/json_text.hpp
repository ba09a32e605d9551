// include/runbox/core/util/json_text.hpp
#pragma once

#include <string>

namespace runbox {

// Quoted JSON string literal for `s`. Control characters and invalid UTF-8
// bytes are written as \u escapes so the line stays valid JSON.
std::string json_quote(const std::string& s);

}  // namespace runbox
