// src/core/util/json_text.cpp
#include "runbox/core/util/json_text.hpp"

#include <cstdint>
#include <cstdio>

namespace runbox {
namespace {

void append_u_escape(std::string& out, unsigned int cp) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "\\u%04x", cp & 0xFFFFu);
  out += buf;
}

// Length of a well-formed UTF-8 sequence starting at s[i], or 0.
std::size_t utf8_sequence_length(const std::string& s, std::size_t i) {
  const auto c = static_cast<std::uint8_t>(s[i]);
  std::size_t n = 0;
  if (c >= 0xC2 && c <= 0xDF) n = 2;
  else if (c >= 0xE0 && c <= 0xEF) n = 3;
  else if (c >= 0xF0 && c <= 0xF4) n = 4;
  else return 0;

  if (i + n > s.size()) return 0;
  for (std::size_t k = 1; k < n; ++k) {
    const auto cc = static_cast<std::uint8_t>(s[i + k]);
    if ((cc & 0xC0) != 0x80) return 0;
  }
  return n;
}

}  // namespace

std::string json_quote(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 2);
  out += '"';

  std::size_t i = 0;
  while (i < s.size()) {
    const auto c = static_cast<std::uint8_t>(s[i]);
    if (c < 0x80) {
      switch (c) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        case '\b': out += "\\b"; break;
        case '\f': out += "\\f"; break;
        default:
          if (c < 0x20 || c == 0x7F) append_u_escape(out, c);
          else out += static_cast<char>(c);
      }
      ++i;
      continue;
    }

    const std::size_t n = utf8_sequence_length(s, i);
    if (n == 0) {
      // Stray byte: map it to U+FFFD.
      append_u_escape(out, 0xFFFD);
      ++i;
      continue;
    }
    out.append(s, i, n);
    i += n;
  }

  out += '"';
  return out;
}

}  // namespace runbox
