// File: include/runbox/core/output/output_normalizer.hpp
#pragma once

#include <cstdint>
#include <string>

#include "runbox/core/types.hpp"

namespace runbox {

inline constexpr const char* kTruncationMarker = "\n\n...OUTPUT_TRUNCATED...";

// Outcome -> single text:
//   Success     raw stdout
//   Failure     "=== STDOUT ===\n..\n\n=== STDERR ===\n..\n\nExitCode: N"
//   TimedOut    "TimeoutExpired: exceeded S seconds.\nPartial output:\n<out>\n<err>"
//   LaunchError "Exception during run:\n<cause>"
std::string render_outcome(const ExecutionOutcome& outcome, int timeout_seconds);

// Cuts to exactly max_bytes and appends kTruncationMarker when longer.
std::string truncate_output(std::string text, std::int64_t max_bytes);

// render_outcome + truncate_output.
std::string normalize_output(const ExecutionOutcome& outcome, int timeout_seconds, std::int64_t max_bytes);

}  // namespace runbox
