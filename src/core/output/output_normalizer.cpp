// File: src/core/output/output_normalizer.cpp
#include "runbox/core/output/output_normalizer.hpp"

#include <utility>

namespace runbox {

std::string render_outcome(const ExecutionOutcome& outcome, int timeout_seconds) {
  using Kind = ExecutionOutcome::Kind;

  switch (outcome.kind) {
    case Kind::kSuccess:
      return outcome.stdout_text;

    case Kind::kFailure: {
      std::string s;
      s.reserve(outcome.stdout_text.size() + outcome.stderr_text.size() + 64);
      s += "=== STDOUT ===\n";
      s += outcome.stdout_text;
      s += "\n\n=== STDERR ===\n";
      s += outcome.stderr_text;
      s += "\n\nExitCode: ";
      s += std::to_string(outcome.exit_code);
      return s;
    }

    case Kind::kTimedOut: {
      std::string s = "TimeoutExpired: exceeded " + std::to_string(timeout_seconds) + " seconds.\nPartial output:\n";
      s += outcome.stdout_text;
      s += '\n';
      s += outcome.stderr_text;
      return s;
    }

    case Kind::kLaunchError:
      return "Exception during run:\n" + outcome.cause;
  }
  return std::string();
}

std::string truncate_output(std::string text, std::int64_t max_bytes) {
  if (max_bytes < 0 || static_cast<std::uint64_t>(text.size()) <= static_cast<std::uint64_t>(max_bytes)) {
    return text;
  }
  text.resize(static_cast<std::size_t>(max_bytes));
  text += kTruncationMarker;
  return text;
}

std::string normalize_output(const ExecutionOutcome& outcome, int timeout_seconds, std::int64_t max_bytes) {
  return truncate_output(render_outcome(outcome, timeout_seconds), max_bytes);
}

}  // namespace runbox
