// include/runbox/core/types.hpp
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace runbox {

// -----------------------------
// Basic identifiers
// -----------------------------

using RunId = std::string;          // 32 lowercase hex chars
using ObjectKey = std::string;      // e.g. "outputs/<run_id>.txt"

// -----------------------------
// Ingress
// -----------------------------

struct SubmitRequest {
  std::string filename;                 // suggested name of the upload
  std::string payload;                  // raw uploaded bytes
  std::optional<std::string> entry;     // relative path inside the workspace
  std::optional<std::string> token;     // shared-secret token
};

// -----------------------------
// Execution outcome
// -----------------------------
// Exactly one kind holds per run. Fields not meaningful for a kind stay empty.

struct ExecutionOutcome {
  enum class Kind {
    kSuccess,
    kFailure,
    kTimedOut,
    kLaunchError,
  };

  Kind kind = Kind::kLaunchError;
  std::string stdout_text;
  std::string stderr_text;
  int exit_code = 0;        // kSuccess / kFailure only; negative = killed by signal
  std::string cause;        // kLaunchError only

  static ExecutionOutcome success(std::string out) {
    ExecutionOutcome o;
    o.kind = Kind::kSuccess;
    o.stdout_text = std::move(out);
    return o;
  }

  static ExecutionOutcome failure(std::string out, std::string err, int exit_code) {
    ExecutionOutcome o;
    o.kind = Kind::kFailure;
    o.stdout_text = std::move(out);
    o.stderr_text = std::move(err);
    o.exit_code = exit_code;
    return o;
  }

  static ExecutionOutcome timed_out(std::string partial_out, std::string partial_err) {
    ExecutionOutcome o;
    o.kind = Kind::kTimedOut;
    o.stdout_text = std::move(partial_out);
    o.stderr_text = std::move(partial_err);
    return o;
  }

  static ExecutionOutcome launch_error(std::string cause) {
    ExecutionOutcome o;
    o.kind = Kind::kLaunchError;
    o.cause = std::move(cause);
    return o;
  }
};

const char* outcome_kind_name(ExecutionOutcome::Kind kind) noexcept;

// -----------------------------
// Artifacts
// -----------------------------

struct Artifact {
  ObjectKey key;
  std::string bytes;
  std::string content_type;
};

struct PublishedArtifacts {
  std::string output_url;
  std::string bundle_url;
};

// -----------------------------
// Run result
// -----------------------------

struct RunReport {
  RunId run_id;
  std::filesystem::path workspace;
  std::filesystem::path entrypoint;
  bool isolated_environment = false;   // true when a venv was provisioned

  ExecutionOutcome::Kind outcome = ExecutionOutcome::Kind::kSuccess;
  int exit_code = 0;

  std::string output_url;
  std::string bundle_url;

  // Non-fatal problems, e.g. a resource ceiling that could not be applied.
  std::vector<std::string> warnings;
};

}  // namespace runbox
