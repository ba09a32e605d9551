// include/runbox/core/config.hpp
#pragma once

#include <cstdint>
#include <string>

#include "runbox/core/status.hpp"

namespace runbox {

// Units policy:
// - Sizes in bytes (int64)
// - Durations in whole seconds; the executor converts to its own clock

constexpr std::int64_t kMiB = 1024 * 1024;

// Address-space ceiling for user programs. Not exposed through YAML or env.
constexpr std::int64_t kMemoryCeilingBytes = 256 * kMiB;

// -----------------------------
// Workspaces
// -----------------------------
struct WorkspaceConfig {
  // One subdirectory per run id lives under here.
  std::string base_dir = "/tmp/runs";

  std::int64_t max_upload_bytes = 50 * kMiB;

  // Archive extraction caps (zip-bomb / hostile archive guard).
  std::int64_t max_extract_bytes = 512 * kMiB;
  int max_archive_entries = 10000;
};

// -----------------------------
// Interpreter family
// -----------------------------
struct RuntimeConfig {
  // Ambient interpreter; a bare name is looked up on PATH.
  std::string interpreter = "python3";

  // Entrypoint candidates are "main" + ext, "app" + ext, then any "*" + ext.
  std::string script_extension = ".py";
};

// -----------------------------
// Dependency bootstrap
// -----------------------------
struct DependencyConfig {
  std::string manifest_name = "requirements.txt";

  // Private environment, relative to the workspace root.
  std::string venv_dir = ".venv";

  // Upgrade pip/setuptools/wheel before installing the manifest.
  bool upgrade_tooling = true;

  int install_timeout_s = 600;
};

// -----------------------------
// Ceilings
// -----------------------------
struct LimitsConfig {
  // Wall-clock timeout and RLIMIT_CPU soft limit.
  int max_run_seconds = 30;

  // RLIMIT_CPU hard limit = max_run_seconds + cpu_grace_seconds.
  int cpu_grace_seconds = 2;

  std::int64_t memory_bytes = kMemoryCeilingBytes;

  std::int64_t max_output_bytes = 200000;

  // Workspace size ceiling for the bundle snapshot (0 disables).
  std::int64_t max_bundle_bytes = 1024 * kMiB;
};

// -----------------------------
// Object store
// -----------------------------
struct StoreConfig {
  std::string type = "s3";  // s3 | local_dir

  std::string bucket;
  std::string region = "us-east-1";
  std::string access_key_id;
  std::string secret_access_key;
  std::string session_token;

  // Optional S3-compatible endpoint (path-style), e.g. http://localhost:9000
  std::string endpoint;

  // local_dir only.
  std::string local_root;

  std::string output_prefix = "outputs";
  std::string bundle_prefix = "bundles";

  int timeout_s = 120;
};

// -----------------------------
// Auth
// -----------------------------
struct AuthConfig {
  // Empty disables the token check (open access).
  std::string api_key;
};

// -----------------------------
// Retention (runbox_sweep)
// -----------------------------
struct RetentionConfig {
  int max_age_hours = 0;   // 0 disables age-based removal
  int keep_last = 0;       // 0 disables count-based removal
};

// -----------------------------
// Logging
// -----------------------------
struct LoggingConfig {
  std::string level = "info";  // trace | debug | info | warn | error | off

  // Per-run JSONL event logs. Empty disables them.
  std::string events_dir;
};

// -----------------------------
// Root config
// -----------------------------
struct Config {
  WorkspaceConfig workspace;
  RuntimeConfig runtime;
  DependencyConfig dependencies;
  LimitsConfig limits;
  StoreConfig store;
  AuthConfig auth;
  RetentionConfig retention;
  LoggingConfig logging;
};

// Minimal validation (keep it strict; fail early).
inline Status validate_config(const Config& cfg) {
  if (cfg.workspace.base_dir.empty()) {
    return Status::invalid_request("workspace.base_dir must not be empty");
  }
  if (cfg.workspace.max_upload_bytes <= 0) {
    return Status::invalid_request("workspace.max_upload_bytes must be > 0");
  }
  if (cfg.workspace.max_extract_bytes <= 0) {
    return Status::invalid_request("workspace.max_extract_bytes must be > 0");
  }
  if (cfg.workspace.max_archive_entries <= 0) {
    return Status::invalid_request("workspace.max_archive_entries must be > 0");
  }
  if (cfg.runtime.interpreter.empty()) {
    return Status::invalid_request("runtime.interpreter must not be empty");
  }
  if (cfg.runtime.script_extension.size() < 2 || cfg.runtime.script_extension[0] != '.') {
    return Status::invalid_request("runtime.script_extension must look like '.py'");
  }
  if (cfg.dependencies.manifest_name.empty()) {
    return Status::invalid_request("dependencies.manifest_name must not be empty");
  }
  if (cfg.dependencies.venv_dir.empty()) {
    return Status::invalid_request("dependencies.venv_dir must not be empty");
  }
  if (cfg.dependencies.install_timeout_s <= 0) {
    return Status::invalid_request("dependencies.install_timeout_s must be > 0");
  }
  if (cfg.limits.max_run_seconds <= 0) {
    return Status::invalid_request("limits.max_run_seconds must be > 0");
  }
  if (cfg.limits.cpu_grace_seconds < 0) {
    return Status::invalid_request("limits.cpu_grace_seconds must be >= 0");
  }
  if (cfg.limits.memory_bytes <= 0) {
    return Status::invalid_request("limits.memory_bytes must be > 0");
  }
  if (cfg.limits.max_output_bytes <= 0) {
    return Status::invalid_request("limits.max_output_bytes must be > 0");
  }
  if (cfg.limits.max_bundle_bytes < 0) {
    return Status::invalid_request("limits.max_bundle_bytes must be >= 0");
  }
  if (cfg.store.type != "s3" && cfg.store.type != "local_dir") {
    return Status::invalid_request("store.type must be 's3' or 'local_dir'");
  }
  if (cfg.store.type == "s3" && cfg.store.bucket.empty()) {
    return Status::invalid_request("store.bucket must not be empty for s3 store");
  }
  if (cfg.store.type == "local_dir" && cfg.store.local_root.empty()) {
    return Status::invalid_request("store.local_root must not be empty for local_dir store");
  }
  if (cfg.store.output_prefix.empty() || cfg.store.bundle_prefix.empty()) {
    return Status::invalid_request("store.output_prefix and store.bundle_prefix must not be empty");
  }
  if (cfg.store.timeout_s <= 0) {
    return Status::invalid_request("store.timeout_s must be > 0");
  }
  if (cfg.retention.max_age_hours < 0 || cfg.retention.keep_last < 0) {
    return Status::invalid_request("retention values must be >= 0");
  }
  return Status::ok_status();
}

}  // namespace runbox
