// src/core/util/config_loader.cpp
#include "runbox/core/util/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <stdexcept>

#include <yaml-cpp/yaml.h>

extern char** environ;

namespace runbox {
namespace fs = std::filesystem;

static std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

static bool is_map(const YAML::Node& n) { return n && n.IsMap(); }

// Recursive merge: maps merge keys; scalars/sequences override.
static YAML::Node merge_yaml(const YAML::Node& base, const YAML::Node& override_) {
  if (!base) return override_;
  if (!override_) return base;

  if (base.IsMap() && override_.IsMap()) {
    YAML::Node out = YAML::Clone(base);
    for (auto it : override_) {
      const auto key = it.first.as<std::string>();
      const auto val = it.second;
      if (out[key]) out[key] = merge_yaml(out[key], val);
      else out[key] = val;
    }
    return out;
  }

  return override_;
}

template <typename T>
static void maybe_set(const YAML::Node& n, const char* key, T& out) {
  if (!n || !n[key]) return;
  out = n[key].as<T>();
}

static Result<YAML::Node> load_yaml_file(const fs::path& path) {
  try {
    if (!fs::exists(path)) {
      return Result<YAML::Node>::err(Status::not_found("config not found: " + path.string()));
    }
    return Result<YAML::Node>::ok(YAML::LoadFile(path.string()));
  } catch (const YAML::Exception& e) {
    return Result<YAML::Node>::err(Status::parse_error("YAML parse error in " + path.string() + ": " + e.what()));
  } catch (const std::exception& e) {
    return Result<YAML::Node>::err(Status::io_error("failed to load " + path.string() + ": " + e.what()));
  }
}

static Result<YAML::Node> load_with_includes(const fs::path& path, int depth) {
  if (depth > 8) {
    return Result<YAML::Node>::err(Status::parse_error("config includes nested too deeply at " + path.string()));
  }

  auto root_r = load_yaml_file(path);
  if (!root_r.ok()) return Result<YAML::Node>::err(root_r.status());
  YAML::Node root = root_r.take_value();

  YAML::Node merged;  // empty
  const fs::path dir = path.parent_path();

  if (root.IsMap() && root["includes"]) {
    const YAML::Node inc = root["includes"];
    if (!inc.IsSequence()) {
      return Result<YAML::Node>::err(Status::parse_error("includes must be a sequence in " + path.string()));
    }
    for (const auto& item : inc) {
      fs::path child = fs::path(item.as<std::string>());
      if (child.is_relative()) child = dir / child;
      auto child_r = load_with_includes(child, depth + 1);
      if (!child_r.ok()) return Result<YAML::Node>::err(child_r.status());
      merged = merge_yaml(merged, child_r.take_value());
    }
    root.remove("includes");
  }

  merged = merge_yaml(merged, root);
  return Result<YAML::Node>::ok(merged);
}

static void apply_yaml(const YAML::Node& y, Config& cfg) {
  if (is_map(y["workspace"])) {
    const auto w = y["workspace"];
    maybe_set(w, "base_dir", cfg.workspace.base_dir);
    maybe_set(w, "max_upload_bytes", cfg.workspace.max_upload_bytes);
    maybe_set(w, "max_extract_bytes", cfg.workspace.max_extract_bytes);
    maybe_set(w, "max_archive_entries", cfg.workspace.max_archive_entries);
  }

  if (is_map(y["runtime"])) {
    const auto r = y["runtime"];
    maybe_set(r, "interpreter", cfg.runtime.interpreter);
    maybe_set(r, "script_extension", cfg.runtime.script_extension);
  }

  if (is_map(y["dependencies"])) {
    const auto d = y["dependencies"];
    maybe_set(d, "manifest_name", cfg.dependencies.manifest_name);
    maybe_set(d, "venv_dir", cfg.dependencies.venv_dir);
    maybe_set(d, "upgrade_tooling", cfg.dependencies.upgrade_tooling);
    maybe_set(d, "install_timeout_s", cfg.dependencies.install_timeout_s);
  }

  // The memory ceiling is deliberately absent here.
  if (is_map(y["limits"])) {
    const auto l = y["limits"];
    maybe_set(l, "max_run_seconds", cfg.limits.max_run_seconds);
    maybe_set(l, "cpu_grace_seconds", cfg.limits.cpu_grace_seconds);
    maybe_set(l, "max_output_bytes", cfg.limits.max_output_bytes);
    maybe_set(l, "max_bundle_bytes", cfg.limits.max_bundle_bytes);
  }

  if (is_map(y["store"])) {
    const auto s = y["store"];
    if (s["type"]) cfg.store.type = to_lower(s["type"].as<std::string>());
    maybe_set(s, "bucket", cfg.store.bucket);
    maybe_set(s, "region", cfg.store.region);
    maybe_set(s, "access_key_id", cfg.store.access_key_id);
    maybe_set(s, "secret_access_key", cfg.store.secret_access_key);
    maybe_set(s, "session_token", cfg.store.session_token);
    maybe_set(s, "endpoint", cfg.store.endpoint);
    maybe_set(s, "local_root", cfg.store.local_root);
    maybe_set(s, "output_prefix", cfg.store.output_prefix);
    maybe_set(s, "bundle_prefix", cfg.store.bundle_prefix);
    maybe_set(s, "timeout_s", cfg.store.timeout_s);
  }

  if (is_map(y["auth"])) {
    maybe_set(y["auth"], "api_key", cfg.auth.api_key);
  }

  if (is_map(y["retention"])) {
    const auto r = y["retention"];
    maybe_set(r, "max_age_hours", cfg.retention.max_age_hours);
    maybe_set(r, "keep_last", cfg.retention.keep_last);
  }

  if (is_map(y["logging"])) {
    const auto l = y["logging"];
    if (l["level"]) cfg.logging.level = to_lower(l["level"].as<std::string>());
    maybe_set(l, "events_dir", cfg.logging.events_dir);
  }
}

static const std::string* env_value(const EnvMap& env, const char* name) {
  const auto it = env.find(name);
  if (it == env.end() || it->second.empty()) return nullptr;
  return &it->second;
}

static void env_string(const EnvMap& env, const char* name, std::string& out) {
  if (const std::string* v = env_value(env, name)) out = *v;
}

template <typename T>
static Status env_integer(const EnvMap& env, const char* name, T& out) {
  const std::string* v = env_value(env, name);
  if (!v) return Status::ok_status();
  try {
    std::size_t used = 0;
    const long long parsed = std::stoll(*v, &used);
    if (used != v->size()) throw std::invalid_argument("trailing characters");
    if (parsed < static_cast<long long>(std::numeric_limits<T>::min()) ||
        parsed > static_cast<long long>(std::numeric_limits<T>::max())) {
      throw std::out_of_range("value out of range");
    }
    out = static_cast<T>(parsed);
  } catch (const std::exception& e) {
    return Status::parse_error(std::string(name) + " must be an integer (got '" + *v + "'): " + e.what());
  }
  return Status::ok_status();
}

EnvMap process_environment() {
  EnvMap env;
  for (char** e = environ; e && *e; ++e) {
    const std::string kv(*e);
    const auto eq = kv.find('=');
    if (eq == std::string::npos) continue;
    env[kv.substr(0, eq)] = kv.substr(eq + 1);
  }
  return env;
}

Status apply_env_overrides(Config& cfg, const EnvMap& env) {
  env_string(env, "RUNBOX_BASE_DIR", cfg.workspace.base_dir);
  env_string(env, "RUNBOX_INTERPRETER", cfg.runtime.interpreter);

  RUNBOX_RETURN_IF_ERROR(env_integer(env, "MAX_RUN_SECONDS", cfg.limits.max_run_seconds));
  RUNBOX_RETURN_IF_ERROR(env_integer(env, "MAX_OUTPUT_BYTES", cfg.limits.max_output_bytes));

  if (const std::string* v = env_value(env, "RUNBOX_STORE")) cfg.store.type = to_lower(*v);
  env_string(env, "S3_BUCKET", cfg.store.bucket);
  env_string(env, "S3_REGION", cfg.store.region);
  env_string(env, "S3_ENDPOINT", cfg.store.endpoint);
  env_string(env, "AWS_ACCESS_KEY_ID", cfg.store.access_key_id);
  env_string(env, "AWS_SECRET_ACCESS_KEY", cfg.store.secret_access_key);
  env_string(env, "AWS_SESSION_TOKEN", cfg.store.session_token);
  env_string(env, "RUNBOX_STORE_ROOT", cfg.store.local_root);

  env_string(env, "API_KEY", cfg.auth.api_key);

  if (const std::string* v = env_value(env, "RUNBOX_LOG_LEVEL")) cfg.logging.level = to_lower(*v);
  env_string(env, "RUNBOX_EVENTS_DIR", cfg.logging.events_dir);

  return Status::ok_status();
}

Result<Config> load_config(const std::string& path_str, const EnvMap& env) {
  Config cfg;  // defaults

  if (!path_str.empty()) {
    auto yaml_r = load_with_includes(fs::path(path_str), 0);
    if (!yaml_r.ok()) return Result<Config>::err(yaml_r.status());
    const YAML::Node y = yaml_r.take_value();

    try {
      apply_yaml(y, cfg);
    } catch (const YAML::Exception& e) {
      return Result<Config>::err(Status::parse_error("bad value in " + path_str + ": " + e.what()));
    }
  }

  const Status env_s = apply_env_overrides(cfg, env);
  if (!env_s.ok()) return Result<Config>::err(env_s);

  // Final validation (fail early).
  const Status s = validate_config(cfg);
  if (!s.ok()) return Result<Config>::err(s);

  return Result<Config>::ok(cfg);
}

Result<Config> load_config(const std::string& path) {
  return load_config(path, process_environment());
}

}  // namespace runbox
