// src/core/util/repro_hash.cpp
#include "runbox/core/util/repro_hash.hpp"

#include <cstdint>
#include <string>

namespace runbox {
namespace {

// FNV-1a 64-bit. Not cryptographic; a stable fingerprint is all we need.
struct Fnv1a64 {
  std::uint64_t h = 1469598103934665603ull;

  void add_bytes(const void* data, std::size_t n) {
    const auto* p = static_cast<const std::uint8_t*>(data);
    for (std::size_t i = 0; i < n; ++i) {
      h ^= static_cast<std::uint64_t>(p[i]);
      h *= 1099511628211ull;
    }
  }

  void add_u64(std::uint64_t v) { add_bytes(&v, sizeof(v)); }
  void add_i64(std::int64_t v)  { add_bytes(&v, sizeof(v)); }
  void add_i32(std::int32_t v)  { add_bytes(&v, sizeof(v)); }

  void add_bool(bool v) {
    const std::uint8_t b = v ? 1u : 0u;
    add_bytes(&b, sizeof(b));
  }

  void add_string(const std::string& s) {
    // Include length so ("ab","c") != ("a","bc") in concatenations.
    add_u64(static_cast<std::uint64_t>(s.size()));
    add_bytes(s.data(), s.size());
  }
};

std::string to_hex(std::uint64_t v) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[static_cast<std::size_t>(i)] = kHex[v & 0xF];
    v >>= 4;
  }
  return out;
}

}  // namespace

std::string compute_config_hash(const Config& cfg) {
  Fnv1a64 h;

  // Workspace.
  h.add_string(cfg.workspace.base_dir);
  h.add_i64(cfg.workspace.max_upload_bytes);
  h.add_i64(cfg.workspace.max_extract_bytes);
  h.add_i32(cfg.workspace.max_archive_entries);

  // Runtime.
  h.add_string(cfg.runtime.interpreter);
  h.add_string(cfg.runtime.script_extension);

  // Dependencies.
  h.add_string(cfg.dependencies.manifest_name);
  h.add_string(cfg.dependencies.venv_dir);
  h.add_bool(cfg.dependencies.upgrade_tooling);
  h.add_i32(cfg.dependencies.install_timeout_s);

  // Limits.
  h.add_i32(cfg.limits.max_run_seconds);
  h.add_i32(cfg.limits.cpu_grace_seconds);
  h.add_i64(cfg.limits.memory_bytes);
  h.add_i64(cfg.limits.max_output_bytes);
  h.add_i64(cfg.limits.max_bundle_bytes);

  // Store (location only, never credentials).
  h.add_string(cfg.store.type);
  h.add_string(cfg.store.bucket);
  h.add_string(cfg.store.region);
  h.add_string(cfg.store.endpoint);
  h.add_string(cfg.store.local_root);
  h.add_string(cfg.store.output_prefix);
  h.add_string(cfg.store.bundle_prefix);
  h.add_i32(cfg.store.timeout_s);

  // Whether auth is on matters; the key itself does not go in.
  h.add_bool(!cfg.auth.api_key.empty());

  return to_hex(h.h);
}

}  // namespace runbox
