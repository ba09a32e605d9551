// include/runbox/core/util/config_loader.hpp
#pragma once

#include <map>
#include <string>

#include "runbox/core/config.hpp"
#include "runbox/core/status.hpp"

namespace runbox {

using EnvMap = std::map<std::string, std::string>;

// Snapshot of the process environment.
EnvMap process_environment();

// Applies the environment-style overrides (S3_BUCKET, MAX_RUN_SECONDS, ...).
// Unset or empty variables leave the config untouched.
Status apply_env_overrides(Config& cfg, const EnvMap& env);

// Loads a YAML config file (supports optional `includes:` for layering).
// - Includes are loaded first (in order), then overridden by the main file.
// - Relative include paths are resolved relative to the including file.
// - An empty path means "defaults only".
// Environment overrides are applied last, then the result is validated.
Result<Config> load_config(const std::string& path, const EnvMap& env);

// Same as above with the real process environment.
Result<Config> load_config(const std::string& path);

}  // namespace runbox
