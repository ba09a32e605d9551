// File: include/runbox/core/deps/dependency_bootstrapper.hpp
#pragma once

#include <filesystem>
#include <string>

#include "runbox/core/config.hpp"
#include "runbox/core/exec/process_runner.hpp"
#include "runbox/core/status.hpp"

namespace runbox {

// Interpreter a run executes with.
struct RunEnvironment {
  std::string interpreter;
  bool isolated = false;  // private venv under the workspace
};

// Without a manifest: the ambient interpreter, nothing spawned.
// With one: venv, optional tooling upgrade, then `pip install -r`.
class DependencyBootstrapper {
 public:
  DependencyBootstrapper(DependencyConfig deps, RuntimeConfig runtime, ProcessRunner& runner);

  // Errors: DependencyInstallFailed (carries the installer's diagnostics).
  Result<RunEnvironment> prepare(const std::filesystem::path& root) const;

 private:
  Status run_step_(const std::string& step, SpawnRequest req) const;

  DependencyConfig deps_;
  RuntimeConfig runtime_;
  ProcessRunner& runner_;
};

}  // namespace runbox
