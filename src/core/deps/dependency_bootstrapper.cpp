// File: src/core/deps/dependency_bootstrapper.cpp
#include "runbox/core/deps/dependency_bootstrapper.hpp"

#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

namespace runbox {
namespace fs = std::filesystem;

namespace {

std::string join_args(const SpawnRequest& req) {
  std::string s = req.executable;
  for (const auto& a : req.args) {
    s += ' ';
    s += a;
  }
  return s;
}

}  // namespace

DependencyBootstrapper::DependencyBootstrapper(DependencyConfig deps, RuntimeConfig runtime, ProcessRunner& runner)
    : deps_(std::move(deps)), runtime_(std::move(runtime)), runner_(runner) {}

Result<RunEnvironment> DependencyBootstrapper::prepare(const fs::path& root) const {
  std::error_code ec;
  const fs::path abs_root = fs::absolute(root, ec);
  if (ec) {
    return Result<RunEnvironment>::err(
        Status::io_error("cannot resolve workspace " + root.string() + ": " + ec.message()));
  }

  const fs::path manifest = abs_root / deps_.manifest_name;
  if (!fs::is_regular_file(manifest, ec)) {
    return Result<RunEnvironment>::ok(RunEnvironment{runtime_.interpreter, false});
  }

  const fs::path venv = abs_root / deps_.venv_dir;
  const std::string pip = (venv / "bin" / "pip").string();

  SpawnRequest base;
  base.working_dir = abs_root;
  base.timeout = std::chrono::seconds(deps_.install_timeout_s);

  spdlog::info("installing dependencies from {}", manifest.string());

  SpawnRequest create = base;
  create.executable = runtime_.interpreter;
  create.args = {"-m", "venv", venv.string()};
  RUNBOX_RESULT_RETURN_IF_ERROR(RunEnvironment, run_step_("venv creation", std::move(create)));

  if (deps_.upgrade_tooling) {
    SpawnRequest upgrade = base;
    upgrade.executable = pip;
    upgrade.args = {"install", "--upgrade", "pip", "setuptools", "wheel"};
    RUNBOX_RESULT_RETURN_IF_ERROR(RunEnvironment, run_step_("tooling upgrade", std::move(upgrade)));
  }

  SpawnRequest install = base;
  install.executable = pip;
  install.args = {"install", "-r", manifest.string()};
  RUNBOX_RESULT_RETURN_IF_ERROR(RunEnvironment, run_step_("pip install", std::move(install)));

  return Result<RunEnvironment>::ok(RunEnvironment{(venv / "bin" / "python").string(), true});
}

Status DependencyBootstrapper::run_step_(const std::string& step, SpawnRequest req) const {
  spdlog::debug("{}: {}", step, join_args(req));
  const SpawnResult res = runner_.spawn(req);

  switch (res.state) {
    case SpawnResult::State::kExited: {
      if (res.exit_code == 0) return Status::ok_status();
      const std::string& diag = res.stderr_text.empty() ? res.stdout_text : res.stderr_text;
      spdlog::error("{} failed with exit code {}", step, res.exit_code);
      return Status::dependency_install_failed(step + " failed (exit code " + std::to_string(res.exit_code) +
                                               "):\n" + diag);
    }
    case SpawnResult::State::kTimedOut:
      spdlog::error("{} exceeded {} s", step, deps_.install_timeout_s);
      return Status::dependency_install_failed(step + " exceeded " + std::to_string(deps_.install_timeout_s) +
                                               " seconds:\n" +
                                               (res.stderr_text.empty() ? res.stdout_text : res.stderr_text));
    case SpawnResult::State::kLaunchError:
      break;
  }
  spdlog::error("{} could not start: {}", step, res.launch_error);
  return Status::dependency_install_failed(step + " could not start: " + res.launch_error);
}

}  // namespace runbox
