// File: src/core/exec/executor.cpp
#include "runbox/core/exec/executor.hpp"

#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

namespace runbox {
namespace fs = std::filesystem;

Executor::Executor(LimitsConfig limits, ProcessRunner& runner)
    : limits_(std::move(limits)), runner_(runner) {}

ExecutionOutcome Executor::run(const std::string& interpreter, const fs::path& entrypoint,
                               const fs::path& workdir, std::vector<std::string>* warnings) const {
  std::error_code ec;
  const fs::path abs_workdir = fs::absolute(workdir, ec);
  if (ec) return ExecutionOutcome::launch_error("cannot resolve " + workdir.string() + ": " + ec.message());

  const fs::path abs_entry = fs::absolute(entrypoint, ec).lexically_normal();
  fs::path script = abs_entry.lexically_relative(abs_workdir.lexically_normal());
  if (script.empty() || *script.begin() == "..") script = abs_entry;

  // "./" keeps a name like "-v.py" from being read as an interpreter option.
  std::string script_arg = script.generic_string();
  if (script.is_relative()) script_arg = "./" + script_arg;

  SpawnRequest req;
  req.executable = interpreter;
  req.args = {script_arg};
  req.working_dir = abs_workdir;
  req.limits.cpu_seconds = limits_.max_run_seconds;
  req.limits.cpu_grace_seconds = limits_.cpu_grace_seconds;
  req.limits.memory_bytes = limits_.memory_bytes;
  req.timeout = std::chrono::seconds(limits_.max_run_seconds);

  // Rendering never keeps more than max_output_bytes of either stream.
  req.max_capture_bytes = static_cast<std::size_t>(limits_.max_output_bytes);

  spdlog::debug("exec: {} {} (cwd {})", req.executable, req.args.front(), abs_workdir.string());
  SpawnResult res = runner_.spawn(req);

  if (warnings) {
    warnings->insert(warnings->end(), res.warnings.begin(), res.warnings.end());
  }

  switch (res.state) {
    case SpawnResult::State::kExited:
      if (res.exit_code == 0) return ExecutionOutcome::success(std::move(res.stdout_text));
      return ExecutionOutcome::failure(std::move(res.stdout_text), std::move(res.stderr_text), res.exit_code);
    case SpawnResult::State::kTimedOut:
      return ExecutionOutcome::timed_out(std::move(res.stdout_text), std::move(res.stderr_text));
    case SpawnResult::State::kLaunchError:
      break;
  }
  return ExecutionOutcome::launch_error(res.launch_error.empty() ? "failed to start " + interpreter
                                                                 : res.launch_error);
}

}  // namespace runbox
