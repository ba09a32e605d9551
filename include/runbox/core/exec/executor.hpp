// File: include/runbox/core/exec/executor.hpp
#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "runbox/core/config.hpp"
#include "runbox/core/exec/process_runner.hpp"
#include "runbox/core/types.hpp"

namespace runbox {

// Runs one entrypoint under the configured ceilings. Exactly one attempt.
class Executor {
 public:
  Executor(LimitsConfig limits, ProcessRunner& runner);

  // Child cwd is `workdir`; the entrypoint is passed relative to it.
  // Limits the child could not apply are appended to `warnings` when given.
  ExecutionOutcome run(const std::string& interpreter, const std::filesystem::path& entrypoint,
                       const std::filesystem::path& workdir,
                       std::vector<std::string>* warnings = nullptr) const;

  [[nodiscard]] const LimitsConfig& limits() const noexcept { return limits_; }

 private:
  LimitsConfig limits_;
  ProcessRunner& runner_;
};

}  // namespace runbox
