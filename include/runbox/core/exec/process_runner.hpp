// File: include/runbox/core/exec/process_runner.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace runbox {

// Ceilings applied in the child before exec. Zero disables a ceiling.
struct ProcessLimits {
  int cpu_seconds = 0;
  int cpu_grace_seconds = 0;       // hard RLIMIT_CPU = cpu_seconds + grace
  std::int64_t memory_bytes = 0;   // RLIMIT_AS
};

struct SpawnRequest {
  std::string executable;                 // bare names are looked up on PATH
  std::vector<std::string> args;          // argv[1..]
  std::filesystem::path working_dir;      // empty = inherit
  ProcessLimits limits;
  std::chrono::milliseconds timeout{0};   // wall clock, must be > 0

  // Per-stream capture ceiling; bytes beyond it are read and dropped.
  // Zero keeps everything.
  std::size_t max_capture_bytes = 0;
};

struct SpawnResult {
  enum class State {
    kExited,
    kTimedOut,
    kLaunchError,
  };

  State state = State::kLaunchError;
  int exit_code = 0;  // kExited only; negative = terminated by that signal
  std::string stdout_text;
  std::string stderr_text;
  std::string launch_error;

  // Limits that could not be applied. The child still ran.
  std::vector<std::string> warnings;
};

// The process collaborator: spawn(executable, args, limits, timeout).
class ProcessRunner {
 public:
  virtual ~ProcessRunner() = default;

  virtual SpawnResult spawn(const SpawnRequest& req) = 0;
};

// fork/exec with pipes, poll-based capture and a process-group kill on
// timeout. Stateless; safe to share between threads.
class PosixProcessRunner final : public ProcessRunner {
 public:
  SpawnResult spawn(const SpawnRequest& req) override;
};

}  // namespace runbox
