// File: include/runbox/core/model/run_orchestrator.hpp
#pragma once

#include <functional>
#include <string>

#include "runbox/core/config.hpp"
#include "runbox/core/exec/process_runner.hpp"
#include "runbox/core/status.hpp"
#include "runbox/core/store/object_store.hpp"
#include "runbox/core/types.hpp"

namespace runbox {

// RunOrchestrator owns one run's lifecycle:
//   auth -> workspace -> entrypoint -> dependencies -> execute -> normalize -> publish
//
// Stage failures short-circuit with their own error kind. Non-zero exits,
// timeouts and launch errors are outcomes, not errors: they are rendered and
// published like any other run.
//
// Event time contract (per-run JSONL, when logging.events_dir is set):
//  - t_ns      = relative since run start using steady clock
//  - t_wall_ns = absolute epoch ns
class RunOrchestrator {
 public:
  using RunIdGenerator = std::function<RunId()>;

  // `store` and `runner` must outlive the orchestrator.
  RunOrchestrator(Config cfg, ObjectStore& store, ProcessRunner& runner, RunIdGenerator next_id = {});

  // Blocking; one call = one run. Safe to call from several threads.
  Result<RunReport> submit(const SubmitRequest& req) const;

  [[nodiscard]] const Config& config() const noexcept { return cfg_; }

 private:
  class Timeline;

  Result<RunReport> run_(const SubmitRequest& req, const RunId& run_id, Timeline& timeline,
                         const char** stage) const;

  Config cfg_;
  ObjectStore& store_;
  ProcessRunner& runner_;
  RunIdGenerator next_id_;
  std::string config_hash_;
};

}  // namespace runbox
