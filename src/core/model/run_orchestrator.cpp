// File: src/core/model/run_orchestrator.cpp
#include "runbox/core/model/run_orchestrator.hpp"

#include <chrono>
#include <exception>
#include <memory>
#include <utility>

#include <spdlog/spdlog.h>

#include "runbox/core/deps/dependency_bootstrapper.hpp"
#include "runbox/core/events/jsonl_event_sink.hpp"
#include "runbox/core/exec/executor.hpp"
#include "runbox/core/output/output_normalizer.hpp"
#include "runbox/core/publish/artifact_publisher.hpp"
#include "runbox/core/util/auth.hpp"
#include "runbox/core/util/repro_hash.hpp"
#include "runbox/core/util/run_id.hpp"
#include "runbox/core/workspace/workspace_manager.hpp"

namespace runbox {

// Per-run event timeline. Event log problems are logged and never fail a run.
class RunOrchestrator::Timeline {
 public:
  explicit Timeline(const std::string& events_dir) {
    if (!events_dir.empty()) sink_ = std::make_unique<JsonlEventSink>(events_dir);
  }

  ~Timeline() { stop(); }

  void start(const RunId& run_id, const std::string& config_hash, const std::string& workspace) {
    t0_steady_ = std::chrono::steady_clock::now();
    t0_wall_ns_ = wall_now_ns();
    if (!sink_) return;

    RunInfo run;
    run.run_id = run_id;
    run.config_hash = config_hash;
    run.workspace = workspace;
    run.wall_start_ns = t0_wall_ns_;

    const Status s = sink_->open(run);
    if (!s.ok()) {
      spdlog::warn("run {}: event log disabled: {}", run_id, s.message());
      sink_.reset();
      return;
    }
    open_ = true;
  }

  void emit(const std::string& type, const std::string& message,
            std::vector<std::pair<std::string, std::string>> fields = {}) {
    if (!open_) return;
    Event e;
    e.type = type;
    e.t_ns = since_start_ns();
    e.t_wall_ns = wall_now_ns();
    e.message = message;
    e.fields = std::move(fields);
    const Status s = sink_->emit(e);
    if (!s.ok()) spdlog::warn("event '{}' not written: {}", type, s.message());
  }

  void stop() {
    if (!open_) return;
    const Status s = sink_->flush();
    if (!s.ok()) spdlog::warn("event log flush failed: {}", s.message());
    sink_->close();
    open_ = false;
  }

 private:
  static std::int64_t wall_now_ns() {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<std::int64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
  }

  std::int64_t since_start_ns() const {
    const auto d = std::chrono::steady_clock::now() - t0_steady_;
    return static_cast<std::int64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(d).count());
  }

  std::unique_ptr<EventSink> sink_;
  bool open_{false};
  std::chrono::steady_clock::time_point t0_steady_{};
  std::int64_t t0_wall_ns_{0};
};

RunOrchestrator::RunOrchestrator(Config cfg, ObjectStore& store, ProcessRunner& runner, RunIdGenerator next_id)
    : cfg_(std::move(cfg)),
      store_(store),
      runner_(runner),
      next_id_(next_id ? std::move(next_id) : RunIdGenerator(generate_run_id)),
      config_hash_(compute_config_hash(cfg_)) {}

Result<RunReport> RunOrchestrator::submit(const SubmitRequest& req) const {
  if (!token_matches(cfg_.auth.api_key, req.token)) {
    spdlog::warn("rejected submission of '{}': bad or missing token", req.filename);
    return Result<RunReport>::err(Status::unauthorized("missing or invalid token"));
  }

  const RunId run_id = next_id_();
  Timeline timeline(cfg_.logging.events_dir);
  const char* stage = "workspace";

  Result<RunReport> result = Result<RunReport>::err(Status::internal("run did not complete"));
  try {
    result = run_(req, run_id, timeline, &stage);
  } catch (const std::exception& e) {
    result = Result<RunReport>::err(Status::internal(std::string(stage) + ": " + e.what()));
  }

  if (!result.ok()) {
    const Status& s = result.status();
    spdlog::error("run {} failed at {}: {}: {}", run_id, stage, code_name(s.code()), s.message());
    timeline.emit("run_failed", s.message(), {{"stage", stage}, {"error", code_name(s.code())}});
  }
  timeline.stop();
  return result;
}

Result<RunReport> RunOrchestrator::run_(const SubmitRequest& req, const RunId& run_id, Timeline& timeline,
                                        const char** stage) const {
  const WorkspaceManager workspaces(cfg_.workspace, cfg_.runtime);

  RunReport report;
  report.run_id = run_id;
  report.workspace = workspaces.workspace_path(run_id);

  timeline.start(run_id, config_hash_, report.workspace.string());
  spdlog::info("run {}: provisioning {} ({} bytes)", run_id, report.workspace.string(), req.payload.size());

  auto ws = workspaces.provision(run_id, req.filename, req.payload);
  if (!ws.ok()) return Result<RunReport>::err(ws.status());

  *stage = "entrypoint";
  auto entry = workspaces.resolve_entrypoint(ws->root, req.entry);
  if (!entry.ok()) return Result<RunReport>::err(entry.status());
  report.entrypoint = *entry;

  timeline.emit("workspace_ready", ws->extracted_archive ? "archive extracted" : "single file",
                {{"entrypoint", report.entrypoint.lexically_relative(ws->root).string()}});

  *stage = "dependencies";
  const DependencyBootstrapper bootstrapper(cfg_.dependencies, cfg_.runtime, runner_);
  auto env = bootstrapper.prepare(ws->root);
  if (!env.ok()) return Result<RunReport>::err(env.status());
  report.isolated_environment = env->isolated;

  timeline.emit("dependencies_ready", env->isolated ? "private environment" : "ambient interpreter",
                {{"interpreter", env->interpreter}});

  *stage = "execute";
  spdlog::info("run {}: executing {}", run_id, report.entrypoint.filename().string());
  const Executor executor(cfg_.limits, runner_);
  const ExecutionOutcome outcome = executor.run(env->interpreter, report.entrypoint, ws->root, &report.warnings);
  report.outcome = outcome.kind;
  report.exit_code = outcome.exit_code;

  for (const auto& w : report.warnings) spdlog::warn("run {}: {}", run_id, w);
  timeline.emit("execution_finished", outcome_kind_name(outcome.kind),
                {{"outcome", outcome_kind_name(outcome.kind)}, {"exit_code", std::to_string(outcome.exit_code)}});

  *stage = "normalize";
  const std::string text = normalize_output(outcome, cfg_.limits.max_run_seconds, cfg_.limits.max_output_bytes);

  *stage = "publish";
  const ArtifactPublisher publisher(cfg_.store, cfg_.limits, store_);
  auto published = publisher.publish(run_id, ws->root, text);
  if (!published.ok()) return Result<RunReport>::err(published.status());
  report.output_url = published->output_url;
  report.bundle_url = published->bundle_url;

  timeline.emit("artifacts_published", "",
                {{"output_url", report.output_url}, {"bundle_url", report.bundle_url}});

  spdlog::info("run {}: done ({}, exit code {})", run_id, outcome_kind_name(outcome.kind), outcome.exit_code);
  return Result<RunReport>::ok(std::move(report));
}

}  // namespace runbox
