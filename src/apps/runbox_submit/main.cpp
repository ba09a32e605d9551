// File: src/apps/runbox_submit/main.cpp
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

#include <spdlog/spdlog.h>

#include "runbox/adapters/local_dir/local_dir_object_store.hpp"
#include "runbox/adapters/s3/s3_object_store.hpp"
#include "runbox/core/exec/process_runner.hpp"
#include "runbox/core/model/run_orchestrator.hpp"
#include "runbox/core/util/config_loader.hpp"
#include "runbox/core/util/file_io.hpp"
#include "runbox/core/util/json_text.hpp"
#include "runbox/core/util/logging.hpp"

namespace {

struct Args {
  std::string config_path;
  std::string file;
  std::string name;
  std::optional<std::string> entry;
  std::optional<std::string> token;
  bool help{false};
  bool bad{false};
};

Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string s = argv[i];
    if (s == "--help" || s == "-h") {
      a.help = true;
      return a;
    }
    const bool has_value = i + 1 < argc;
    if (s == "--config" && has_value) {
      a.config_path = argv[++i];
    } else if (s == "--file" && has_value) {
      a.file = argv[++i];
    } else if (s == "--name" && has_value) {
      a.name = argv[++i];
    } else if (s == "--entry" && has_value) {
      a.entry = argv[++i];
    } else if (s == "--token" && has_value) {
      a.token = argv[++i];
    } else {
      a.bad = true;
      return a;
    }
  }
  return a;
}

void print_usage() {
  std::cout << "runbox_submit\n"
            << "  --file <path>       script or zip archive to run\n"
            << "  [--config <path>]   YAML config (defaults + environment when omitted)\n"
            << "  [--name <filename>] upload name (default: basename of --file)\n"
            << "  [--entry <rel>]     entrypoint inside the workspace\n"
            << "  [--token <t>]       shared-secret token\n";
}

std::unique_ptr<runbox::ObjectStore> make_store_from_config(const runbox::Config& cfg) {
  if (cfg.store.type == "s3") return std::make_unique<runbox::S3ObjectStore>(cfg.store);
  if (cfg.store.type == "local_dir") return std::make_unique<runbox::LocalDirObjectStore>(cfg.store.local_root);
  return nullptr;
}

void print_error(const runbox::Status& s) {
  std::cout << "{\"error\":" << runbox::json_quote(runbox::code_name(s.code()))
            << ",\"detail\":" << runbox::json_quote(s.message()) << "}\n";
}

void print_report(const runbox::RunReport& r) {
  std::ostringstream ss;
  ss << "{\"status\":\"done\""
     << ",\"run_id\":" << runbox::json_quote(r.run_id)
     << ",\"output_url\":" << runbox::json_quote(r.output_url)
     << ",\"bundle_url\":" << runbox::json_quote(r.bundle_url)
     << ",\"outcome\":" << runbox::json_quote(runbox::outcome_kind_name(r.outcome))
     << ",\"exit_code\":" << r.exit_code
     << ",\"warnings\":[";
  for (std::size_t i = 0; i < r.warnings.size(); ++i) {
    if (i) ss << ",";
    ss << runbox::json_quote(r.warnings[i]);
  }
  ss << "]}";
  std::cout << ss.str() << "\n";
}

}  // namespace

int main(int argc, char** argv) {
  const Args args = parse_args(argc, argv);
  if (args.help || args.bad || args.file.empty()) {
    print_usage();
    return args.help ? 0 : 2;
  }

  auto cfg_r = runbox::load_config(args.config_path);
  if (!cfg_r.ok()) {
    std::cerr << cfg_r.status().message() << "\n";
    return 2;
  }
  runbox::Config cfg = cfg_r.take_value();

  const runbox::Status st_log = runbox::init_logging(cfg.logging);
  if (!st_log.ok()) {
    std::cerr << st_log.message() << "\n";
    return 2;
  }

  std::unique_ptr<runbox::ObjectStore> store = make_store_from_config(cfg);
  if (!store) {
    std::cerr << "Unknown store.type: " << cfg.store.type << "\n";
    return 2;
  }

  auto payload_r = runbox::read_file(args.file);
  if (!payload_r.ok()) {
    print_error(runbox::Status::invalid_request(payload_r.status().message()));
    return 1;
  }

  runbox::SubmitRequest req;
  req.filename = args.name.empty() ? std::filesystem::path(args.file).filename().string() : args.name;
  req.payload = payload_r.take_value();
  req.entry = args.entry;
  req.token = args.token;

  runbox::PosixProcessRunner runner;
  const runbox::RunOrchestrator orchestrator(cfg, *store, runner);

  auto report_r = orchestrator.submit(req);
  if (!report_r.ok()) {
    print_error(report_r.status());
    return 1;
  }

  print_report(*report_r);
  spdlog::default_logger()->flush();
  return 0;
}
