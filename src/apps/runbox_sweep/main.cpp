// File: src/apps/runbox_sweep/main.cpp
#include <iostream>
#include <optional>
#include <string>

#include "runbox/core/model/retention_sweeper.hpp"
#include "runbox/core/util/config_loader.hpp"
#include "runbox/core/util/logging.hpp"

namespace {

struct Args {
  std::string config_path;
  std::optional<int> max_age_hours;
  std::optional<int> keep_last;
  bool dry_run{false};
  bool help{false};
  bool bad{false};
};

std::optional<int> parse_count(const std::string& s) {
  if (s.empty() || s.size() > 9) return std::nullopt;
  for (char c : s) {
    if (c < '0' || c > '9') return std::nullopt;
  }
  return std::stoi(s);
}

Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string s = argv[i];
    if (s == "--help" || s == "-h") {
      a.help = true;
      return a;
    }
    if (s == "--dry-run") {
      a.dry_run = true;
      continue;
    }
    if (s == "--config" && i + 1 < argc) {
      a.config_path = argv[++i];
      continue;
    }
    if ((s == "--max-age-hours" || s == "--keep-last") && i + 1 < argc) {
      const auto v = parse_count(argv[++i]);
      if (!v) {
        a.bad = true;
        return a;
      }
      (s == "--keep-last" ? a.keep_last : a.max_age_hours) = v;
      continue;
    }
    a.bad = true;
    return a;
  }
  return a;
}

void print_usage() {
  std::cout << "runbox_sweep\n"
            << "  [--config <path>]\n"
            << "  [--max-age-hours N]  remove run workspaces older than N hours\n"
            << "  [--keep-last N]      keep only the N newest run workspaces\n"
            << "  [--dry-run]          list what would be removed\n";
}

}  // namespace

int main(int argc, char** argv) {
  const Args args = parse_args(argc, argv);
  if (args.help || args.bad) {
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

  if (args.max_age_hours) cfg.retention.max_age_hours = *args.max_age_hours;
  if (args.keep_last) cfg.retention.keep_last = *args.keep_last;

  const runbox::RetentionSweeper sweeper(cfg.workspace.base_dir, cfg.retention);
  auto report_r = sweeper.sweep(args.dry_run);
  if (!report_r.ok()) {
    std::cerr << report_r.status().message() << "\n";
    return 1;
  }

  const runbox::SweepReport& report = *report_r;
  for (const auto& p : report.removed) {
    std::cout << (args.dry_run ? "would remove " : "removed ") << p.string() << "\n";
  }
  std::cout << report.removed.size() << " of " << report.examined << " run workspaces "
            << (args.dry_run ? "selected" : "removed") << "\n";

  return report.errors.empty() ? 0 : 1;
}
