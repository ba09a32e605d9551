// File: src/core/model/retention_sweeper.cpp
#include "runbox/core/model/retention_sweeper.hpp"

#include <algorithm>
#include <chrono>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

#include "runbox/core/util/run_id.hpp"

namespace runbox {
namespace fs = std::filesystem;

RetentionSweeper::RetentionSweeper(std::string base_dir, RetentionConfig cfg)
    : base_dir_(std::move(base_dir)), cfg_(cfg) {}

Result<SweepReport> RetentionSweeper::sweep(bool dry_run) const {
  return sweep_at(fs::file_time_type::clock::now(), dry_run);
}

Result<SweepReport> RetentionSweeper::sweep_at(fs::file_time_type now, bool dry_run) const {
  SweepReport report;
  if (cfg_.max_age_hours < 0 || cfg_.keep_last < 0) {
    return Result<SweepReport>::err(Status::invalid_request("retention values must be >= 0"));
  }
  if (cfg_.max_age_hours == 0 && cfg_.keep_last == 0) return Result<SweepReport>::ok(report);

  std::error_code ec;
  if (!fs::exists(base_dir_, ec)) return Result<SweepReport>::ok(report);

  struct Entry {
    fs::file_time_type mtime;
    fs::path path;
  };

  std::vector<Entry> runs;
  std::error_code list_ec;
  fs::directory_iterator it(base_dir_, list_ec);
  for (const fs::directory_iterator end{}; !list_ec && it != end; it.increment(list_ec)) {
    // Entry errors skip the entry; only listing errors fail the sweep.
    std::error_code entry_ec;
    if (!it->is_directory(entry_ec) || it->is_symlink(entry_ec)) continue;
    if (!is_valid_run_id(it->path().filename().string())) continue;

    const auto mtime = it->last_write_time(entry_ec);
    if (entry_ec) {
      spdlog::debug("skipping {}: {}", it->path().string(), entry_ec.message());
      continue;
    }
    runs.push_back(Entry{mtime, it->path()});
  }
  if (list_ec) {
    return Result<SweepReport>::err(Status::io_error("failed listing '" + base_dir_ + "': " + list_ec.message()));
  }
  report.examined = runs.size();

  // Newest first; names break ties so the order is stable.
  std::sort(runs.begin(), runs.end(), [](const Entry& a, const Entry& b) {
    if (a.mtime != b.mtime) return a.mtime > b.mtime;
    return a.path.filename() < b.path.filename();
  });

  const auto max_age = std::chrono::hours(cfg_.max_age_hours);
  for (std::size_t i = 0; i < runs.size(); ++i) {
    const bool over_count = cfg_.keep_last > 0 && i >= static_cast<std::size_t>(cfg_.keep_last);
    const bool too_old = cfg_.max_age_hours > 0 && now - runs[i].mtime > max_age;
    if (!over_count && !too_old) continue;

    if (!dry_run) {
      fs::remove_all(runs[i].path, ec);
      if (ec) {
        spdlog::warn("failed removing {}: {}", runs[i].path.string(), ec.message());
        report.errors.push_back(runs[i].path.string() + ": " + ec.message());
        ec.clear();
        continue;
      }
    }
    spdlog::debug("{} {}", dry_run ? "would remove" : "removed", runs[i].path.string());
    report.removed.push_back(runs[i].path);
  }

  return Result<SweepReport>::ok(std::move(report));
}

}  // namespace runbox
