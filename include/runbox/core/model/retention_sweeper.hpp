// File: include/runbox/core/model/retention_sweeper.hpp
#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "runbox/core/config.hpp"
#include "runbox/core/status.hpp"

namespace runbox {

struct SweepReport {
  std::size_t examined = 0;                      // run workspaces seen
  std::vector<std::filesystem::path> removed;    // or would be, on a dry run
  std::vector<std::string> errors;               // per-directory removal failures
};

// Deletes run workspaces under base_dir that are older than max_age_hours
// and/or beyond the newest keep_last. Only run-id-named directories count.
class RetentionSweeper {
 public:
  RetentionSweeper(std::string base_dir, RetentionConfig cfg);

  Result<SweepReport> sweep(bool dry_run) const;
  Result<SweepReport> sweep_at(std::filesystem::file_time_type now, bool dry_run) const;

 private:
  std::string base_dir_;
  RetentionConfig cfg_;
};

}  // namespace runbox
