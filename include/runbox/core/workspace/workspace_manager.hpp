// File: include/runbox/core/workspace/workspace_manager.hpp
#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "runbox/core/config.hpp"
#include "runbox/core/status.hpp"
#include "runbox/core/types.hpp"

namespace runbox {

struct Workspace {
  RunId run_id;
  std::filesystem::path root;
  bool extracted_archive = false;
};

// Owns the per-run directory layout under workspace.base_dir.
// Workspaces are never reused and never cleaned up here (see runbox_sweep).
class WorkspaceManager {
 public:
  WorkspaceManager(WorkspaceConfig cfg, RuntimeConfig runtime);

  // Creates <base_dir>/<run_id>, writes the upload, and unpacks it when it is
  // a zip archive (the saved archive file does not survive).
  // Errors: WorkspaceCollision, InvalidRequest, InvalidArchive, IoError.
  Result<Workspace> provision(const RunId& run_id, const std::string& filename,
                              const std::string& payload) const;

  // Resolution order:
  //  (a) `override_rel`, when it names a regular file inside `root`
  //  (b) main<ext>
  //  (c) app<ext>
  //  (d) first *<ext> in `root` by file name (non-recursive)
  // Errors: NoEntrypoint.
  Result<std::filesystem::path> resolve_entrypoint(
      const std::filesystem::path& root, const std::optional<std::string>& override_rel) const;

  std::filesystem::path workspace_path(const RunId& run_id) const;

  // Upload name reduced to a single safe path component.
  static std::string sanitize_filename(const std::string& filename);

 private:
  Status extract_archive_(const std::filesystem::path& root, const std::string& bytes) const;

  WorkspaceConfig cfg_;
  RuntimeConfig runtime_;
};

// True when `candidate` (after normalisation) stays inside `root`.
bool is_within(const std::filesystem::path& root, const std::filesystem::path& candidate);

}  // namespace runbox
