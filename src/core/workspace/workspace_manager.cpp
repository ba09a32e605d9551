// File: src/core/workspace/workspace_manager.cpp
#include "runbox/core/workspace/workspace_manager.hpp"

#include <algorithm>
#include <system_error>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "runbox/core/util/file_io.hpp"
#include "runbox/core/util/zip_archive.hpp"

namespace runbox {
namespace fs = std::filesystem;

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Rejects absolute names, ".." components and embedded NULs.
Status validate_entry_name(const std::string& name) {
  if (name.empty()) return Status::invalid_archive("archive entry with empty name");
  if (name.find('\0') != std::string::npos) return Status::invalid_archive("archive entry name contains NUL");

  const fs::path rel(name);
  if (rel.is_absolute() || rel.has_root_name() || rel.has_root_directory()) {
    return Status::invalid_archive("absolute path in archive: " + name);
  }
  for (const auto& part : rel) {
    if (part == "..") return Status::invalid_archive("path traversal in archive: " + name);
  }
  return Status::ok_status();
}

}  // namespace

bool is_within(const fs::path& root, const fs::path& candidate) {
  const fs::path r = root.lexically_normal();
  const fs::path c = candidate.lexically_normal();
  const fs::path rel = c.lexically_relative(r);
  if (rel.empty()) return false;
  const auto first = rel.begin();
  return first == rel.end() || *first != "..";
}

WorkspaceManager::WorkspaceManager(WorkspaceConfig cfg, RuntimeConfig runtime)
    : cfg_(std::move(cfg)), runtime_(std::move(runtime)) {}

fs::path WorkspaceManager::workspace_path(const RunId& run_id) const {
  return fs::path(cfg_.base_dir) / run_id;
}

std::string WorkspaceManager::sanitize_filename(const std::string& filename) {
  std::string name = filename;
  name.erase(std::remove(name.begin(), name.end(), '\0'), name.end());

  // Browsers on Windows may send a full client path.
  const auto slash = name.find_last_of("/\\");
  if (slash != std::string::npos) name = name.substr(slash + 1);

  if (name.empty() || name == "." || name == "..") return "upload";
  return name;
}

Result<Workspace> WorkspaceManager::provision(const RunId& run_id, const std::string& filename,
                                              const std::string& payload) const {
  if (static_cast<std::int64_t>(payload.size()) > cfg_.max_upload_bytes) {
    return Result<Workspace>::err(Status::invalid_request(
        "upload exceeds " + std::to_string(cfg_.max_upload_bytes) + " bytes"));
  }
  if (run_id.empty() || run_id.find('/') != std::string::npos || run_id == "." || run_id == "..") {
    return Result<Workspace>::err(Status::internal("malformed run id '" + run_id + "'"));
  }

  std::error_code ec;
  fs::create_directories(cfg_.base_dir, ec);
  if (ec) {
    return Result<Workspace>::err(
        Status::io_error("failed creating base_dir '" + cfg_.base_dir + "': " + ec.message()));
  }

  Workspace ws;
  ws.run_id = run_id;
  ws.root = workspace_path(run_id);

  // create_directory reports false (without error) when the path exists.
  const bool created = fs::create_directory(ws.root, ec);
  if (ec) {
    return Result<Workspace>::err(
        Status::io_error("failed creating workspace '" + ws.root.string() + "': " + ec.message()));
  }
  if (!created) {
    return Result<Workspace>::err(Status::workspace_collision("workspace already exists: " + ws.root.string()));
  }

  const fs::path saved = ws.root / sanitize_filename(filename);
  RUNBOX_RESULT_RETURN_IF_ERROR(Workspace, write_file(saved, payload));

  if (looks_like_zip(payload)) {
    // Drop the archive first so an entry with the same name survives.
    fs::remove(saved, ec);
    if (ec) {
      return Result<Workspace>::err(Status::io_error("failed removing archive " + saved.string() + ": " + ec.message()));
    }
    RUNBOX_RESULT_RETURN_IF_ERROR(Workspace, extract_archive_(ws.root, payload));
    ws.extracted_archive = true;
  }

  spdlog::debug("workspace {} ready ({})", ws.root.string(), ws.extracted_archive ? "archive" : "single file");
  return Result<Workspace>::ok(std::move(ws));
}

Status WorkspaceManager::extract_archive_(const fs::path& root, const std::string& bytes) const {
  auto reader_r = ZipReader::open(bytes);
  if (!reader_r.ok()) return reader_r.status();
  const ZipReader& reader = *reader_r;

  const auto& entries = reader.entries();
  if (static_cast<std::int64_t>(entries.size()) > cfg_.max_archive_entries) {
    return Status::invalid_archive("archive has " + std::to_string(entries.size()) + " entries (limit " +
                                   std::to_string(cfg_.max_archive_entries) + ")");
  }

  // Validate everything before writing anything.
  std::uint64_t total = 0;
  for (const auto& e : entries) {
    RUNBOX_RETURN_IF_ERROR(validate_entry_name(e.name));
    if (e.is_symlink) return Status::invalid_archive("symlinks are not allowed in archives: " + e.name);
    if (!is_within(root, root / e.name)) return Status::invalid_archive("entry escapes workspace: " + e.name);
    total += e.uncompressed_size;
  }
  if (total > static_cast<std::uint64_t>(cfg_.max_extract_bytes)) {
    return Status::invalid_archive("archive expands to " + std::to_string(total) + " bytes (limit " +
                                   std::to_string(cfg_.max_extract_bytes) + ")");
  }

  std::error_code ec;
  for (const auto& e : entries) {
    const fs::path target = (root / e.name).lexically_normal();

    if (e.is_directory) {
      fs::create_directories(target, ec);
      if (ec) return Status::invalid_archive("cannot create directory " + e.name + ": " + ec.message());
      continue;
    }

    fs::create_directories(target.parent_path(), ec);
    if (ec) return Status::invalid_archive("cannot create parent of " + e.name + ": " + ec.message());

    auto data = reader.read(e);
    if (!data.ok()) return data.status();
    RUNBOX_RETURN_IF_ERROR(write_file(target, *data));
  }

  spdlog::debug("extracted {} entries ({} bytes) into {}", entries.size(), total, root.string());
  return Status::ok_status();
}

Result<fs::path> WorkspaceManager::resolve_entrypoint(const fs::path& root,
                                                      const std::optional<std::string>& override_rel) const {
  std::error_code ec;

  if (override_rel && !override_rel->empty()) {
    const fs::path rel(*override_rel);
    const fs::path candidate = (root / rel).lexically_normal();
    if (!rel.is_absolute() && is_within(root, candidate) && fs::is_regular_file(candidate, ec)) {
      return Result<fs::path>::ok(candidate);
    }
    spdlog::debug("entrypoint override '{}' not usable; falling back", *override_rel);
  }

  for (const char* stem : {"main", "app"}) {
    const fs::path p = root / (std::string(stem) + runtime_.script_extension);
    if (fs::is_regular_file(p, ec)) return Result<fs::path>::ok(p);
  }

  std::vector<std::string> names;
  std::error_code list_ec;
  for (const auto& it : fs::directory_iterator(root, list_ec)) {
    if (!it.is_regular_file(ec)) continue;
    const std::string name = it.path().filename().string();
    if (!ends_with(name, runtime_.script_extension)) continue;
    names.push_back(name);
  }
  if (list_ec) {
    return Result<fs::path>::err(
        Status::io_error("failed listing workspace " + root.string() + ": " + list_ec.message()));
  }

  if (names.empty()) {
    return Result<fs::path>::err(Status::no_entrypoint(
        "no " + runtime_.script_extension + " entrypoint found (upload main" + runtime_.script_extension +
        " or specify an entry)"));
  }

  std::sort(names.begin(), names.end());
  return Result<fs::path>::ok(root / names.front());
}

}  // namespace runbox
