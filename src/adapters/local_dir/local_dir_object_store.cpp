// File: src/adapters/local_dir/local_dir_object_store.cpp
#include "runbox/adapters/local_dir/local_dir_object_store.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

#include "runbox/core/util/file_io.hpp"

namespace runbox {
namespace fs = std::filesystem;

LocalDirObjectStore::LocalDirObjectStore(std::string root) : root_(std::move(root)) {}

Result<std::string> LocalDirObjectStore::put(const Artifact& artifact) {
  if (root_.empty()) return Result<std::string>::err(Status::invalid_request("LocalDirObjectStore: root is empty"));

  const fs::path rel(artifact.key);
  if (artifact.key.empty() || rel.is_absolute()) {
    return Result<std::string>::err(Status::invalid_request("LocalDirObjectStore: bad key '" + artifact.key + "'"));
  }
  for (const auto& part : rel) {
    if (part == "..") {
      return Result<std::string>::err(Status::invalid_request("LocalDirObjectStore: bad key '" + artifact.key + "'"));
    }
  }

  std::error_code ec;
  const fs::path target = (fs::absolute(root_, ec) / rel).lexically_normal();
  if (ec) return Result<std::string>::err(Status::io_error("LocalDirObjectStore: " + ec.message()));

  fs::create_directories(target.parent_path(), ec);
  if (ec) {
    return Result<std::string>::err(
        Status::io_error("LocalDirObjectStore: failed creating " + target.parent_path().string() + ": " + ec.message()));
  }

  RUNBOX_RESULT_RETURN_IF_ERROR(std::string, write_file(target, artifact.bytes));
  return Result<std::string>::ok("file://" + target.string());
}

}  // namespace runbox
