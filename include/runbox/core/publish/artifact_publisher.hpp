// File: include/runbox/core/publish/artifact_publisher.hpp
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "runbox/core/config.hpp"
#include "runbox/core/status.hpp"
#include "runbox/core/store/object_store.hpp"
#include "runbox/core/types.hpp"

namespace runbox {

inline constexpr const char* kOutputFileName = "output.txt";
inline constexpr const char* kBundleFileName = "bundle.zip";

// Writes output.txt, snapshots the workspace to bundle.zip, then uploads the
// output and the bundle, in that order. The first failure aborts.
class ArtifactPublisher {
 public:
  ArtifactPublisher(StoreConfig store, LimitsConfig limits, ObjectStore& sink);

  // Errors: PublishFailed (message names the failing artifact).
  Result<PublishedArtifacts> publish(const RunId& run_id, const std::filesystem::path& root,
                                     const std::string& output_text) const;

  [[nodiscard]] ObjectKey output_key(const RunId& run_id) const;
  [[nodiscard]] ObjectKey bundle_key(const RunId& run_id) const;

 private:
  Result<std::string> snapshot_(const std::filesystem::path& root) const;

  StoreConfig store_;
  LimitsConfig limits_;
  ObjectStore& sink_;
};

// Sum of regular file sizes under `root`, symlinks not followed.
Result<std::uint64_t> directory_size(const std::filesystem::path& root);

}  // namespace runbox
