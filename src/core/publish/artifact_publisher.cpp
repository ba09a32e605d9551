// File: src/core/publish/artifact_publisher.cpp
#include "runbox/core/publish/artifact_publisher.hpp"

#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

#include "runbox/core/util/file_io.hpp"
#include "runbox/core/util/zip_archive.hpp"

namespace runbox {
namespace fs = std::filesystem;

namespace {

std::string strip_slashes(std::string s) {
  while (!s.empty() && s.back() == '/') s.pop_back();
  while (!s.empty() && s.front() == '/') s.erase(s.begin());
  return s;
}

}  // namespace

Result<std::uint64_t> directory_size(const fs::path& root) {
  std::error_code ec;
  std::uint64_t total = 0;

  fs::recursive_directory_iterator it(root, fs::directory_options::none, ec);
  if (ec) return Result<std::uint64_t>::err(Status::io_error("failed walking " + root.string() + ": " + ec.message()));

  for (const fs::recursive_directory_iterator end{}; it != end; it.increment(ec)) {
    if (ec) {
      return Result<std::uint64_t>::err(Status::io_error("failed walking " + root.string() + ": " + ec.message()));
    }
    const fs::file_status st = it->symlink_status(ec);
    if (ec) continue;
    if (fs::is_regular_file(st)) {
      const auto n = it->file_size(ec);
      if (!ec) total += n;
    }
  }
  if (ec) return Result<std::uint64_t>::err(Status::io_error("failed walking " + root.string() + ": " + ec.message()));
  return Result<std::uint64_t>::ok(total);
}

ArtifactPublisher::ArtifactPublisher(StoreConfig store, LimitsConfig limits, ObjectStore& sink)
    : store_(std::move(store)), limits_(std::move(limits)), sink_(sink) {}

ObjectKey ArtifactPublisher::output_key(const RunId& run_id) const {
  return strip_slashes(store_.output_prefix) + "/" + run_id + ".txt";
}

ObjectKey ArtifactPublisher::bundle_key(const RunId& run_id) const {
  return strip_slashes(store_.bundle_prefix) + "/" + run_id + ".zip";
}

Result<std::string> ArtifactPublisher::snapshot_(const fs::path& root) const {
  if (limits_.max_bundle_bytes > 0) {
    auto size = directory_size(root);
    if (!size.ok()) return Result<std::string>::err(Status::publish_failed("bundle: " + size.status().message()));
    if (*size > static_cast<std::uint64_t>(limits_.max_bundle_bytes)) {
      return Result<std::string>::err(Status::publish_failed(
          "bundle: workspace holds " + std::to_string(*size) + " bytes (limit " +
          std::to_string(limits_.max_bundle_bytes) + ")"));
    }
  }

  auto zip = zip_directory(root, {fs::path(kBundleFileName)});
  if (!zip.ok()) return Result<std::string>::err(Status::publish_failed("bundle: " + zip.status().message()));

  const Status written = write_file(root / kBundleFileName, *zip);
  if (!written.ok()) return Result<std::string>::err(Status::publish_failed("bundle: " + written.message()));
  return zip;
}

Result<PublishedArtifacts> ArtifactPublisher::publish(const RunId& run_id, const fs::path& root,
                                                      const std::string& output_text) const {
  const Status out_written = write_file(root / kOutputFileName, output_text);
  if (!out_written.ok()) {
    return Result<PublishedArtifacts>::err(Status::publish_failed("output: " + out_written.message()));
  }

  auto bundle = snapshot_(root);
  if (!bundle.ok()) return Result<PublishedArtifacts>::err(bundle.status());

  PublishedArtifacts published;

  const Artifact output{output_key(run_id), output_text, "text/plain; charset=utf-8"};
  auto output_url = sink_.put(output);
  if (!output_url.ok()) {
    spdlog::error("upload of {} to {} failed: {}", output.key, sink_.name(), output_url.status().message());
    return Result<PublishedArtifacts>::err(
        Status::publish_failed("output " + output.key + ": " + output_url.status().message()));
  }
  published.output_url = output_url.take_value();

  const Artifact archive{bundle_key(run_id), bundle.take_value(), "application/zip"};
  auto bundle_url = sink_.put(archive);
  if (!bundle_url.ok()) {
    spdlog::error("upload of {} to {} failed: {}", archive.key, sink_.name(), bundle_url.status().message());
    return Result<PublishedArtifacts>::err(
        Status::publish_failed("bundle " + archive.key + ": " + bundle_url.status().message()));
  }
  published.bundle_url = bundle_url.take_value();

  spdlog::info("published {} and {}", published.output_url, published.bundle_url);
  return Result<PublishedArtifacts>::ok(std::move(published));
}

}  // namespace runbox
