// File: include/runbox/adapters/s3/s3_object_store.hpp
#pragma once

#include <string>

#include "runbox/core/config.hpp"
#include "runbox/core/store/object_store.hpp"

namespace runbox {

// HTTP PUT with AWS Signature V4 (libcurl's built-in signer).
// Public URL: https://<bucket>.s3.<region>.amazonaws.com/<key>, or
// <endpoint>/<bucket>/<key> when an S3-compatible endpoint is configured.
// One curl handle per put; instances are safe to share between threads.
class S3ObjectStore final : public ObjectStore {
 public:
  explicit S3ObjectStore(StoreConfig cfg);

  Result<std::string> put(const Artifact& artifact) override;

  std::string name() const override { return "s3"; }

  [[nodiscard]] std::string object_url(const ObjectKey& key) const;

 private:
  StoreConfig cfg_;
};

}  // namespace runbox
