// File: include/runbox/adapters/local_dir/local_dir_object_store.hpp
#pragma once

#include <string>

#include "runbox/core/store/object_store.hpp"

namespace runbox {

// Objects are plain files at <root>/<key>; URLs are file:// URLs.
class LocalDirObjectStore final : public ObjectStore {
 public:
  explicit LocalDirObjectStore(std::string root);

  Result<std::string> put(const Artifact& artifact) override;

  std::string name() const override { return "local_dir"; }

 private:
  std::string root_;
};

}  // namespace runbox
