// File: include/runbox/core/store/object_store.hpp
#pragma once

#include <string>

#include "runbox/core/status.hpp"
#include "runbox/core/types.hpp"

namespace runbox {

class ObjectStore {
 public:
  virtual ~ObjectStore() = default;

  // Stores `artifact` under its key and returns a retrievable URL.
  // Errors carry the backend's diagnostic; callers decide the error kind.
  virtual Result<std::string> put(const Artifact& artifact) = 0;

  virtual std::string name() const = 0;
};

}  // namespace runbox
