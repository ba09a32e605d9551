// File: include/runbox/core/events/event_sink.hpp
#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "runbox/core/status.hpp"
#include "runbox/core/types.hpp"

namespace runbox {

// Run event model.
// Keep output stable and boring; evolve by adding fields (not breaking existing ones).

struct RunInfo {
  RunId run_id;
  std::string config_hash;
  std::string workspace;

  // Absolute epoch ns at run start.
  std::int64_t wall_start_ns = 0;
};

struct Event {
  std::string type;          // e.g. "workspace_ready", "execution_finished"
  std::int64_t t_ns = 0;     // relative since run start
  std::int64_t t_wall_ns = 0;

  std::string message;       // optional human-readable hint

  // Extra string fields, written in order.
  std::vector<std::pair<std::string, std::string>> fields;
};

class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual Status open(const RunInfo& run) = 0;
  virtual Status emit(const Event& e) = 0;
  virtual Status flush() = 0;
  virtual void close() = 0;
};

}  // namespace runbox
