// File: include/runbox/core/events/jsonl_event_sink.hpp
#pragma once

#include <fstream>
#include <string>

#include "runbox/core/events/event_sink.hpp"
#include "runbox/core/status.hpp"

namespace runbox {

// JSONL sink for run events.
// Writes one file per run: <events_dir>/events_<run_id>.jsonl
class JsonlEventSink final : public EventSink {
 public:
  explicit JsonlEventSink(std::string events_dir);
  ~JsonlEventSink() override;

  const std::string& path() const { return path_; }

  Status open(const RunInfo& run) override;
  Status emit(const Event& e) override;
  Status flush() override;
  void close() override;

 private:
  Status write_line_(const std::string& line);

  std::string events_dir_;
  bool open_{false};
  std::string path_;
  std::ofstream f_;
};

}  // namespace runbox
