// File: src/core/events/jsonl_event_sink.cpp
#include "runbox/core/events/jsonl_event_sink.hpp"

#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>

#include "runbox/core/util/json_text.hpp"

namespace runbox {
namespace {

double ns_to_s(std::int64_t ns) { return static_cast<double>(ns) * 1e-9; }

}  // namespace

JsonlEventSink::JsonlEventSink(std::string events_dir) : events_dir_(std::move(events_dir)) {}

JsonlEventSink::~JsonlEventSink() { close(); }

Status JsonlEventSink::open(const RunInfo& run) {
  close();

  std::error_code ec;
  std::filesystem::create_directories(events_dir_, ec);
  if (ec) {
    return Status::io_error("failed creating events_dir '" + events_dir_ + "': " + ec.message());
  }

  path_ = (std::filesystem::path(events_dir_) / ("events_" + run.run_id + ".jsonl")).string();

  f_.open(path_, std::ios::out | std::ios::trunc);
  if (!f_.is_open()) return Status::io_error("failed opening '" + path_ + "'");

  open_ = true;

  std::ostringstream ss;
  ss << std::fixed << std::setprecision(6);
  ss << "{"
     << "\"type\":\"run_started\","
     << "\"t_ns\":0,"
     << "\"t_wall_ns\":" << run.wall_start_ns << ","
     << "\"t_wall_s\":" << ns_to_s(run.wall_start_ns) << ","
     << "\"run_id\":" << json_quote(run.run_id) << ","
     << "\"workspace\":" << json_quote(run.workspace) << ","
     << "\"config_hash\":" << json_quote(run.config_hash)
     << "}";

  const Status w = write_line_(ss.str());
  if (!w.ok()) return w;
  return flush();
}

Status JsonlEventSink::emit(const Event& e) {
  if (!open_) return Status::internal("JsonlEventSink::emit called while not open");

  std::ostringstream ss;
  ss << std::fixed << std::setprecision(6);

  ss << "{"
     << "\"type\":" << json_quote(e.type) << ","
     << "\"t_ns\":" << e.t_ns << ","
     << "\"t_s\":" << ns_to_s(e.t_ns) << ","
     << "\"t_wall_ns\":" << e.t_wall_ns;

  if (!e.message.empty()) {
    ss << ",\"message\":" << json_quote(e.message);
  }
  for (const auto& kv : e.fields) {
    ss << "," << json_quote(kv.first) << ":" << json_quote(kv.second);
  }

  ss << "}";

  return write_line_(ss.str());
}

Status JsonlEventSink::write_line_(const std::string& line) {
  f_ << line << "\n";
  if (!f_.good()) return Status::io_error("failed writing to '" + path_ + "'");
  return Status{};
}

Status JsonlEventSink::flush() {
  if (!open_) return Status{};

  f_.flush();
  if (!f_.good()) return Status::io_error("failed flushing '" + path_ + "'");
  return Status{};
}

void JsonlEventSink::close() {
  if (f_.is_open()) f_.close();
  open_ = false;
}

}  // namespace runbox
