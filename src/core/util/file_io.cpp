// src/core/util/file_io.cpp
#include "runbox/core/util/file_io.hpp"

#include <fstream>
#include <iterator>

namespace runbox {

Result<std::string> read_file(const std::filesystem::path& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f.is_open()) {
    return Result<std::string>::err(Status::io_error("failed to open " + path.string()));
  }

  std::string bytes((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  if (f.bad()) {
    return Result<std::string>::err(Status::io_error("failed reading " + path.string()));
  }
  return Result<std::string>::ok(std::move(bytes));
}

Status write_file(const std::filesystem::path& path, const std::string& bytes) {
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f.is_open()) return Status::io_error("failed to open " + path.string() + " for writing");

  f.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  f.flush();
  if (!f.good()) return Status::io_error("failed writing " + path.string());
  return Status::ok_status();
}

}  // namespace runbox
