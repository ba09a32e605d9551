// include/runbox/core/util/file_io.hpp
#pragma once

#include <filesystem>
#include <string>

#include "runbox/core/status.hpp"

namespace runbox {

Result<std::string> read_file(const std::filesystem::path& path);

// Creates or truncates `path`. Parent directories must exist.
Status write_file(const std::filesystem::path& path, const std::string& bytes);

}  // namespace runbox
